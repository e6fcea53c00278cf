#pragma once
#include <cstdint>

// Triangular numbers 1, 3, 6, 10, ... delimit the rows of the board:
// row r holds the positions (T(r-1), T(r)].
// Terms are 64-bit so T(r) of any int r is representable.

// Restartable generator; every instance starts again from the first term.
class TriangularSequence
{
public:
    int64_t next()
    {
        ++n;
        sum += n;
        return sum;
    }

private:
    int64_t n{0};
    int64_t sum{0};
};

// T(r), the number closing row r. T(0) = 0, negative rows count as 0.
inline constexpr int64_t row_triangular(int64_t r)
{
    return r <= 0 ? 0 : r * (r + 1) / 2;
}

// True for 0, 1, 3, 6, 10, ...
inline bool is_triangular(int64_t n)
{
    if (n < 0)
        return false;
    TriangularSequence seq;
    int64_t last = 0;
    while (last < n)
        last = seq.next();
    return last == n;
}

// 1-indexed row holding pos: one more than the number of terms below pos.
inline int row_of(int64_t pos)
{
    TriangularSequence seq;
    int below = 0;
    while (seq.next() < pos)
        ++below;
    return below + 1;
}
