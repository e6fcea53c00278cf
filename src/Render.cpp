#include "Render.hpp"
#include "Triangular.hpp"
#include <cctype>
#include <ostream>

char pos_letter(int pos)
{
    if (pos < 1 || pos > LETTER_COUNT)
        return '?';
    return static_cast<char>(FIRST_LETTER + pos - 1);
}

int letter_pos(char letter)
{
    if (letter < FIRST_LETTER || letter >= FIRST_LETTER + LETTER_COUNT)
        return 0;
    return letter - FIRST_LETTER + 1;
}

std::vector<int> row_positions(int row)
{
    std::vector<int> out;
    int last = static_cast<int>(row_triangular(row));
    for (int pos = static_cast<int>(row_triangular(row - 1)) + 1; pos <= last; ++pos)
        out.push_back(pos);
    return out;
}

// half a hole per row of difference, rounded up
std::string row_padding(int row, int rows)
{
    int width = (rows - row) * POS_CHARS;
    if (width <= 0)
        return {};
    return std::string((width + 1) / 2, ' ');
}

std::string render_pos(const Board &b, int pos)
{
    std::string s(1, pos_letter(pos));
    s += b.is_pegged(pos) ? '0' : '-';
    return s;
}

std::string render_row(const Board &b, int row)
{
    std::string s = row_padding(row, b.rows());
    bool first = true;
    for (int pos : row_positions(row))
    {
        if (!first)
            s += ' ';
        s += render_pos(b, pos);
        first = false;
    }
    return s;
}

void print_board(std::ostream &out, const Board &b)
{
    for (int row = 1; row <= b.rows(); ++row)
        out << render_row(b, row) << '\n';
}

std::vector<int> parse_positions(const std::string &s)
{
    std::vector<int> out;
    for (unsigned char c : s)
        if (std::isalpha(c))
            out.push_back(letter_pos(static_cast<char>(std::tolower(c))));
    return out;
}
