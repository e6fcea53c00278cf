#pragma once
#include <map>
#include <memory>
#include <optional>
#include <vector>

// destination -> jumped position
using Connections = std::map<int, int>;

// Triangular peg board. Positions run 1..max_pos() row by row from the top.
// The jump graph is built once and shared read-only between copies; the
// occupancy is owned by each Board value, so "modifying" calls return a new
// board and leave this one untouched.
class Board
{
public:
    Board(); // degenerate board with no holes
    explicit Board(int rows); // std::out_of_range if T(rows) does not fit an int

    int rows() const { return rowCount; }
    int max_pos() const { return maxPos; }
    bool contains(int pos) const { return pos >= 1 && pos <= maxPos; }
    bool playable() const { return maxPos > 0; }

    // all of these throw std::out_of_range for a position off the board
    bool is_pegged(int pos) const;
    const Connections &connections(int pos) const;
    Board remove_peg(int pos) const;
    Board place_peg(int pos) const;
    Board move_peg(int from, int to) const;

    // jumps from pos that are legal right now; empty if pos holds no peg
    Connections valid_moves(int pos) const;
    std::optional<int> valid_move(int from, int to) const;

    // nullopt when the jump is illegal
    std::optional<Board> make_move(int from, int to) const;

    bool can_move() const;
    int peg_count() const;

private:
    int rowCount{0};
    int maxPos{0};
    std::shared_ptr<const std::vector<Connections>> graph;
    std::vector<bool> pegged;

    void check(int pos) const;
    Board with_peg(int pos, bool value) const;
};
