#include "Board.hpp"
#include "Triangular.hpp"
#include <algorithm>
#include <cstdint>
#include <limits>
#include <stdexcept>
#include <string>
#include <utility>

static void connect(std::vector<Connections> &g, int maxPos, int64_t pos, int64_t neighbor, int64_t destination)
{
    if (destination > maxPos)
        return;
    g[pos][static_cast<int>(destination)] = static_cast<int>(neighbor);
    g[destination][static_cast<int>(pos)] = static_cast<int>(neighbor);
}

static void connect_right(std::vector<Connections> &g, int maxPos, int64_t pos)
{
    int64_t neighbor = pos + 1;
    int64_t destination = neighbor + 1;
    // a triangular position ends its row
    if (is_triangular(pos) || is_triangular(neighbor))
        return;
    connect(g, maxPos, pos, neighbor, destination);
}

static void connect_down_left(std::vector<Connections> &g, int maxPos, int64_t pos)
{
    int64_t row = row_of(pos);
    int64_t neighbor = pos + row;
    int64_t destination = 1 + row + neighbor;
    connect(g, maxPos, pos, neighbor, destination);
}

static void connect_down_right(std::vector<Connections> &g, int maxPos, int64_t pos)
{
    int64_t row = row_of(pos);
    int64_t neighbor = pos + row + 1;
    int64_t destination = 2 + row + neighbor;
    connect(g, maxPos, pos, neighbor, destination);
}

Board::Board() : graph(std::make_shared<std::vector<Connections>>(1)), pegged(1, false) {}

Board::Board(int rows)
{
    rowCount = rows < 0 ? 0 : rows;
    int64_t holes = row_triangular(rowCount);
    if (holes > std::numeric_limits<int>::max())
        throw std::out_of_range("a board of " + std::to_string(rows) + " rows has " + std::to_string(holes) +
                                " holes, more than a position can number");
    maxPos = static_cast<int>(holes);
    auto g = std::make_shared<std::vector<Connections>>(maxPos + 1);
    for (int pos = 1; pos <= maxPos; ++pos)
    {
        connect_right(*g, maxPos, pos);
        connect_down_left(*g, maxPos, pos);
        connect_down_right(*g, maxPos, pos);
    }
    graph = std::move(g);
    pegged.assign(maxPos + 1, true);
    pegged[0] = false;
}

void Board::check(int pos) const
{
    if (!contains(pos))
        throw std::out_of_range("position " + std::to_string(pos) + " is not on a board of " +
                                std::to_string(rowCount) + " rows");
}

bool Board::is_pegged(int pos) const
{
    check(pos);
    return pegged[pos];
}

const Connections &Board::connections(int pos) const
{
    check(pos);
    return (*graph)[pos];
}

Board Board::with_peg(int pos, bool value) const
{
    check(pos);
    Board next = *this;
    next.pegged[pos] = value;
    return next;
}

Board Board::remove_peg(int pos) const { return with_peg(pos, false); }

Board Board::place_peg(int pos) const { return with_peg(pos, true); }

Board Board::move_peg(int from, int to) const { return remove_peg(from).place_peg(to); }

Connections Board::valid_moves(int pos) const
{
    Connections out;
    if (!is_pegged(pos))
        return out;
    for (auto &kv : (*graph)[pos])
    {
        int destination = kv.first, jumped = kv.second;
        if (!pegged[destination] && pegged[jumped])
            out.emplace(destination, jumped);
    }
    return out;
}

std::optional<int> Board::valid_move(int from, int to) const
{
    auto moves = valid_moves(from);
    auto it = moves.find(to);
    if (it == moves.end())
        return std::nullopt;
    return it->second;
}

std::optional<Board> Board::make_move(int from, int to) const
{
    auto jumped = valid_move(from, to);
    if (!jumped)
        return std::nullopt;
    return remove_peg(*jumped).move_peg(from, to);
}

bool Board::can_move() const
{
    for (int pos = 1; pos <= maxPos; ++pos)
        if (pegged[pos] && !valid_moves(pos).empty())
            return true;
    return false;
}

int Board::peg_count() const
{
    return static_cast<int>(std::count(pegged.begin() + 1, pegged.end(), true));
}
