#pragma once
#include <cstdint>
#include "Board.hpp"

static constexpr int DEFAULT_ROWS = 5;
// largest triangle whose holes all have a letter: T(6) = 21, T(7) = 28
static constexpr int MAX_ROWS = 6;
static constexpr char DEFAULT_EMPTY_HOLE = 'e';

inline bool supported_rows(int rows) { return rows >= 1 && rows <= MAX_ROWS; }

enum class Phase : uint8_t
{
    AwaitingEmptyHole,
    Playing,
    GameOver
};

// One round: pick the empty hole, jump until nothing can jump.
struct Game
{
    Board board{DEFAULT_ROWS};
    Phase phase = Phase::AwaitingEmptyHole;

    void reset(int rows)
    {
        board = Board{rows};
        // a board without holes has nothing to play
        phase = board.playable() ? Phase::AwaitingEmptyHole : Phase::GameOver;
    }
    int rows() const { return board.rows(); }
    int score() const { return board.peg_count(); }
    bool over() const { return phase == Phase::GameOver; }

    bool choose_empty_hole(int pos)
    {
        if (phase != Phase::AwaitingEmptyHole || !board.playable() || !board.contains(pos))
            return false;
        board = board.remove_peg(pos);
        phase = board.can_move() ? Phase::Playing : Phase::GameOver;
        return true;
    }

    // false leaves the board exactly as it was
    bool try_move(int from, int to)
    {
        if (phase != Phase::Playing || !board.contains(from))
            return false;
        auto next = board.make_move(from, to);
        if (!next)
            return false;
        board = *next;
        if (!board.can_move())
            phase = Phase::GameOver;
        return true;
    }

    const char *phase_name() const
    {
        switch (phase)
        {
        case Phase::AwaitingEmptyHole:
            return "Remove a peg";
        case Phase::Playing:
            return "Playing";
        case Phase::GameOver:
            return "Game over";
        }
        return "";
    }
};
