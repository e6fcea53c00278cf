#include <iostream>
#include <sstream>
#include <string>
#include "Game.hpp"
#include "Render.hpp"
#include "Utils.hpp"

static void show(const Board &b)
{
    std::cout << "\nHere's your board:\n";
    print_board(std::cout, b);
}

// false on end of input
static bool prompt_rows(Game &g, int defaultRows)
{
    while (true)
    {
        std::cout << "How many rows? [" << defaultRows << "]\n";
        auto in = read_input(std::cin, std::to_string(defaultRows));
        if (!in)
            return false;
        std::stringstream ss(*in);
        int rows;
        if (!(ss >> rows) || !(ss >> std::ws).eof())
        {
            std::cout << "bad input\n";
            continue;
        }
        if (!supported_rows(rows))
        {
            std::cout << "Rows must be between 1 and " << MAX_ROWS << ".\n";
            continue;
        }
        g.reset(rows);
        return true;
    }
}

static bool prompt_empty_hole(Game &g)
{
    while (g.phase == Phase::AwaitingEmptyHole)
    {
        show(g.board);
        std::cout << "Remove which peg? [" << DEFAULT_EMPTY_HOLE << "]\n";
        auto in = read_input(std::cin, std::string(1, DEFAULT_EMPTY_HOLE));
        if (!in)
            return false;
        auto picked = parse_positions(*in);
        if (picked.size() != 1 || !g.choose_empty_hole(picked.front()))
            std::cout << "\n!!! That peg isn't on the board.\n";
    }
    return true;
}

static bool play(Game &g)
{
    while (g.phase == Phase::Playing)
    {
        show(g.board);
        std::cout << "Move from where to where? Enter two letters:\n";
        auto in = read_input(std::cin);
        if (!in)
            return false;
        auto moves = parse_positions(*in);
        if (moves.size() < 2 || !g.try_move(moves[0], moves[1]))
            std::cout << "\n!!! That was an invalid move. :(\n";
    }
    return true;
}

static void game_over(const Game &g)
{
    std::cout << "Game over! You had " << g.score() << " pegs left:\n";
    print_board(std::cout, g.board);
}

int main(int argc, char **argv)
{
    int defaultRows = DEFAULT_ROWS;
    if (argc >= 3 && std::string(argv[1]) == "--rows")
    {
        std::stringstream ss(argv[2]);
        if (!(ss >> defaultRows) || !supported_rows(defaultRows))
        {
            std::cerr << "--rows expects a number from 1 to " << MAX_ROWS << "\n";
            return 2;
        }
    }
    else if (argc > 1)
    {
        std::cerr << "usage: " << argv[0] << " [--rows N]\n";
        return 2;
    }

    std::cout << "Get ready to play Peg Thing!\n";
    Game g;
    while (true)
    {
        if (!prompt_rows(g, defaultRows) || !prompt_empty_hole(g) || !play(g))
            break;
        game_over(g);
        std::cout << "Play again? [y/n]\n";
        auto in = read_input(std::cin, "y");
        if (!in || *in != "y")
            break;
    }
    std::cout << "Bye!\n";
    return 0;
}
