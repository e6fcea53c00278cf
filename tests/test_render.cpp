#include <cassert>
#include <sstream>
#include <string>
#include <vector>
#include "Board.hpp"
#include "Render.hpp"
#include "Utils.hpp"

static void letters()
{
    assert(pos_letter(1) == 'a');
    assert(pos_letter(26) == 'z');
    assert(letter_pos('a') == 1);
    assert(letter_pos('e') == 5);
    assert(letter_pos('z') == 26);
    assert(letter_pos('A') == 0);
    assert(letter_pos('{') == 0);
    for (int pos = 1; pos <= LETTER_COUNT; ++pos)
        assert(letter_pos(pos_letter(pos)) == pos);
}

static void rows_and_padding()
{
    assert(row_positions(1) == std::vector<int>{1});
    assert((row_positions(3) == std::vector<int>{4, 5, 6}));
    assert(row_positions(0).empty());
    assert(row_padding(1, 5) == std::string(6, ' '));
    assert(row_padding(2, 5) == std::string(5, ' '));
    assert(row_padding(4, 5) == std::string(2, ' '));
    assert(row_padding(5, 5).empty());
}

static void board_text()
{
    Board b = Board(5).remove_peg(4);
    assert(render_pos(b, 1) == "a0");
    assert(render_pos(b, 4) == "d-");
    assert(render_row(b, 1) == "      a0");
    assert(render_row(b, 3) == "   d- e0 f0");
    assert(render_row(b, 5) == "k0 l0 m0 n0 o0");

    std::ostringstream out;
    print_board(out, b);
    assert(out.str() == "      a0\n"
                        "     b0 c0\n"
                        "   d- e0 f0\n"
                        "  g0 h0 i0 j0\n"
                        "k0 l0 m0 n0 o0\n");

    std::ostringstream none;
    print_board(none, Board(0));
    assert(none.str().empty());
}

static void move_parsing()
{
    assert((parse_positions("ad") == std::vector<int>{1, 4}));
    assert((parse_positions("A D") == std::vector<int>{1, 4}));
    assert((parse_positions("a1-d!") == std::vector<int>{1, 4}));
    assert(parse_positions("").empty());
    assert(parse_positions("42").empty());
}

static void input_lines()
{
    assert(trim("  Ab c \t") == "Ab c");
    assert(trim("   ").empty());
    assert(to_lower("AdZ") == "adz");
    std::istringstream in("  AD \n\nxyz\n");
    assert(*read_input(in, "e") == "ad");
    assert(*read_input(in, "e") == "e");
    assert(*read_input(in) == "xyz");
    assert(!read_input(in));
}

int main()
{
    letters();
    rows_and_padding();
    board_text();
    move_parsing();
    input_lines();
    return 0;
}
