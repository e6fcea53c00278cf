#pragma once
#include <iosfwd>
#include <string>
#include <vector>
#include "Board.hpp"

// Holes are named by letter: 'a' is position 1, 'z' is 26.
static constexpr char FIRST_LETTER = 'a';
static constexpr int LETTER_COUNT = 26;
// width of one rendered hole plus its separator
static constexpr int POS_CHARS = 3;

char pos_letter(int pos);
int letter_pos(char letter); // 0 for anything that is not a lowercase letter

std::vector<int> row_positions(int row);
std::string row_padding(int row, int rows);
std::string render_pos(const Board &b, int pos);
std::string render_row(const Board &b, int row);
void print_board(std::ostream &out, const Board &b);

// positions named by the letters of s, in order; other characters are skipped
std::vector<int> parse_positions(const std::string &s);
