#ifndef NOTATION_HPP
#define NOTATION_HPP

#include <string>
#include "Board.hpp"
#include "Move.hpp"

// Text form of boards and moves: rows of '.', '1', '2', 'O' and "x y dx dy".
class Notation {
public:
	static char cellSymbol(Board::Cell cell);
	static bool symbolCell(char symbol, Board::Cell& out);
	static std::string cellName(Board::Cell cell);
	static std::string toString(const Board& board);
	static bool parseBoard(const std::string& text, Board& out);
	static std::string moveToString(const Move& move);
	static bool parseMove(const std::string& text, Move& out);
};

#endif
