#include "Notation.hpp"

#include <cctype>
#include <sstream>

char Notation::cellSymbol(Board::Cell cell) {
	switch (cell) {
	case Board::Cell::Player1:
		return '1';
	case Board::Cell::Player2:
		return '2';
	case Board::Cell::Hole:
		return 'O';
	case Board::Cell::Empty:
		break;
	}
	return '.';
}

bool Notation::symbolCell(char symbol, Board::Cell& out) {
	switch (symbol) {
	case '.':
		out = Board::Cell::Empty;
		return true;
	case '1':
		out = Board::Cell::Player1;
		return true;
	case '2':
		out = Board::Cell::Player2;
		return true;
	case 'O':
	case 'o':
		out = Board::Cell::Hole;
		return true;
	default:
		return false;
	}
}

std::string Notation::cellName(Board::Cell cell) {
	switch (cell) {
	case Board::Cell::Player1:
		return "Player1";
	case Board::Cell::Player2:
		return "Player2";
	case Board::Cell::Hole:
		return "Hole";
	case Board::Cell::Empty:
		break;
	}
	return "Empty";
}

std::string Notation::toString(const Board& board) {
	std::string text;
	for (int y = 0; y < Board::kWidth; ++y) {
		for (int x = 0; x < Board::kWidth; ++x) {
			text += cellSymbol(board.at(x, y));
			if (x + 1 < Board::kWidth) {
				text += ' ';
			}
		}
		if (y + 1 < Board::kWidth) {
			text += '\n';
		}
	}
	return text;
}

bool Notation::parseBoard(const std::string& text, Board& out) {
	Board parsed;
	int filled = 0;
	for (char c : text) {
		if (std::isspace(static_cast<unsigned char>(c))) {
			continue;
		}
		Board::Cell cell = Board::Cell::Empty;
		if (filled >= Board::kCellCount || !symbolCell(c, cell)) {
			return false;
		}
		parsed.set(filled % Board::kWidth, filled / Board::kWidth, cell);
		++filled;
	}
	if (filled != Board::kCellCount) {
		return false;
	}
	out = parsed;
	return true;
}

std::string Notation::moveToString(const Move& move) {
	std::ostringstream out;
	out << "(" << move.x << "," << move.y << "," << move.dx << "," << move.dy << ")";
	return out.str();
}

bool Notation::parseMove(const std::string& text, Move& out) {
	std::istringstream in(text);
	int values[4];
	for (int i = 0; i < 4; ++i) {
		if (!(in >> values[i])) {
			return false;
		}
	}
	std::string rest;
	if (in >> rest) {
		return false;
	}
	out = Move(values[0], values[1], values[2], values[3]);
	return true;
}
