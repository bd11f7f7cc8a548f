#include "Board.hpp"

#include <cstddef>

constexpr int Board::kWidth;
constexpr int Board::kCellCount;

Board::Board() {
	clear();
}

Board Board::createInitial() {
	Board board;
	for (int x = 0; x < kWidth; ++x) {
		board.set(x, 0, Cell::Player1);
		board.set(x, kWidth - 1, Cell::Player2);
	}
	board.set(kWidth / 2, kWidth / 2, Cell::Hole);
	return board;
}

Board::Cell Board::at(int x, int y) const {
	return cells[static_cast<std::size_t>(index(x, y))];
}

void Board::set(int x, int y, Cell value) {
	cells[static_cast<std::size_t>(index(x, y))] = value;
}

void Board::remove(int x, int y) {
	set(x, y, Cell::Empty);
}

bool Board::inBounds(int x, int y) const {
	return x >= 0 && y >= 0 && x < kWidth && y < kWidth;
}

int Board::count(Cell value) const {
	int total = 0;
	for (std::size_t i = 0; i < cells.size(); ++i) {
		if (cells[i] == value) {
			++total;
		}
	}
	return total;
}

void Board::clear() {
	cells.fill(Cell::Empty);
}

bool Board::operator==(const Board& other) const {
	return cells == other.cells;
}

bool Board::operator!=(const Board& other) const {
	return !(*this == other);
}

int Board::index(int x, int y) {
	return y * kWidth + x;
}
