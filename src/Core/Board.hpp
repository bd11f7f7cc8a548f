#ifndef BOARD_HPP
#define BOARD_HPP

#include <array>

// 5x5 Ostle board, row-major (index = y * 5 + x). Treated as a value:
// rules never modify a board in place, they return a new one.
class Board {
public:
	enum class Cell { Empty, Player1, Player2, Hole };

	static constexpr int kWidth = 5;
	static constexpr int kCellCount = kWidth * kWidth;

	Board();

	static Board createInitial();

	Cell at(int x, int y) const;
	void set(int x, int y, Cell value);
	void remove(int x, int y);
	bool inBounds(int x, int y) const;
	int count(Cell value) const;
	void clear();

	bool operator==(const Board& other) const;
	bool operator!=(const Board& other) const;

	static int index(int x, int y);

private:
	std::array<Cell, kCellCount> cells;
};

#endif
