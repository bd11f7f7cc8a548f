#include "Move.hpp"

#include <cstdlib>

#include "Board.hpp"

Move::Move() : x(-1), y(-1), dx(0), dy(0) {
}

Move::Move(int xPos, int yPos, int dirX, int dirY) : x(xPos), y(yPos), dx(dirX), dy(dirY) {
}

bool Move::operator==(const Move& other) const {
	return x == other.x && y == other.y && dx == other.dx && dy == other.dy;
}

bool Move::operator!=(const Move& other) const {
	return !(*this == other);
}

bool Move::isValid() const {
	bool origin = x >= 0 && y >= 0 && x < Board::kWidth && y < Board::kWidth;
	bool axis = (std::abs(dx) + std::abs(dy)) == 1;
	return origin && axis;
}

int Move::targetX() const {
	return x + dx;
}

int Move::targetY() const {
	return y + dy;
}
