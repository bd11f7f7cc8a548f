#ifndef MOVE_HPP
#define MOVE_HPP

// Origin cell (x, y) and a unit axis direction (dx, dy).
class Move {
public:
	int x;
	int y;
	int dx;
	int dy;

	Move();
	Move(int xPos, int yPos, int dirX, int dirY);

	bool operator==(const Move& other) const;
	bool operator!=(const Move& other) const;
	bool isValid() const;
	int targetX() const;
	int targetY() const;
};

#endif
