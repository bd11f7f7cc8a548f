#include "CoordinateMapper.hpp"

CoordinateMapper::CoordinateMapper(const UiLayout& layoutIn) : layout(layoutIn) {
}

bool CoordinateMapper::pixelToCell(int px, int py, int& outX, int& outY) const {
	int relX = px - layout.boardX;
	int relY = py - layout.boardY;
	if (relX < 0 || relY < 0 || layout.cellSize <= 0) {
		return false;
	}
	int x = relX / layout.cellSize;
	int y = relY / layout.cellSize;
	if (x >= layout.boardSize || y >= layout.boardSize) {
		return false;
	}
	outX = x;
	outY = y;
	return true;
}

void CoordinateMapper::cellToPixelCenter(int x, int y, int& outPx, int& outPy) const {
	outPx = layout.boardX + x * layout.cellSize + layout.cellSize / 2;
	outPy = layout.boardY + y * layout.cellSize + layout.cellSize / 2;
}

void CoordinateMapper::cellToPixelOrigin(int x, int y, int& outPx, int& outPy) const {
	outPx = layout.boardX + x * layout.cellSize;
	outPy = layout.boardY + y * layout.cellSize;
}
