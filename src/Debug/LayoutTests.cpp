#include "DebugTests.hpp"

#include <cassert>

#include "CoordinateMapper.hpp"
#include "UiLayout.hpp"

namespace {
void testSquareCells() {
	UiLayout layout;
	assert(layout.boardSize == Board::kWidth);
	assert(layout.cellSize * layout.boardSize == layout.boardPixelSize);
	assert(layout.boardX + layout.boardPixelSize <= layout.windowWidth);
	assert(layout.pieceRadius * 2 < layout.cellSize);
}

void testPixelMapping() {
	UiLayout layout;
	CoordinateMapper mapper(layout);
	for (int y = 0; y < Board::kWidth; ++y) {
		for (int x = 0; x < Board::kWidth; ++x) {
			int px = 0;
			int py = 0;
			mapper.cellToPixelCenter(x, y, px, py);
			int cx = -1;
			int cy = -1;
			assert(mapper.pixelToCell(px, py, cx, cy));
			assert(cx == x && cy == y);

			// Any pixel inside the square belongs to the same cell.
			mapper.cellToPixelOrigin(x, y, px, py);
			assert(mapper.pixelToCell(px, py, cx, cy) && cx == x && cy == y);
			assert(mapper.pixelToCell(px + layout.cellSize - 1, py + layout.cellSize - 1, cx, cy));
			assert(cx == x && cy == y);
		}
	}
	int cx = 9;
	int cy = 9;
	assert(!mapper.pixelToCell(layout.boardX - 1, layout.boardY, cx, cy));
	assert(!mapper.pixelToCell(layout.boardX, layout.boardY + layout.boardPixelSize, cx, cy));
	assert(cx == 9 && cy == 9);
}
}  // namespace

void runLayoutTests() {
	testSquareCells();
	testPixelMapping();
}
