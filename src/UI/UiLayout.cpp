#include "UiLayout.hpp"

#include "Board.hpp"

UiLayout::UiLayout() : UiLayout(Board::kWidth) {
}

UiLayout::UiLayout(int boardSizeIn) {
	updateForWindow(600, 600, boardSizeIn);
}

void UiLayout::updateForWindow(int width, int height, int boardSizeIn) {
	windowWidth = width;
	windowHeight = height;
	padding = 30;
	boardSize = boardSizeIn;
	int minSize = (width < height) ? width : height;
	boardPixelSize = minSize - padding * 2;
	if (boardPixelSize < 100) {
		boardPixelSize = minSize;
	}
	cellSize = boardPixelSize / boardSize;
	boardPixelSize = cellSize * boardSize;
	boardX = (width - boardPixelSize) / 2;
	boardY = (height - boardPixelSize) / 2;
	pieceRadius = cellSize * 4 / 10;
}
