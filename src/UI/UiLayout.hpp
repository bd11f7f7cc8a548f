#ifndef UILAYOUT_HPP
#define UILAYOUT_HPP

// Window geometry for a board of square cells. boardX/boardY is the top-left
// corner of cell (0, 0) and boardPixelSize is always boardSize * cellSize.
class UiLayout {
public:
	int windowWidth;
	int windowHeight;
	int padding;
	int boardPixelSize;
	int cellSize;
	int pieceRadius;
	int boardX;
	int boardY;
	int boardSize;

	UiLayout();
	explicit UiLayout(int boardSizeIn);
	void updateForWindow(int width, int height, int boardSizeIn);
};

#endif
