#ifndef COORDINATEMAPPER_HPP
#define COORDINATEMAPPER_HPP

#include "UiLayout.hpp"

// Maps between window pixels and board cells. A pixel belongs to the square
// that contains it; cells are addressed by their centre or top-left corner.
class CoordinateMapper {
public:
	explicit CoordinateMapper(const UiLayout& layout);
	// False for pixels outside the board; outputs untouched then.
	bool pixelToCell(int px, int py, int& outX, int& outY) const;
	void cellToPixelCenter(int x, int y, int& outPx, int& outPy) const;
	void cellToPixelOrigin(int x, int y, int& outPx, int& outPy) const;

private:
	UiLayout layout;
};

#endif
