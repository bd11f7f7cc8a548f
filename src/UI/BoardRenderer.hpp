#ifndef BOARDRENDERER_HPP
#define BOARDRENDERER_HPP

#include <SDL2/SDL.h>

#include "GameController.hpp"
#include "UiLayout.hpp"

class BoardRenderer {
public:
	void render(SDL_Renderer* renderer, const GameController& controller, const UiLayout& layout, const Board* ghostBoard);

private:
	void drawCells(SDL_Renderer* renderer, const Board& board, const UiLayout& layout);
	void drawPieces(SDL_Renderer* renderer, const Board& board, const UiLayout& layout);
	void drawSelection(SDL_Renderer* renderer, const GameController& controller, const UiLayout& layout);
	void drawLastMove(SDL_Renderer* renderer, const GameState& state, const UiLayout& layout);
	void drawGhostPieces(SDL_Renderer* renderer, const Board& board, const UiLayout& layout, const Board* ghostBoard);
	void drawFilledCircle(SDL_Renderer* renderer, int cx, int cy, int radius, SDL_Color color);
	void drawCircleOutline(SDL_Renderer* renderer, int cx, int cy, int radius, SDL_Color color);
	SDL_Color pieceColor(Board::Cell cell) const;
};

#endif
