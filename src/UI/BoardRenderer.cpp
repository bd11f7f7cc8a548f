#include "BoardRenderer.hpp"

#include "CoordinateMapper.hpp"

void BoardRenderer::render(SDL_Renderer* renderer, const GameController& controller, const UiLayout& layout, const Board* ghostBoard) {
	Board board = controller.displayedBoard();
	drawCells(renderer, board, layout);
	if (!controller.isReviewing()) {
		drawLastMove(renderer, controller.state(), layout);
		drawSelection(renderer, controller, layout);
	}
	drawPieces(renderer, board, layout);
	drawGhostPieces(renderer, board, layout, ghostBoard);
}

void BoardRenderer::drawCells(SDL_Renderer* renderer, const Board& board, const UiLayout& layout) {
	CoordinateMapper mapper(layout);
	for (int y = 0; y < Board::kWidth; ++y) {
		for (int x = 0; x < Board::kWidth; ++x) {
			int px = 0;
			int py = 0;
			mapper.cellToPixelOrigin(x, y, px, py);
			SDL_Rect rect = { px + 2, py + 2, layout.cellSize - 4, layout.cellSize - 4 };
			if (board.at(x, y) == Board::Cell::Hole) {
				SDL_SetRenderDrawColor(renderer, 30, 34, 42, 255);
			} else {
				SDL_SetRenderDrawColor(renderer, 76, 86, 106, 255);
			}
			SDL_RenderFillRect(renderer, &rect);
		}
	}
}

void BoardRenderer::drawPieces(SDL_Renderer* renderer, const Board& board, const UiLayout& layout) {
	CoordinateMapper mapper(layout);
	for (int y = 0; y < Board::kWidth; ++y) {
		for (int x = 0; x < Board::kWidth; ++x) {
			Board::Cell cell = board.at(x, y);
			if (cell != Board::Cell::Player1 && cell != Board::Cell::Player2) {
				continue;
			}
			int px = 0;
			int py = 0;
			mapper.cellToPixelCenter(x, y, px, py);
			drawFilledCircle(renderer, px, py, layout.pieceRadius, pieceColor(cell));
		}
	}
}

void BoardRenderer::drawSelection(SDL_Renderer* renderer, const GameController& controller, const UiLayout& layout) {
	if (!controller.hasSelection()) {
		return;
	}
	CoordinateMapper mapper(layout);
	int px = 0;
	int py = 0;
	mapper.cellToPixelOrigin(controller.selectedX(), controller.selectedY(), px, py);
	SDL_Rect rect = { px, py, layout.cellSize, layout.cellSize };
	SDL_SetRenderDrawColor(renderer, 235, 203, 139, 255);
	SDL_RenderDrawRect(renderer, &rect);
	SDL_Rect inner = { px + 1, py + 1, layout.cellSize - 2, layout.cellSize - 2 };
	SDL_RenderDrawRect(renderer, &inner);

	SDL_Color targetColor = { 163, 190, 140, 255 };
	for (const Move& move : controller.selectedMoves()) {
		int tx = 0;
		int ty = 0;
		mapper.cellToPixelCenter(move.targetX(), move.targetY(), tx, ty);
		drawCircleOutline(renderer, tx, ty, layout.pieceRadius + 3, targetColor);
	}
}

void BoardRenderer::drawLastMove(SDL_Renderer* renderer, const GameState& state, const UiLayout& layout) {
	if (!state.hasLastMove) {
		return;
	}
	CoordinateMapper mapper(layout);
	int px = 0;
	int py = 0;
	mapper.cellToPixelOrigin(state.lastMove.targetX(), state.lastMove.targetY(), px, py);
	SDL_Rect rect = { px + 2, py + 2, layout.cellSize - 4, layout.cellSize - 4 };
	SDL_SetRenderDrawColor(renderer, 191, 97, 106, 255);
	SDL_RenderDrawRect(renderer, &rect);
}

// Translucent preview of the agent's current best continuation.
void BoardRenderer::drawGhostPieces(SDL_Renderer* renderer, const Board& board, const UiLayout& layout, const Board* ghostBoard) {
	if (!ghostBoard) {
		return;
	}
	CoordinateMapper mapper(layout);
	SDL_SetRenderDrawBlendMode(renderer, SDL_BLENDMODE_BLEND);
	for (int y = 0; y < Board::kWidth; ++y) {
		for (int x = 0; x < Board::kWidth; ++x) {
			Board::Cell ghost = ghostBoard->at(x, y);
			if (ghost == board.at(x, y)) {
				continue;
			}
			int px = 0;
			int py = 0;
			mapper.cellToPixelCenter(x, y, px, py);
			if (ghost == Board::Cell::Player1 || ghost == Board::Cell::Player2) {
				SDL_Color color = pieceColor(ghost);
				color.a = 90;
				drawFilledCircle(renderer, px, py, layout.pieceRadius, color);
			} else if (ghost == Board::Cell::Hole) {
				drawCircleOutline(renderer, px, py, layout.pieceRadius, SDL_Color{ 30, 34, 42, 160 });
			}
		}
	}
	SDL_SetRenderDrawBlendMode(renderer, SDL_BLENDMODE_NONE);
}

SDL_Color BoardRenderer::pieceColor(Board::Cell cell) const {
	if (cell == Board::Cell::Player1) {
		return SDL_Color{ 94, 129, 172, 255 };
	}
	return SDL_Color{ 236, 239, 244, 255 };
}

void BoardRenderer::drawFilledCircle(SDL_Renderer* renderer, int cx, int cy, int radius, SDL_Color color) {
	SDL_SetRenderDrawColor(renderer, color.r, color.g, color.b, color.a);
	for (int dy = -radius; dy <= radius; ++dy) {
		for (int dx = -radius; dx <= radius; ++dx) {
			if (dx * dx + dy * dy <= radius * radius) {
				SDL_RenderDrawPoint(renderer, cx + dx, cy + dy);
			}
		}
	}
}

void BoardRenderer::drawCircleOutline(SDL_Renderer* renderer, int cx, int cy, int radius, SDL_Color color) {
	SDL_SetRenderDrawColor(renderer, color.r, color.g, color.b, color.a);
	int x = radius;
	int y = 0;
	int err = 0;
	while (x >= y) {
		SDL_RenderDrawPoint(renderer, cx + x, cy + y);
		SDL_RenderDrawPoint(renderer, cx + y, cy + x);
		SDL_RenderDrawPoint(renderer, cx - y, cy + x);
		SDL_RenderDrawPoint(renderer, cx - x, cy + y);
		SDL_RenderDrawPoint(renderer, cx - x, cy - y);
		SDL_RenderDrawPoint(renderer, cx - y, cy - x);
		SDL_RenderDrawPoint(renderer, cx + y, cy - x);
		SDL_RenderDrawPoint(renderer, cx + x, cy - y);
		++y;
		err += 1 + 2 * y;
		if (2 * (err - x) + 1 > 0) {
			--x;
			err += 1 - 2 * x;
		}
	}
}
