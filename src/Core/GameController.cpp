#include "GameController.hpp"

#include "Rules.hpp"

GameController::GameController(const GameSettings& settings)
	: game(settings),
	  selected(false),
	  selX(-1),
	  selY(-1),
	  reviewing(false),
	  reviewIndex(0) {
}

void GameController::onCellClicked(int x, int y) {
	if (reviewing || !game.isHumanTurn() || !game.getState().isRunning()) {
		return;
	}
	const GameState& current = game.getState();
	Board::Cell cell = current.board.at(x, y);
	bool selectable = (cell == current.toMove || cell == Board::Cell::Hole);
	if (!selected) {
		if (selectable) {
			selected = true;
			selX = x;
			selY = y;
		}
		return;
	}
	int dx = x - selX;
	int dy = y - selY;
	if (dx * dx + dy * dy == 1) {
		game.submitHumanMove(Move(selX, selY, dx, dy));
		clearSelection();
		return;
	}
	if (selectable && !(x == selX && y == selY)) {
		selX = x;
		selY = y;
		return;
	}
	clearSelection();
}

void GameController::tick() {
	game.tick();
}

void GameController::newGame() {
	clearSelection();
	reviewing = false;
	reviewIndex = 0;
	game.reset();
}

const GameState& GameController::state() const {
	return game.getState();
}

const MoveHistory& GameController::history() const {
	return game.getHistory();
}

std::string GameController::playerName(Board::Cell player) const {
	return game.playerName(player);
}

bool GameController::hasGhostBoard() const {
	return !reviewing && game.hasGhostBoard();
}

Board GameController::ghostBoard() const {
	return game.getGhostBoard();
}

bool GameController::hasSelection() const {
	return selected;
}

int GameController::selectedX() const {
	return selX;
}

int GameController::selectedY() const {
	return selY;
}

std::vector<Move> GameController::selectedMoves() const {
	std::vector<Move> moves;
	if (!selected) {
		return moves;
	}
	const GameState& current = game.getState();
	for (const Move& move : Rules::legalMoves(current.board, current.toMove)) {
		if (move.x == selX && move.y == selY) {
			moves.push_back(move);
		}
	}
	return moves;
}

void GameController::reviewBack() {
	size_t total = game.getHistory().size();
	if (total == 0 || game.getState().isRunning()) {
		return;
	}
	if (!reviewing) {
		reviewing = true;
		reviewIndex = total;
		clearSelection();
	}
	if (reviewIndex > 0) {
		--reviewIndex;
	}
}

void GameController::reviewForward() {
	if (!reviewing) {
		return;
	}
	++reviewIndex;
	if (reviewIndex >= game.getHistory().size()) {
		reviewing = false;
		reviewIndex = 0;
	}
}

bool GameController::isReviewing() const {
	return reviewing;
}

size_t GameController::reviewPly() const {
	return reviewIndex;
}

Board GameController::displayedBoard() const {
	if (!reviewing) {
		return game.getState().board;
	}
	return game.getHistory().boardAt(reviewIndex, game.getState().board);
}

void GameController::clearSelection() {
	selected = false;
	selX = -1;
	selY = -1;
}
