#ifndef GAMECONTROLLER_HPP
#define GAMECONTROLLER_HPP

#include <cstddef>
#include <vector>

#include "Game.hpp"

// Turns board clicks into moves and keeps the review cursor for the viewer.
class GameController {
public:
	explicit GameController(const GameSettings& settings);

	// First click selects an own piece or the hole, second click on an
	// orthogonal neighbour submits the move.
	void onCellClicked(int x, int y);
	void tick();
	void newGame();
	const GameState& state() const;
	const MoveHistory& history() const;
	std::string playerName(Board::Cell player) const;
	bool hasGhostBoard() const;
	Board ghostBoard() const;

	bool hasSelection() const;
	int selectedX() const;
	int selectedY() const;
	std::vector<Move> selectedMoves() const;

	void reviewBack();
	void reviewForward();
	bool isReviewing() const;
	size_t reviewPly() const;
	Board displayedBoard() const;

private:
	Game game;
	bool selected;
	int selX;
	int selY;
	bool reviewing;
	size_t reviewIndex;

	void clearSelection();
};

#endif
