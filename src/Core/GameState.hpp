#ifndef GAMESTATE_HPP
#define GAMESTATE_HPP

#include <string>
#include "Board.hpp"
#include "GameSettings.hpp"
#include "Move.hpp"

class GameState {
public:
	enum class Status { Running, Player1Won, Player2Won, Draw };
	enum class FinishReason { None, WinCondition, Timeout, IllegalMove, NoLegalMoves, PlyLimit };

	Board board;
	Board prevBoard;
	bool hasPrevBoard;
	Board::Cell toMove;
	Status status;
	FinishReason reason;
	bool hasLastMove;
	Move lastMove;
	double timeRemainingPlayer1;
	double timeRemainingPlayer2;
	int plyCount;
	std::string lastMessage;

	GameState();
	void reset(const GameSettings& settings, Board::Cell firstPlayer);
	double& remainingFor(Board::Cell player);
	double remainingFor(Board::Cell player) const;
	// Empty while running or after a draw.
	Board::Cell winner() const;
	bool isRunning() const;
	static std::string reasonName(FinishReason reason);
};

#endif
