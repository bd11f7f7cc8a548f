#include "GameState.hpp"

GameState::GameState()
	: board(Board::createInitial()),
	  prevBoard(),
	  hasPrevBoard(false),
	  toMove(Board::Cell::Player1),
	  status(Status::Running),
	  reason(FinishReason::None),
	  hasLastMove(false),
	  lastMove(),
	  timeRemainingPlayer1(0.0),
	  timeRemainingPlayer2(0.0),
	  plyCount(0),
	  lastMessage() {
}

void GameState::reset(const GameSettings& settings, Board::Cell firstPlayer) {
	board = Board::createInitial();
	prevBoard = Board();
	hasPrevBoard = false;
	toMove = firstPlayer;
	status = Status::Running;
	reason = FinishReason::None;
	hasLastMove = false;
	lastMove = Move();
	timeRemainingPlayer1 = settings.timeLimitMs;
	timeRemainingPlayer2 = settings.timeLimitMs;
	plyCount = 0;
	lastMessage.clear();
}

double& GameState::remainingFor(Board::Cell player) {
	return (player == Board::Cell::Player2) ? timeRemainingPlayer2 : timeRemainingPlayer1;
}

double GameState::remainingFor(Board::Cell player) const {
	return (player == Board::Cell::Player2) ? timeRemainingPlayer2 : timeRemainingPlayer1;
}

Board::Cell GameState::winner() const {
	if (status == Status::Player1Won) {
		return Board::Cell::Player1;
	}
	if (status == Status::Player2Won) {
		return Board::Cell::Player2;
	}
	return Board::Cell::Empty;
}

bool GameState::isRunning() const {
	return status == Status::Running;
}

std::string GameState::reasonName(FinishReason reason) {
	switch (reason) {
	case FinishReason::WinCondition:
		return "win condition";
	case FinishReason::Timeout:
		return "timeout";
	case FinishReason::IllegalMove:
		return "illegal move";
	case FinishReason::NoLegalMoves:
		return "no legal moves";
	case FinishReason::PlyLimit:
		return "ply limit";
	case FinishReason::None:
		break;
	}
	return "none";
}
