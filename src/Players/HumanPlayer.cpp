#include "HumanPlayer.hpp"

HumanPlayer::HumanPlayer() : pending(false), pendingMove() {
}

bool HumanPlayer::isHuman() const {
	return true;
}

std::string HumanPlayer::name() const {
	return "Human";
}

// Humans answer through setPendingMove(); polling returns what is queued.
SearchResult HumanPlayer::calcBestMove(const Board&, const Board*, Board::Cell, double) {
	SearchResult result;
	if (pending) {
		result.status = SearchResult::Status::Found;
		result.move = takePendingMove();
	}
	return result;
}

void HumanPlayer::setPendingMove(const Move& move) {
	pendingMove = move;
	pending = true;
}

bool HumanPlayer::hasPendingMove() const {
	return pending;
}

Move HumanPlayer::takePendingMove() {
	pending = false;
	return pendingMove;
}
