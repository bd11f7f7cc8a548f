#include "RandomPlayer.hpp"

#include <cstddef>
#include <vector>

#include "Rules.hpp"

RandomPlayer::RandomPlayer() : rng(std::random_device{}()) {
}

RandomPlayer::RandomPlayer(unsigned int seed) : rng(seed) {
}

bool RandomPlayer::isHuman() const {
	return false;
}

std::string RandomPlayer::name() const {
	return "Random";
}

SearchResult RandomPlayer::calcBestMove(const Board& board, const Board*, Board::Cell player, double) {
	SearchResult result;
	if (!Rules::isPlayer(player)) {
		result.status = SearchResult::Status::InvalidPlayer;
		return result;
	}
	std::vector<Move> moves = Rules::legalMoves(board, player);
	if (moves.empty()) {
		result.status = SearchResult::Status::NoLegalMoves;
		return result;
	}
	std::uniform_int_distribution<std::size_t> pick(0, moves.size() - 1);
	result.status = SearchResult::Status::Found;
	result.move = moves[pick(rng)];
	return result;
}
