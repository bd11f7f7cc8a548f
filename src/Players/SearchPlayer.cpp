#include "SearchPlayer.hpp"

#include <utility>

#include "Config.hpp"

SearchPlayer::SearchPlayer(const std::string& playerNameIn)
	: rng(std::random_device{}()),
	  playerName(playerNameIn),
	  ghostCallback() {
}

bool SearchPlayer::isHuman() const {
	return false;
}

std::string SearchPlayer::name() const {
	return playerName;
}

SearchResult SearchPlayer::calcBestMove(const Board& board, const Board* prevBoard, Board::Cell player, double timeBudgetMs) {
	SearchSettings settings = makeSettings(timeBudgetMs);
	if (Config::kGhostMode) {
		settings.onGhostUpdate = ghostCallback;
	}
	return Search::findBestMove(board, prevBoard, player, settings);
}

void SearchPlayer::setGhostCallback(GhostCallback callback) {
	ghostCallback = std::move(callback);
}

// Fixed depth, material only, deterministic ordering.
AlphaBetaPlayer::AlphaBetaPlayer(int depthIn) : SearchPlayer("AlphaBeta"), depth(depthIn) {
}

SearchSettings AlphaBetaPlayer::makeSettings(double timeBudgetMs) {
	SearchSettings settings;
	settings.depth = depth;
	settings.timeLimitMs = Search::allocateMoveTime(timeBudgetMs);
	settings.immediateWinExit = false;
	settings.weights.mobility = 0.0;
	settings.weights.center = 0.0;
	return settings;
}

RandomizedNegamaxPlayer::RandomizedNegamaxPlayer() : SearchPlayer("Negamax") {
}

RandomizedNegamaxPlayer::RandomizedNegamaxPlayer(unsigned int seed) : SearchPlayer("Negamax") {
	rng.seed(seed);
}

// Openings get monotonous without the shuffle.
SearchSettings RandomizedNegamaxPlayer::makeSettings(double timeBudgetMs) {
	SearchSettings settings;
	settings.depth = Search::depthForBudget(timeBudgetMs);
	settings.timeLimitMs = Search::allocateMoveTime(timeBudgetMs);
	settings.orderMoves = false;
	settings.shuffleMoves = true;
	settings.immediateWinExit = false;
	settings.rng = &rng;
	return settings;
}

IterativeDeepeningPlayer::IterativeDeepeningPlayer() : SearchPlayer("Iterative") {
}

SearchSettings IterativeDeepeningPlayer::makeSettings(double timeBudgetMs) {
	SearchSettings settings;
	settings.depth = Config::kAiMaxDepth;
	settings.iterativeDeepening = true;
	settings.timeLimitMs = Search::allocateMoveTime(timeBudgetMs);
	settings.weights.mobility = 3.0;
	return settings;
}
