#ifndef SEARCH_HPP
#define SEARCH_HPP

#include <functional>
#include <random>

#include "Board.hpp"
#include "Evaluation.hpp"
#include "SearchResult.hpp"

struct SearchSettings {
	int depth = 4;
	// Search depth 1, 2, ... up to depth, keeping the last completed result.
	bool iterativeDeepening = false;
	// Wall-clock limit for this call; <= 0 disables time checks.
	double timeLimitMs = 0.0;
	bool orderMoves = true;
	bool shuffleMoves = false;
	bool immediateWinExit = true;
	EvalWeights weights;
	std::mt19937* rng = nullptr;
	std::function<void(const Board&)> onGhostUpdate;
};

class Search {
public:
	static SearchResult findBestMove(const Board& board, const Board* prevBoard, Board::Cell player,
		const SearchSettings& settings);
	// Time slice a time-driven agent may spend on one move.
	static double allocateMoveTime(double remainingMs);
	// Small depth table used by agents without iterative deepening.
	static int depthForBudget(double remainingMs);
};

#endif
