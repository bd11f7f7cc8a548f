#ifndef EVALUATION_HPP
#define EVALUATION_HPP

#include <vector>

#include "Board.hpp"
#include "Move.hpp"

struct EvalWeights {
	double piece = 100.0;
	double mobility = 10.0;
	double center = 10.0;
	// A loss scores -(win + depth) so the two sides share one scale.
	double win = 10000.0;
};

class Evaluation {
public:
	// Heuristic score of a non-terminal board from player's point of view.
	static double evaluate(const Board& board, Board::Cell player, const EvalWeights& weights);
	// Win/loss score for sideToMove if the board is decided, with a bonus for
	// remaining depth (faster wins, slower losses). Returns false otherwise.
	static bool terminalScore(const Board& board, Board::Cell sideToMove, int depthLeft,
		const EvalWeights& weights, double& outScore);
	static int orderingScore(const Board& board, const Move& move, Board::Cell player);
	static std::vector<Move> orderMoves(const Board& board, const std::vector<Move>& moves, Board::Cell player);
	static bool isCenter(int x, int y);
};

#endif
