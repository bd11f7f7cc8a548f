#include "Evaluation.hpp"

#include <algorithm>
#include <utility>

#include "Rules.hpp"

namespace {
const int kCenterCells[5][2] = { {1, 2}, {2, 1}, {2, 2}, {2, 3}, {3, 2} };

constexpr int kDropBonus = 1000;
constexpr int kLossPenalty = -1000;
constexpr int kDisplaceBonus = 100;
constexpr int kQuietPiece = 10;
constexpr int kHoleMove = 0;
}  // namespace

bool Evaluation::isCenter(int x, int y) {
	for (int i = 0; i < 5; ++i) {
		if (kCenterCells[i][0] == x && kCenterCells[i][1] == y) {
			return true;
		}
	}
	return false;
}

double Evaluation::evaluate(const Board& board, Board::Cell player, const EvalWeights& weights) {
	Board::Cell opponent = Board::Cell::Empty;
	if (!Rules::opponentOf(player, opponent)) {
		return 0.0;
	}
	double score = 0.0;

	score += (board.count(player) - board.count(opponent)) * weights.piece;

	if (weights.mobility != 0.0) {
		int mine = static_cast<int>(Rules::legalMoves(board, player).size());
		int theirs = static_cast<int>(Rules::legalMoves(board, opponent).size());
		score += (mine - theirs) * weights.mobility;
	}

	if (weights.center != 0.0) {
		for (int i = 0; i < 5; ++i) {
			Board::Cell cell = board.at(kCenterCells[i][0], kCenterCells[i][1]);
			if (cell == player) {
				score += weights.center;
			} else if (cell == opponent) {
				score -= weights.center;
			}
		}
	}
	return score;
}

bool Evaluation::terminalScore(const Board& board, Board::Cell sideToMove, int depthLeft,
	const EvalWeights& weights, double& outScore) {
	Board::Cell lastMover = Board::Cell::Empty;
	if (!Rules::opponentOf(sideToMove, lastMover)) {
		return false;
	}
	Board::Cell winner = Rules::winnerAfterMove(board, lastMover);
	if (winner == Board::Cell::Empty) {
		return false;
	}
	if (winner == sideToMove) {
		outScore = weights.win + depthLeft;
	} else {
		outScore = -(weights.win + depthLeft);
	}
	return true;
}

int Evaluation::orderingScore(const Board& board, const Move& move, Board::Cell player) {
	Board::Cell opponent = Board::Cell::Empty;
	if (!Rules::opponentOf(player, opponent)) {
		return 0;
	}
	if (board.at(move.x, move.y) == Board::Cell::Hole) {
		return kHoleMove;
	}
	Board next = Rules::apply(board, move);
	int dropped = board.count(opponent) - next.count(opponent);
	int lost = board.count(player) - next.count(player);
	int score = dropped * kDropBonus + lost * kLossPenalty;
	if (dropped == 0 && lost == 0) {
		score += (board.at(move.targetX(), move.targetY()) == opponent) ? kDisplaceBonus : kQuietPiece;
	}
	return score;
}

std::vector<Move> Evaluation::orderMoves(const Board& board, const std::vector<Move>& moves, Board::Cell player) {
	std::vector<std::pair<int, Move>> scored;
	scored.reserve(moves.size());
	for (const Move& move : moves) {
		scored.emplace_back(orderingScore(board, move, player), move);
	}
	std::stable_sort(scored.begin(), scored.end(),
		[](const std::pair<int, Move>& a, const std::pair<int, Move>& b) {
			return a.first > b.first;
		});
	std::vector<Move> ordered;
	ordered.reserve(scored.size());
	for (const auto& entry : scored) {
		ordered.push_back(entry.second);
	}
	return ordered;
}
