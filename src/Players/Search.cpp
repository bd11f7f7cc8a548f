#include "Search.hpp"

#include <algorithm>
#include <chrono>
#include <iostream>
#include <limits>
#include <vector>

#include "Config.hpp"
#include "Notation.hpp"
#include "Rules.hpp"

namespace {
constexpr double kInfinity = std::numeric_limits<double>::infinity();

struct SearchContext {
	const SearchSettings& settings;
	std::chrono::steady_clock::time_point start;
	long long nodes;
	bool stopped;
	bool clockEnabled;
};

struct NodeResult {
	double score;
	Move move;
	bool hasMove;
};

double elapsedMs(const SearchContext& ctx) {
	return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - ctx.start).count();
}

bool pollClock(SearchContext& ctx) {
	if (ctx.stopped) {
		return true;
	}
	if (!ctx.clockEnabled || ctx.settings.timeLimitMs <= 0.0) {
		return false;
	}
	if (elapsedMs(ctx) >= ctx.settings.timeLimitMs) {
		ctx.stopped = true;
	}
	return ctx.stopped;
}

// Reads the clock only every kTimeCheckInterval nodes.
bool timedOut(SearchContext& ctx) {
	if (ctx.stopped) {
		return true;
	}
	if (ctx.nodes % Config::kTimeCheckInterval != 0) {
		return false;
	}
	return pollClock(ctx);
}

std::vector<Move> candidateMoves(const Board& board, Board::Cell player, SearchContext& ctx, const Move* pvMove) {
	std::vector<Move> moves = Rules::legalMoves(board, player);
	if (ctx.settings.shuffleMoves && ctx.settings.rng) {
		std::shuffle(moves.begin(), moves.end(), *ctx.settings.rng);
	}
	if (ctx.settings.orderMoves) {
		moves = Evaluation::orderMoves(board, moves, player);
	}
	if (pvMove) {
		auto it = std::find(moves.begin(), moves.end(), *pvMove);
		if (it != moves.end()) {
			std::rotate(moves.begin(), it, it + 1);
		}
	}
	return moves;
}

NodeResult negamax(const Board& board,
	const Board* prevBoard,
	Board::Cell player,
	int depth,
	double alpha,
	double beta,
	SearchContext& ctx) {
	++ctx.nodes;
	const EvalWeights& weights = ctx.settings.weights;
	double terminal = 0.0;
	if (Evaluation::terminalScore(board, player, depth, weights, terminal)) {
		return NodeResult{terminal, Move(), false};
	}
	if (depth <= 0 || timedOut(ctx)) {
		return NodeResult{Evaluation::evaluate(board, player, weights), Move(), false};
	}
	Board::Cell opponent = Board::Cell::Empty;
	Rules::opponentOf(player, opponent);

	std::vector<Move> moves = candidateMoves(board, player, ctx, nullptr);
	if (moves.empty()) {
		return NodeResult{-(weights.win + depth), Move(), false};
	}

	NodeResult best{-kInfinity, Move(), false};
	for (const Move& move : moves) {
		Board next = Rules::apply(board, move);
		if (prevBoard && next == *prevBoard) {
			continue;
		}
		NodeResult child = negamax(next, &board, opponent, depth - 1, -beta, -alpha, ctx);
		double score = -child.score;
		if (!best.hasMove || score > best.score) {
			best = NodeResult{score, move, true};
		}
		alpha = std::max(alpha, score);
		if (alpha >= beta || timedOut(ctx)) {
			break;
		}
	}
	if (!best.hasMove) {
		// Every move recreates the previous position.
		return NodeResult{Evaluation::evaluate(board, player, weights), Move(), false};
	}
	return best;
}

NodeResult searchRoot(const Board& board,
	const Board* prevBoard,
	Board::Cell player,
	int depth,
	const Move* pvMove,
	SearchContext& ctx) {
	++ctx.nodes;
	Board::Cell opponent = Board::Cell::Empty;
	Rules::opponentOf(player, opponent);
	std::vector<Move> moves = candidateMoves(board, player, ctx, pvMove);
	double alpha = -kInfinity;
	const double beta = kInfinity;
	NodeResult best{-kInfinity, Move(), false};
	for (const Move& move : moves) {
		Board next = Rules::apply(board, move);
		if (prevBoard && next == *prevBoard) {
			continue;
		}
		NodeResult child = negamax(next, &board, opponent, depth - 1, -beta, -alpha, ctx);
		double score = -child.score;
		if (!best.hasMove || score > best.score) {
			best = NodeResult{score, move, true};
		}
		alpha = std::max(alpha, score);
		if (timedOut(ctx)) {
			break;
		}
	}
	return best;
}

void logDepth(int depth, const NodeResult& result) {
	std::cout << "Best move with depth " << depth << " is " << Notation::moveToString(result.move)
	          << " with " << result.score << " score" << std::endl;
}
}  // namespace

SearchResult Search::findBestMove(const Board& board, const Board* prevBoard, Board::Cell player,
	const SearchSettings& settings) {
	SearchContext ctx{settings, std::chrono::steady_clock::now(), 0, false, true};
	SearchResult result;

	Board::Cell opponent = Board::Cell::Empty;
	if (!Rules::opponentOf(player, opponent)) {
		result.status = SearchResult::Status::InvalidPlayer;
		return result;
	}
	std::vector<Move> legal = Rules::legalMoves(board, player);
	if (legal.empty()) {
		result.status = SearchResult::Status::NoLegalMoves;
		return result;
	}
	result.status = SearchResult::Status::Found;
	result.move = legal.front();
	if (prevBoard) {
		for (const Move& move : legal) {
			if (Rules::apply(board, move) != *prevBoard) {
				result.move = move;
				break;
			}
		}
	}

	if (settings.immediateWinExit) {
		for (const Move& move : legal) {
			if (Rules::winnerAfterMove(Rules::apply(board, move), player) == player) {
				result.move = move;
				result.score = settings.weights.win;
				result.depthReached = 1;
				result.nodes = static_cast<long long>(legal.size());
				result.elapsedMs = elapsedMs(ctx);
				return result;
			}
		}
	}

	int maxDepth = std::max(1, settings.depth);
	if (settings.iterativeDeepening) {
		maxDepth = std::min(maxDepth, Config::kAiMaxDepth);
		Move pvMove;
		bool hasPv = false;
		for (int depth = 1; depth <= maxDepth; ++depth) {
			// Depth 1 always completes so there is a result to fall back on.
			ctx.clockEnabled = depth > 1;
			NodeResult iteration = searchRoot(board, prevBoard, player, depth, hasPv ? &pvMove : nullptr, ctx);
			if (ctx.stopped) {
				break;
			}
			if (iteration.hasMove) {
				result.move = iteration.move;
				result.score = iteration.score;
				result.depthReached = depth;
				pvMove = iteration.move;
				hasPv = true;
				if (Config::kLogSearchDepth) {
					logDepth(depth, iteration);
				}
				if (settings.onGhostUpdate) {
					settings.onGhostUpdate(Rules::apply(board, iteration.move));
				}
				if (iteration.score >= settings.weights.win) {
					break;
				}
			}
			ctx.clockEnabled = true;
			if (pollClock(ctx)) {
				break;
			}
		}
	} else {
		NodeResult root = searchRoot(board, prevBoard, player, maxDepth, nullptr, ctx);
		if (root.hasMove) {
			result.move = root.move;
			result.score = root.score;
			result.depthReached = maxDepth;
			if (Config::kLogSearchDepth) {
				logDepth(maxDepth, root);
			}
			if (settings.onGhostUpdate) {
				settings.onGhostUpdate(Rules::apply(board, root.move));
			}
		}
	}
	result.nodes = ctx.nodes;
	result.elapsedMs = elapsedMs(ctx);
	return result;
}

double Search::allocateMoveTime(double remainingMs) {
	double slice = remainingMs * Config::kMoveTimeFraction;
	slice = std::max(slice, Config::kMinMoveTimeMs);
	slice = std::min(slice, Config::kMaxMoveTimeMs);
	slice = std::min(slice, remainingMs - Config::kTimeSafetyMarginMs);
	// A zero limit would disable the clock entirely.
	return std::max(slice, 1.0);
}

int Search::depthForBudget(double remainingMs) {
	if (remainingMs < 1000.0) {
		return 3;
	}
	if (remainingMs < 3000.0) {
		return 4;
	}
	return 5;
}
