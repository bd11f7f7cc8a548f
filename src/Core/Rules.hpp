#ifndef RULES_HPP
#define RULES_HPP

#include <string>
#include <vector>
#include "Board.hpp"
#include "Move.hpp"

class Rules {
public:
	// Direction order used by move generation: left, right, up, down.
	static const int kDirections[4][2];
	// A player wins once the opponent is down to this many pieces.
	static constexpr int kWinThreshold = 3;

	static bool isPlayer(Board::Cell cell);
	// Fails (returns false, leaves out untouched) for Empty and Hole.
	static bool opponentOf(Board::Cell player, Board::Cell& out);

	static std::vector<Move> legalMoves(const Board& board, Board::Cell player);
	static bool isLegal(const Board& board, const Move& move, Board::Cell player, std::string* reason = nullptr);

	// No validation: the move must come from legalMoves() for this board.
	static Board apply(const Board& board, const Move& move);

	static bool isWinner(const Board& board, Board::Cell player);
	// Winner after mover played, mover checked first. Empty when nobody won.
	static Board::Cell winnerAfterMove(const Board& board, Board::Cell mover);
	static int pieceCount(const Board& board);
};

#endif
