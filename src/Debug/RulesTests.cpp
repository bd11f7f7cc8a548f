#include "DebugTests.hpp"

#include <cassert>
#include <random>
#include <string>
#include <vector>

#include "Rules.hpp"

namespace {
void testInitialLayout() {
	Board board = Board::createInitial();
	for (int x = 0; x < Board::kWidth; ++x) {
		assert(board.at(x, 0) == Board::Cell::Player1);
		assert(board.at(x, 4) == Board::Cell::Player2);
	}
	assert(board.at(2, 2) == Board::Cell::Hole);
	assert(board.count(Board::Cell::Player1) == 5);
	assert(board.count(Board::Cell::Player2) == 5);
	assert(board.count(Board::Cell::Hole) == 1);
	assert(board.count(Board::Cell::Empty) == 14);
	assert(!Rules::isWinner(board, Board::Cell::Player1));
	assert(!Rules::isWinner(board, Board::Cell::Player2));
	// 13 piece moves along the back rank plus 4 hole slides.
	assert(Rules::legalMoves(board, Board::Cell::Player1).size() == 17);
	assert(Rules::legalMoves(board, Board::Cell::Player2).size() == 17);
}

void testOpponentOf() {
	Board::Cell out = Board::Cell::Hole;
	assert(Rules::opponentOf(Board::Cell::Player1, out) && out == Board::Cell::Player2);
	assert(Rules::opponentOf(Board::Cell::Player2, out) && out == Board::Cell::Player1);
	out = Board::Cell::Player1;
	assert(!Rules::opponentOf(Board::Cell::Empty, out));
	assert(!Rules::opponentOf(Board::Cell::Hole, out));
	assert(out == Board::Cell::Player1);
	assert(Rules::legalMoves(Board::createInitial(), Board::Cell::Hole).empty());
}

void testHoleMoves() {
	Board board = boardFromText(
		". . . . .\n"
		". . 1 . .\n"
		". . O . .\n"
		". . . . .\n"
		". . . . .");
	std::vector<Move> holeMoves;
	for (const Move& move : Rules::legalMoves(board, Board::Cell::Player1)) {
		if (move.x == 2 && move.y == 2) {
			holeMoves.push_back(move);
		}
	}
	assert(holeMoves.size() == 3);
	assert(holeMoves[0] == Move(2, 2, -1, 0));
	assert(holeMoves[1] == Move(2, 2, 1, 0));
	assert(holeMoves[2] == Move(2, 2, 0, 1));

	Board moved = Rules::apply(board, Move(2, 2, 0, 1));
	assert(moved.at(2, 2) == Board::Cell::Empty);
	assert(moved.at(2, 3) == Board::Cell::Hole);
	assert(moved.count(Board::Cell::Hole) == 1);
}

void testPushChain() {
	Board board = boardFromText(
		"1 2 1 . .\n"
		". . . . .\n"
		". . O . .\n"
		". . . . .\n"
		". . . . .");
	Board snapshot = board;
	Board next = Rules::apply(board, Move(0, 0, 1, 0));
	assert(next.at(0, 0) == Board::Cell::Empty);
	assert(next.at(1, 0) == Board::Cell::Player1);
	assert(next.at(2, 0) == Board::Cell::Player2);
	assert(next.at(3, 0) == Board::Cell::Player1);
	assert(next.at(4, 0) == Board::Cell::Empty);
	assert(board == snapshot);
}

void testEdgeFallOff() {
	Board board = boardFromText(
		". . . 1 2\n"
		". . . . .\n"
		". . O . .\n"
		". . . . .\n"
		". . . . .");
	Board next = Rules::apply(board, Move(3, 0, 1, 0));
	assert(next.at(3, 0) == Board::Cell::Empty);
	assert(next.at(4, 0) == Board::Cell::Player1);
	assert(next.count(Board::Cell::Player2) == 0);
}

void testHoleAbsorption() {
	Board board = boardFromText(
		". . . . .\n"
		". . . . .\n"
		"1 2 O . .\n"
		". . . . .\n"
		". . . . .");
	Board next = Rules::apply(board, Move(0, 2, 1, 0));
	assert(next.at(0, 2) == Board::Cell::Empty);
	assert(next.at(1, 2) == Board::Cell::Player1);
	assert(next.at(2, 2) == Board::Cell::Hole);
	assert(next.count(Board::Cell::Player2) == 0);

	Board direct = Rules::apply(boardFromText(
		". . . . .\n"
		". . . . .\n"
		". 1 O 2 .\n"
		". . . . .\n"
		". . . . ."), Move(1, 2, 1, 0));
	assert(direct.at(1, 2) == Board::Cell::Empty);
	assert(direct.at(2, 2) == Board::Cell::Hole);
	assert(direct.at(3, 2) == Board::Cell::Player2);
	assert(direct.count(Board::Cell::Player1) == 0);
}

void testLegality() {
	Board board = Board::createInitial();
	std::string reason;
	assert(Rules::isLegal(board, Move(0, 0, 0, 1), Board::Cell::Player1, &reason));
	assert(!Rules::isLegal(board, Move(0, 0, 0, 1), Board::Cell::Hole, &reason));
	assert(reason == "not a player");
	assert(!Rules::isLegal(board, Move(0, 0, 1, 1), Board::Cell::Player1, &reason));
	assert(reason == "not an axis direction");
	assert(!Rules::isLegal(board, Move(7, 0, 1, 0), Board::Cell::Player1, &reason));
	assert(reason == "out of bounds");
	assert(!Rules::isLegal(board, Move(0, 0, 0, -1), Board::Cell::Player1, &reason));
	assert(reason == "target out of bounds");
	assert(!Rules::isLegal(board, Move(0, 4, 0, -1), Board::Cell::Player1, &reason));
	assert(reason == "not your piece");
	assert(!Rules::isLegal(board, Move(1, 1, 0, 1), Board::Cell::Player1, &reason));
	assert(reason == "not your piece");

	Board blocked = board;
	blocked.set(2, 1, Board::Cell::Player2);
	assert(!Rules::isLegal(blocked, Move(2, 2, 0, -1), Board::Cell::Player1, &reason));
	assert(reason == "hole blocked");
	assert(Rules::isLegal(blocked, Move(2, 2, 0, 1), Board::Cell::Player2));

	for (const Move& move : Rules::legalMoves(board, Board::Cell::Player2)) {
		assert(Rules::isLegal(board, move, Board::Cell::Player2));
	}
}

void testWinner() {
	Board board = boardFromText(
		"1 1 . 1 .\n"
		". . . . .\n"
		". . O . .\n"
		". . . . .\n"
		"2 2 2 2 2");
	assert(Rules::isWinner(board, Board::Cell::Player2));
	assert(!Rules::isWinner(board, Board::Cell::Player1));
	assert(Rules::winnerAfterMove(board, Board::Cell::Player1) == Board::Cell::Player2);
	assert(!Rules::isWinner(board, Board::Cell::Empty));

	// Both sides at the threshold: the player who just moved is credited.
	Board both = boardFromText(
		"1 1 1 . .\n"
		". . . . .\n"
		". . O . .\n"
		". . . . .\n"
		"2 2 2 . .");
	assert(Rules::winnerAfterMove(both, Board::Cell::Player1) == Board::Cell::Player1);
	assert(Rules::winnerAfterMove(both, Board::Cell::Player2) == Board::Cell::Player2);
	assert(Rules::winnerAfterMove(Board::createInitial(), Board::Cell::Player1) == Board::Cell::Empty);
}

void testRandomPlayoutInvariants() {
	std::mt19937 rng(1234);
	for (int game = 0; game < 20; ++game) {
		Board board = Board::createInitial();
		Board::Cell player = Board::Cell::Player1;
		for (int ply = 0; ply < 120; ++ply) {
			std::vector<Move> moves = Rules::legalMoves(board, player);
			if (moves.empty()) {
				break;
			}
			std::uniform_int_distribution<int> pick(0, static_cast<int>(moves.size()) - 1);
			Board snapshot = board;
			Board next = Rules::apply(board, moves[pick(rng)]);
			assert(board == snapshot);
			assert(next.count(Board::Cell::Hole) == 1);
			assert(Rules::pieceCount(next) <= Rules::pieceCount(board));
			assert(next.count(Board::Cell::Player1) <= board.count(Board::Cell::Player1));
			assert(next.count(Board::Cell::Player2) <= board.count(Board::Cell::Player2));
			board = next;
			if (Rules::winnerAfterMove(board, player) != Board::Cell::Empty) {
				break;
			}
			Rules::opponentOf(player, player);
		}
	}
}
}  // namespace

void runRulesTests() {
	testInitialLayout();
	testOpponentOf();
	testHoleMoves();
	testPushChain();
	testEdgeFallOff();
	testHoleAbsorption();
	testLegality();
	testWinner();
	testRandomPlayoutInvariants();
}
