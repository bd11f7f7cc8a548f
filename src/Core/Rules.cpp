#include "Rules.hpp"

const int Rules::kDirections[4][2] = { {-1, 0}, {1, 0}, {0, -1}, {0, 1} };
constexpr int Rules::kWinThreshold;

bool Rules::isPlayer(Board::Cell cell) {
	return cell == Board::Cell::Player1 || cell == Board::Cell::Player2;
}

bool Rules::opponentOf(Board::Cell player, Board::Cell& out) {
	if (player == Board::Cell::Player1) {
		out = Board::Cell::Player2;
		return true;
	}
	if (player == Board::Cell::Player2) {
		out = Board::Cell::Player1;
		return true;
	}
	return false;
}

std::vector<Move> Rules::legalMoves(const Board& board, Board::Cell player) {
	std::vector<Move> moves;
	if (!isPlayer(player)) {
		return moves;
	}
	for (int y = 0; y < Board::kWidth; ++y) {
		for (int x = 0; x < Board::kWidth; ++x) {
			Board::Cell cell = board.at(x, y);
			if (cell != player && cell != Board::Cell::Hole) {
				continue;
			}
			for (int i = 0; i < 4; ++i) {
				int dx = kDirections[i][0];
				int dy = kDirections[i][1];
				int nx = x + dx;
				int ny = y + dy;
				if (!board.inBounds(nx, ny)) {
					continue;
				}
				if (cell == Board::Cell::Hole && board.at(nx, ny) != Board::Cell::Empty) {
					continue;
				}
				moves.emplace_back(x, y, dx, dy);
			}
		}
	}
	return moves;
}

bool Rules::isLegal(const Board& board, const Move& move, Board::Cell player, std::string* reason) {
	if (!isPlayer(player)) {
		if (reason) {
			*reason = "not a player";
		}
		return false;
	}
	if (!move.isValid()) {
		if (reason) {
			*reason = board.inBounds(move.x, move.y) ? "not an axis direction" : "out of bounds";
		}
		return false;
	}
	if (!board.inBounds(move.targetX(), move.targetY())) {
		if (reason) {
			*reason = "target out of bounds";
		}
		return false;
	}
	Board::Cell origin = board.at(move.x, move.y);
	if (origin == Board::Cell::Hole) {
		if (board.at(move.targetX(), move.targetY()) != Board::Cell::Empty) {
			if (reason) {
				*reason = "hole blocked";
			}
			return false;
		}
		return true;
	}
	if (origin != player) {
		if (reason) {
			*reason = "not your piece";
		}
		return false;
	}
	return true;
}

Board Rules::apply(const Board& board, const Move& move) {
	Board next = board;
	Board::Cell mover = next.at(move.x, move.y);

	if (mover == Board::Cell::Hole) {
		next.set(move.x, move.y, Board::Cell::Empty);
		next.set(move.targetX(), move.targetY(), Board::Cell::Hole);
		return next;
	}
	if (!isPlayer(mover)) {
		return next;
	}

	// Walk the chain. carried is what gets written behind the current cell.
	int curX = move.x;
	int curY = move.y;
	Board::Cell carried = Board::Cell::Empty;
	while (true) {
		int nx = curX + move.dx;
		int ny = curY + move.dy;
		if (!next.inBounds(nx, ny) || next.at(nx, ny) == Board::Cell::Hole) {
			// The leading piece falls off or into the hole.
			next.set(curX, curY, carried);
			break;
		}
		Board::Cell ahead = next.at(nx, ny);
		if (ahead == Board::Cell::Empty) {
			next.set(nx, ny, next.at(curX, curY));
			next.set(curX, curY, carried);
			break;
		}
		Board::Cell current = next.at(curX, curY);
		next.set(curX, curY, carried);
		carried = current;
		curX = nx;
		curY = ny;
	}
	return next;
}

bool Rules::isWinner(const Board& board, Board::Cell player) {
	Board::Cell opponent = Board::Cell::Empty;
	if (!opponentOf(player, opponent)) {
		return false;
	}
	return board.count(opponent) <= kWinThreshold;
}

Board::Cell Rules::winnerAfterMove(const Board& board, Board::Cell mover) {
	Board::Cell opponent = Board::Cell::Empty;
	if (!opponentOf(mover, opponent)) {
		return Board::Cell::Empty;
	}
	if (isWinner(board, mover)) {
		return mover;
	}
	if (isWinner(board, opponent)) {
		return opponent;
	}
	return Board::Cell::Empty;
}

int Rules::pieceCount(const Board& board) {
	return board.count(Board::Cell::Player1) + board.count(Board::Cell::Player2);
}
