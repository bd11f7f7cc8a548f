#ifndef MOVEHISTORY_HPP
#define MOVEHISTORY_HPP

#include <cstddef>
#include <vector>
#include "Board.hpp"
#include "Move.hpp"

class MoveHistory {
public:
	struct HistoryEntry {
		Board boardBefore;
		Move move;
		Board::Cell player;
		double elapsedMs;
	};

	void clear();
	void push(const HistoryEntry& entry);
	size_t size() const;
	const std::vector<HistoryEntry>& all() const;
	// Board before ply i; i == size() yields finalBoard.
	Board boardAt(size_t ply, const Board& finalBoard) const;

private:
	std::vector<HistoryEntry> entries;
};

#endif
