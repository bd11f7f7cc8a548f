#include "MoveHistory.hpp"

void MoveHistory::clear() {
	entries.clear();
}

void MoveHistory::push(const HistoryEntry& entry) {
	entries.push_back(entry);
}

size_t MoveHistory::size() const {
	return entries.size();
}

const std::vector<MoveHistory::HistoryEntry>& MoveHistory::all() const {
	return entries;
}

Board MoveHistory::boardAt(size_t ply, const Board& finalBoard) const {
	if (ply >= entries.size()) {
		return finalBoard;
	}
	return entries[ply].boardBefore;
}
