#ifndef SEARCHRESULT_HPP
#define SEARCHRESULT_HPP

#include "Move.hpp"

struct SearchResult {
	// Pending: no answer yet (a human who has not moved).
	enum class Status { Pending, Found, NoLegalMoves, InvalidPlayer };

	Status status = Status::Pending;
	Move move;
	double score = 0.0;
	int depthReached = 0;
	long long nodes = 0;
	double elapsedMs = 0.0;

	bool found() const {
		return status == Status::Found;
	}
};

#endif
