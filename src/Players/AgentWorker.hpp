#ifndef AGENTWORKER_HPP
#define AGENTWORKER_HPP

#include <atomic>
#include <mutex>
#include <thread>

#include "Board.hpp"
#include "IPlayer.hpp"
#include "SearchResult.hpp"

// Runs one agent's search on a background thread. The driver polls
// hasResultReady() once per tick; a running search is never interrupted.
class AgentWorker {
public:
	explicit AgentWorker(IPlayer& player, int moveDelayMs);
	~AgentWorker();
	AgentWorker(const AgentWorker&) = delete;
	AgentWorker& operator=(const AgentWorker&) = delete;

	void startThinking(const Board& board, const Board* prevBoard, Board::Cell player, double timeBudgetMs);
	bool isThinking() const;
	bool hasResultReady() const;
	SearchResult takeResult();
	bool hasGhostBoard() const;
	Board ghostBoardCopy() const;
	// Blocks until the current search, if any, has finished.
	void wait();

private:
	IPlayer& agent;
	int delayMs;
	mutable std::mutex ghostMutex;
	mutable std::mutex resultMutex;
	std::thread worker;
	std::atomic<bool> thinking;
	std::atomic<bool> resultReady;
	std::atomic<bool> ghostActive;
	SearchResult readyResult;
	Board ghostBoard;
};

#endif
