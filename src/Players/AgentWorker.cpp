#include "AgentWorker.hpp"

#include <chrono>

#include "Config.hpp"

AgentWorker::AgentWorker(IPlayer& player, int moveDelayMs)
	: agent(player),
	  delayMs(moveDelayMs),
	  thinking(false),
	  resultReady(false),
	  ghostActive(false),
	  readyResult(),
	  ghostBoard() {
	if (Config::kGhostMode) {
		agent.setGhostCallback([this](const Board& board) {
			std::lock_guard<std::mutex> lock(ghostMutex);
			ghostBoard = board;
			ghostActive.store(true);
		});
	}
}

AgentWorker::~AgentWorker() {
	wait();
	agent.setGhostCallback(IPlayer::GhostCallback());
}

void AgentWorker::startThinking(const Board& board, const Board* prevBoard, Board::Cell player, double timeBudgetMs) {
	if (thinking.load()) {
		return;
	}
	if (worker.joinable()) {
		worker.join();
	}
	thinking.store(true);
	resultReady.store(false);
	ghostActive.store(false);
	Board boardCopy = board;
	bool hasPrev = (prevBoard != nullptr);
	Board prevCopy = hasPrev ? *prevBoard : Board();
	worker = std::thread([this, boardCopy, hasPrev, prevCopy, player, timeBudgetMs]() {
		int delay = (Config::kAiMoveDelayMs > 0) ? Config::kAiMoveDelayMs : delayMs;
		if (delay > 0) {
			std::this_thread::sleep_for(std::chrono::milliseconds(delay));
		}
		SearchResult result = agent.calcBestMove(boardCopy, hasPrev ? &prevCopy : nullptr, player, timeBudgetMs);
		{
			std::lock_guard<std::mutex> lock(resultMutex);
			readyResult = result;
		}
		ghostActive.store(false);
		thinking.store(false);
		resultReady.store(true);
	});
}

bool AgentWorker::isThinking() const {
	return thinking.load();
}

bool AgentWorker::hasResultReady() const {
	return resultReady.load();
}

SearchResult AgentWorker::takeResult() {
	std::lock_guard<std::mutex> lock(resultMutex);
	resultReady.store(false);
	return readyResult;
}

bool AgentWorker::hasGhostBoard() const {
	return ghostActive.load();
}

Board AgentWorker::ghostBoardCopy() const {
	std::lock_guard<std::mutex> lock(ghostMutex);
	return ghostBoard;
}

void AgentWorker::wait() {
	if (worker.joinable()) {
		worker.join();
	}
}
