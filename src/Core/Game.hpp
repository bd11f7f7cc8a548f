#ifndef GAME_HPP
#define GAME_HPP

#include <chrono>
#include <memory>
#include <random>
#include <string>

#include "AgentWorker.hpp"
#include "GameSettings.hpp"
#include "GameState.hpp"
#include "HumanPlayer.hpp"
#include "IPlayer.hpp"
#include "MoveHistory.hpp"
#include "Rules.hpp"

// Match driver: alternates turns, runs the clocks, validates and applies
// moves and decides the result.
class Game {
public:
	explicit Game(const GameSettings& settings);
	// Uses the given agents instead of building them from the settings' names.
	Game(const GameSettings& settings, std::unique_ptr<IPlayer> player1, std::unique_ptr<IPlayer> player2);
	~Game();

	void reset();
	void reset(const GameSettings& settings);
	const GameState& getState() const;
	const MoveHistory& getHistory() const;
	const GameSettings& getSettings() const;
	void tick();
	// Plays synchronously until the game ends or a human has to move.
	void runToEnd();
	bool submitHumanMove(const Move& move);
	bool isHumanTurn() const;
	bool isThinking() const;
	bool hasGhostBoard() const;
	Board getGhostBoard() const;
	std::string playerName(Board::Cell player) const;

private:
	GameSettings settings;
	GameState state;
	MoveHistory history;
	std::unique_ptr<IPlayer> player1;
	std::unique_ptr<IPlayer> player2;
	std::unique_ptr<AgentWorker> worker1;
	std::unique_ptr<AgentWorker> worker2;
	bool injectedPlayers;
	bool turnStarted;
	std::chrono::steady_clock::time_point turnStartTime;
	std::mt19937 rng;

	IPlayer* currentPlayer() const;
	IPlayer* playerFor(Board::Cell player) const;
	AgentWorker* workerFor(Board::Cell player) const;
	void createPlayers();
	void createWorkers();
	void discardPendingResults();
	Board::Cell chooseFirstPlayer();
	double elapsedThisTurnMs() const;
	bool startTurn();
	void handleAgentResult(const SearchResult& result, double elapsedMs);
	void applyMove(const Move& move, double elapsedMs, bool isAiMove);
	void finish(Board::Cell winner, GameState::FinishReason reason);
	void logMatchup() const;
	void logMovePlayed(const Move& move, Board::Cell mover, double elapsedMs, bool isAiMove) const;
	void logFinish() const;
};

#endif
