#include "Game.hpp"

#include <algorithm>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <thread>
#include <vector>

#include "Notation.hpp"
#include "PlayerFactory.hpp"

Game::Game(const GameSettings& settingsIn)
	: settings(settingsIn),
	  state(),
	  history(),
	  player1(),
	  player2(),
	  worker1(),
	  worker2(),
	  injectedPlayers(false),
	  turnStarted(false),
	  rng(std::random_device{}()) {
	reset(settingsIn);
}

Game::Game(const GameSettings& settingsIn, std::unique_ptr<IPlayer> player1In, std::unique_ptr<IPlayer> player2In)
	: settings(settingsIn),
	  state(),
	  history(),
	  player1(std::move(player1In)),
	  player2(std::move(player2In)),
	  worker1(),
	  worker2(),
	  injectedPlayers(true),
	  turnStarted(false),
	  rng(std::random_device{}()) {
	reset(settingsIn);
}

Game::~Game() {
	worker1.reset();
	worker2.reset();
}

void Game::reset() {
	reset(settings);
}

void Game::reset(const GameSettings& settingsIn) {
	discardPendingResults();
	worker1.reset();
	worker2.reset();
	settings = settingsIn;
	if (!injectedPlayers) {
		createPlayers();
	}
	createWorkers();
	state.reset(settings, chooseFirstPlayer());
	history.clear();
	turnStarted = false;
	turnStartTime = std::chrono::steady_clock::now();
	logMatchup();
}

const GameState& Game::getState() const {
	return state;
}

const MoveHistory& Game::getHistory() const {
	return history;
}

const GameSettings& Game::getSettings() const {
	return settings;
}

void Game::tick() {
	if (!state.isRunning()) {
		return;
	}
	IPlayer* player = currentPlayer();
	if (!player) {
		return;
	}
	if (!turnStarted && !startTurn()) {
		return;
	}
	if (player->isHuman()) {
		HumanPlayer* human = dynamic_cast<HumanPlayer*>(player);
		if (!human || !human->hasPendingMove()) {
			return;
		}
		Move move = human->takePendingMove();
		std::string reason;
		if (!Rules::isLegal(state.board, move, state.toMove, &reason)) {
			state.lastMessage = "Illegal move: " + reason;
			if (settings.logMoves) {
				std::cout << state.lastMessage << std::endl;
			}
			return;
		}
		applyMove(move, elapsedThisTurnMs(), false);
		return;
	}

	AgentWorker* worker = workerFor(state.toMove);
	if (!worker) {
		return;
	}
	double elapsed = elapsedThisTurnMs();
	if (worker->hasResultReady()) {
		handleAgentResult(worker->takeResult(), elapsed);
		return;
	}
	if (state.remainingFor(state.toMove) - elapsed < 0.0) {
		state.remainingFor(state.toMove) -= elapsed;
		Board::Cell opponent = Board::Cell::Empty;
		Rules::opponentOf(state.toMove, opponent);
		finish(opponent, GameState::FinishReason::Timeout);
	}
}

void Game::runToEnd() {
	while (state.isRunning() && !isHumanTurn()) {
		tick();
		if (settings.asyncAgents && isThinking()) {
			std::this_thread::sleep_for(std::chrono::milliseconds(1));
		}
	}
}

bool Game::submitHumanMove(const Move& move) {
	if (!state.isRunning()) {
		return false;
	}
	HumanPlayer* human = dynamic_cast<HumanPlayer*>(currentPlayer());
	if (!human) {
		return false;
	}
	human->setPendingMove(move);
	return true;
}

bool Game::isHumanTurn() const {
	IPlayer* player = currentPlayer();
	return player && player->isHuman();
}

bool Game::isThinking() const {
	AgentWorker* worker = workerFor(state.toMove);
	return worker && worker->isThinking();
}

bool Game::hasGhostBoard() const {
	AgentWorker* worker = workerFor(state.toMove);
	return state.isRunning() && worker && worker->hasGhostBoard();
}

Board Game::getGhostBoard() const {
	AgentWorker* worker = workerFor(state.toMove);
	return worker ? worker->ghostBoardCopy() : state.board;
}

std::string Game::playerName(Board::Cell player) const {
	IPlayer* agent = playerFor(player);
	return agent ? agent->name() : "-";
}

IPlayer* Game::currentPlayer() const {
	return playerFor(state.toMove);
}

IPlayer* Game::playerFor(Board::Cell player) const {
	if (player == Board::Cell::Player1) {
		return player1.get();
	}
	if (player == Board::Cell::Player2) {
		return player2.get();
	}
	return nullptr;
}

AgentWorker* Game::workerFor(Board::Cell player) const {
	if (player == Board::Cell::Player1) {
		return worker1.get();
	}
	if (player == Board::Cell::Player2) {
		return worker2.get();
	}
	return nullptr;
}

void Game::createPlayers() {
	player1 = PlayerFactory::create(settings.player1Agent);
	if (!player1) {
		std::cerr << "Unknown agent '" << settings.player1Agent << "', using " << PlayerFactory::kDefaultAgent << std::endl;
		player1 = PlayerFactory::create(PlayerFactory::kDefaultAgent);
	}
	player2 = PlayerFactory::create(settings.player2Agent);
	if (!player2) {
		std::cerr << "Unknown agent '" << settings.player2Agent << "', using " << PlayerFactory::kDefaultAgent << std::endl;
		player2 = PlayerFactory::create(PlayerFactory::kDefaultAgent);
	}
}

void Game::createWorkers() {
	if (!settings.asyncAgents) {
		return;
	}
	if (player1 && !player1->isHuman()) {
		worker1 = std::make_unique<AgentWorker>(*player1, settings.aiMoveDelayMs);
	}
	if (player2 && !player2->isHuman()) {
		worker2 = std::make_unique<AgentWorker>(*player2, settings.aiMoveDelayMs);
	}
}

void Game::discardPendingResults() {
	AgentWorker* workers[2] = { worker1.get(), worker2.get() };
	for (AgentWorker* worker : workers) {
		if (!worker) {
			continue;
		}
		worker->wait();
		if (worker->hasResultReady()) {
			worker->takeResult();
		}
	}
}

Board::Cell Game::chooseFirstPlayer() {
	switch (settings.firstPlayer) {
	case GameSettings::FirstPlayer::Player2:
		return Board::Cell::Player2;
	case GameSettings::FirstPlayer::Random: {
		std::uniform_int_distribution<int> coin(0, 1);
		return coin(rng) == 0 ? Board::Cell::Player1 : Board::Cell::Player2;
	}
	case GameSettings::FirstPlayer::Player1:
		break;
	}
	return Board::Cell::Player1;
}

double Game::elapsedThisTurnMs() const {
	return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - turnStartTime).count();
}

// Returns false when the turn ended the game or was resolved synchronously.
bool Game::startTurn() {
	turnStarted = true;
	turnStartTime = std::chrono::steady_clock::now();
	Board::Cell opponent = Board::Cell::Empty;
	Rules::opponentOf(state.toMove, opponent);
	if (Rules::legalMoves(state.board, state.toMove).empty()) {
		finish(opponent, GameState::FinishReason::NoLegalMoves);
		return false;
	}
	IPlayer* player = currentPlayer();
	if (player->isHuman()) {
		return true;
	}
	const Board* prev = state.hasPrevBoard ? &state.prevBoard : nullptr;
	double budget = state.remainingFor(state.toMove);
	AgentWorker* worker = workerFor(state.toMove);
	if (worker) {
		worker->startThinking(state.board, prev, state.toMove, budget);
		return true;
	}
	SearchResult result = player->calcBestMove(state.board, prev, state.toMove, budget);
	handleAgentResult(result, elapsedThisTurnMs());
	return false;
}

void Game::handleAgentResult(const SearchResult& result, double elapsedMs) {
	Board::Cell opponent = Board::Cell::Empty;
	Rules::opponentOf(state.toMove, opponent);
	state.remainingFor(state.toMove) -= elapsedMs;
	if (state.remainingFor(state.toMove) < 0.0) {
		finish(opponent, GameState::FinishReason::Timeout);
		return;
	}
	if (result.status == SearchResult::Status::NoLegalMoves) {
		finish(opponent, GameState::FinishReason::NoLegalMoves);
		return;
	}
	std::vector<Move> legal = Rules::legalMoves(state.board, state.toMove);
	bool listed = result.found() && std::find(legal.begin(), legal.end(), result.move) != legal.end();
	if (!listed) {
		state.lastMessage = playerName(state.toMove) + " returned illegal move " + Notation::moveToString(result.move);
		if (settings.logMoves) {
			std::cout << "\033[31m" << state.lastMessage << "\033[0m" << std::endl;
		}
		finish(opponent, GameState::FinishReason::IllegalMove);
		return;
	}
	applyMove(result.move, elapsedMs, true);
}

void Game::applyMove(const Move& move, double elapsedMs, bool isAiMove) {
	Board::Cell mover = state.toMove;
	MoveHistory::HistoryEntry entry;
	entry.boardBefore = state.board;
	entry.move = move;
	entry.player = mover;
	entry.elapsedMs = elapsedMs;
	history.push(entry);

	state.prevBoard = state.board;
	state.hasPrevBoard = true;
	state.board = Rules::apply(state.board, move);
	state.lastMove = move;
	state.hasLastMove = true;
	state.lastMessage.clear();
	++state.plyCount;
	logMovePlayed(move, mover, elapsedMs, isAiMove);

	Board::Cell winner = Rules::winnerAfterMove(state.board, mover);
	if (winner != Board::Cell::Empty) {
		finish(winner, GameState::FinishReason::WinCondition);
		return;
	}
	if (settings.maxPlies > 0 && state.plyCount >= settings.maxPlies) {
		finish(Board::Cell::Empty, GameState::FinishReason::PlyLimit);
		return;
	}
	Rules::opponentOf(mover, state.toMove);
	turnStarted = false;
}

void Game::finish(Board::Cell winner, GameState::FinishReason reason) {
	if (winner == Board::Cell::Player1) {
		state.status = GameState::Status::Player1Won;
	} else if (winner == Board::Cell::Player2) {
		state.status = GameState::Status::Player2Won;
	} else {
		state.status = GameState::Status::Draw;
	}
	state.reason = reason;
	turnStarted = false;
	logFinish();
}

void Game::logMatchup() const {
	if (!settings.logMoves) {
		return;
	}
	std::cout << "\033[90mPlayer1 (" << playerName(Board::Cell::Player1) << ") vs Player2 ("
	          << playerName(Board::Cell::Player2) << "), " << Notation::cellName(state.toMove) << " starts\033[0m" << std::endl;
}

void Game::logMovePlayed(const Move& move, Board::Cell mover, double elapsedMs, bool isAiMove) const {
	if (!settings.logMoves) {
		return;
	}
	auto colorTag = [](Board::Cell player) {
		return (player == Board::Cell::Player1) ? "\033[34m[P1]\033[0m" : "\033[97m[P2]\033[0m";
	};
	auto timeColor = [](double ms) {
		if (ms > 500.0) {
			return "\033[31m";
		}
		if (ms > 200.0) {
			return "\033[33m";
		}
		return "\033[32m";
	};
	auto formatTime = [](double ms) {
		std::ostringstream out;
		out << std::fixed << std::setprecision(1);
		if (ms >= 1000.0) {
			out << (ms / 1000.0) << "s";
		} else {
			out << ms << "ms";
		}
		return out.str();
	};
	const char* timeStyle = isAiMove ? timeColor(elapsedMs) : "\033[37m";
	std::ostringstream line;
	line << colorTag(mover) << " played " << Notation::moveToString(move) << " in "
	     << timeStyle << formatTime(elapsedMs) << "\033[0m";
	if (isAiMove) {
		line << " | \033[36mclock " << formatTime(std::max(0.0, state.remainingFor(mover))) << "\033[0m";
	}
	line << " | pieces " << state.board.count(Board::Cell::Player1) << "-" << state.board.count(Board::Cell::Player2);
	std::cout << line.str() << std::endl;
}

void Game::logFinish() const {
	if (!settings.logMoves) {
		return;
	}
	Board::Cell winner = state.winner();
	if (winner == Board::Cell::Empty) {
		std::cout << "\033[36mGame ends in a draw (" << GameState::reasonName(state.reason) << ").\033[0m" << std::endl;
		return;
	}
	const char* colorTag = (winner == Board::Cell::Player1) ? "\033[34m[P1]\033[0m" : "\033[97m[P2]\033[0m";
	std::cout << colorTag << " " << playerName(winner) << " \033[35mwins by "
	          << GameState::reasonName(state.reason) << "\033[0m." << std::endl;
	std::cout << Notation::toString(state.board) << std::endl;
}
