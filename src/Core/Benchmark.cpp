#include "Benchmark.hpp"

#include <iomanip>
#include <iostream>

#include "Game.hpp"
#include "PlayerFactory.hpp"

namespace {
bool rejectSide(const std::string& agent, std::string* reason) {
	if (!PlayerFactory::isKnown(agent)) {
		if (reason) {
			*reason = "unknown agent '" + agent + "'";
		}
		return true;
	}
	std::unique_ptr<IPlayer> probe = PlayerFactory::create(agent);
	if (probe->isHuman()) {
		if (reason) {
			*reason = "benchmark needs two agents, got '" + agent + "'";
		}
		return true;
	}
	return false;
}
}  // namespace

bool Benchmark::run(const GameSettings& settings, int games, BenchmarkResult& out, std::string* reason) {
	if (games <= 0) {
		if (reason) {
			*reason = "game count must be positive";
		}
		return false;
	}
	if (rejectSide(settings.player1Agent, reason) || rejectSide(settings.player2Agent, reason)) {
		return false;
	}
	BenchmarkResult result;
	GameSettings matchSettings = settings;
	matchSettings.asyncAgents = false;
	matchSettings.aiMoveDelayMs = 0;
	for (int i = 0; i < games; ++i) {
		matchSettings.firstPlayer = (i % 2 == 0) ? GameSettings::FirstPlayer::Player1 : GameSettings::FirstPlayer::Player2;
		Game game(matchSettings);
		game.runToEnd();
		const GameState& state = game.getState();
		Board::Cell winner = state.winner();
		if (winner == Board::Cell::Player1) {
			++result.player1Wins;
		} else if (winner == Board::Cell::Player2) {
			++result.player2Wins;
		} else {
			++result.draws;
		}
		result.totalPlies += state.plyCount;
		++result.games;
	}
	out = result;
	return true;
}

void Benchmark::print(const GameSettings& settings, const BenchmarkResult& result) {
	double avgPlies = (result.games > 0) ? result.totalPlies / result.games : 0.0;
	std::cout << "\033[36m" << result.games << " games\033[0m | "
	          << "\033[34m[P1] " << settings.player1Agent << " " << result.player1Wins << "\033[0m | "
	          << "\033[97m[P2] " << settings.player2Agent << " " << result.player2Wins << "\033[0m | "
	          << "draws " << result.draws << " | "
	          << std::fixed << std::setprecision(1) << "avg plies " << avgPlies << std::endl;
}
