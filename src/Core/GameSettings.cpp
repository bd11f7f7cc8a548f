#include "GameSettings.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <limits>

#include "Config.hpp"

namespace {
bool parseNumber(const std::string& value, double& out) {
	if (value.empty()) {
		return false;
	}
	char* end = nullptr;
	double parsed = std::strtod(value.c_str(), &end);
	if (!end || *end != '\0' || !std::isfinite(parsed) || parsed < 0.0) {
		return false;
	}
	out = parsed;
	return true;
}
}  // namespace

GameSettings::GameSettings()
	: player1Agent("human"),
	  player2Agent("iterative"),
	  firstPlayer(FirstPlayer::Player1),
	  timeLimitMs(Config::kTimeLimitMs),
	  asyncAgents(true),
	  aiMoveDelayMs(150),
	  maxPlies(Config::kMaxPlies),
	  logMoves(true) {
}

bool GameSettings::parseFirstPlayer(const std::string& value, FirstPlayer& out) {
	std::string lower = value;
	std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char c) {
		return static_cast<char>(std::tolower(c));
	});
	if (lower == "1" || lower == "p1") {
		out = FirstPlayer::Player1;
		return true;
	}
	if (lower == "2" || lower == "p2") {
		out = FirstPlayer::Player2;
		return true;
	}
	if (lower == "random") {
		out = FirstPlayer::Random;
		return true;
	}
	return false;
}

bool GameSettings::parseTimeMs(const std::string& value, double& out) {
	return parseNumber(value, out);
}

bool GameSettings::parseCount(const std::string& value, int& out) {
	double parsed = 0.0;
	if (!parseNumber(value, parsed)) {
		return false;
	}
	if (parsed > static_cast<double>(std::numeric_limits<int>::max()) || parsed != std::floor(parsed)) {
		return false;
	}
	out = static_cast<int>(parsed);
	return true;
}
