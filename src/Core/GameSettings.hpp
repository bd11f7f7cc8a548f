#ifndef GAMESETTINGS_HPP
#define GAMESETTINGS_HPP

#include <string>

class GameSettings {
public:
	enum class FirstPlayer { Player1, Player2, Random };

	// Agent names as understood by PlayerFactory ("human" for a person).
	std::string player1Agent;
	std::string player2Agent;
	FirstPlayer firstPlayer;
	double timeLimitMs;
	bool asyncAgents;
	int aiMoveDelayMs;
	int maxPlies;
	bool logMoves;

	GameSettings();

	// Command-line value parsers; out is left untouched on failure.
	static bool parseFirstPlayer(const std::string& value, FirstPlayer& out);
	// Finite, non-negative milliseconds.
	static bool parseTimeMs(const std::string& value, double& out);
	// Whole number in [0, INT_MAX].
	static bool parseCount(const std::string& value, int& out);
};

#endif
