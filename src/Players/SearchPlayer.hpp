#ifndef SEARCHPLAYER_HPP
#define SEARCHPLAYER_HPP

#include <random>
#include <string>

#include "IPlayer.hpp"
#include "Search.hpp"

// Base for agents that delegate to Search; subclasses pick the settings.
class SearchPlayer : public IPlayer {
public:
	explicit SearchPlayer(const std::string& playerName);
	bool isHuman() const override;
	std::string name() const override;
	SearchResult calcBestMove(const Board& board, const Board* prevBoard, Board::Cell player, double timeBudgetMs) override;
	void setGhostCallback(GhostCallback callback) override;

protected:
	virtual SearchSettings makeSettings(double timeBudgetMs) = 0;
	std::mt19937 rng;

private:
	std::string playerName;
	GhostCallback ghostCallback;
};

class AlphaBetaPlayer : public SearchPlayer {
public:
	explicit AlphaBetaPlayer(int depth);

protected:
	SearchSettings makeSettings(double timeBudgetMs) override;

private:
	int depth;
};

class RandomizedNegamaxPlayer : public SearchPlayer {
public:
	RandomizedNegamaxPlayer();
	explicit RandomizedNegamaxPlayer(unsigned int seed);

protected:
	SearchSettings makeSettings(double timeBudgetMs) override;
};

class IterativeDeepeningPlayer : public SearchPlayer {
public:
	IterativeDeepeningPlayer();

protected:
	SearchSettings makeSettings(double timeBudgetMs) override;
};

#endif
