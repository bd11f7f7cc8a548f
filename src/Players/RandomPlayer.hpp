#ifndef RANDOMPLAYER_HPP
#define RANDOMPLAYER_HPP

#include <random>

#include "IPlayer.hpp"

class RandomPlayer : public IPlayer {
public:
	RandomPlayer();
	explicit RandomPlayer(unsigned int seed);
	bool isHuman() const override;
	std::string name() const override;
	SearchResult calcBestMove(const Board& board, const Board* prevBoard, Board::Cell player, double timeBudgetMs) override;

private:
	std::mt19937 rng;
};

#endif
