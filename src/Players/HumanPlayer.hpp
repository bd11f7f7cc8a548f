#ifndef HUMANPLAYER_HPP
#define HUMANPLAYER_HPP

#include "IPlayer.hpp"
#include "Move.hpp"

class HumanPlayer : public IPlayer {
public:
	HumanPlayer();
	bool isHuman() const override;
	std::string name() const override;
	SearchResult calcBestMove(const Board& board, const Board* prevBoard, Board::Cell player, double timeBudgetMs) override;

	void setPendingMove(const Move& move);
	bool hasPendingMove() const;
	Move takePendingMove();

private:
	bool pending;
	Move pendingMove;
};

#endif
