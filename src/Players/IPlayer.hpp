#ifndef IPLAYER_HPP
#define IPLAYER_HPP

#include <functional>
#include <string>

#include "Board.hpp"
#include "SearchResult.hpp"

class IPlayer {
public:
	using GhostCallback = std::function<void(const Board&)>;

	virtual ~IPlayer() = default;
	virtual bool isHuman() const = 0;
	virtual std::string name() const = 0;
	// prevBoard is the position one ply earlier, or nullptr at game start.
	virtual SearchResult calcBestMove(const Board& board, const Board* prevBoard, Board::Cell player, double timeBudgetMs) = 0;
	virtual void setGhostCallback(GhostCallback) {
	}
};

#endif
