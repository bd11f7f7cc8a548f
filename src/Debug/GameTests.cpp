#include "DebugTests.hpp"

#include <cassert>
#include <chrono>
#include <cstddef>
#include <memory>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "Benchmark.hpp"
#include "Game.hpp"
#include "GameController.hpp"
#include "HumanPlayer.hpp"
#include "RandomPlayer.hpp"

namespace {
// Replays a fixed list of moves, then repeats the last one.
class ScriptedPlayer : public IPlayer {
public:
	explicit ScriptedPlayer(std::vector<Move> movesIn) : moves(std::move(movesIn)), next(0) {
	}
	bool isHuman() const override {
		return false;
	}
	std::string name() const override {
		return "Scripted";
	}
	SearchResult calcBestMove(const Board&, const Board*, Board::Cell, double) override {
		SearchResult result;
		result.status = SearchResult::Status::Found;
		result.move = moves[next < moves.size() ? next : moves.size() - 1];
		++next;
		return result;
	}

private:
	std::vector<Move> moves;
	size_t next;
};

class StatusPlayer : public IPlayer {
public:
	StatusPlayer(SearchResult::Status statusIn, int sleepMsIn) : status(statusIn), sleepMs(sleepMsIn) {
	}
	bool isHuman() const override {
		return false;
	}
	std::string name() const override {
		return "Status";
	}
	SearchResult calcBestMove(const Board& board, const Board*, Board::Cell player, double) override {
		if (sleepMs > 0) {
			std::this_thread::sleep_for(std::chrono::milliseconds(sleepMs));
		}
		SearchResult result;
		result.status = status;
		if (status == SearchResult::Status::Found) {
			result.move = Rules::legalMoves(board, player).front();
		}
		return result;
	}

private:
	SearchResult::Status status;
	int sleepMs;
};

GameSettings quietSettings() {
	GameSettings settings;
	settings.asyncAgents = false;
	settings.aiMoveDelayMs = 0;
	settings.logMoves = false;
	return settings;
}

std::vector<Move> shuffleInPlace(int x, int y, int dy) {
	return { Move(x, y, 0, dy), Move(x, y + dy, 0, -dy) };
}

void testScriptedWin() {
	std::vector<Move> attack = {
		Move(0, 0, 0, 1), Move(0, 1, 0, 1), Move(0, 2, 0, 1), Move(0, 3, 0, 1),
		Move(1, 0, 0, 1), Move(1, 1, 0, 1), Move(1, 2, 0, 1), Move(1, 3, 0, 1)
	};
	std::vector<Move> waiting;
	for (int i = 0; i < 4; ++i) {
		std::vector<Move> pair = shuffleInPlace(4, 4, -1);
		waiting.insert(waiting.end(), pair.begin(), pair.end());
	}
	Game game(quietSettings(), std::make_unique<ScriptedPlayer>(attack), std::make_unique<ScriptedPlayer>(waiting));
	game.runToEnd();
	const GameState& state = game.getState();
	assert(state.status == GameState::Status::Player1Won);
	assert(state.reason == GameState::FinishReason::WinCondition);
	assert(state.plyCount == 15);
	assert(game.getHistory().size() == 15);
	assert(state.board.count(Board::Cell::Player2) == 3);
	assert(state.board.count(Board::Cell::Player1) == 5);
	assert(state.hasLastMove && state.lastMove == Move(1, 3, 0, 1));
	assert(state.timeRemainingPlayer1 <= game.getSettings().timeLimitMs);

	const MoveHistory& history = game.getHistory();
	assert(history.boardAt(0, state.board) == Board::createInitial());
	assert(history.boardAt(history.size(), state.board) == state.board);
	assert(history.all()[1].player == Board::Cell::Player2);
	assert(state.prevBoard == history.all().back().boardBefore);
}

void testIllegalMoveForfeits() {
	Game game(quietSettings(),
		std::make_unique<ScriptedPlayer>(std::vector<Move>{ Move(0, 0, 0, -1) }),
		std::make_unique<RandomPlayer>(3));
	game.runToEnd();
	const GameState& state = game.getState();
	assert(state.status == GameState::Status::Player2Won);
	assert(state.reason == GameState::FinishReason::IllegalMove);
	assert(state.board == Board::createInitial());
	assert(game.getHistory().size() == 0);
}

void testNoLegalMovesLoses() {
	Game game(quietSettings(),
		std::make_unique<RandomPlayer>(3),
		std::make_unique<StatusPlayer>(SearchResult::Status::NoLegalMoves, 0));
	game.runToEnd();
	const GameState& state = game.getState();
	assert(state.status == GameState::Status::Player1Won);
	assert(state.reason == GameState::FinishReason::NoLegalMoves);
	assert(state.plyCount == 1);
}

void testSyncTimeout() {
	GameSettings settings = quietSettings();
	settings.timeLimitMs = 10.0;
	Game game(settings,
		std::make_unique<StatusPlayer>(SearchResult::Status::Found, 40),
		std::make_unique<RandomPlayer>(3));
	game.runToEnd();
	const GameState& state = game.getState();
	assert(state.status == GameState::Status::Player2Won);
	assert(state.reason == GameState::FinishReason::Timeout);
	assert(state.timeRemainingPlayer1 < 0.0);
	assert(game.getHistory().size() == 0);
}

void testAsyncTimeout() {
	GameSettings settings = quietSettings();
	settings.asyncAgents = true;
	settings.timeLimitMs = 10.0;
	settings.firstPlayer = GameSettings::FirstPlayer::Player2;
	Game game(settings,
		std::make_unique<RandomPlayer>(3),
		std::make_unique<StatusPlayer>(SearchResult::Status::Found, 60));
	assert(game.getState().toMove == Board::Cell::Player2);
	game.runToEnd();
	const GameState& state = game.getState();
	assert(state.status == GameState::Status::Player1Won);
	assert(state.reason == GameState::FinishReason::Timeout);
}

void testAsyncAgentsFinish() {
	GameSettings settings = quietSettings();
	settings.asyncAgents = true;
	settings.maxPlies = 40;
	Game game(settings, std::make_unique<RandomPlayer>(5), std::make_unique<RandomPlayer>(6));
	game.runToEnd();
	const GameState& state = game.getState();
	assert(!state.isRunning());
	assert(game.getHistory().size() == static_cast<size_t>(state.plyCount));
	assert(state.plyCount <= 40);
}

void testPlyLimitDraw() {
	GameSettings settings = quietSettings();
	settings.maxPlies = 10;
	Game game(settings,
		std::make_unique<ScriptedPlayer>(std::vector<Move>{ Move(0, 0, 0, 1), Move(0, 1, 0, -1),
			Move(0, 0, 0, 1), Move(0, 1, 0, -1), Move(0, 0, 0, 1) }),
		std::make_unique<ScriptedPlayer>(std::vector<Move>{ Move(4, 4, 0, -1), Move(4, 3, 0, 1),
			Move(4, 4, 0, -1), Move(4, 3, 0, 1), Move(4, 4, 0, -1) }));
	game.runToEnd();
	const GameState& state = game.getState();
	assert(state.status == GameState::Status::Draw);
	assert(state.reason == GameState::FinishReason::PlyLimit);
	assert(state.plyCount == 10);
	assert(state.winner() == Board::Cell::Empty);
}

void testHumanPendingMove() {
	HumanPlayer human;
	Board board = Board::createInitial();
	SearchResult waiting = human.calcBestMove(board, nullptr, Board::Cell::Player1, 0.0);
	assert(waiting.status == SearchResult::Status::Pending);
	assert(!waiting.found());

	human.setPendingMove(Move(0, 0, 0, 1));
	SearchResult answered = human.calcBestMove(board, nullptr, Board::Cell::Player1, 0.0);
	assert(answered.found() && answered.move == Move(0, 0, 0, 1));
	assert(!human.hasPendingMove());
	assert(human.calcBestMove(board, nullptr, Board::Cell::Player1, 0.0).status == SearchResult::Status::Pending);
}

void testHumanTurn() {
	GameSettings settings = quietSettings();
	Game game(settings, std::make_unique<HumanPlayer>(), std::make_unique<RandomPlayer>(8));
	assert(game.isHumanTurn());
	game.runToEnd();
	assert(game.getState().isRunning());

	assert(game.submitHumanMove(Move(0, 0, 0, -1)));
	game.tick();
	assert(game.getState().isRunning());
	assert(game.getState().toMove == Board::Cell::Player1);
	assert(game.getState().lastMessage == "Illegal move: target out of bounds");

	assert(game.submitHumanMove(Move(2, 2, 0, -1)));
	game.tick();
	assert(game.getState().board.at(2, 1) == Board::Cell::Hole);
	assert(game.getState().toMove == Board::Cell::Player2);
	assert(!game.submitHumanMove(Move(0, 0, 0, 1)));
	// Humans are not on the clock.
	assert(game.getState().timeRemainingPlayer1 == settings.timeLimitMs);

	game.tick();
	assert(game.getState().toMove == Board::Cell::Player1);
	assert(game.getHistory().size() == 2);
	assert(game.playerName(Board::Cell::Player1) == "Human");
	assert(game.playerName(Board::Cell::Player2) == "Random");

	game.reset();
	assert(game.getHistory().size() == 0);
	assert(game.getState().board == Board::createInitial());
	assert(game.getState().isRunning());
}

void testControllerClicks() {
	GameSettings settings = quietSettings();
	settings.player1Agent = "human";
	settings.player2Agent = "random";
	GameController controller(settings);

	controller.onCellClicked(2, 2);
	assert(controller.hasSelection());
	assert(controller.selectedMoves().size() == 4);
	controller.onCellClicked(0, 0);
	assert(controller.hasSelection() && controller.selectedX() == 0 && controller.selectedY() == 0);
	assert(controller.selectedMoves().size() == 2);
	controller.onCellClicked(0, 1);
	assert(!controller.hasSelection());
	controller.tick();
	assert(controller.history().size() == 1);
	assert(controller.history().all()[0].move == Move(0, 0, 0, 1));
	controller.tick();
	assert(controller.history().size() == 2);
	assert(controller.state().toMove == Board::Cell::Player1);

	controller.onCellClicked(3, 3);
	assert(!controller.hasSelection());
	controller.reviewBack();
	assert(!controller.isReviewing());

	controller.newGame();
	assert(controller.history().size() == 0);
	assert(controller.displayedBoard() == Board::createInitial());
}

void testControllerReview() {
	GameSettings settings = quietSettings();
	settings.player1Agent = "random";
	settings.player2Agent = "random";
	settings.maxPlies = 6;
	GameController controller(settings);
	while (controller.state().isRunning()) {
		controller.tick();
	}
	size_t plies = controller.history().size();
	assert(plies >= 1 && plies <= 6);
	controller.reviewBack();
	assert(controller.isReviewing() && controller.reviewPly() == plies - 1);
	assert(controller.displayedBoard() == controller.history().all()[plies - 1].boardBefore);
	for (int i = 0; i < 10; ++i) {
		controller.reviewBack();
	}
	assert(controller.reviewPly() == 0);
	assert(controller.displayedBoard() == Board::createInitial());
	for (size_t i = 0; i < plies; ++i) {
		controller.reviewForward();
	}
	assert(!controller.isReviewing());
	assert(controller.displayedBoard() == controller.state().board);
}

void testBenchmark() {
	GameSettings settings = quietSettings();
	settings.player1Agent = "random";
	settings.player2Agent = "Random";
	settings.maxPlies = 60;
	BenchmarkResult result;
	std::string reason;
	assert(Benchmark::run(settings, 4, result, &reason));
	assert(result.games == 4);
	assert(result.player1Wins + result.player2Wins + result.draws == 4);

	settings.player1Agent = "human";
	assert(!Benchmark::run(settings, 2, result, &reason));
	assert(reason.find("human") != std::string::npos);
	settings.player1Agent = "dqn";
	assert(!Benchmark::run(settings, 2, result, &reason));
	settings.player1Agent = "random";
	assert(!Benchmark::run(settings, 0, result, &reason));
}
}  // namespace

void runGameTests() {
	testScriptedWin();
	testIllegalMoveForfeits();
	testNoLegalMovesLoses();
	testSyncTimeout();
	testAsyncTimeout();
	testAsyncAgentsFinish();
	testPlyLimitDraw();
	testHumanPendingMove();
	testHumanTurn();
	testControllerClicks();
	testControllerReview();
	testBenchmark();
}
