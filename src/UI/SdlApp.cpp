#include "SdlApp.hpp"

#include <algorithm>
#include <iomanip>
#include <iostream>
#include <sstream>

#include "Notation.hpp"

SdlApp::SdlApp(GameController& controllerIn, const UiLayout& layoutIn)
	: controller(controllerIn),
	  layout(layoutIn),
	  mapper(layoutIn),
	  renderer(),
	  window(nullptr),
	  sdlRenderer(nullptr),
	  running(false),
	  sdlInitialized(false),
	  lastTitle() {
}

SdlApp::~SdlApp() {
	shutdown();
}

void SdlApp::shutdown() {
	if (sdlRenderer) {
		SDL_DestroyRenderer(sdlRenderer);
		sdlRenderer = nullptr;
	}
	if (window) {
		SDL_DestroyWindow(window);
		window = nullptr;
	}
	if (sdlInitialized) {
		SDL_Quit();
		sdlInitialized = false;
	}
}

bool SdlApp::init() {
	if (SDL_Init(SDL_INIT_VIDEO) != 0) {
		std::cerr << "SDL_Init failed: " << SDL_GetError() << std::endl;
		return false;
	}
	sdlInitialized = true;
	window = SDL_CreateWindow("Ostle", SDL_WINDOWPOS_CENTERED, SDL_WINDOWPOS_CENTERED,
					 layout.windowWidth, layout.windowHeight, SDL_WINDOW_SHOWN);
	if (!window) {
		std::cerr << "SDL_CreateWindow failed: " << SDL_GetError() << std::endl;
		shutdown();
		return false;
	}
	sdlRenderer = SDL_CreateRenderer(window, -1, SDL_RENDERER_ACCELERATED);
	if (!sdlRenderer) {
		std::cerr << "SDL_CreateRenderer failed: " << SDL_GetError() << std::endl;
		shutdown();
		return false;
	}
	return true;
}

void SdlApp::run() {
	if (!init()) {
		return;
	}
	running = true;
	while (running) {
		SDL_Event event;
		while (SDL_PollEvent(&event)) {
			handleEvent(event);
		}
		controller.tick();
		updateTitle();
		render();
		SDL_Delay(16);
	}
	shutdown();
}

void SdlApp::handleEvent(const SDL_Event& event) {
	if (event.type == SDL_QUIT) {
		running = false;
		return;
	}
	if (event.type == SDL_KEYDOWN) {
		handleKey(event.key.keysym.sym);
		return;
	}
	if (event.type == SDL_MOUSEBUTTONDOWN && event.button.button == SDL_BUTTON_LEFT) {
		int x = 0;
		int y = 0;
		if (mapper.pixelToCell(event.button.x, event.button.y, x, y)) {
			controller.onCellClicked(x, y);
		}
	}
}

void SdlApp::handleKey(SDL_Keycode key) {
	switch (key) {
	case SDLK_ESCAPE:
		running = false;
		break;
	case SDLK_SPACE:
		controller.newGame();
		break;
	case SDLK_LEFT:
		controller.reviewBack();
		break;
	case SDLK_RIGHT:
		controller.reviewForward();
		break;
	default:
		break;
	}
}

void SdlApp::render() {
	SDL_SetRenderDrawColor(sdlRenderer, 46, 52, 64, 255);
	SDL_RenderClear(sdlRenderer);
	const Board* ghostBoard = nullptr;
	Board ghostCopy;
	if (controller.hasGhostBoard()) {
		ghostCopy = controller.ghostBoard();
		ghostBoard = &ghostCopy;
	}
	renderer.render(sdlRenderer, controller, layout, ghostBoard);
	SDL_RenderPresent(sdlRenderer);
}

void SdlApp::updateTitle() {
	const GameState& state = controller.state();
	auto clock = [](double ms) {
		std::ostringstream out;
		out << std::fixed << std::setprecision(1) << (std::max(0.0, ms) / 1000.0) << "s";
		return out.str();
	};
	std::string title = "Ostle";
	if (controller.isReviewing()) {
		title += " - review ply " + std::to_string(controller.reviewPly()) + "/" + std::to_string(controller.history().size());
	} else if (state.status == GameState::Status::Player1Won) {
		title += " - Player1 wins (" + GameState::reasonName(state.reason) + ")";
	} else if (state.status == GameState::Status::Player2Won) {
		title += " - Player2 wins (" + GameState::reasonName(state.reason) + ")";
	} else if (state.status == GameState::Status::Draw) {
		title += " - Draw (" + GameState::reasonName(state.reason) + ")";
	} else if (!state.lastMessage.empty()) {
		title += " - " + state.lastMessage;
	} else {
		title += " - " + Notation::cellName(state.toMove) + " to move";
	}
	title += " | P1 " + controller.playerName(Board::Cell::Player1) + " " + clock(state.timeRemainingPlayer1);
	title += " | P2 " + controller.playerName(Board::Cell::Player2) + " " + clock(state.timeRemainingPlayer2);
	if (title != lastTitle) {
		SDL_SetWindowTitle(window, title.c_str());
		lastTitle = title;
	}
}
