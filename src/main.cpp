#include "Benchmark.hpp"
#include "GameSettings.hpp"
#include "PlayerFactory.hpp"

#include <algorithm>
#include <cctype>
#include <iostream>
#include <string>

#ifdef DEBUG_TESTS
#include "DebugTests.hpp"
#else
#include "GameController.hpp"
#include "SdlApp.hpp"
#include "UiLayout.hpp"
#endif

#ifndef DEBUG_TESTS
namespace {
std::string toLower(const std::string& value) {
	std::string lower = value;
	std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char c) {
		return static_cast<char>(std::tolower(c));
	});
	return lower;
}

void printUsage(const char* exe) {
	std::cerr << "Usage: " << exe << " [--p1 AGENT] [--p2 AGENT] [--first 1|2|random] [--time MS]\n"
	          << "       " << exe << " [--max-plies N] [--benchmark N] [--quiet] [--list-agents] [--help]\n"
	          << "Agents:";
	for (const std::string& name : PlayerFactory::names()) {
		std::cerr << " " << name;
	}
	std::cerr << std::endl;
}

// Splits "--flag=value"; otherwise takes the next argv entry as value.
bool takeValue(const std::string& arg, const std::string& flag, int argc, char** argv, int& i, std::string& value) {
	if (arg == flag) {
		if (i + 1 >= argc) {
			return false;
		}
		value = argv[++i];
		return true;
	}
	if (arg.rfind(flag + "=", 0) == 0) {
		value = arg.substr(flag.size() + 1);
		return true;
	}
	return false;
}
}  // namespace
#endif

int main(int argc, char** argv) {
#ifdef DEBUG_TESTS
	(void)argc;
	(void)argv;
	runDebugTests();
	return 0;
#else
	GameSettings settings;
	int benchmarkGames = 0;
	for (int i = 1; i < argc; ++i) {
		std::string arg = argv[i];
		std::string value;
		if (arg == "--help" || arg == "-h") {
			printUsage(argv[0]);
			return 0;
		}
		if (arg == "--list-agents") {
			for (const std::string& name : PlayerFactory::names()) {
				std::cout << name << (name == PlayerFactory::kDefaultAgent ? " (default)" : "") << std::endl;
			}
			return 0;
		}
		if (arg == "--quiet") {
			settings.logMoves = false;
			continue;
		}
		if (takeValue(arg, "--p1", argc, argv, i, value) || takeValue(arg, "--p2", argc, argv, i, value)) {
			if (!PlayerFactory::isKnown(value)) {
				std::cerr << "Unknown agent: " << value << std::endl;
				printUsage(argv[0]);
				return 1;
			}
			if (arg.compare(0, 4, "--p1") == 0) {
				settings.player1Agent = toLower(value);
			} else {
				settings.player2Agent = toLower(value);
			}
			continue;
		}
		if (takeValue(arg, "--first", argc, argv, i, value)) {
			if (!GameSettings::parseFirstPlayer(value, settings.firstPlayer)) {
				std::cerr << "Invalid first player: " << value << std::endl;
				printUsage(argv[0]);
				return 1;
			}
			continue;
		}
		if (takeValue(arg, "--time", argc, argv, i, value)) {
			if (!GameSettings::parseTimeMs(value, settings.timeLimitMs)) {
				std::cerr << "Invalid time limit: " << value << std::endl;
				printUsage(argv[0]);
				return 1;
			}
			continue;
		}
		if (takeValue(arg, "--max-plies", argc, argv, i, value)) {
			if (!GameSettings::parseCount(value, settings.maxPlies)) {
				std::cerr << "Invalid ply cap: " << value << std::endl;
				printUsage(argv[0]);
				return 1;
			}
			continue;
		}
		if (takeValue(arg, "--benchmark", argc, argv, i, value)) {
			if (!GameSettings::parseCount(value, benchmarkGames) || benchmarkGames <= 0) {
				std::cerr << "Invalid game count: " << value << std::endl;
				printUsage(argv[0]);
				return 1;
			}
			continue;
		}
		std::cerr << "Unknown argument: " << arg << std::endl;
		printUsage(argv[0]);
		return 1;
	}

	if (benchmarkGames > 0) {
		BenchmarkResult result;
		std::string reason;
		if (!Benchmark::run(settings, benchmarkGames, result, &reason)) {
			std::cerr << "Benchmark failed: " << reason << std::endl;
			return 1;
		}
		Benchmark::print(settings, result);
		return 0;
	}

	GameController controller(settings);
	UiLayout layout;
	SdlApp app(controller, layout);
	app.run();
	return 0;
#endif
}
