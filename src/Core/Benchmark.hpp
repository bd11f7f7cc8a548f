#ifndef BENCHMARK_HPP
#define BENCHMARK_HPP

#include <string>

#include "GameSettings.hpp"

struct BenchmarkResult {
	int games = 0;
	int player1Wins = 0;
	int player2Wins = 0;
	int draws = 0;
	double totalPlies = 0.0;
};

class Benchmark {
public:
	// Plays synchronous matches, alternating who moves first. Fails when a
	// side is human or an agent name is unknown.
	static bool run(const GameSettings& settings, int games, BenchmarkResult& out, std::string* reason = nullptr);
	static void print(const GameSettings& settings, const BenchmarkResult& result);
};

#endif
