#include "PlayerFactory.hpp"

#include <algorithm>
#include <cctype>
#include <functional>
#include <map>
#include <memory>

#include "Config.hpp"
#include "HumanPlayer.hpp"
#include "RandomPlayer.hpp"
#include "SearchPlayer.hpp"

namespace {
using Constructor = std::function<std::unique_ptr<IPlayer>()>;

const std::map<std::string, Constructor>& registry() {
	static const std::map<std::string, Constructor> table = {
		{ "alphabeta", []() { return std::make_unique<AlphaBetaPlayer>(Config::kAiFixedDepth); } },
		{ "human", []() { return std::make_unique<HumanPlayer>(); } },
		{ "iterative", []() { return std::make_unique<IterativeDeepeningPlayer>(); } },
		{ "negamax", []() { return std::make_unique<RandomizedNegamaxPlayer>(); } },
		{ "random", []() { return std::make_unique<RandomPlayer>(); } },
	};
	return table;
}

std::string toLower(const std::string& value) {
	std::string lower = value;
	std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char c) {
		return static_cast<char>(std::tolower(c));
	});
	return lower;
}
}  // namespace

const std::string PlayerFactory::kDefaultAgent = "iterative";

std::vector<std::string> PlayerFactory::names() {
	std::vector<std::string> result;
	for (const auto& entry : registry()) {
		result.push_back(entry.first);
	}
	return result;
}

bool PlayerFactory::isKnown(const std::string& name) {
	return registry().count(toLower(name)) != 0;
}

std::unique_ptr<IPlayer> PlayerFactory::create(const std::string& name) {
	auto it = registry().find(toLower(name));
	if (it == registry().end()) {
		return nullptr;
	}
	return it->second();
}
