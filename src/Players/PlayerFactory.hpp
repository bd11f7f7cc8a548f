#ifndef PLAYERFACTORY_HPP
#define PLAYERFACTORY_HPP

#include <memory>
#include <string>
#include <vector>

#include "IPlayer.hpp"

class PlayerFactory {
public:
	static const std::string kDefaultAgent;

	static std::vector<std::string> names();
	static bool isKnown(const std::string& name);
	// nullptr for unknown names. Lookup is case-insensitive.
	static std::unique_ptr<IPlayer> create(const std::string& name);
};

#endif
