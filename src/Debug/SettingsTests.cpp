#include "DebugTests.hpp"

#include <cassert>

#include "GameSettings.hpp"

namespace {
void testTimeValues() {
	double time = 42.0;
	assert(GameSettings::parseTimeMs("1500", time) && time == 1500.0);
	assert(GameSettings::parseTimeMs("0.5", time) && time == 0.5);
	assert(GameSettings::parseTimeMs("0", time) && time == 0.0);

	time = 42.0;
	assert(!GameSettings::parseTimeMs("", time));
	assert(!GameSettings::parseTimeMs("-5", time));
	assert(!GameSettings::parseTimeMs("12ms", time));
	assert(!GameSettings::parseTimeMs("nan", time));
	assert(!GameSettings::parseTimeMs("NAN", time));
	assert(!GameSettings::parseTimeMs("inf", time));
	assert(!GameSettings::parseTimeMs("1e400", time));
	assert(time == 42.0);
}

void testCountValues() {
	int count = 7;
	assert(GameSettings::parseCount("400", count) && count == 400);
	assert(GameSettings::parseCount("0", count) && count == 0);
	assert(GameSettings::parseCount("2147483647", count) && count == 2147483647);

	count = 7;
	assert(!GameSettings::parseCount("2147483648", count));
	assert(!GameSettings::parseCount("1e20", count));
	assert(!GameSettings::parseCount("2.5", count));
	assert(!GameSettings::parseCount("-1", count));
	assert(!GameSettings::parseCount("nan", count));
	assert(!GameSettings::parseCount("ten", count));
	assert(count == 7);
}

void testFirstPlayerValues() {
	GameSettings::FirstPlayer first = GameSettings::FirstPlayer::Player1;
	assert(GameSettings::parseFirstPlayer("2", first) && first == GameSettings::FirstPlayer::Player2);
	assert(GameSettings::parseFirstPlayer("P1", first) && first == GameSettings::FirstPlayer::Player1);
	assert(GameSettings::parseFirstPlayer("Random", first) && first == GameSettings::FirstPlayer::Random);
	assert(!GameSettings::parseFirstPlayer("3", first));
	assert(first == GameSettings::FirstPlayer::Random);
}
}  // namespace

void runSettingsTests() {
	testTimeValues();
	testCountValues();
	testFirstPlayerValues();
}
