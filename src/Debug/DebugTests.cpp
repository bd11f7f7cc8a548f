#include "DebugTests.hpp"

#include <cassert>
#include <iostream>

#include "Notation.hpp"

Board boardFromText(const std::string& text) {
	Board board;
	bool parsed = Notation::parseBoard(text, board);
	assert(parsed);
	(void)parsed;
	return board;
}

void runDebugTests() {
	runRulesTests();
	std::cout << "Rules tests passed." << std::endl;
	runNotationTests();
	std::cout << "Notation tests passed." << std::endl;
	runSearchTests();
	std::cout << "Search tests passed." << std::endl;
	runGameTests();
	std::cout << "Game tests passed." << std::endl;
	runSettingsTests();
	std::cout << "Settings tests passed." << std::endl;
	runLayoutTests();
	std::cout << "Layout tests passed." << std::endl;
	std::cout << "Debug tests passed." << std::endl;
}
