#ifndef DEBUGTESTS_HPP
#define DEBUGTESTS_HPP

#include <string>

#include "Board.hpp"

void runDebugTests();

void runRulesTests();
void runNotationTests();
void runSearchTests();
void runGameTests();
void runSettingsTests();
void runLayoutTests();

// Builds a board from rows of '.', '1', '2', 'O'; aborts on malformed text.
Board boardFromText(const std::string& text);

#endif
