// decklist.h
#pragma once

#include <istream>
#include <string>

#include "rules/player.h"

// Reads a deck list into a PlayerConfig. Accepted lines:
//   4 Lightning Bolt
//   4x Lightning Bolt (LEA) 161
//   Lightning Bolt
// Lines starting with // or # are comments. An "About" section may set the deck
// name with "Name <deck name>". Everything after "Sideboard" is ignored.
// Cards missing from the registry are logged and skipped.
PlayerConfig parseDeckList(std::istream& input, const std::string& default_name);

// Throws std::runtime_error if the file cannot be read.
PlayerConfig loadDeckList(const std::string& path);
