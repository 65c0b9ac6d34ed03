// basic_lands.h
#pragma once

#include <string>

#include "rules/card.h"

Card createBasicLandCard(const std::string& name, Color color);

Card basicPlains();
Card basicIsland();
Card basicMountain();
Card basicForest();
Card basicSwamp();

void registerBasicLands();
