#pragma once

#include <optional>
#include <vector>

#include "rules/ability.h"
#include "rules/mana.h"

class Game;

// Specs of the targets an effect list needs, in the order targets are consumed.
std::vector<TargetSpec> requiredTargetSpecs(const std::vector<Effect>& effects);

bool isLegalTarget(Game* game, const Colors& source_colors, int controller_id,
                   const TargetSpec& spec, const Target& target);

// Picks targets for a scripted player. Harmful effects aim at the opponent, beneficial ones at the controller.
// Returns nullopt when some required target has no legal choice.
std::optional<std::vector<Target>> chooseTargets(Game* game, const std::vector<Effect>& effects,
                                                 int controller_id, const Colors& source_colors);
