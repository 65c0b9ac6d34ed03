// targeting.cpp
#include "targeting.h"
#include "rules/game.h"

#include <algorithm>

#include <spdlog/spdlog.h>

std::vector<TargetSpec> requiredTargetSpecs(const std::vector<Effect>& effects) {
    std::vector<TargetSpec> specs;
    for (const Effect& effect : effects) {
        if (effect.target.required()) {
            specs.push_back(effect.target);
        }
    }
    return specs;
}

namespace {

bool isLegalPlayerTarget(Game* game, int controller_id, const TargetSpec& spec, int player_id) {
    Player* player = game->player(player_id);
    if (player == nullptr || player->lost) {
        return false;
    }
    switch (spec.kind) {
        case TargetKind::ANY:
        case TargetKind::PLAYER:
            return true;
        case TargetKind::OPPONENT:
            return player->isOpponent(controller_id);
        default:
            return false;
    }
}

bool isLegalPermanentTarget(Game* game, const Colors& source_colors, int controller_id,
                            const TargetSpec& spec, int permanent_id) {
    Permanent* permanent = game->permanent(permanent_id);
    if (permanent == nullptr) {
        return false;
    }
    switch (spec.kind) {
        case TargetKind::ANY:
        case TargetKind::CREATURE:
            if (!permanent->isCreature()) {
                return false;
            }
            break;
        case TargetKind::PERMANENT:
            break;
        default:
            return false;
    }
    if (spec.non_artifact && permanent->isArtifact()) {
        return false;
    }
    for (Color color : permanent->colors()) {
        if (spec.excluded_colors.contains(color)) {
            return false;
        }
    }
    if (permanent->hasKeyword(Keyword::SHROUD)) {
        return false;
    }
    if (permanent->hasKeyword(Keyword::HEXPROOF) && permanent->controller_id != controller_id) {
        return false;
    }
    return !permanent->keywords().hasProtectionFrom(source_colors, false);
}

bool isLegalStackTarget(Game* game, const TargetSpec& spec, int stack_object_id) {
    if (spec.kind != TargetKind::SPELL) {
        return false;
    }
    StackObject* object = game->zones->stack->find(stack_object_id);
    return object != nullptr && object->isSpell();
}

int remainingToughness(const Permanent* permanent) {
    return permanent->toughness() - permanent->damage;
}

} // namespace

bool isLegalTarget(Game* game, const Colors& source_colors, int controller_id,
                   const TargetSpec& spec, const Target& target) {
    switch (target.type) {
        case Target::Type::PLAYER:
            return isLegalPlayerTarget(game, controller_id, spec, target.id);
        case Target::Type::PERMANENT:
            return isLegalPermanentTarget(game, source_colors, controller_id, spec, target.id);
        case Target::Type::STACK_OBJECT:
            return isLegalStackTarget(game, spec, target.id);
    }
    return false;
}

std::optional<std::vector<Target>> chooseTargets(Game* game, const std::vector<Effect>& effects,
                                                 int controller_id, const Colors& source_colors) {
    std::vector<Target> targets;
    Player* controller = game->player(controller_id);

    auto legal = [&](const TargetSpec& spec, const Target& target) {
        return isLegalTarget(game, source_colors, controller_id, spec, target);
    };

    // Biggest legal creature of the given player, by power.
    auto biggestCreature = [&](const TargetSpec& spec, int player_id,
                               std::function<bool(const Permanent*)> filter) -> std::optional<Target> {
        Permanent* best = nullptr;
        for (Permanent* creature : game->zones->battlefield->creatures(player_id)) {
            if (!legal(spec, Target::permanent(creature->id)) || !filter(creature)) {
                continue;
            }
            if (best == nullptr || creature->power() > best->power()) {
                best = creature;
            }
        }
        if (best == nullptr) {
            return std::nullopt;
        }
        return Target::permanent(best->id);
    };

    for (const Effect& effect : effects) {
        if (!effect.target.required()) {
            continue;
        }
        const TargetSpec& spec = effect.target;
        std::optional<Target> choice;

        if (spec.kind == TargetKind::SPELL) {
            for (auto it = game->zones->stack->objects.rbegin(); it != game->zones->stack->objects.rend(); ++it) {
                const StackObject* object = it->get();
                if (object->controller_id != controller_id && legal(spec, Target::stackObject(object->id))) {
                    choice = Target::stackObject(object->id);
                    break;
                }
            }
        } else if (effect.isHarmful()) {
            for (int opponent_id : controller->opponent_ids) {
                if (effect.type == EffectType::DEAL_DAMAGE) {
                    choice = biggestCreature(spec, opponent_id, [&](const Permanent* creature) {
                        return remainingToughness(creature) <= effect.amount;
                    });
                } else {
                    choice = biggestCreature(spec, opponent_id, [](const Permanent*) { return true; });
                }
                if (!choice && legal(spec, Target::player(opponent_id))) {
                    choice = Target::player(opponent_id);
                }
                if (choice) {
                    break;
                }
            }
        } else {
            if (legal(spec, Target::player(controller_id))) {
                choice = Target::player(controller_id);
            } else {
                // Prefer creatures already in combat.
                choice = biggestCreature(spec, controller_id, [](const Permanent* creature) {
                    return creature->attacking.has_value() || creature->blocking.has_value();
                });
                if (!choice) {
                    choice = biggestCreature(spec, controller_id, [](const Permanent*) { return true; });
                }
            }
        }

        if (!choice) {
            spdlog::debug("No legal target for {}", effect.toString());
            return std::nullopt;
        }
        targets.push_back(*choice);
    }
    return targets;
}
