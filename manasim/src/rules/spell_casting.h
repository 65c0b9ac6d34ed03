#pragma once

#include <optional>
#include <vector>

#include "rules/ability.h"
#include "rules/mana.h"

class Game;
class Card;
class Player;
class Permanent;
class StackObject;

// Casting, activation and resolution. Every state change ends with a state-based action check.
class SpellCastingEngine {
public:
    Game* game;

    SpellCastingEngine(Game* game);

    // Throws std::invalid_argument for a card not in the caster's hand or a land,
    // IllegalTimingError, InvalidTargetError or InsufficientManaError. Nothing changes on failure.
    StackObject* castSpell(Card* card, Player* caster, const std::vector<Target>& targets = {});
    // Every check castSpell makes except payment. Throws the same errors and changes nothing.
    void validateCast(const Card* card, Player* caster, const std::vector<Target>& targets = {}) const;

    // Mana abilities resolve immediately and return nullptr.
    StackObject* activateAbility(Permanent* source, const Ability& ability, Player* controller,
                                 const std::vector<Target>& targets = {});
    void validateActivation(const Permanent* source, const Ability& ability, Player* controller,
                            const std::vector<Target>& targets = {}) const;

    StackObject* counterSpell(Card* counter_card, Player* caster, StackObject* target);

    // Returns nullptr when the ability needs a target and none is legal.
    StackObject* putTriggeredAbility(Permanent* source, const Ability& ability);

    void resolveTop();
    void resolveStack();

    bool hasCastTiming(const Card* card, Player* caster) const;
    bool hasActivationTiming(const Ability& ability, Player* controller) const;

private:
    void checkTargets(const std::vector<Effect>& effects, const std::vector<Target>& targets,
                      int controller_id, const Colors& source_colors) const;
    void resolve(StackObject* object);
    void applyEffects(const std::vector<Effect>& effects, const std::vector<Target>& targets,
                      int controller_id, std::optional<int> source_id, const Colors& source_colors);
    void applyEffect(const Effect& effect, const std::optional<Target>& target,
                     int controller_id, std::optional<int> source_id);
    Colors sourceColors(const StackObject* object) const;
};
