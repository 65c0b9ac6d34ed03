#pragma once

#include <vector>
#include <memory>
#include <optional>
#include <string>

#include "zones/zone.h"
#include "rules/ability.h"

class Game;
class Card;
class Player;

enum class StackObjectType {
    SPELL,
    ABILITY
};

class StackObject {
public:
    int id;
    StackObjectType type;
    int controller_id;

    // Spells only.
    Card* card = nullptr;
    // Abilities only. A copy, so the object outlives its source.
    std::optional<Ability> ability;
    std::optional<int> source_id;

    std::vector<Target> targets;
    // Set only when a counterspell targeting this object resolves.
    bool countered = false;

    static std::unique_ptr<StackObject> spell(int id, Card* card, int controller_id, const std::vector<Target>& targets);
    static std::unique_ptr<StackObject> abilityOf(int id, const Ability& ability, int source_id, int controller_id,
                                                  const std::vector<Target>& targets);

    bool isSpell() const { return type == StackObjectType::SPELL; }
    const std::vector<Effect>& effects() const;
    std::string toString() const;
};

// Last in, first out. Spell cards sit in this zone while their object is on the stack.
class Stack : public Zone {
public:
    std::vector<std::unique_ptr<StackObject>> objects;

    Stack(Game* game);

    virtual void move(Card* card) override;
    virtual void remove(Card* card) override;
    const char* name() const override { return "stack"; }

    StackObject* push(std::unique_ptr<StackObject> object);
    std::unique_ptr<StackObject> pop();
    StackObject* top();
    const StackObject* peek() const;
    StackObject* find(int stack_object_id);

    size_t size() const;
    bool empty() const;
};
