#pragma once

#include <memory>
#include <string>
#include <vector>

#include "rules/ability.h"

class Player;
class PrioritySystem;
class Card;
class Game;
class DeclareBlockersStep;
class DeclareAttackersStep;
class Permanent;

class Action {
public:
    Player* player;
    Action(Player* player) : player(player) {}
    virtual void execute() = 0;
    virtual std::string toString() const = 0;
    virtual ~Action() = default;
};

enum class ActionType {
    PRIORITY,
    DECLARE_ATTACKER,
    DECLARE_BLOCKER,
};

class ActionSpace {
public:
    Player* player;
    ActionType action_type;
    std::vector<std::unique_ptr<Action>> actions;
    ActionSpace(Player* player, ActionType action_type, std::vector<std::unique_ptr<Action>>&& actions) : player(player), action_type(action_type), actions(std::move(actions)) {}
    virtual ~ActionSpace() = default;
    bool empty();
};

// Scripted player. Action spaces are ordered so that the first action is the preferred one.
class Agent {
public:
    Player* player;

    Agent(Player* player) : player(player) {}
    virtual ~Agent() = default;
    virtual Action* selectAction(ActionSpace* action_space);
};

// Combat actions

class DeclareAttackerAction : public Action {
public:
    Permanent* attacker;
    bool attack;
    DeclareAttackersStep* step;

    DeclareAttackerAction(Permanent* attacker, bool attack, Player* player, DeclareAttackersStep* step) : Action(player), attacker(attacker), attack(attack), step(step) {}

    void execute() override;
    std::string toString() const override;
};  

class DeclareBlockerAction : public Action {
public:
    Permanent* blocker;
    // nullptr for no block.
    Permanent* attacker;
    DeclareBlockersStep* step;

    DeclareBlockerAction(Permanent* blocker, Permanent* attacker, Player* player, DeclareBlockersStep* step) : Action(player), blocker(blocker), attacker(attacker), step(step) {}

    void execute() override;
    std::string toString() const override;
};  

// Priority actions

class PlayLand : public Action {
public:
    Game* game;
    Card* card;

    PlayLand(Card* card, Player* player, Game* game);

    void execute() override;
    std::string toString() const override;
};

class CastSpell : public Action {
public:
    Game* game;
    Card* card;
    std::vector<Target> targets;

    CastSpell(Card* card, Player* player, Game* game, const std::vector<Target>& targets = {});

    void execute() override;
    std::string toString() const override;
};

class ActivateAbility : public Action {
public:
    Game* game;
    Permanent* source;
    const Ability* ability;
    std::vector<Target> targets;

    ActivateAbility(Permanent* source, const Ability* ability, Player* player, Game* game, const std::vector<Target>& targets = {});

    void execute() override;
    std::string toString() const override;
};

class PassPriority : public Action {
public:
    PrioritySystem* priority_system;

    PassPriority(Player* player, PrioritySystem* priority_system);

    void execute() override;
    std::string toString() const override;
};
