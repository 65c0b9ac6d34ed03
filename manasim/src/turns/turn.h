#pragma once

#include <vector>
#include <memory>
#include <map>

#include "agents/action.h"

class ActionSpace;
class Step;
class Phase;
class Turn;
class Player;
class Game;

enum class StepKind {
    UNTAP,
    UPKEEP,
    DRAW,
    PRECOMBAT_MAIN,
    BEGINNING_OF_COMBAT,
    DECLARE_ATTACKERS,
    DECLARE_BLOCKERS,
    COMBAT_DAMAGE,
    END_OF_COMBAT,
    POSTCOMBAT_MAIN,
    END,
    CLEANUP
};

const char* toString(StepKind step);

class TurnSystem {
public:
    std::unique_ptr<Turn> current_turn;
    int active_player_index;
    int global_turn_count;
    Game* game;

    Player* activePlayer();
    Player* nonActivePlayer();

    TurnSystem(Game* game);
    std::unique_ptr<ActionSpace> tick();
    void startNextTurn();
    std::vector<Player*> priorityOrder();

    int landsPlayed() const;
    void landPlayed();
};  

class Turn {
public:
    TurnSystem* turn_system;
    Player* active_player;

    std::vector<std::unique_ptr<Phase>> phases;
    size_t current_phase_index = 0;
    int lands_played = 0;

    Turn(Player* active_player, TurnSystem* turn_system);
    std::unique_ptr<ActionSpace> tick();
    bool isComplete() {
        return current_phase_index >= phases.size();
    }
};

class Phase {
public:
    Turn* turn;
    
    std::vector<std::unique_ptr<Step>> steps;
    size_t current_step_index = 0;

    Phase(Turn* turn) : turn(turn) {}
    
    bool isComplete() {
        return current_step_index >= steps.size();
    }

    std::unique_ptr<ActionSpace> tick();
    virtual ~Phase() = default;
};

class Step {
public:
    Phase* phase;
    StepKind kind;
    bool initialized = false;
    bool has_priority_window = true;
    bool turn_based_actions_complete = false;
    bool mana_pools_emptied = false;

    Step(Phase* phase, StepKind kind) : phase(phase), kind(kind) {}

    bool isComplete();

    virtual void initialize() {}

    virtual std::unique_ptr<ActionSpace> performTurnBasedActions() {
        turn_based_actions_complete = true;
        return nullptr;
    };

    // Inline reference accesors
    Game* game() {
        return phase->turn->turn_system->game;
    }
    TurnSystem* turn_system() {
        return phase->turn->turn_system;
    }
    Turn* turn() {
        return phase->turn;
    }
    Player* activePlayer() {
        return phase->turn->active_player;
    }   

    std::unique_ptr<ActionSpace> tick();
    virtual ~Step() = default;
};

// BeginningSteps

class UntapStep : public Step {
public:
    UntapStep(Phase* parent_phase) : Step(parent_phase, StepKind::UNTAP) { has_priority_window = false; }

    virtual std::unique_ptr<ActionSpace> performTurnBasedActions() override;
};

class UpkeepStep : public Step {
public:
    UpkeepStep(Phase* parent_phase) : Step(parent_phase, StepKind::UPKEEP) {}
};

class DrawStep : public Step {
public:
    DrawStep(Phase* parent_phase) : Step(parent_phase, StepKind::DRAW) {}
    
    virtual std::unique_ptr<ActionSpace> performTurnBasedActions() override;
};

// Main Step

class MainStep : public Step {
public:
    MainStep(Phase* parent_phase, StepKind kind) : Step(parent_phase, kind) {}
};

// Ending Steps

class EndStep : public Step {
public:
    EndStep(Phase* parent_phase) : Step(parent_phase, StepKind::END) {}
};

class CleanupStep : public Step {
public:
    CleanupStep(Phase* parent_phase) : Step(parent_phase, StepKind::CLEANUP) {
        has_priority_window = false;
    }

    virtual std::unique_ptr<ActionSpace> performTurnBasedActions() override;
};

// Phases
class BeginningPhase : public Phase {
public:
    BeginningPhase(Turn* parent_turn) : Phase(parent_turn) {
        steps.emplace_back(new UntapStep(this));
        steps.emplace_back(new UpkeepStep(this));
        steps.emplace_back(new DrawStep(this));
    }
};

class PrecombatMainPhase : public Phase {
public:
    PrecombatMainPhase(Turn* parent_turn): Phase(parent_turn) {
        steps.emplace_back(new MainStep(this, StepKind::PRECOMBAT_MAIN));
    }
};

class PostcombatMainPhase : public Phase {
public:
    PostcombatMainPhase(Turn* parent_turn): Phase(parent_turn) {
        steps.emplace_back(new MainStep(this, StepKind::POSTCOMBAT_MAIN));
    }
};

class EndingPhase : public Phase {
public:
    EndingPhase(Turn* parent_turn): Phase(parent_turn) {
        steps.emplace_back(new EndStep(this));
        steps.emplace_back(new CleanupStep(this));
    }
};
