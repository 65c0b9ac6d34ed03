// turn.cpp
#include "turn.h"
#include "combat.h"
#include "priority.h"
#include "rules/game.h"
#include "agents/action.h"

#include <spdlog/spdlog.h>

const char* toString(StepKind step) {
    switch (step) {
        case StepKind::UNTAP: return "untap";
        case StepKind::UPKEEP: return "upkeep";
        case StepKind::DRAW: return "draw";
        case StepKind::PRECOMBAT_MAIN: return "precombat main";
        case StepKind::BEGINNING_OF_COMBAT: return "beginning of combat";
        case StepKind::DECLARE_ATTACKERS: return "declare attackers";
        case StepKind::DECLARE_BLOCKERS: return "declare blockers";
        case StepKind::COMBAT_DAMAGE: return "combat damage";
        case StepKind::END_OF_COMBAT: return "end of combat";
        case StepKind::POSTCOMBAT_MAIN: return "postcombat main";
        case StepKind::END: return "end";
        case StepKind::CLEANUP: return "cleanup";
    }
    return "unknown";
}

TurnSystem::TurnSystem(Game* game) : game(game) {
    global_turn_count = 0;
    active_player_index = 0;
}

std::unique_ptr<ActionSpace> TurnSystem::tick() {

    if (current_turn == nullptr || current_turn->isComplete()) {
        startNextTurn();
    }   

    return current_turn->tick();
}

void TurnSystem::startNextTurn() {
    if (global_turn_count != 0) {
        active_player_index = (active_player_index + 1) % game->players.size();
    }
    current_turn = std::make_unique<Turn>(activePlayer(), this);
    global_turn_count++;
    spdlog::info("Turn {}: {}", global_turn_count, activePlayer()->toString());
}

std::vector<Player*> TurnSystem::priorityOrder() {
    std::vector<Player*> order;
    int num_players = game->players.size();

    for (int i = 0; i < num_players; i++) {
        order.push_back(game->players[(active_player_index + i) % num_players].get());
    }

    return order;
}

Player* TurnSystem::activePlayer() {
    return game->players.at(active_player_index).get();
}

Player* TurnSystem::nonActivePlayer() {
    return game->players.at((active_player_index + 1) % game->players.size()).get();
}

int TurnSystem::landsPlayed() const {
    return current_turn ? current_turn->lands_played : 0;
}

void TurnSystem::landPlayed() {
    if (current_turn) {
        current_turn->lands_played += 1;
    }
}

Turn::Turn(Player* player, TurnSystem* turn_system)
    : turn_system(turn_system), active_player(player) {

    phases.emplace_back(new BeginningPhase(this));
    phases.emplace_back(new PrecombatMainPhase(this));
    phases.emplace_back(new CombatPhase(this));
    phases.emplace_back(new PostcombatMainPhase(this));
    phases.emplace_back(new EndingPhase(this));
}

std::unique_ptr<ActionSpace> Turn::tick() {

    if (current_phase_index >= phases.size()) {
        return nullptr;
    }

    Phase* current_phase = phases[current_phase_index].get();

    if (current_phase->isComplete()) {
        current_phase_index++;
        return nullptr;
    } else {
        return current_phase->tick();
    }
}

std::unique_ptr<ActionSpace> Phase::tick() {
    Step* current_step = steps[current_step_index].get();

    if (current_step->isComplete()) {
        current_step_index++;
        return nullptr;
    }
    return current_step->tick();
}

bool Step::isComplete() {
    return turn_based_actions_complete && mana_pools_emptied;
}

std::unique_ptr<ActionSpace> Step::tick() {
    
    if (!initialized) {
        spdlog::debug("Starting {} step", toString(kind));
        game()->enterStep(kind);
        initialize();
        initialized = true;
    }

    if (isComplete()) {
        throw std::logic_error("Step is complete");
    }

    if (!turn_based_actions_complete) {
        return performTurnBasedActions();
    }

    if (has_priority_window && !game()->priority_system->isComplete()) {
        return game()->priority_system->tick();
    }

    game()->clearManaPools();
    mana_pools_emptied = true;
    return nullptr;
}

// Implementations of specific Steps

std::unique_ptr<ActionSpace> UntapStep::performTurnBasedActions() {
    game()->markPermanentsNotSummoningSick(activePlayer());
    game()->untapAllPermanents(activePlayer());
    turn_based_actions_complete = true;
    return nullptr;
}

std::unique_ptr<ActionSpace> DrawStep::performTurnBasedActions() {
    // The player who goes first skips their first draw.
    if (turn_system()->global_turn_count > 1) {
        game()->drawCards(activePlayer(), 1);
    }
    turn_based_actions_complete = true;
    return nullptr;
}

std::unique_ptr<ActionSpace> CleanupStep::performTurnBasedActions() {
    game()->discardToHandSize(activePlayer());
    game()->endTurnEffects();
    turn_based_actions_complete = true;
    return nullptr;
}
