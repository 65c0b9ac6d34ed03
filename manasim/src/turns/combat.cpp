#include "combat.h"
#include "combat_resolver.h"

#include "zones/battlefield.h"
#include "rules/game.h"
#include "agents/action.h"

#include <memory>
#include <spdlog/spdlog.h>

CombatPhase::CombatPhase(Turn* parent_turn) : Phase(parent_turn) {
    steps.emplace_back(new BeginningOfCombatStep(this));
    steps.emplace_back(new DeclareAttackersStep(this));
    steps.emplace_back(new DeclareBlockersStep(this));
    steps.emplace_back(new CombatDamageStep(this));
    steps.emplace_back(new EndOfCombatStep(this));
}

void DeclareAttackersStep::initialize() {
    attackers_to_declare = game()->zones->battlefield->eligibleAttackers(activePlayer()->id);
}

void DeclareAttackersStep::declareAttacker(Permanent* attacker) {
    if (!attacker->canAttack()) {
        throw std::logic_error(fmt::format("{} cannot attack", attacker->toString()));
    }
    attacker->attack(game()->nonActivePlayer()->id);
    combat_phase->attackers.push_back(attacker->id);
    combat_phase->proposed_blocks[attacker->id] = std::vector<int>();
    spdlog::info("{} attacks", attacker->toString());
}

std::unique_ptr<ActionSpace> DeclareAttackersStep::makeActionSpace(Permanent* attacker) {

    std::vector<std::unique_ptr<Action>> actions;
    Player* active_player = activePlayer();

    actions.emplace_back(new DeclareAttackerAction(attacker, true, active_player, this));
    // Goaded creatures attack if able.
    if (!attacker->goaded) {
        actions.emplace_back(new DeclareAttackerAction(attacker, false, active_player, this));
    }

    return std::make_unique<ActionSpace>(active_player, ActionType::DECLARE_ATTACKER, std::move(actions));
}

std::unique_ptr<ActionSpace> DeclareAttackersStep::performTurnBasedActions() {

    if (attackers_to_declare.empty()) {
        turn_based_actions_complete = true;
        return nullptr;
    }

    Permanent* attacker = attackers_to_declare.back();
    attackers_to_declare.pop_back();
    
    return makeActionSpace(attacker);
}

void DeclareBlockersStep::initialize() {
    if (combat_phase->attackers.empty()) {
        // No attackers: nothing to block and no priority window.
        has_priority_window = false;
        turn_based_actions_complete = true;
        return;
    }
    blockers_to_declare = game()->zones->battlefield->eligibleBlockers(game()->nonActivePlayer()->id);
}

void DeclareBlockersStep::declareBlocker(Permanent* blocker, Permanent* attacker) {
    if (!CombatResolver::canBlock(attacker, blocker)) {
        throw std::logic_error(fmt::format("{} cannot block {}", blocker->toString(), attacker->toString()));
    }
    combat_phase->proposed_blocks[attacker->id].push_back(blocker->id);
}

std::unique_ptr<ActionSpace> DeclareBlockersStep::makeActionSpace(Permanent* blocker) {

    std::vector<std::unique_ptr<Action>> favorable;
    std::vector<std::unique_ptr<Action>> unfavorable;
    Player* blocking_player = game()->nonActivePlayer();

    for (int attacker_id : combat_phase->attackers) {
        Permanent* attacker = game()->permanent(attacker_id);
        if (attacker == nullptr || !CombatResolver::canBlock(attacker, blocker)) {
            continue;
        }
        bool survives = blocker->toughness() - blocker->damage > attacker->power()
            && !attacker->hasKeyword(Keyword::DEATHTOUCH);
        bool kills = blocker->power() >= attacker->toughness() - attacker->damage
            || (blocker->hasKeyword(Keyword::DEATHTOUCH) && blocker->power() > 0);
        auto action = std::make_unique<DeclareBlockerAction>(blocker, attacker, blocking_player, this);
        if (survives || kills) {
            favorable.push_back(std::move(action));
        } else {
            unfavorable.push_back(std::move(action));
        }
    }

    std::vector<std::unique_ptr<Action>> actions = std::move(favorable);
    actions.emplace_back(new DeclareBlockerAction(blocker, nullptr, blocking_player, this));
    for (std::unique_ptr<Action>& action : unfavorable) {
        actions.push_back(std::move(action));
    }

    return std::make_unique<ActionSpace>(blocking_player, ActionType::DECLARE_BLOCKER, std::move(actions));
}

void DeclareBlockersStep::assignBlocks() {
    CombatResolver resolver(game());
    for (auto& [attacker_id, blocker_ids] : combat_phase->proposed_blocks) {
        Permanent* attacker = game()->permanent(attacker_id);
        if (attacker == nullptr) {
            continue;
        }
        std::vector<Permanent*> blockers;
        for (int blocker_id : blocker_ids) {
            Permanent* blocker = game()->permanent(blocker_id);
            if (blocker) {
                blockers.push_back(blocker);
            }
        }
        if (!resolver.assignBlockers(attacker, blockers)) {
            spdlog::info("Blocks on {} are illegal and removed", attacker->toString());
            blocker_ids.clear();
        }
    }
}

std::unique_ptr<ActionSpace> DeclareBlockersStep::performTurnBasedActions() {
    if (blockers_to_declare.empty()) {
        assignBlocks();
        turn_based_actions_complete = true;
        return nullptr;
    }

    Permanent* blocker = blockers_to_declare.back();
    blockers_to_declare.pop_back();
    
    return makeActionSpace(blocker);
}

void CombatDamageStep::initialize() {
    if (combat_phase->attackers.empty()) {
        has_priority_window = false;
    }
}

std::unique_ptr<ActionSpace> CombatDamageStep::performTurnBasedActions() {
    if (!combat_phase->attackers.empty()) {
        CombatResolver resolver(game());
        resolver.resolveDamage();
    }
    turn_based_actions_complete = true;
    return nullptr;
}

std::unique_ptr<ActionSpace> EndOfCombatStep::performTurnBasedActions() {
    game()->zones->battlefield->forEach([](Permanent* permanent) {
        permanent->clearCombatState();
    });
    combat_phase->attackers.clear();
    combat_phase->proposed_blocks.clear();
    turn_based_actions_complete = true;
    return nullptr;
}
