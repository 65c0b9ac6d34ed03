// combat_resolver.cpp
#include "combat_resolver.h"
#include "rules/game.h"
#include "rules/state_based_actions.h"

#include <algorithm>
#include <spdlog/spdlog.h>

const char* toString(DamageStage stage) {
    switch (stage) {
        case DamageStage::FIRST_STRIKE_DAMAGE: return "first strike damage";
        case DamageStage::CLEANUP_1: return "first cleanup";
        case DamageStage::REGULAR_DAMAGE: return "regular damage";
        case DamageStage::CLEANUP_2: return "second cleanup";
        case DamageStage::DONE: return "done";
    }
    return "unknown";
}

CombatResolver::CombatResolver(Game* game) : game(game) {}

bool CombatResolver::canBlock(const Permanent* attacker, const Permanent* blocker) {
    if (!blocker->canBlock()) {
        return false;
    }

    bool shares_color = std::any_of(attacker->colors().begin(), attacker->colors().end(),
        [&](Color color) { return blocker->colors().contains(color); });
    bool artifact_creature = blocker->isArtifact() && blocker->isCreature();

    if (attacker->hasKeyword(Keyword::FLYING)
        && !blocker->hasKeyword(Keyword::FLYING) && !blocker->hasKeyword(Keyword::REACH)) {
        return false;
    }
    if (attacker->hasKeyword(Keyword::INTIMIDATE) && !artifact_creature && !shares_color) {
        return false;
    }
    // Shadow creatures block and are blocked only by each other.
    if (attacker->hasKeyword(Keyword::SHADOW) != blocker->hasKeyword(Keyword::SHADOW)) {
        return false;
    }
    if (attacker->hasKeyword(Keyword::FEAR) && !artifact_creature && !blocker->colors().contains(Color::BLACK)) {
        return false;
    }
    if (attacker->hasKeyword(Keyword::HORSEMANSHIP) && !blocker->hasKeyword(Keyword::HORSEMANSHIP)) {
        return false;
    }
    if (attacker->hasKeyword(Keyword::UNBLOCKABLE)) {
        return false;
    }
    // Protection overrides everything above.
    return !attacker->keywords().hasProtectionFrom(blocker->colors(), blocker->isArtifact());
}

bool CombatResolver::assignBlockers(Permanent* attacker, const std::vector<Permanent*>& blockers) {
    if (blockers.empty()) {
        return true;
    }
    if (attacker->hasKeyword(Keyword::MENACE) && blockers.size() < 2) {
        spdlog::info("{} has menace and cannot be blocked by a single creature", attacker->toString());
        return false;
    }
    for (const Permanent* blocker : blockers) {
        if (!canBlock(attacker, blocker) || blocker->blocking.has_value()) {
            spdlog::info("{} cannot block {}", blocker->toString(), attacker->toString());
            return false;
        }
    }

    for (Permanent* blocker : blockers) {
        blocker->blocking = attacker->id;
        attacker->blocked_by.push_back(blocker->id);
        spdlog::info("{} blocks {}", blocker->toString(), attacker->toString());
    }
    attacker->blocked = true;
    return true;
}

bool CombatResolver::dealsDamageIn(const Permanent* permanent, bool first_strike_step) {
    bool first_strike = permanent->hasKeyword(Keyword::FIRST_STRIKE);
    bool double_strike = permanent->hasKeyword(Keyword::DOUBLE_STRIKE);
    if (first_strike_step) {
        return first_strike || double_strike;
    }
    return !first_strike || double_strike;
}

std::vector<CombatResolver::DamageAssignment> CombatResolver::assignCombatDamage(bool first_strike_step) {
    std::vector<DamageAssignment> assignments;
    Battlefield* battlefield = game->zones->battlefield.get();

    battlefield->forEach([&](Permanent* permanent) {
        if (!permanent->isCreature() || !dealsDamageIn(permanent, first_strike_step) || permanent->power() <= 0) {
            return;
        }

        if (permanent->blocking) {
            Permanent* attacker = battlefield->find(*permanent->blocking);
            if (attacker) {
                assignments.push_back({permanent->id, false, attacker->id, permanent->power()});
            }
            return;
        }

        if (!permanent->attacking) {
            return;
        }

        int defending_player_id = *permanent->attacking;
        bool trample = permanent->hasKeyword(Keyword::TRAMPLE);
        if (!permanent->blocked) {
            assignments.push_back({permanent->id, true, defending_player_id, permanent->power()});
            return;
        }

        std::vector<Permanent*> blockers;
        for (int blocker_id : permanent->blocked_by) {
            Permanent* blocker = battlefield->find(blocker_id);
            if (blocker) {
                blockers.push_back(blocker);
            }
        }

        // Lethal damage to each blocker in order. Trample sends the rest to the player,
        // otherwise the last blocker takes it.
        int remaining = permanent->power();
        bool deathtouch = permanent->hasKeyword(Keyword::DEATHTOUCH);
        for (size_t i = 0; i < blockers.size() && remaining > 0; i++) {
            Permanent* blocker = blockers[i];
            int lethal = deathtouch ? 1 : std::max(0, blocker->toughness() - blocker->damage);
            bool last = i + 1 == blockers.size();
            int amount = (last && !trample) ? remaining : std::min(remaining, lethal);
            if (amount > 0) {
                assignments.push_back({permanent->id, false, blocker->id, amount});
                remaining -= amount;
            }
        }
        if (trample && remaining > 0) {
            assignments.push_back({permanent->id, true, defending_player_id, remaining});
        }
    });

    return assignments;
}

void CombatResolver::dealCombatDamage(bool first_strike_step) {
    // Everything is assigned before anything is dealt.
    std::vector<DamageAssignment> assignments = assignCombatDamage(first_strike_step);

    for (const DamageAssignment& assignment : assignments) {
        Permanent* source = game->permanent(assignment.source_id);
        if (assignment.to_player) {
            Player* player = game->player(assignment.target_id);
            player->takeDamage(assignment.amount);
            spdlog::info("{} deals {} damage to {}", source->toString(), assignment.amount, player->name);
        } else {
            Permanent* target = game->permanent(assignment.target_id);
            target->takeDamage(assignment.amount, source->hasKeyword(Keyword::DEATHTOUCH));
            spdlog::info("{} deals {} damage to {}", source->toString(), assignment.amount, target->toString());
        }
        if (source->hasKeyword(Keyword::LIFELINK)) {
            Player* controller = game->player(source->controller_id);
            controller->gainLife(assignment.amount);
            spdlog::info("{} gains {} life", controller->name, assignment.amount);
        }
    }
}

DamageStage CombatResolver::advance() {
    spdlog::debug("Combat damage: {}", toString(stage));
    switch (stage) {
        case DamageStage::FIRST_STRIKE_DAMAGE:
            dealCombatDamage(true);
            stage = DamageStage::CLEANUP_1;
            break;
        case DamageStage::CLEANUP_1:
            game->state_based_actions->check();
            stage = DamageStage::REGULAR_DAMAGE;
            break;
        case DamageStage::REGULAR_DAMAGE:
            dealCombatDamage(false);
            stage = DamageStage::CLEANUP_2;
            break;
        case DamageStage::CLEANUP_2:
            game->state_based_actions->check();
            stage = DamageStage::DONE;
            break;
        case DamageStage::DONE:
            break;
    }
    return stage;
}

void CombatResolver::resolveDamage() {
    while (stage != DamageStage::DONE) {
        advance();
    }
}
