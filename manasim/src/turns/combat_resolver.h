#pragma once

#include <vector>

class Game;
class Permanent;

enum class DamageStage {
    FIRST_STRIKE_DAMAGE,
    CLEANUP_1,
    REGULAR_DAMAGE,
    CLEANUP_2,
    DONE
};

const char* toString(DamageStage stage);

// Block legality and combat damage for the current combat.
// Attackers and blockers are read from the combat state of permanents on the battlefield.
class CombatResolver {
public:
    Game* game;
    DamageStage stage = DamageStage::FIRST_STRIKE_DAMAGE;

    CombatResolver(Game* game);

    // Pairwise legality. Menace is checked by assignBlockers.
    static bool canBlock(const Permanent* attacker, const Permanent* blocker);

    // Records the blocks, or returns false and changes nothing if they are illegal.
    bool assignBlockers(Permanent* attacker, const std::vector<Permanent*>& blockers);

    // Runs one stage and returns the next.
    DamageStage advance();
    // Runs every remaining stage.
    void resolveDamage();

private:
    struct DamageAssignment {
        int source_id;
        bool to_player;
        int target_id;
        int amount;
    };

    static bool dealsDamageIn(const Permanent* permanent, bool first_strike_step);
    std::vector<DamageAssignment> assignCombatDamage(bool first_strike_step);
    void dealCombatDamage(bool first_strike_step);
};
