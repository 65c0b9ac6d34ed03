#pragma once

#include <map>
#include <vector>

#include "turns/turn.h"

class Permanent;
class ActionSpace;

class CombatPhase : public Phase {
public:
    // Attacking permanent ids, in declaration order.
    std::vector<int> attackers;
    // Proposed blocks: attacker id -> blocker ids. Applied at the end of the declare blockers step.
    std::map<int, std::vector<int>> proposed_blocks;

    CombatPhase(Turn* parent_turn);
};

class CombatStep : public Step {
public:
    CombatPhase* combat_phase;
    CombatStep(CombatPhase* parent_combat_phase, StepKind kind) : Step(parent_combat_phase, kind), combat_phase(parent_combat_phase) {}
};

class BeginningOfCombatStep : public CombatStep {
public:
    BeginningOfCombatStep(CombatPhase* parent_combat_phase): CombatStep(parent_combat_phase, StepKind::BEGINNING_OF_COMBAT) {}
};

class DeclareAttackersStep : public CombatStep {
public:
    std::vector<Permanent*> attackers_to_declare;
    
    DeclareAttackersStep(CombatPhase* parent_combat_phase): CombatStep(parent_combat_phase, StepKind::DECLARE_ATTACKERS) {}
    virtual std::unique_ptr<ActionSpace> performTurnBasedActions() override;
    virtual void initialize() override;

    void declareAttacker(Permanent* attacker);

private:
    std::unique_ptr<ActionSpace> makeActionSpace(Permanent* attacker);
};

class DeclareBlockersStep : public CombatStep {
public:
    std::vector<Permanent*> blockers_to_declare;

    DeclareBlockersStep(CombatPhase* parent_combat_phase): CombatStep(parent_combat_phase, StepKind::DECLARE_BLOCKERS) {}
    virtual std::unique_ptr<ActionSpace> performTurnBasedActions() override;
    virtual void initialize() override;

    void declareBlocker(Permanent* blocker, Permanent* attacker);

private:
    std::unique_ptr<ActionSpace> makeActionSpace(Permanent* blocker);
    void assignBlocks();
};

class CombatDamageStep : public CombatStep {
public:
    CombatDamageStep(CombatPhase* parent_combat_phase): CombatStep(parent_combat_phase, StepKind::COMBAT_DAMAGE) {}
    virtual void initialize() override;
    virtual std::unique_ptr<ActionSpace> performTurnBasedActions() override;
};

class EndOfCombatStep : public CombatStep {
public:
    EndOfCombatStep(CombatPhase* parent_combat_phase): CombatStep(parent_combat_phase, StepKind::END_OF_COMBAT) {}
    virtual std::unique_ptr<ActionSpace> performTurnBasedActions() override;
};
