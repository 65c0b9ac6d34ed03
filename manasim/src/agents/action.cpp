#include "action.h"
#include "rules/game.h"
#include "rules/spell_casting.h"
#include "turns/combat.h"
#include "turns/turn.h"

#include <spdlog/spdlog.h>

Action* Agent::selectAction(ActionSpace* action_space) {
    if (action_space->empty()) {
        throw std::logic_error("No actions in action space");
    }
    Action* action = action_space->actions[0].get();
    spdlog::debug("{} chooses {}", action_space->player->name, action->toString());
    return action;
}

bool ActionSpace::empty() {
    return actions.empty();
}

void DeclareAttackerAction::execute() {
    if (attack) {
        step->declareAttacker(attacker);
    }
}

std::string DeclareAttackerAction::toString() const {
    return fmt::format("{} {}", attack ? "attack with" : "hold back", attacker->toString());
}
    
void DeclareBlockerAction::execute() {
    if (attacker != nullptr) {
        step->declareBlocker(blocker, attacker);
    }
}

std::string DeclareBlockerAction::toString() const {
    if (attacker == nullptr) {
        return fmt::format("no block for {}", blocker->toString());
    }
    return fmt::format("block {} with {}", attacker->toString(), blocker->toString());
}

PlayLand::PlayLand(Card* card, Player* player, Game* game) : Action(player), game(game), card(card) {}

void PlayLand::execute() {
    game->playLand(player, card);
}

std::string PlayLand::toString() const {
    return "play land " + card->name;
}

CastSpell::CastSpell(Card* card, Player* player, Game* game, const std::vector<Target>& targets)
    : Action(player), game(game), card(card), targets(targets) {
    if (!card->types.isCastable()) {
        throw std::invalid_argument("Cannot cast a land card.");
    }
}

void CastSpell::execute() {
    // Lands are tapped only for a cast that would succeed.
    game->spells->validateCast(card, player, targets);
    game->zones->battlefield->produceMana(card->mana_cost.value_or(ManaCost()), player->id);
    if (targets.size() == 1 && targets[0].type == Target::Type::STACK_OBJECT) {
        game->spells->counterSpell(card, player, game->zones->stack->find(targets[0].id));
    } else {
        game->spells->castSpell(card, player, targets);
    }
}

std::string CastSpell::toString() const {
    return "cast " + card->name;
}

ActivateAbility::ActivateAbility(Permanent* source, const Ability* ability, Player* player, Game* game,
                                 const std::vector<Target>& targets)
    : Action(player), game(game), source(source), ability(ability), targets(targets) {}

void ActivateAbility::execute() {
    game->spells->validateActivation(source, *ability, player, targets);
    if (!ability->cost.mana.isZero()) {
        game->zones->battlefield->produceMana(ability->cost.mana, player->id);
    }
    game->spells->activateAbility(source, *ability, player, targets);
}

std::string ActivateAbility::toString() const {
    return fmt::format("activate '{}' of {}", ability->name, source->toString());
}

PassPriority::PassPriority(Player* player, PrioritySystem* priority_system) : Action(player), priority_system(priority_system) {}

void PassPriority::execute() {
    priority_system->passPriority(player);
}

std::string PassPriority::toString() const {
    return "pass priority";
}
