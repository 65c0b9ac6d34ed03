#include "priority.h"
#include "agents/action.h"
#include "rules/game.h"
#include "rules/spell_casting.h"
#include "rules/state_based_actions.h"
#include "rules/targeting.h"
#include <spdlog/spdlog.h>

#include <algorithm>
#include <memory>

PrioritySystem::PrioritySystem(Game* game) : game(game) {
    reset();
}

std::unique_ptr<ActionSpace> PrioritySystem::makeActionSpace(Player* player) {
    return std::make_unique<ActionSpace>(player, ActionType::PRIORITY, availablePriorityActions(player));
}

void PrioritySystem::reset() {
    for (Player* player : game->priorityOrder()) {
        passed[player->id] = false;
    }
    holder_id = game->activePlayer()->id;
}

void PrioritySystem::grantPriority(Player* player) {
    for (auto& [player_id, has_passed] : passed) {
        has_passed = false;
    }
    holder_id = player->id;
}

bool PrioritySystem::hasPriority(const Player* player) const {
    return !complete && player->id == holder_id;
}

Player* PrioritySystem::playerWithPriority() {
    if (complete) {
        return nullptr;
    }
    return game->player(holder_id);
}

void PrioritySystem::passPriority(Player* player) {
    if (!hasPriority(player)) {
        throw std::logic_error(fmt::format("{} does not have priority", player->name));
    }
    spdlog::debug("{} passes priority", player->name);
    passed[player->id] = true;

    std::vector<Player*> order = game->priorityOrder();
    bool all_passed = std::all_of(order.begin(), order.end(), [&](Player* p) { return passed[p->id]; });

    if (!all_passed) {
        // Next player in turn order.
        auto it = std::find(order.begin(), order.end(), player);
        ++it;
        if (it == order.end()) {
            it = order.begin();
        }
        holder_id = (*it)->id;
        return;
    }

    if (game->zones->stack->empty()) {
        complete = true;
    } else {
        // Resolution resets priority to the active player.
        game->spells->resolveTop();
    }
}

std::unique_ptr<ActionSpace> PrioritySystem::tick() {

    if (isComplete()) {
        throw std::logic_error("Priority system is complete");
    }

    game->state_based_actions->check();
    if (game->isGameOver()) {
        return nullptr;
    }

    return makeActionSpace(playerWithPriority());
}

std::vector<std::unique_ptr<Action>> PrioritySystem::availablePriorityActions(Player* player) {
    
    std::vector<std::unique_ptr<Action>> actions;

    std::vector<Card*> hand_cards = game->cardsInHand(player);
    Mana available_mana = player->mana_pool;
    available_mana.add(game->zones->battlefield->producibleMana(player->id));

    for (Card* card : hand_cards) {
        if (card == nullptr) {
            throw std::logic_error("Card should never be null");
        }
        if (card->types.isLand() && game->canPlayLand(player)) {
            actions.push_back(std::make_unique<PlayLand>(card, player, game));
        }
    }

    for (Card* card : hand_cards) {
        if (card->types.isLand() || !game->spells->hasCastTiming(card, player)) {
            continue;
        }
        if (!available_mana.canPay(card->mana_cost.value_or(ManaCost()))) {
            continue;
        }
        std::optional<std::vector<Target>> targets = chooseTargets(game, card->spell_effects, player->id, card->colors);
        if (targets) {
            actions.push_back(std::make_unique<CastSpell>(card, player, game, *targets));
        }
    }

    // Mana abilities are activated while paying costs, not offered here.
    for (Permanent* permanent : game->zones->battlefield->permanentsOf(player->id)) {
        for (const Ability& ability : permanent->card->abilities) {
            if (ability.type != AbilityType::ACTIVATED || ability.cost.isFree()) {
                continue;
            }
            if (!game->spells->hasActivationTiming(ability, player)) {
                continue;
            }
            if (ability.cost.tap && !permanent->canPayTapCost(ability)) {
                continue;
            }
            if (!available_mana.canPay(ability.cost.mana)) {
                continue;
            }
            std::optional<std::vector<Target>> targets =
                chooseTargets(game, ability.effects, player->id, permanent->colors());
            if (targets) {
                actions.push_back(std::make_unique<ActivateAbility>(permanent, &ability, player, game, *targets));
            }
        }
    }

    // Always allow passing priority
    actions.push_back(std::make_unique<PassPriority>(player, this));

    return actions;
}
