// state_based_actions.cpp
#include "state_based_actions.h"
#include "rules/game.h"

#include <spdlog/spdlog.h>

StateBasedActionChecker::StateBasedActionChecker(Game* game) : game(game) {}

bool StateBasedActionChecker::check() {
    bool changed = false;

    // 704.5a If a player has 0 or less life, that player loses the game.
    // 704.5b A player who attempted to draw from an empty library loses the game.
    // Every loss in one pass happens simultaneously.
    std::vector<Player*> losers;
    for (const std::unique_ptr<Player>& player : game->players) {
        if (player->lost) {
            continue;
        }
        if (player->life <= 0) {
            spdlog::info("{} has {} life", player->name, player->life);
            losers.push_back(player.get());
        } else if (player->drew_from_empty_library) {
            spdlog::info("{} drew from an empty library", player->name);
            losers.push_back(player.get());
        }
    }
    for (Player* player : losers) {
        game->loseGame(player);
        changed = true;
    }

    // 704.5g / 704.5h Lethal damage, or any deathtouch damage, destroys a creature.
    std::vector<Permanent*> permanents_to_destroy;
    game->zones->battlefield->forEach([&](Permanent* permanent) {
        if (permanent->hasLethalDamage() && !permanent->hasKeyword(Keyword::INDESTRUCTIBLE)) {
            permanents_to_destroy.push_back(permanent);
        }
    });

    // Destroy permanents after iteration
    for (Permanent* permanent : permanents_to_destroy) {
        spdlog::info("{} has lethal damage", permanent->toString());
        changed = game->zones->battlefield->destroy(permanent) || changed;
    }

    return changed;
}
