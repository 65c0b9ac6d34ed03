#pragma once

#include <map>
#include <memory>
#include <vector>

class Game;
class Player;
class Action;
class ActionSpace;

// Priority within one step. Created fresh by Game::enterStep.
class PrioritySystem {
public:
    Game* game;
    // Passes in succession, by player id.
    std::map<int, bool> passed;
    int holder_id;
    bool complete = false;

    PrioritySystem(Game* game);

    // Clears the pass chain and gives priority to the active player.
    void reset();
    // Clears the pass chain and gives priority to a player who just cast or activated.
    void grantPriority(Player* player);
    // Throws std::logic_error if the player does not hold priority.
    void passPriority(Player* player);

    bool hasPriority(const Player* player) const;
    Player* playerWithPriority();
    bool isComplete() const { return complete; }

    std::unique_ptr<ActionSpace> tick();
    std::vector<std::unique_ptr<Action>> availablePriorityActions(Player* player);

private:
    std::unique_ptr<ActionSpace> makeActionSpace(Player* player);
};
