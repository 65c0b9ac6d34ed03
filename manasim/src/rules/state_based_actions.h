#pragma once

class Game;

class StateBasedActionChecker {
public:
    Game* game;

    StateBasedActionChecker(Game* game);

    // Returns true if anything changed. A second call with no change in between does nothing.
    bool check();
};
