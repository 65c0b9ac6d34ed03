// src/main.cpp
#include <functional>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include "rules/game.h"
#include "rules/player.h"
#include "cardsets/card_registry.h"
#include "cardsets/decklist.h"

namespace {

PlayerConfig redDeck() {
    return PlayerConfig("Red Player", {
        {"Mountain", 17},
        {"Gray Ogre", 8},
        {"Hill Giant", 8},
        {"Lightning Bolt", 4},
        {"Shivan Dragon", 3}
    });
}

PlayerConfig greenDeck() {
    return PlayerConfig("Green Player", {
        {"Forest", 17},
        {"Llanowar Elves", 8},
        {"Grizzly Bears", 8},
        {"Giant Growth", 4},
        {"Craw Wurm", 3}
    });
}

// Wins are counted per deck slot, so decks with the same name stay apart.
struct Tally {
    std::mutex mutex;
    int wins_a = 0;
    int wins_b = 0;
    int no_result = 0;
    int total_turns = 0;
};

void playGames(int first_seed, int num_games, const PlayerConfig& deck_a, const PlayerConfig& deck_b, Tally& tally) {
    for (int i = 0; i < num_games; i++) {
        GameConfig config;
        config.seed = first_seed + i;

        Game game(config);
        // Alternate who goes first.
        bool a_first = config.seed % 2 == 0;
        if (a_first) {
            game.addPlayer(deck_a);
            game.addPlayer(deck_b);
        } else {
            game.addPlayer(deck_b);
            game.addPlayer(deck_a);
        }
        GameResult result = game.start();

        std::lock_guard<std::mutex> lock(tally.mutex);
        tally.total_turns += result.turns;
        if (result.hasWinner()) {
            // Player ids follow the order the decks were added in.
            bool a_won = (*result.winner_id == 0) == a_first;
            (a_won ? tally.wins_a : tally.wins_b)++;
        } else {
            tally.no_result++;
        }
    }
}

} // namespace

int main(int argc, char* argv[]) {
    auto console = spdlog::stdout_color_mt("console");
    spdlog::set_default_logger(console);
    spdlog::set_level(spdlog::level::warn);

    registerAllCards();

    int num_games = argc > 1 ? std::stoi(argv[1]) : 1;
    int num_threads = argc > 2 ? std::stoi(argv[2]) : 1;
    if (num_games < 1 || num_threads < 1) {
        std::cerr << "usage: manasim [games] [threads] [deck_a deck_b]" << std::endl;
        return 1;
    }
    if (num_games == 1) {
        spdlog::set_level(spdlog::level::info);
    }

    PlayerConfig deck_a = redDeck();
    PlayerConfig deck_b = greenDeck();
    if (argc > 4) {
        try {
            deck_a = loadDeckList(argv[3]);
            deck_b = loadDeckList(argv[4]);
        } catch (const std::runtime_error& e) {
            spdlog::error("{}", e.what());
            return 1;
        }
    }

    Tally tally;
    std::vector<std::thread> workers;
    int per_thread = num_games / num_threads;
    int remainder = num_games % num_threads;
    int next_seed = 0;
    for (int t = 0; t < num_threads; t++) {
        int count = per_thread + (t < remainder ? 1 : 0);
        if (count == 0) {
            continue;
        }
        workers.emplace_back(playGames, next_seed, count, std::cref(deck_a), std::cref(deck_b), std::ref(tally));
        next_seed += count;
    }
    for (std::thread& worker : workers) {
        worker.join();
    }

    std::cout << "Played " << num_games << " games" << std::endl;
    std::cout << "  deck a (" << deck_a.name << "): " << tally.wins_a << " wins" << std::endl;
    std::cout << "  deck b (" << deck_b.name << "): " << tally.wins_b << " wins" << std::endl;
    std::cout << "  no result: " << tally.no_result << std::endl;
    std::cout << "  average turns: " << static_cast<double>(tally.total_turns) / num_games << std::endl;

    return 0;
}
