// decklist.cpp
#include "decklist.h"
#include "cardsets/card_registry.h"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <stdexcept>

#include <spdlog/spdlog.h>

namespace {

std::string trim(const std::string& text) {
    size_t begin = text.find_first_not_of(" \t\r");
    if (begin == std::string::npos) {
        return "";
    }
    size_t end = text.find_last_not_of(" \t\r");
    return text.substr(begin, end - begin + 1);
}

std::string lower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

// "4x Name (SET) 123" -> (4, "Name")
std::pair<int, std::string> parseCardLine(const std::string& line) {
    int quantity = 1;
    std::string rest = line;

    size_t digits = 0;
    while (digits < line.size() && std::isdigit(static_cast<unsigned char>(line[digits]))) {
        digits++;
    }
    if (digits > 0) {
        size_t after = digits;
        if (after < line.size() && (line[after] == 'x' || line[after] == 'X')) {
            after++;
        }
        if (after < line.size() && (line[after] == ' ' || line[after] == '\t')) {
            try {
                quantity = std::stoi(line.substr(0, digits));
            } catch (const std::out_of_range&) {
                // Reported as malformed by the caller.
                return {0, ""};
            }
            rest = line.substr(after);
        }
    }

    size_t set_code = rest.find(" (");
    if (set_code != std::string::npos) {
        rest = rest.substr(0, set_code);
    }
    return {quantity, trim(rest)};
}

} // namespace

PlayerConfig parseDeckList(std::istream& input, const std::string& default_name) {
    PlayerConfig config;
    config.name = default_name;
    const CardRegistry& registry = CardRegistry::instance();

    bool in_about = false;
    std::string raw_line;
    while (std::getline(input, raw_line)) {
        std::string line = trim(raw_line);
        if (line.empty() || line.rfind("//", 0) == 0 || line[0] == '#') {
            continue;
        }

        std::string lowered = lower(line);
        if (lowered == "sideboard") {
            break;
        }
        if (lowered == "about") {
            in_about = true;
            continue;
        }
        if (lowered == "deck") {
            in_about = false;
            continue;
        }
        if (in_about && lowered.rfind("name ", 0) == 0) {
            config.name = trim(line.substr(5));
            continue;
        }
        in_about = false;

        auto [quantity, card_name] = parseCardLine(line);
        if (card_name.empty() || quantity <= 0) {
            spdlog::warn("Skipping malformed deck line '{}'", line);
            continue;
        }
        if (!registry.contains(card_name)) {
            spdlog::warn("Skipping unknown card '{}'", card_name);
            continue;
        }
        config.decklist[card_name] += quantity;
    }

    spdlog::debug("Deck {} has {} cards", config.name, config.deckSize());
    return config;
}

PlayerConfig loadDeckList(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        throw std::runtime_error("Cannot read deck list: " + path);
    }
    return parseDeckList(file, std::filesystem::path(path).stem().string());
}
