// mana.cpp
#include "mana.h"
#include "rules/errors.h"

#include <algorithm>
#include <cctype>
#include <stdexcept>

#include <spdlog/fmt/fmt.h>

namespace {

// Generic costs drain colorless first so colored mana stays available.
const std::vector<Color> GENERIC_PAYMENT_ORDER = {
    Color::COLORLESS, Color::ANY,
    Color::WHITE, Color::BLUE, Color::BLACK, Color::RED, Color::GREEN
};

bool isNumber(const std::string& token) {
    return !token.empty() && std::all_of(token.begin(), token.end(), [](unsigned char c) { return std::isdigit(c); });
}

std::vector<std::string> symbolTokens(const std::string& str) {
    std::vector<std::string> tokens;
    if (str.find('{') == std::string::npos) {
        // Compact form: leading digits are one generic token, every other char is a symbol.
        size_t i = 0;
        while (i < str.size() && std::isdigit(static_cast<unsigned char>(str[i]))) {
            ++i;
        }
        if (i > 0) {
            tokens.push_back(str.substr(0, i));
        }
        for (; i < str.size(); ++i) {
            if (!std::isspace(static_cast<unsigned char>(str[i]))) {
                tokens.push_back(std::string(1, str[i]));
            }
        }
        return tokens;
    }

    size_t pos = 0;
    while ((pos = str.find('{', pos)) != std::string::npos) {
        size_t end = str.find('}', pos);
        if (end == std::string::npos) {
            throw std::invalid_argument(fmt::format("Unterminated mana symbol in '{}'", str));
        }
        tokens.push_back(str.substr(pos + 1, end - pos - 1));
        pos = end + 1;
    }
    return tokens;
}

} // namespace

std::string toString(Color color) {
    switch (color) {
        case Color::WHITE:     return "W";
        case Color::BLUE:      return "U";
        case Color::BLACK:     return "B";
        case Color::RED:       return "R";
        case Color::GREEN:     return "G";
        case Color::COLORLESS: return "C";
        case Color::ANY:       return "*";
    }
    return "?";
}

Color colorFromSymbol(char symbol) {
    switch (std::toupper(static_cast<unsigned char>(symbol))) {
        case 'W': return Color::WHITE;
        case 'U': return Color::BLUE;
        case 'B': return Color::BLACK;
        case 'R': return Color::RED;
        case 'G': return Color::GREEN;
        case 'C': return Color::COLORLESS;
        default:
            throw std::invalid_argument(fmt::format("Unknown mana symbol '{}'", symbol));
    }
}

bool isColored(Color color) {
    return color != Color::COLORLESS && color != Color::ANY;
}

ManaCost::ManaCost() : generic(0) {}

ManaCost ManaCost::parse(const std::string& mana_cost_str, int x_value) {
    ManaCost mana_cost;
    for (const std::string& token : symbolTokens(mana_cost_str)) {
        if (isNumber(token)) {
            mana_cost.generic += std::stoi(token);
        } else if (token == "X" || token == "x") {
            mana_cost.generic += x_value;
        } else if (token.find('/') != std::string::npos) {
            // Hybrid and Phyrexian symbols are paid as generic; {2/W} counts two.
            mana_cost.generic += token.rfind("2/", 0) == 0 ? 2 : 1;
        } else if (token.size() == 1) {
            mana_cost.cost[colorFromSymbol(token[0])] += 1;
        } else {
            throw std::invalid_argument(fmt::format("Unknown mana symbol '{}' in '{}'", token, mana_cost_str));
        }
    }
    return mana_cost;
}

std::string ManaCost::toString() const {
    std::string result;
    if (generic > 0 || cost.empty()) {
        result += std::to_string(generic);
    }
    for (const auto& [color, amount] : cost) {
        for (int i = 0; i < amount; ++i) {
            result += ::toString(color);
        }
    }
    return result;
}

Colors ManaCost::colors() const {
    Colors colors;
    for (const auto& [color, amount] : cost) {
        if (amount > 0 && isColored(color)) {
            colors.insert(color);
        }
    }
    return colors;
}

int ManaCost::manaValue() const {
    int value = generic;
    for (const auto& [color, amount] : cost) {
        value += amount;
    }
    return value;
}

bool ManaCost::isZero() const {
    return manaValue() == 0;
}

Mana::Mana() {}

Mana Mana::parse(const std::string& mana_str) {
    Mana result;
    for (const std::string& token : symbolTokens(mana_str)) {
        if (isNumber(token)) {
            result.add(Color::COLORLESS, std::stoi(token));
        } else if (token.size() == 1) {
            result.add(colorFromSymbol(token[0]), 1);
        } else {
            throw std::invalid_argument(fmt::format("Unknown mana symbol '{}' in '{}'", token, mana_str));
        }
    }
    return result;
}

Mana Mana::single(Color color, int amount) {
    Mana result;
    result.add(color, amount);
    return result;
}

void Mana::add(const Mana& other) {
    for (const auto& [color, amount] : other.mana) {
        add(color, amount);
    }
}

void Mana::add(Color color, int amount) {
    if (amount < 0) {
        throw std::invalid_argument("Cannot add a negative amount of mana.");
    }
    mana[color] += amount;
}

int Mana::amount(Color color) const {
    auto it = mana.find(color);
    return it == mana.end() ? 0 : it->second;
}

int Mana::total() const {
    int sum = 0;
    for (const auto& [color, amount] : mana) {
        sum += amount;
    }
    return sum;
}

bool Mana::canPay(const ManaCost& mana_cost) const {
    int colored_required = 0;
    for (const auto& [color, required] : mana_cost.cost) {
        if (amount(color) < required) {
            return false;
        }
        colored_required += required;
    }
    return total() - colored_required >= mana_cost.generic;
}

void Mana::pay(const ManaCost& mana_cost) {
    if (!canPay(mana_cost)) {
        throw InsufficientManaError(fmt::format("Cannot pay {} with {}", mana_cost.toString(), toString()));
    }

    for (const auto& [color, required] : mana_cost.cost) {
        mana[color] -= required;
    }

    int generic_left = mana_cost.generic;
    for (Color color : GENERIC_PAYMENT_ORDER) {
        if (generic_left == 0) {
            break;
        }
        int spent = std::min(amount(color), generic_left);
        if (spent > 0) {
            mana[color] -= spent;
            generic_left -= spent;
        }
    }
}

void Mana::clear() {
    mana.clear();
}

std::string Mana::toString() const {
    std::string result;
    for (const auto& [color, amount] : mana) {
        for (int i = 0; i < amount; ++i) {
            result += ::toString(color);
        }
    }
    return result.empty() ? "0" : result;
}
