#pragma once

#include <optional>
#include <set>
#include <string>
#include <vector>

#include "rules/mana.h"

enum class Keyword {
    DEATHTOUCH,
    DEFENDER,
    DOUBLE_STRIKE,
    FEAR,
    FIRST_STRIKE,
    FLASH,
    FLYING,
    HASTE,
    HEXPROOF,
    HORSEMANSHIP,
    INDESTRUCTIBLE,
    INTIMIDATE,
    LIFELINK,
    MENACE,
    REACH,
    SHADOW,
    SHROUD,
    TRAMPLE,
    UNBLOCKABLE,
    VIGILANCE
};

std::string toString(Keyword keyword);
std::optional<Keyword> parseKeyword(const std::string& text);

// Evergreen keywords plus "Protection from <quality>", parsed from a card's keyword list.
class Keywords {
public:
    std::set<Keyword> keywords;
    Colors protection_from_colors;
    bool protection_from_artifacts = false;

    Keywords() = default;
    static Keywords parse(const std::vector<std::string>& keyword_list);

    bool has(Keyword keyword) const;
    bool hasProtectionFrom(const Colors& colors, bool is_artifact) const;
};
