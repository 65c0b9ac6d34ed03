#include "keywords.h"

#include <algorithm>
#include <cctype>
#include <map>

#include <spdlog/spdlog.h>

namespace {

std::string lower(const std::string& text) {
    std::string result = text;
    std::transform(result.begin(), result.end(), result.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

std::string trim(const std::string& text) {
    size_t begin = text.find_first_not_of(" \t");
    if (begin == std::string::npos) {
        return "";
    }
    size_t end = text.find_last_not_of(" \t");
    return text.substr(begin, end - begin + 1);
}

const std::map<std::string, Keyword>& keywordNames() {
    static const std::map<std::string, Keyword> names = {
        {"deathtouch", Keyword::DEATHTOUCH},
        {"defender", Keyword::DEFENDER},
        {"double strike", Keyword::DOUBLE_STRIKE},
        {"fear", Keyword::FEAR},
        {"first strike", Keyword::FIRST_STRIKE},
        {"flash", Keyword::FLASH},
        {"flying", Keyword::FLYING},
        {"haste", Keyword::HASTE},
        {"hexproof", Keyword::HEXPROOF},
        {"horsemanship", Keyword::HORSEMANSHIP},
        {"indestructible", Keyword::INDESTRUCTIBLE},
        {"intimidate", Keyword::INTIMIDATE},
        {"lifelink", Keyword::LIFELINK},
        {"menace", Keyword::MENACE},
        {"reach", Keyword::REACH},
        {"shadow", Keyword::SHADOW},
        {"shroud", Keyword::SHROUD},
        {"trample", Keyword::TRAMPLE},
        {"unblockable", Keyword::UNBLOCKABLE},
        {"vigilance", Keyword::VIGILANCE},
    };
    return names;
}

const std::map<std::string, Color>& protectionColors() {
    static const std::map<std::string, Color> colors = {
        {"white", Color::WHITE},
        {"blue", Color::BLUE},
        {"black", Color::BLACK},
        {"red", Color::RED},
        {"green", Color::GREEN},
    };
    return colors;
}

const std::string PROTECTION_PREFIX = "protection from ";

} // namespace

std::string toString(Keyword keyword) {
    for (const auto& [name, value] : keywordNames()) {
        if (value == keyword) {
            return name;
        }
    }
    return "unknown";
}

std::optional<Keyword> parseKeyword(const std::string& text) {
    auto it = keywordNames().find(lower(trim(text)));
    if (it == keywordNames().end()) {
        return std::nullopt;
    }
    return it->second;
}

Keywords Keywords::parse(const std::vector<std::string>& keyword_list) {
    Keywords result;
    for (const std::string& entry : keyword_list) {
        std::string text = lower(trim(entry));

        if (text.rfind(PROTECTION_PREFIX, 0) == 0) {
            std::string quality = trim(text.substr(PROTECTION_PREFIX.size()));
            auto color = protectionColors().find(quality);
            if (color != protectionColors().end()) {
                result.protection_from_colors.insert(color->second);
            } else if (quality == "artifacts") {
                result.protection_from_artifacts = true;
            } else {
                spdlog::debug("Ignoring unsupported protection quality '{}'", quality);
            }
            continue;
        }

        if (std::optional<Keyword> keyword = parseKeyword(text)) {
            result.keywords.insert(*keyword);
        } else {
            spdlog::debug("Ignoring unsupported keyword '{}'", entry);
        }
    }
    return result;
}

bool Keywords::has(Keyword keyword) const {
    return keywords.contains(keyword);
}

bool Keywords::hasProtectionFrom(const Colors& colors, bool is_artifact) const {
    if (is_artifact && protection_from_artifacts) {
        return true;
    }
    return std::any_of(colors.begin(), colors.end(),
        [&](Color color) { return protection_from_colors.contains(color); });
}
