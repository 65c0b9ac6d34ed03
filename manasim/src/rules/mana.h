#pragma once

#include <string>
#include <map>
#include <set>
#include <vector>

enum class Color {
    WHITE,
    BLUE,
    BLACK,
    RED,
    GREEN,
    COLORLESS,
    // Mana not bound to any color. Only spends on generic costs.
    ANY
};

std::string toString(Color color);
Color colorFromSymbol(char symbol);
bool isColored(Color color);

using Colors = std::set<Color>;

class ManaCost {
public:
    std::map<Color, int> cost;
    int generic;

    ManaCost();
    // Accepts "{2}{R}{G}" or the compact "2RG". {X} becomes x_value generic.
    static ManaCost parse(const std::string& mana_cost_str, int x_value = 0);
    std::string toString() const;
    Colors colors() const;
    int manaValue() const;
    bool isZero() const;
};

class Mana {
public:
    std::map<Color, int> mana;
    static Mana parse(const std::string& mana_str);
    static Mana single(Color color, int amount = 1);

    Mana();
    void add(const Mana& other);
    void add(Color color, int amount);
    int amount(Color color) const;
    int total() const;
    bool canPay(const ManaCost& mana_cost) const;
    void pay(const ManaCost& mana_cost);
    void clear();
    std::string toString() const;
};
