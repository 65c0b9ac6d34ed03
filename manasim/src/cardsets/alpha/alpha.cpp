// alpha.cpp
#include "alpha.h"
#include "cardsets/card_registry.h"

namespace {

Card creature(const std::string& name, const std::string& mana_cost, const std::vector<std::string>& subtypes,
              int power, int toughness, const std::vector<std::string>& keywords = {},
              const std::vector<Ability>& abilities = {}, const std::string& text = "") {
    return Card(name, ManaCost::parse(mana_cost), CardTypes({CardType::CREATURE}), {}, subtypes, keywords,
                abilities, {}, text, power, toughness);
}

Card instant(const std::string& name, const std::string& mana_cost, const std::vector<Effect>& effects,
             const std::string& text) {
    return Card(name, ManaCost::parse(mana_cost), CardTypes({CardType::INSTANT}), {}, {}, {},
                {}, effects, text, std::nullopt, std::nullopt);
}

} // namespace

// Instants

Card lightningBolt() {
    return instant("Lightning Bolt", "{R}", {Effect::dealDamage(3)},
                   "Lightning Bolt deals 3 damage to any target.");
}

Card counterspell() {
    return instant("Counterspell", "{U}{U}", {Effect::counterSpell()}, "Counter target spell.");
}

Card giantGrowth() {
    return instant("Giant Growth", "{G}", {Effect::pump(3, 3)}, "Target creature gets +3/+3 until end of turn.");
}

Card healingSalve() {
    return instant("Healing Salve", "{W}", {Effect::gainLife(3, TargetKind::PLAYER)}, "Target player gains 3 life.");
}

Card ancestralRecall() {
    return instant("Ancestral Recall", "{U}", {Effect::drawCards(3, TargetKind::PLAYER)},
                   "Target player draws three cards.");
}

Card terror() {
    TargetSpec target(TargetKind::CREATURE);
    target.non_artifact = true;
    target.excluded_colors = {Color::BLACK};
    return instant("Terror", "{1}{B}", {Effect::destroy(target)},
                   "Destroy target nonartifact, nonblack creature. It can't be regenerated.");
}

Card unsummon() {
    return instant("Unsummon", "{U}", {Effect::returnToHand(TargetKind::CREATURE)},
                   "Return target creature to its owner's hand.");
}

// Creatures

Card llanowarElves() {
    return creature("Llanowar Elves", "{G}", {"Elf", "Druid"}, 1, 1, {}, {Ability::tapForMana("G")},
                    "{T}: Add {G}.");
}

Card grizzlyBears() {
    return creature("Grizzly Bears", "{1}{G}", {"Bear"}, 2, 2);
}

Card grayOgre() {
    return creature("Gray Ogre", "{2}{R}", {"Ogre"}, 2, 2);
}

Card hillGiant() {
    return creature("Hill Giant", "{3}{R}", {"Giant"}, 3, 3);
}

Card crawWurm() {
    return creature("Craw Wurm", "{4}{G}{G}", {"Wurm"}, 6, 4);
}

Card giantSpider() {
    return creature("Giant Spider", "{3}{G}", {"Spider"}, 2, 4, {"Reach"});
}

Card serraAngel() {
    return creature("Serra Angel", "{3}{W}{W}", {"Angel"}, 4, 4, {"Flying", "Vigilance"});
}

Card sengirVampire() {
    return creature("Sengir Vampire", "{3}{B}{B}", {"Vampire"}, 4, 4, {"Flying"});
}

Card shivanDragon() {
    AbilityCost firebreathing;
    firebreathing.mana = ManaCost::parse("{R}");
    Ability ability = Ability::activated("Firebreathing", firebreathing, {Effect::pump(1, 0, TargetKind::NONE)});
    return creature("Shivan Dragon", "{4}{R}{R}", {"Dragon"}, 5, 5, {"Flying"}, {ability},
                    "Flying\n{R}: Shivan Dragon gets +1/+0 until end of turn.");
}

Card whiteKnight() {
    return creature("White Knight", "{W}{W}", {"Human", "Knight"}, 2, 2, {"First strike", "Protection from black"});
}

Card blackKnight() {
    return creature("Black Knight", "{B}{B}", {"Human", "Knight"}, 2, 2, {"First strike", "Protection from white"});
}

Card venerableMonk() {
    Ability ability = Ability::triggered("Venerable Monk enters", TriggerCondition::ENTERS_THE_BATTLEFIELD,
                                         {Effect::gainLife(2)});
    return creature("Venerable Monk", "{2}{W}", {"Human", "Monk", "Cleric"}, 2, 2, {}, {ability},
                    "When Venerable Monk enters the battlefield, you gain 2 life.");
}

Card prodigalSorcerer() {
    AbilityCost tap_cost;
    tap_cost.tap = true;
    Ability ability = Ability::activated("Ping", tap_cost, {Effect::dealDamage(1)});
    return creature("Prodigal Sorcerer", "{2}{U}", {"Human", "Wizard"}, 1, 1, {}, {ability},
                    "{T}: Prodigal Sorcerer deals 1 damage to any target.");
}

void registerAlpha() {
    CardRegistry& registry = CardRegistry::instance();
    for (const Card& card : {lightningBolt(), counterspell(), giantGrowth(), healingSalve(), ancestralRecall(),
                             terror(), unsummon(), llanowarElves(), grizzlyBears(), grayOgre(), hillGiant(),
                             crawWurm(), giantSpider(), serraAngel(), sengirVampire(), shivanDragon(),
                             whiteKnight(), blackKnight(), venerableMonk(), prodigalSorcerer()}) {
        registry.registerCard(card.name, card);
    }
}
