// stack.cpp
#include "stack.h"
#include "rules/game.h"

#include <algorithm>

#include <spdlog/spdlog.h>

std::unique_ptr<StackObject> StackObject::spell(int id, Card* card, int controller_id, const std::vector<Target>& targets) {
    auto object = std::make_unique<StackObject>();
    object->id = id;
    object->type = StackObjectType::SPELL;
    object->controller_id = controller_id;
    object->card = card;
    object->targets = targets;
    return object;
}

std::unique_ptr<StackObject> StackObject::abilityOf(int id, const Ability& ability, int source_id, int controller_id,
                                                    const std::vector<Target>& targets) {
    auto object = std::make_unique<StackObject>();
    object->id = id;
    object->type = StackObjectType::ABILITY;
    object->controller_id = controller_id;
    object->ability = ability;
    object->source_id = source_id;
    object->targets = targets;
    return object;
}

const std::vector<Effect>& StackObject::effects() const {
    if (isSpell()) {
        return card->spell_effects;
    }
    return ability->effects;
}

std::string StackObject::toString() const {
    if (isSpell()) {
        return fmt::format("spell {} [{}]", card->name, id);
    }
    return fmt::format("ability '{}' [{}]", ability->name, id);
}

Stack::Stack(Game* game)
    : Zone(game) {}

void Stack::move(Card* card) {
    if (card->current_zone == this) {
        throw std::logic_error(fmt::format("Card {} already on the stack", card->toString()));
    }
    Zone::move(card);
}

void Stack::remove(Card* card) {
    Zone::remove(card);
    objects.erase(std::remove_if(objects.begin(), objects.end(),
        [&card](const std::unique_ptr<StackObject>& object) { return object->card == card; }),
        objects.end());
}

StackObject* Stack::push(std::unique_ptr<StackObject> object) {
    if (object->isSpell()) {
        move(object->card);
    }
    spdlog::debug("Pushing {} onto the stack", object->toString());
    objects.push_back(std::move(object));
    return objects.back().get();
}

std::unique_ptr<StackObject> Stack::pop() {
    if (objects.empty()) {
        throw std::logic_error("Cannot pop an empty stack");
    }
    std::unique_ptr<StackObject> object = std::move(objects.back());
    objects.pop_back();
    return object;
}

StackObject* Stack::top() {
    return objects.empty() ? nullptr : objects.back().get();
}

const StackObject* Stack::peek() const {
    return objects.empty() ? nullptr : objects.back().get();
}

StackObject* Stack::find(int stack_object_id) {
    for (const std::unique_ptr<StackObject>& object : objects) {
        if (object->id == stack_object_id) {
            return object.get();
        }
    }
    return nullptr;
}

size_t Stack::size() const {
    return objects.size();
}

bool Stack::empty() const {
    return objects.empty();
}
