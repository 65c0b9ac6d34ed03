// spell_casting.cpp
#include "spell_casting.h"
#include "rules/game.h"
#include "rules/errors.h"
#include "rules/targeting.h"
#include "rules/state_based_actions.h"
#include "turns/priority.h"

#include <spdlog/spdlog.h>

SpellCastingEngine::SpellCastingEngine(Game* game) : game(game) {}

bool SpellCastingEngine::hasCastTiming(const Card* card, Player* caster) const {
    if (game->priority_system == nullptr || !game->priority_system->hasPriority(caster)) {
        return false;
    }
    return card->hasInstantTiming() || game->canCastSorceries(caster);
}

bool SpellCastingEngine::hasActivationTiming(const Ability& ability, Player* controller) const {
    switch (ability.timing) {
        case TimingRestriction::ANY_TIME:
            return true;
        case TimingRestriction::INSTANT_SPEED:
            return game->priority_system != nullptr && game->priority_system->hasPriority(controller);
        case TimingRestriction::SORCERY_SPEED:
            return game->canCastSorceries(controller);
    }
    return false;
}

void SpellCastingEngine::checkTargets(const std::vector<Effect>& effects, const std::vector<Target>& targets,
                                      int controller_id, const Colors& source_colors) const {
    std::vector<TargetSpec> specs = requiredTargetSpecs(effects);
    if (specs.size() != targets.size()) {
        throw InvalidTargetError(fmt::format("Expected {} targets, got {}", specs.size(), targets.size()));
    }
    for (size_t i = 0; i < specs.size(); i++) {
        if (!isLegalTarget(game, source_colors, controller_id, specs[i], targets[i])) {
            throw InvalidTargetError(fmt::format("Illegal target {}", targets[i].toString()));
        }
    }
}

void SpellCastingEngine::validateCast(const Card* card, Player* caster, const std::vector<Target>& targets) const {
    if (card->types.isLand()) {
        throw std::invalid_argument("Land cards cannot be cast.");
    }
    if (!game->zones->hand->contains(card, caster->id)) {
        throw std::invalid_argument(fmt::format("{} is not in {}'s hand", card->toString(), caster->name));
    }
    if (!hasCastTiming(card, caster)) {
        throw IllegalTimingError(fmt::format("{} cannot cast {} now", caster->name, card->toString()));
    }
    checkTargets(card->spell_effects, targets, caster->id, card->colors);
}

StackObject* SpellCastingEngine::castSpell(Card* card, Player* caster, const std::vector<Target>& targets) {
    validateCast(card, caster, targets);

    ManaCost cost = card->mana_cost.value_or(ManaCost());
    caster->mana_pool.pay(cost);

    StackObject* object = game->zones->stack->push(
        StackObject::spell(game->nextStackObjectId(), card, caster->id, targets));
    spdlog::info("{} casts {}", caster->name, card->toString());

    game->priority_system->grantPriority(caster);
    game->state_based_actions->check();
    return object;
}

void SpellCastingEngine::validateActivation(const Permanent* source, const Ability& ability, Player* controller,
                                            const std::vector<Target>& targets) const {
    if (source->controller_id != controller->id) {
        throw std::invalid_argument(fmt::format("{} does not control {}", controller->name, source->toString()));
    }
    if (ability.type == AbilityType::TRIGGERED || ability.type == AbilityType::STATIC) {
        throw std::invalid_argument(fmt::format("'{}' cannot be activated", ability.name));
    }
    if (!hasActivationTiming(ability, controller)) {
        throw IllegalTimingError(fmt::format("{} cannot activate '{}' now", controller->name, ability.name));
    }
    if (ability.cost.tap && !source->canPayTapCost(ability)) {
        throw RulesError(fmt::format("{} cannot pay the tap cost of '{}'", source->toString(), ability.name));
    }
    checkTargets(ability.effects, targets, controller->id, source->colors());
}

StackObject* SpellCastingEngine::activateAbility(Permanent* source, const Ability& ability, Player* controller,
                                                 const std::vector<Target>& targets) {
    validateActivation(source, ability, controller, targets);

    controller->mana_pool.pay(ability.cost.mana);
    if (ability.cost.tap) {
        source->tap();
    }

    if (!ability.usesStack()) {
        spdlog::debug("{} activates '{}' of {}", controller->name, ability.name, source->toString());
        applyEffects(ability.effects, targets, controller->id, source->id, source->colors());
        return nullptr;
    }

    StackObject* object = game->zones->stack->push(
        StackObject::abilityOf(game->nextStackObjectId(), ability, source->id, controller->id, targets));
    spdlog::info("{} activates '{}' of {}", controller->name, ability.name, source->toString());

    if (game->priority_system) {
        game->priority_system->grantPriority(controller);
    }
    game->state_based_actions->check();
    return object;
}

StackObject* SpellCastingEngine::counterSpell(Card* counter_card, Player* caster, StackObject* target) {
    if (target == nullptr || !target->isSpell() || game->zones->stack->find(target->id) != target) {
        throw InvalidTargetError("Counter target must be a spell on the stack");
    }
    return castSpell(counter_card, caster, {Target::stackObject(target->id)});
}

StackObject* SpellCastingEngine::putTriggeredAbility(Permanent* source, const Ability& ability) {
    std::optional<std::vector<Target>> targets =
        chooseTargets(game, ability.effects, source->controller_id, source->colors());
    if (!targets) {
        spdlog::info("'{}' of {} has no legal target and is removed", ability.name, source->toString());
        return nullptr;
    }
    StackObject* object = game->zones->stack->push(
        StackObject::abilityOf(game->nextStackObjectId(), ability, source->id, source->controller_id, *targets));
    spdlog::info("'{}' of {} triggers", ability.name, source->toString());
    return object;
}

void SpellCastingEngine::resolveTop() {
    std::unique_ptr<StackObject> object = game->zones->stack->pop();
    resolve(object.get());
    if (game->priority_system) {
        game->priority_system->reset();
    }
    game->state_based_actions->check();
}

void SpellCastingEngine::resolveStack() {
    while (!game->zones->stack->empty() && !game->isGameOver()) {
        resolveTop();
    }
}

Colors SpellCastingEngine::sourceColors(const StackObject* object) const {
    if (object->isSpell()) {
        return object->card->colors;
    }
    if (object->source_id) {
        Permanent* source = game->permanent(*object->source_id);
        if (source) {
            return source->colors();
        }
    }
    return Colors();
}

void SpellCastingEngine::resolve(StackObject* object) {
    if (object->countered) {
        spdlog::info("{} was countered", object->toString());
        if (object->isSpell()) {
            game->zones->graveyard->move(object->card);
        }
        return;
    }

    if (!object->isSpell() && object->source_id && game->permanent(*object->source_id) == nullptr) {
        spdlog::info("{} fizzles, its source left the battlefield", object->toString());
        return;
    }

    Colors colors = sourceColors(object);
    if (!object->targets.empty()) {
        std::vector<TargetSpec> specs = requiredTargetSpecs(object->effects());
        bool any_legal = false;
        for (size_t i = 0; i < object->targets.size() && i < specs.size(); i++) {
            any_legal = any_legal || isLegalTarget(game, colors, object->controller_id, specs[i], object->targets[i]);
        }
        if (!any_legal) {
            spdlog::info("{} fizzles", object->toString());
            if (object->isSpell()) {
                game->zones->graveyard->move(object->card);
            }
            return;
        }
    }

    spdlog::info("Resolving {}", object->toString());

    if (object->isSpell() && object->card->types.isPermanent()) {
        Card* card = object->card;
        Permanent* permanent = game->zones->battlefield->enter(card);
        for (const Ability& ability : card->abilities) {
            if (ability.type == AbilityType::TRIGGERED && ability.trigger == TriggerCondition::ENTERS_THE_BATTLEFIELD) {
                putTriggeredAbility(permanent, ability);
            }
        }
        return;
    }

    applyEffects(object->effects(), object->targets, object->controller_id, object->source_id, colors);

    if (object->isSpell() && object->card->current_zone == game->zones->stack.get()) {
        game->zones->graveyard->move(object->card);
    }
}

void SpellCastingEngine::applyEffects(const std::vector<Effect>& effects, const std::vector<Target>& targets,
                                      int controller_id, std::optional<int> source_id, const Colors& source_colors) {
    auto next_target = targets.begin();
    for (const Effect& effect : effects) {
        if (!effect.target.required()) {
            applyEffect(effect, std::nullopt, controller_id, source_id);
            continue;
        }
        if (next_target == targets.end()) {
            break;
        }
        const Target& target = *next_target++;
        // Targets that became illegal are skipped; the rest of the effects still happen.
        if (!isLegalTarget(game, source_colors, controller_id, effect.target, target)) {
            spdlog::debug("Target {} is no longer legal for {}", target.toString(), effect.toString());
            continue;
        }
        applyEffect(effect, target, controller_id, source_id);
    }
}

void SpellCastingEngine::applyEffect(const Effect& effect, const std::optional<Target>& target,
                                     int controller_id, std::optional<int> source_id) {
    Player* controller = game->player(controller_id);

    Player* target_player = nullptr;
    Permanent* target_permanent = nullptr;
    StackObject* target_object = nullptr;
    if (target) {
        switch (target->type) {
            case Target::Type::PLAYER:
                target_player = game->player(target->id);
                break;
            case Target::Type::PERMANENT:
                target_permanent = game->permanent(target->id);
                break;
            case Target::Type::STACK_OBJECT:
                target_object = game->zones->stack->find(target->id);
                break;
        }
    } else if (source_id) {
        // Untargeted permanent effects apply to their source.
        target_permanent = game->permanent(*source_id);
    }
    Permanent* source = source_id ? game->permanent(*source_id) : nullptr;

    switch (effect.type) {
        case EffectType::DEAL_DAMAGE:
            if (target_player) {
                target_player->takeDamage(effect.amount);
                spdlog::info("{} takes {} damage", target_player->name, effect.amount);
            } else if (target_permanent) {
                bool deathtouch = source && source->hasKeyword(Keyword::DEATHTOUCH);
                target_permanent->takeDamage(effect.amount, deathtouch);
                spdlog::info("{} takes {} damage", target_permanent->toString(), effect.amount);
            }
            break;
        case EffectType::GAIN_LIFE: {
            Player* player = target_player ? target_player : controller;
            player->gainLife(effect.amount);
            spdlog::info("{} gains {} life", player->name, effect.amount);
            break;
        }
        case EffectType::LOSE_LIFE: {
            Player* player = target_player ? target_player : controller;
            player->life -= effect.amount;
            spdlog::info("{} loses {} life", player->name, effect.amount);
            break;
        }
        case EffectType::DRAW_CARDS:
            game->drawCards(target_player ? target_player : controller, effect.amount);
            break;
        case EffectType::ADD_MANA:
            controller->mana_pool.add(effect.mana);
            spdlog::debug("{} adds {}", controller->name, effect.mana.toString());
            break;
        case EffectType::PUMP_CREATURE:
            if (target_permanent) {
                if (effect.duration == EffectDuration::PERMANENT) {
                    target_permanent->base_power += effect.power;
                    target_permanent->base_toughness += effect.toughness;
                } else {
                    target_permanent->power_modifier += effect.power;
                    target_permanent->toughness_modifier += effect.toughness;
                }
                spdlog::info("{} gets {:+}/{:+}", target_permanent->toString(), effect.power, effect.toughness);
            }
            break;
        case EffectType::DESTROY_PERMANENT:
            if (target_permanent) {
                game->zones->battlefield->destroy(target_permanent);
            }
            break;
        case EffectType::COUNTER_SPELL:
            if (target_object) {
                target_object->countered = true;
                spdlog::info("{} is countered", target_object->toString());
            }
            break;
        case EffectType::RETURN_TO_HAND:
            if (target_permanent) {
                spdlog::info("{} returns to its owner's hand", target_permanent->toString());
                game->zones->hand->move(target_permanent->card);
            }
            break;
        case EffectType::TAP_PERMANENT:
            if (target_permanent && !target_permanent->tapped) {
                target_permanent->tap();
            }
            break;
        case EffectType::UNTAP_PERMANENT:
            if (target_permanent) {
                target_permanent->untap();
            }
            break;
        case EffectType::GOAD:
            if (target_permanent) {
                target_permanent->goaded = true;
                spdlog::info("{} is goaded", target_permanent->toString());
            }
            break;
    }
}
