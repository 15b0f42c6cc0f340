/// @file vitality.cpp
/// @brief Vitality state machine implementation.

#include "tts/game/vitality.hpp"

#include <algorithm>

#include "tts/foundation/game_logger.hpp"

namespace tts::game {

using tts::foundation::ErrorCode;
using tts::foundation::GameError;
using tts::foundation::GameResult;
using tts::foundation::LogCategory;
using tts::foundation::LogContext;
using tts::foundation::LogLevel;

namespace {

void logTransition(const Character& c, std::string_view msg) {
    auto& logger = foundation::GameLogger::instance();
    if (!logger.isEnabled(LogLevel::Debug, LogCategory::Vitality)) {
        return;
    }
    LogContext ctx;
    ctx.characterId = c.id;
    ctx.extra["hp"] = std::to_string(c.currentHp);
    ctx.extra["successes"] = std::to_string(c.deathSaveSuccesses);
    ctx.extra["failures"] = std::to_string(c.deathSaveFailures);
    logger.logWithContext(LogLevel::Debug, LogCategory::Vitality, msg, ctx);
}

void resetDeathSaves(Character& c) {
    c.deathSaveSuccesses = 0;
    c.deathSaveFailures = 0;
}

/// base + amount, saturating at @p cap. Requires base <= cap and amount >= 0.
int32_t addUpTo(int32_t base, int32_t amount, int32_t cap) {
    return amount >= cap - base ? cap : base + amount;
}

}  // namespace

// ── Derived state ───────────────────────────────────────────────────────

VitalityState Vitality::state(const Character& c) {
    if (c.isDead()) {
        return VitalityState::Dead;
    }
    if (c.currentHp > 0) {
        return VitalityState::Alive;
    }
    if (c.isStable()) {
        return VitalityState::Stable;
    }
    return VitalityState::Unconscious;
}

CombatStatus Vitality::combatStatus(const Character& c) {
    if (!c.isPlayerCharacter()) {
        if (c.isDead() || c.currentHp <= 0) {
            return CombatStatus::Defeated;
        }
        return CombatStatus::None;
    }
    switch (state(c)) {
        case VitalityState::Alive:       return CombatStatus::None;
        case VitalityState::Unconscious: return CombatStatus::Unconscious;
        case VitalityState::Stable:      return CombatStatus::Stable;
        case VitalityState::Dead:        return CombatStatus::Dead;
    }
    return CombatStatus::None;
}

// ── Hit points ──────────────────────────────────────────────────────────

GameResult<void> Vitality::setHp(Character& c, int32_t hp) {
    int32_t clamped = std::clamp(hp, static_cast<int32_t>(0), std::max(c.maxHp, 0));
    if (clamped != hp) {
        LogContext ctx;
        ctx.characterId = c.id;
        ctx.extra["requested"] = std::to_string(hp);
        ctx.extra["applied"] = std::to_string(clamped);
        foundation::GameLogger::instance().logWithContext(
            LogLevel::Warning, LogCategory::Vitality, "Hit points clamped to [0, maxHp]", ctx);
    }

    if (c.isDead() && clamped > 0) {
        return GameResult<void>::err(
            GameError(ErrorCode::CharacterIsDead,
                      "cannot restore hit points of dead character '" + c.name + "'",
                      c.id));
    }

    int32_t previous = c.currentHp;
    c.currentHp = clamped;

    if (!c.isPlayerCharacter() || c.isDead()) {
        return GameResult<void>::ok();
    }

    if (previous > 0 && clamped == 0) {
        // Entering 0 hp always starts a fresh death-save clock.
        resetDeathSaves(c);
        c.removeCondition(kConditionStable);
        c.addCondition(kConditionUnconscious);
        logTransition(c, "Character fell unconscious");
    } else if (previous <= 0 && clamped > 0) {
        c.removeCondition(kConditionUnconscious);
        c.removeCondition(kConditionStable);
        resetDeathSaves(c);
        logTransition(c, "Character regained consciousness");
    }
    return GameResult<void>::ok();
}

GameResult<void> Vitality::applyDamage(Character& c, int32_t amount) {
    if (amount < 0) {
        return GameResult<void>::err(
            GameError(ErrorCode::InvalidHitPoints, "damage must not be negative"));
    }

    int32_t remaining = amount;
    int32_t absorbed = std::min(c.temporaryHp, remaining);
    remaining -= absorbed;

    if (c.currentHp > 0 && remaining >= c.currentHp) {
        int32_t overflow = remaining - c.currentHp;
        if (overflow >= c.maxHp) {
            c.temporaryHp -= absorbed;
            markDead(c);
            return GameResult<void>::ok();
        }
    }

    auto result = setHp(c, c.currentHp - remaining);
    if (result) {
        c.temporaryHp -= absorbed;
    }
    return result;
}

GameResult<void> Vitality::heal(Character& c, int32_t amount) {
    if (amount < 0) {
        return GameResult<void>::err(
            GameError(ErrorCode::InvalidHitPoints, "healing must not be negative"));
    }
    return setHp(c, addUpTo(c.currentHp, amount, std::max(c.maxHp, c.currentHp)));
}

GameResult<void> Vitality::setTemporaryHp(Character& c, int32_t amount) {
    if (amount < 0) {
        return GameResult<void>::err(
            GameError(ErrorCode::InvalidHitPoints, "temporary hit points must not be negative"));
    }
    c.temporaryHp = amount;
    return GameResult<void>::ok();
}

// ── Death saves ─────────────────────────────────────────────────────────

GameResult<void> Vitality::requireDying(const Character& c, std::string_view action) {
    if (!c.isPlayerCharacter()) {
        return GameResult<void>::err(GameError(
            ErrorCode::DeathSaveNotApplicable,
            std::string(action) + " applies only to player characters", c.id));
    }
    if (c.isDead()) {
        return GameResult<void>::err(GameError(
            ErrorCode::CharacterIsDead,
            std::string(action) + " on dead character '" + c.name + "'", c.id));
    }
    if (c.currentHp > 0) {
        return GameResult<void>::err(GameError(
            ErrorCode::CharacterNotDying,
            std::string(action) + " requires 0 hit points", c.id));
    }
    return GameResult<void>::ok();
}

GameResult<void> Vitality::recordDeathSaveSuccess(Character& c, int32_t count) {
    if (count < 0) {
        return GameResult<void>::err(
            GameError(ErrorCode::InvalidDeathSaveCount, "death save count must not be negative"));
    }
    if (auto check = requireDying(c, "death save success"); !check) {
        return check;
    }

    c.deathSaveSuccesses = addUpTo(c.deathSaveSuccesses, count, kMaxDeathSaves);
    if (c.deathSaveSuccesses == kMaxDeathSaves && !c.isStable()) {
        c.removeCondition(kConditionUnconscious);
        c.addCondition(kConditionStable);
        logTransition(c, "Character stabilized by death saves");
    }
    return GameResult<void>::ok();
}

GameResult<void> Vitality::recordDeathSaveFailure(Character& c, int32_t count) {
    if (count < 0) {
        return GameResult<void>::err(
            GameError(ErrorCode::InvalidDeathSaveCount, "death save count must not be negative"));
    }
    if (auto check = requireDying(c, "death save failure"); !check) {
        return check;
    }
    if (count == 0) {
        return GameResult<void>::ok();
    }

    if (c.isStable()) {
        c.removeCondition(kConditionStable);
        c.addCondition(kConditionUnconscious);
        c.deathSaveSuccesses = 0;
    }

    c.deathSaveFailures = addUpTo(c.deathSaveFailures, count, kMaxDeathSaves);
    if (c.deathSaveFailures == kMaxDeathSaves) {
        c.removeCondition(kConditionUnconscious);
        c.addCondition(kConditionDead);
        logTransition(c, "Character died after three failed death saves");
    }
    return GameResult<void>::ok();
}

GameResult<void> Vitality::stabilize(Character& c) {
    if (auto check = requireDying(c, "stabilize"); !check) {
        return check;
    }
    c.deathSaveSuccesses = kMaxDeathSaves;
    c.removeCondition(kConditionUnconscious);
    c.addCondition(kConditionStable);
    logTransition(c, "Character stabilized");
    return GameResult<void>::ok();
}

void Vitality::markDead(Character& c) {
    c.currentHp = 0;
    c.removeCondition(kConditionUnconscious);
    c.removeCondition(kConditionStable);
    c.addCondition(kConditionDead);
    logTransition(c, "Character died");
}

// ── Conditions ──────────────────────────────────────────────────────────

void Vitality::addCondition(Character& c, std::string_view condition) {
    if (condition == kConditionDead) {
        markDead(c);
        return;
    }
    c.addCondition(condition);
}

void Vitality::removeCondition(Character& c, std::string_view condition) {
    c.removeCondition(condition);
}

void Vitality::setConditions(Character& c, const std::vector<std::string>& conditions) {
    auto before = state(c);
    c.conditions.clear();
    for (const auto& condition : conditions) {
        c.addCondition(condition);
    }

    if (c.isDead()) {
        markDead(c);
        return;
    }
    if (!c.isPlayerCharacter() || c.currentHp > 0) {
        return;
    }

    // A PC at 0 hp is either Stable or dying; counters follow the state.
    if (c.isStable()) {
        c.removeCondition(kConditionUnconscious);
        if (before == VitalityState::Dead) {
            resetDeathSaves(c);
        }
        c.deathSaveSuccesses = kMaxDeathSaves;
    } else {
        c.addCondition(kConditionUnconscious);
        if (before != VitalityState::Unconscious) {
            resetDeathSaves(c);
        }
    }
    if (state(c) != before) {
        logTransition(c, "Conditions replaced");
    }
}

}  // namespace tts::game
