#pragma once

/// @file vitality.hpp
/// @brief Hit-point, condition and death-save state machine for one character.
///
/// States (derived, see Vitality::state):
///   Alive (hp > 0) -> Unconscious (hp == 0) -> Stable (3 successes)
///                                           -> Dead   (3 failures)
///   Massive damage skips the counters and goes straight to Dead.
///
/// The machine reacts only to explicit calls. Damage taken while already
/// at 0 hp is not turned into a failed save here; the caller records the
/// failure (one for a normal hit, two for a critical).
///
/// Every operation either applies completely or leaves the character
/// untouched and returns an error.

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "tts/foundation/game_result.hpp"
#include "tts/game/character_types.hpp"

namespace tts::game {

class Vitality {
public:
    /// Current derived state.
    [[nodiscard]] static VitalityState state(const Character& c);

    /// Badge for the turn order. Non-players at 0 hp are Defeated;
    /// PCs map onto their vitality state and are never Defeated.
    [[nodiscard]] static CombatStatus combatStatus(const Character& c);

    /// Set hit points, clamped to [0, maxHp].
    ///
    /// Dropping a PC from above 0 to 0 adds Unconscious and zeroes both
    /// counters. Raising a PC from 0 clears Unconscious/Stable and zeroes
    /// both counters. Healing a Dead character fails with CharacterIsDead.
    static foundation::GameResult<void> setHp(Character& c, int32_t hp);

    /// Apply damage; temporary hp absorbs first.
    ///
    /// If the hit takes hp from above 0 to 0 and the overflow is at least
    /// maxHp, the character dies outright.
    static foundation::GameResult<void> applyDamage(Character& c, int32_t amount);

    static foundation::GameResult<void> heal(Character& c, int32_t amount);

    static foundation::GameResult<void> setTemporaryHp(Character& c, int32_t amount);

    /// successes = min(3, successes + count); Stable at 3.
    static foundation::GameResult<void> recordDeathSaveSuccess(Character& c, int32_t count);

    /// failures = min(3, failures + count); Dead at 3.
    /// A failure while Stable puts the character back to Unconscious.
    static foundation::GameResult<void> recordDeathSaveFailure(Character& c, int32_t count);

    /// Another character's action: successes jump straight to 3.
    static foundation::GameResult<void> stabilize(Character& c);

    /// Instant death (massive damage or a DM ruling). Counters are untouched.
    static void markDead(Character& c);

    /// Add a condition; "Dead" is routed through markDead().
    static void addCondition(Character& c, std::string_view condition);

    static void removeCondition(Character& c, std::string_view condition);

    /// Replace the whole condition set (duplicates dropped, order kept).
    ///
    /// A list containing "Dead" goes through markDead(). A PC left at 0 hp
    /// ends up Stable with successes at 3, or dying with Unconscious
    /// re-added. Coming back from Dead or Stable to dying restarts both
    /// counters; coming back from Dead to Stable clears the failures.
    static void setConditions(Character& c, const std::vector<std::string>& conditions);

private:
    static foundation::GameResult<void> requireDying(const Character& c,
                                                     std::string_view action);
};

}  // namespace tts::game
