#pragma once

/// @file character_types.hpp
/// @brief Roster character record plus the enumerations and condition names
///        used by the vitality state machine.

#include <algorithm>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "tts/foundation/types.hpp"

namespace tts::game {

/// Upper bound for both death-save counters.
constexpr int32_t kMaxDeathSaves = 3;

/// Condition names the state machine manages itself.
inline constexpr std::string_view kConditionUnconscious = "Unconscious";
inline constexpr std::string_view kConditionStable = "Stable";
inline constexpr std::string_view kConditionDead = "Dead";

/// Who controls a character.
enum class CharacterType : uint8_t {
    PC,    ///< Player-controlled; makes death saves at 0 hp.
    NPC,   ///< Non-player; defeated at 0 hp.
    Enemy  ///< Non-player; defeated at 0 hp.
};

/// Hit-point state derived from hp, conditions and save counters.
enum class VitalityState : uint8_t {
    Alive,        ///< hp > 0.
    Unconscious,  ///< hp == 0, still making death saves.
    Stable,       ///< hp == 0, three successes (or stabilized).
    Dead          ///< Three failures or massive damage.
};

/// Status badge shown for a combatant in the turn order.
///
/// PCs only ever take None/Unconscious/Stable/Dead; Defeated is reserved
/// for non-player combatants.
enum class CombatStatus : uint8_t {
    None,
    Unconscious,
    Stable,
    Dead,
    Defeated
};

constexpr std::string_view characterTypeName(CharacterType type) {
    switch (type) {
        case CharacterType::PC:    return "PC";
        case CharacterType::NPC:   return "NPC";
        case CharacterType::Enemy: return "Enemy";
    }
    return "PC";
}

/// Parse "PC", "NPC" or "Enemy"; anything else yields nullopt.
constexpr std::optional<CharacterType> parseCharacterType(std::string_view name) {
    if (name == "PC") return CharacterType::PC;
    if (name == "NPC") return CharacterType::NPC;
    if (name == "Enemy") return CharacterType::Enemy;
    return std::nullopt;
}

constexpr std::string_view vitalityStateName(VitalityState state) {
    switch (state) {
        case VitalityState::Alive:       return "Alive";
        case VitalityState::Unconscious: return "Unconscious";
        case VitalityState::Stable:      return "Stable";
        case VitalityState::Dead:        return "Dead";
    }
    return "Alive";
}

constexpr std::string_view combatStatusName(CombatStatus status) {
    switch (status) {
        case CombatStatus::None:        return "None";
        case CombatStatus::Unconscious: return "Unconscious";
        case CombatStatus::Stable:      return "Stable";
        case CombatStatus::Dead:        return "Dead";
        case CombatStatus::Defeated:    return "Defeated";
    }
    return "None";
}

/// A character owned by the campaign roster.
///
/// Plain data; hp/condition transitions go through Vitality so that the
/// death-save invariants hold. `conditions` behaves as an insertion-ordered
/// set.
struct Character {
    foundation::CharacterId id;
    std::string name;
    CharacterType type = CharacterType::PC;

    int32_t maxHp = 0;
    int32_t currentHp = 0;
    int32_t temporaryHp = 0;
    int32_t armorClass = 0;
    int32_t initiative = 0;

    std::vector<std::string> conditions;
    std::string statusNotes;

    int32_t deathSaveSuccesses = 0;
    int32_t deathSaveFailures = 0;

    /// Controlling user, for PCs that have been claimed.
    std::optional<std::string> playerId;
    std::optional<std::string> playerName;

    [[nodiscard]] bool isPlayerCharacter() const noexcept {
        return type == CharacterType::PC;
    }

    [[nodiscard]] bool hasCondition(std::string_view condition) const {
        return std::find(conditions.begin(), conditions.end(), condition) != conditions.end();
    }

    /// Append a condition unless already present.
    void addCondition(std::string_view condition) {
        if (!hasCondition(condition)) {
            conditions.emplace_back(condition);
        }
    }

    void removeCondition(std::string_view condition) {
        conditions.erase(std::remove(conditions.begin(), conditions.end(), condition),
                         conditions.end());
    }

    [[nodiscard]] bool isStable() const { return hasCondition(kConditionStable); }
    [[nodiscard]] bool isDead() const { return hasCondition(kConditionDead); }
};

}  // namespace tts::game
