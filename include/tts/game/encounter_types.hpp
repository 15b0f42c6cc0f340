#pragma once

/// @file encounter_types.hpp
/// @brief Combat encounter record: turn slots, round and turn pointers.
///
/// A turn slot holds only combat-structural data. Name, hit points and
/// conditions always come from the roster Character, so the turn order
/// never carries a second copy that could drift.

#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "tts/foundation/types.hpp"
#include "tts/game/character_types.hpp"

namespace tts::game {

/// One combatant's position in the turn order.
struct TurnSlot {
    foundation::CharacterId characterId;
    CharacterType type = CharacterType::PC;
    int32_t initiative = 0;
    uint32_t joinOrder = 0;  ///< Tie-break for equal initiative.
};

/// Combatant description handed to start_combat / add_combatant.
///
/// Name and hit points are only used to register a combatant the roster
/// does not know yet.
struct CombatantSeed {
    foundation::CharacterId id;
    std::string name;
    CharacterType type = CharacterType::Enemy;
    int32_t initiative = 0;
    int32_t currentHp = 0;
    int32_t maxHp = 0;
    bool surprised = false;
};

/// The active combat of one campaign.
struct CombatEncounter {
    std::string id;
    bool isActive = true;
    int32_t roundNumber = 1;
    std::vector<TurnSlot> turnOrder;
    std::optional<std::size_t> currentTurnIndex;
    std::set<foundation::CharacterId> surprisedEntities;
    std::vector<foundation::CharacterId> defeatedIds;
    uint32_t nextJoinOrder = 0;

    [[nodiscard]] std::optional<std::size_t> indexOf(const foundation::CharacterId& id) const {
        for (std::size_t i = 0; i < turnOrder.size(); ++i) {
            if (turnOrder[i].characterId == id) {
                return i;
            }
        }
        return std::nullopt;
    }

    [[nodiscard]] bool contains(const foundation::CharacterId& id) const {
        return indexOf(id).has_value();
    }

    /// Slot whose turn it is, or nullptr when the order is empty.
    [[nodiscard]] const TurnSlot* current() const {
        if (!currentTurnIndex || *currentTurnIndex >= turnOrder.size()) {
            return nullptr;
        }
        return &turnOrder[*currentTurnIndex];
    }

    [[nodiscard]] bool isSurprised(const foundation::CharacterId& id) const {
        return surprisedEntities.count(id) > 0;
    }

    [[nodiscard]] bool isDefeated(const foundation::CharacterId& id) const {
        for (const auto& defeated : defeatedIds) {
            if (defeated == id) {
                return true;
            }
        }
        return false;
    }
};

}  // namespace tts::game
