#pragma once

/// @file campaign_types.hpp
/// @brief The per-campaign aggregate persisted and mutated as one unit.

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "tts/foundation/types.hpp"
#include "tts/game/character_types.hpp"
#include "tts/game/encounter_types.hpp"

namespace tts::service {

/// Roster plus optional active encounter of one campaign.
///
/// Every committed mutation bumps `version`; the store always receives
/// the whole aggregate.
struct CampaignAggregate {
    foundation::CampaignId id;
    std::string name;
    std::vector<game::Character> roster;
    std::optional<game::CombatEncounter> combat;  ///< nullopt: no active combat.
    uint64_t version = 0;

    [[nodiscard]] game::Character* findCharacter(const foundation::CharacterId& characterId) {
        for (auto& c : roster) {
            if (c.id == characterId) {
                return &c;
            }
        }
        return nullptr;
    }

    [[nodiscard]] const game::Character* findCharacter(
        const foundation::CharacterId& characterId) const {
        for (const auto& c : roster) {
            if (c.id == characterId) {
                return &c;
            }
        }
        return nullptr;
    }

    [[nodiscard]] bool inActiveCombat(const foundation::CharacterId& characterId) const {
        return combat && combat->isActive && combat->contains(characterId);
    }
};

}  // namespace tts::service
