#pragma once

/// @file turn_order.hpp
/// @brief TurnOrderManager: ordering, turn advancement and defeat handling
///        for one CombatEncounter.
///
/// Lifecycle:
///   NoCombat -> start() -> Active(round 1) -> advance() ... -> end()
///
/// The manager is a view over an encounter owned elsewhere (the campaign
/// aggregate). It never touches the roster; the caller decides what a
/// defeat or an empty enemy side means for the campaign.

#include <string>
#include <vector>

#include "tts/foundation/game_result.hpp"
#include "tts/game/encounter_types.hpp"

namespace tts::game {

class TurnOrderManager {
public:
    explicit TurnOrderManager(CombatEncounter& encounter) : encounter_(encounter) {}

    /// Build a new encounter ordered by descending initiative. Equal
    /// initiatives keep their order in @p combatants.
    ///
    /// @return InvalidArgument when @p combatants is empty,
    ///         DuplicateCharacter when an id repeats,
    ///         InvalidHitPoints for a non-player already at 0 hp.
    [[nodiscard]] static foundation::GameResult<CombatEncounter> start(
        std::string encounterId, const std::vector<CombatantSeed>& combatants);

    /// Change one combatant's initiative and re-sort the whole order.
    ///
    /// The current-turn pointer follows the combatant who held the turn
    /// before the re-sort, so changing initiative never hands the turn to
    /// somebody else.
    [[nodiscard]] foundation::GameResult<void> setInitiative(
        const foundation::CharacterId& id, int32_t initiative);

    /// Move to the next combatant. Wrapping past the end starts a new
    /// round and clears the surprised set.
    ///
    /// @return true when a new round started.
    [[nodiscard]] foundation::GameResult<bool> advance();

    /// Remove a defeated non-player combatant from the order.
    ///
    /// If the removed slot sat at or before the current turn, the pointer
    /// steps back by one (never below 0).
    ///
    /// @return whether any non-player combatant is still in the order.
    [[nodiscard]] foundation::GameResult<bool> markDefeated(const foundation::CharacterId& id);

    /// Insert a combatant after everyone with equal or higher initiative.
    /// A non-player at 0 hp is rejected with InvalidHitPoints.
    [[nodiscard]] foundation::GameResult<void> add(const CombatantSeed& combatant);

    /// Remove any combatant (a PC leaving the fight, a summon expiring).
    [[nodiscard]] foundation::GameResult<void> remove(const foundation::CharacterId& id);

    /// Mark the encounter inactive.
    void end();

    /// True while at least one NPC/Enemy remains in the order.
    [[nodiscard]] bool hasActiveEnemies() const;

    [[nodiscard]] const CombatEncounter& encounter() const { return encounter_; }

private:
    void sortKeepingCurrent();
    void removeAt(std::size_t index);
    [[nodiscard]] foundation::GameResult<std::size_t> requireSlot(
        const foundation::CharacterId& id) const;

    CombatEncounter& encounter_;
};

/// Generate a process-unique encounter id ("enc-<n>").
std::string generateEncounterId();

}  // namespace tts::game
