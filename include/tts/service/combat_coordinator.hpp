#pragma once

/// @file combat_coordinator.hpp
/// @brief Per-campaign transaction boundary for combat and character
///        mutations.
///
/// Every mutation runs, under the campaign's exclusive lock:
///   load aggregate -> resolve character -> apply (Vitality/TurnOrderManager)
///   -> version++ and save -> build one canonical event -> route.
///
/// Any failure before the save leaves the store untouched and emits
/// nothing. A failed save is reported as PersistenceFailed and emits
/// nothing. A failed publish is logged by the router and does not undo
/// the committed mutation.
///
/// Example:
/// @code
///   InMemoryCampaignStore store;
///   NotificationRouter router(sink);
///   CombatCoordinator coordinator(store, router);
///
///   auto started = coordinator.startCombat(campaignId, {
///       {"elara", "Elara", CharacterType::PC, 18},
///       {"goblin-1", "Goblin", CharacterType::Enemy, 12, 7, 7},
///   });
///   coordinator.updateCharacterState(campaignId, "Goblin", StateChange::hp(0));
/// @endcode

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "tts/foundation/game_result.hpp"
#include "tts/foundation/types.hpp"
#include "tts/game/encounter_types.hpp"
#include "tts/service/campaign_store.hpp"
#include "tts/service/campaign_types.hpp"
#include "tts/service/change_event.hpp"
#include "tts/service/notification_router.hpp"
#include "tts/service/state_change.hpp"

namespace tts::service {

/// A committed mutation: the event it produced and where it went.
struct MutationOutcome {
    ChangeEvent event;
    std::vector<RoutedMessage> routed;
};

class CombatCoordinator {
public:
    CombatCoordinator(ICampaignStore& store, NotificationRouter& router);

    CombatCoordinator(const CombatCoordinator&) = delete;
    CombatCoordinator& operator=(const CombatCoordinator&) = delete;

    // ── Combat lifecycle ────────────────────────────────────────────────

    /// Begin a new encounter; replaces an active one.
    ///
    /// Ids already in the roster keep their roster name/type/hp and take
    /// the seed's initiative. Unknown ids are added to the roster.
    foundation::GameResult<MutationOutcome> startCombat(
        foundation::CampaignId campaignId, const std::vector<game::CombatantSeed>& combatants);

    foundation::GameResult<MutationOutcome> setInitiative(foundation::CampaignId campaignId,
                                                          const std::string& characterRef,
                                                          int32_t initiative);

    foundation::GameResult<MutationOutcome> advanceTurn(foundation::CampaignId campaignId);

    /// Remove a non-player from the turn order (hp forced to 0). Ends the
    /// combat when no non-player is left.
    foundation::GameResult<MutationOutcome> markDefeated(foundation::CampaignId campaignId,
                                                         const std::string& characterRef);

    foundation::GameResult<MutationOutcome> endCombat(foundation::CampaignId campaignId);

    foundation::GameResult<MutationOutcome> addCombatant(foundation::CampaignId campaignId,
                                                         const game::CombatantSeed& combatant);

    /// Take a combatant out of the order without defeating it.
    foundation::GameResult<MutationOutcome> removeCombatant(foundation::CampaignId campaignId,
                                                            const std::string& characterRef);

    // ── Character state ─────────────────────────────────────────────────

    /// Apply one key/value update. @p characterRef is an id or exact name.
    foundation::GameResult<MutationOutcome> updateCharacterState(
        foundation::CampaignId campaignId, const std::string& characterRef,
        const StateChange& change);

    // ── Narrative cues (no durable state) ───────────────────────────────

    /// Route a player's choice to the DM; the character must exist.
    foundation::GameResult<MutationOutcome> submitPlayerChoice(foundation::CampaignId campaignId,
                                                               const std::string& characterRef,
                                                               std::string choice);

    /// Route a roll the player made at the table to everyone.
    foundation::GameResult<MutationOutcome> logPlayerRoll(foundation::CampaignId campaignId,
                                                          const std::string& characterRef,
                                                          std::string checkType, int32_t result,
                                                          std::optional<std::string> outcome);

    /// Route a caller-built cue: choices, atmosphere, anchor and insight go
    /// to the players, read-aloud text to the DM, scene images to all.
    ///
    /// @return InvalidArgument for any other kind, or a payload of the
    ///         wrong shape.
    foundation::GameResult<MutationOutcome> publishCue(foundation::CampaignId campaignId,
                                                       EventKind kind, EventPayload payload);

    // ── Players ─────────────────────────────────────────────────────────

    /// Assign a PC to a player. Re-claiming by the same player refreshes
    /// the stored name; a claim held by another player is refused.
    foundation::GameResult<MutationOutcome> claimCharacter(foundation::CampaignId campaignId,
                                                           const std::string& characterRef,
                                                           const std::string& playerId,
                                                           const std::string& playerName);

    foundation::GameResult<MutationOutcome> releaseCharacter(foundation::CampaignId campaignId,
                                                             const std::string& characterRef);

    /// Tell the DM a player came online or dropped. The payload names the
    /// character that player has claimed, when there is one.
    foundation::GameResult<MutationOutcome> playerPresence(foundation::CampaignId campaignId,
                                                           const std::string& playerId,
                                                           const std::string& playerName,
                                                           bool online);

    // ── Queries ─────────────────────────────────────────────────────────

    /// Current combat view, or nullopt when no combat is active.
    foundation::GameResult<std::optional<CombatStatePayload>> combatState(
        foundation::CampaignId campaignId);

    foundation::GameResult<game::Character> character(foundation::CampaignId campaignId,
                                                      const std::string& characterRef);

    /// Rebuild the combat view from the turn order and the live roster.
    [[nodiscard]] static CombatStatePayload buildCombatState(const CampaignAggregate& aggregate);

private:
    std::mutex& campaignLock(foundation::CampaignId campaignId);

    /// How a transaction ends after the working copy has been changed.
    enum class Commit : uint8_t {
        Persist,   ///< version++, save, then route.
        RouteOnly  ///< Narrative cue: nothing durable changed.
    };

    /// Lock, load, run @p apply on a working copy, commit, route.
    template <typename Apply>
    foundation::GameResult<MutationOutcome> transact(foundation::CampaignId campaignId,
                                                     std::string_view operation, Commit commit,
                                                     Apply&& apply);

    ICampaignStore& store_;
    NotificationRouter& router_;

    std::mutex locksMutex_;
    std::unordered_map<foundation::CampaignId, std::unique_ptr<std::mutex>> locks_;
};

/// Find a roster entry by exact id, falling back to exact
/// (case-sensitive) name.
///
/// @return CharacterNotFound when nothing matches, AmbiguousCharacter when
///         several characters share the requested name.
[[nodiscard]] foundation::GameResult<std::size_t> resolveCharacter(
    const CampaignAggregate& aggregate, const std::string& characterRef);

}  // namespace tts::service
