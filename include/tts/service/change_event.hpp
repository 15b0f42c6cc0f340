#pragma once

/// @file change_event.hpp
/// @brief Canonical change events and their full-state payloads.
///
/// Payloads always describe the complete new state of the affected slice
/// (never a delta), so applying the same event twice, or a stale one
/// after a newer one has been discarded by sequence, is harmless.

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "tts/foundation/types.hpp"
#include "tts/game/character_types.hpp"

namespace tts::service {

enum class EventKind : uint8_t {
    CombatStarted,
    CombatStateUpdated,
    TurnAdvanced,
    RoundAdvanced,
    CombatEnded,
    CharacterStateUpdated,
    PlayerChoiceSubmitted,
    PlayerChoicesPresented,
    AtmospherePulse,
    NarrativeAnchor,
    GroupInsight,
    PlayerRollLogged,
    ReadAloudText,
    SceneImageUpdated,
    CharacterClaimed,
    CharacterReleased,
    PlayerConnected,
    PlayerDisconnected
};

/// Wire name of an event, as receivers subscribe to it.
constexpr std::string_view eventName(EventKind kind) {
    switch (kind) {
        case EventKind::CombatStarted:          return "CombatStarted";
        case EventKind::CombatStateUpdated:     return "CombatStateUpdated";
        case EventKind::TurnAdvanced:           return "TurnAdvanced";
        case EventKind::RoundAdvanced:          return "RoundAdvanced";
        case EventKind::CombatEnded:            return "CombatEnded";
        case EventKind::CharacterStateUpdated:  return "CharacterStateUpdated";
        case EventKind::PlayerChoiceSubmitted:  return "PlayerChoiceSubmitted";
        case EventKind::PlayerChoicesPresented: return "PlayerChoicesPresented";
        case EventKind::AtmospherePulse:        return "AtmospherePulseReceived";
        case EventKind::NarrativeAnchor:        return "NarrativeAnchorUpdated";
        case EventKind::GroupInsight:           return "GroupInsightTriggered";
        case EventKind::PlayerRollLogged:       return "PlayerRollLogged";
        case EventKind::ReadAloudText:          return "ReadAloudTextReceived";
        case EventKind::SceneImageUpdated:      return "SceneImageUpdated";
        case EventKind::CharacterClaimed:       return "CharacterClaimed";
        case EventKind::CharacterReleased:      return "CharacterReleased";
        case EventKind::PlayerConnected:        return "PlayerConnected";
        case EventKind::PlayerDisconnected:     return "PlayerDisconnected";
    }
    return "Unknown";
}

/// Whether an event kind comes out of a combat/character mutation (as
/// opposed to a narrative cue or a choice that changes no durable state).
constexpr bool isStateChange(EventKind kind) {
    switch (kind) {
        case EventKind::CombatStarted:
        case EventKind::CombatStateUpdated:
        case EventKind::TurnAdvanced:
        case EventKind::RoundAdvanced:
        case EventKind::CombatEnded:
        case EventKind::CharacterStateUpdated:
            return true;
        default:
            return false;
    }
}

/// One row of the turn order as viewers see it, assembled from the turn
/// slot and the live roster entry.
struct CombatantView {
    foundation::CharacterId id;
    std::string name;
    game::CharacterType type = game::CharacterType::PC;
    int32_t initiative = 0;
    int32_t currentHp = 0;
    int32_t maxHp = 0;
    bool isSurprised = false;
    game::CombatStatus status = game::CombatStatus::None;
};

struct CombatStatePayload {
    std::string combatId;
    bool isActive = false;
    int32_t roundNumber = 1;
    std::vector<CombatantView> turnOrder;
    /// Non-players defeated this encounter, in order of defeat.
    std::vector<CombatantView> defeated;
    std::optional<std::size_t> currentTurnIndex;
    std::optional<foundation::CharacterId> currentCombatantId;
};

struct CombatEndedPayload {
    std::string combatId;
    bool allEnemiesDefeated = false;
};

struct CharacterStatePayload {
    game::Character character;
    game::VitalityState vitality = game::VitalityState::Alive;
    game::CombatStatus status = game::CombatStatus::None;
    std::string changedKey;
    /// Combat state after the change; nullopt when no combat is running.
    std::optional<CombatStatePayload> combat;
    /// Set when this change defeated the last enemy and ended the combat.
    bool combatEnded = false;
};

struct PlayerChoicePayload {
    foundation::CharacterId characterId;
    std::string characterName;
    std::string choice;
};

struct PlayerChoicesPayload {
    std::vector<std::string> choices;
};

struct AtmospherePulsePayload {
    std::string text;
    std::optional<std::string> intensity;    ///< "Low", "Medium", "High"
    std::optional<std::string> sensoryType;  ///< "Sound", "Smell", "Visual", "Feeling"
};

struct NarrativeAnchorPayload {
    std::string shortText;
    std::optional<std::string> moodCategory;  ///< "Danger", "Mystery", "Safety", "Urgency"
};

struct GroupInsightPayload {
    std::string text;
    std::string relevantSkill;
    bool highlight = false;
};

/// A check a player rolled at the table, logged for everyone.
struct PlayerRollPayload {
    foundation::CharacterId characterId;
    std::string characterName;
    std::string checkType;
    int32_t result = 0;
    std::optional<std::string> outcome;  ///< "Success", "Failure", ...
};

/// Boxed text for the DM to read out.
struct ReadAloudPayload {
    std::string text;
};

struct SceneImagePayload {
    std::string imageUri;
};

struct CharacterClaimPayload {
    foundation::CharacterId characterId;
    std::string characterName;
    std::optional<std::string> playerId;
    std::optional<std::string> playerName;
    bool isClaimed = false;
};

struct PlayerConnectionPayload {
    std::string playerId;
    std::string playerName;
    /// The character this player has claimed, if any.
    std::optional<foundation::CharacterId> characterId;
    std::optional<std::string> characterName;
    bool isOnline = false;
};

using EventPayload = std::variant<CombatStatePayload,
                                  CombatEndedPayload,
                                  CharacterStatePayload,
                                  PlayerChoicePayload,
                                  PlayerChoicesPayload,
                                  AtmospherePulsePayload,
                                  NarrativeAnchorPayload,
                                  GroupInsightPayload,
                                  PlayerRollPayload,
                                  ReadAloudPayload,
                                  SceneImagePayload,
                                  CharacterClaimPayload,
                                  PlayerConnectionPayload>;

/// One event per committed mutation or narrative cue.
struct ChangeEvent {
    EventKind kind = EventKind::CombatStateUpdated;
    foundation::CampaignId campaignId;
    uint64_t sequence = 0;  ///< Per-campaign, assigned by the router.
    EventPayload payload;
};

}  // namespace tts::service
