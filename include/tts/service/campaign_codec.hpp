#pragma once

/// @file campaign_codec.hpp
/// @brief YAML encoding of campaigns and change events.
///
/// Used only at the edges (file store, console sink, tool responses);
/// the state machines work on the typed model and never see YAML.

#include <string>
#include <string_view>
#include <vector>

#include <yaml-cpp/yaml.h>

#include "tts/foundation/game_result.hpp"
#include "tts/game/character_types.hpp"
#include "tts/service/campaign_types.hpp"
#include "tts/service/change_event.hpp"

namespace tts::service {

[[nodiscard]] YAML::Node encodeCharacter(const game::Character& character);

/// @return AggregateCorrupted when a field is missing, mistyped or out of
///         range (hp outside [0, maxHp], save counters outside [0, 3]).
[[nodiscard]] foundation::GameResult<game::Character> decodeCharacter(const YAML::Node& node);

/// Decode a YAML sequence of characters (used to seed a roster).
[[nodiscard]] foundation::GameResult<std::vector<game::Character>> decodeRoster(
    const YAML::Node& node);

[[nodiscard]] YAML::Node encodeCampaignNode(const CampaignAggregate& aggregate);

/// Serialize a whole aggregate to a block-style YAML document.
[[nodiscard]] std::string encodeCampaign(const CampaignAggregate& aggregate);

/// Parse a document produced by encodeCampaign().
///
/// Besides field checks, every turn slot must reference a roster entry and
/// the current turn index must point into the turn order.
[[nodiscard]] foundation::GameResult<CampaignAggregate> decodeCampaign(std::string_view document);

[[nodiscard]] YAML::Node encodeCombatState(const CombatStatePayload& state);

[[nodiscard]] YAML::Node encodeEventNode(const ChangeEvent& event);

/// Single-line flow-style rendering of an event, for transports and logs.
[[nodiscard]] std::string encodeEvent(const ChangeEvent& event);

/// Single-line flow-style rendering of any node.
[[nodiscard]] std::string toFlowString(const YAML::Node& node);

}  // namespace tts::service
