#pragma once

/// @file tool_gateway.hpp
/// @brief Decodes tool invocations into CombatCoordinator calls.
///
/// A tool call is a name plus an argument object (JSON or YAML flow text,
/// or an already-parsed YAML node):
///
/// | Tool                    | Arguments                                         |
/// |-------------------------|---------------------------------------------------|
/// | start_combat            | combatants: [{id,name,type,initiative,...}]       |
/// | set_initiative          | character_id, value                               |
/// | advance_turn            | (none)                                            |
/// | update_character_state  | character_id or character_name, key, value        |
/// | mark_defeated           | character_id                                      |
/// | end_combat              | (none)                                            |
/// | add_combatant           | id, name, type, initiative, currentHp, maxHp      |
/// | remove_combatant        | character_id                                      |
/// | get_combat_state        | (none)                                            |
/// | present_player_choices  | choices: [string]                                 |
/// | submit_player_choice    | character_id, choice                              |
/// | atmosphere_pulse        | text, intensity?, sensory_type?                   |
/// | narrative_anchor        | short_text, mood_category?                        |
/// | group_insight           | text, relevant_skill, highlight?                  |
/// | log_player_roll         | character_id, check_type, result, outcome?        |
/// | read_aloud_text         | text                                              |
/// | update_scene_image      | image_uri                                         |
/// | claim_character         | character_id, player_id, player_name?             |
/// | release_character       | character_id                                      |
/// | player_connected        | player_id, player_name?                           |
/// | player_disconnected     | player_id, player_name?                           |

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <yaml-cpp/yaml.h>

#include "tts/foundation/game_error.hpp"
#include "tts/foundation/game_result.hpp"
#include "tts/foundation/types.hpp"
#include "tts/service/change_event.hpp"
#include "tts/service/combat_coordinator.hpp"
#include "tts/service/notification_router.hpp"

namespace tts::service {

/// Outcome of one tool invocation.
struct ToolResult {
    bool success = false;
    std::optional<foundation::GameError> error;
    std::optional<ChangeEvent> event;
    std::vector<RoutedMessage> routed;
    YAML::Node data;  ///< Query result (get_combat_state); null otherwise.

    /// Flow-style document handed back to the caller.
    [[nodiscard]] std::string toResponse() const;
};

class ToolGateway {
public:
    explicit ToolGateway(CombatCoordinator& coordinator) : coordinator_(coordinator) {}

    /// Parse @p arguments (a JSON/YAML object, empty means no arguments)
    /// and run the tool.
    ToolResult execute(foundation::CampaignId campaignId, std::string_view tool,
                       std::string_view arguments);

    ToolResult execute(foundation::CampaignId campaignId, std::string_view tool,
                       const YAML::Node& arguments);

    /// Every tool name execute() understands.
    [[nodiscard]] static std::vector<std::string_view> toolNames();

private:
    using Handler = ToolResult (ToolGateway::*)(foundation::CampaignId, const YAML::Node&);

    [[nodiscard]] static Handler findHandler(std::string_view tool);

    ToolResult startCombat(foundation::CampaignId campaignId, const YAML::Node& args);
    ToolResult setInitiative(foundation::CampaignId campaignId, const YAML::Node& args);
    ToolResult advanceTurn(foundation::CampaignId campaignId, const YAML::Node& args);
    ToolResult updateCharacterState(foundation::CampaignId campaignId, const YAML::Node& args);
    ToolResult markDefeated(foundation::CampaignId campaignId, const YAML::Node& args);
    ToolResult endCombat(foundation::CampaignId campaignId, const YAML::Node& args);
    ToolResult addCombatant(foundation::CampaignId campaignId, const YAML::Node& args);
    ToolResult removeCombatant(foundation::CampaignId campaignId, const YAML::Node& args);
    ToolResult getCombatState(foundation::CampaignId campaignId, const YAML::Node& args);
    ToolResult presentPlayerChoices(foundation::CampaignId campaignId, const YAML::Node& args);
    ToolResult submitPlayerChoice(foundation::CampaignId campaignId, const YAML::Node& args);
    ToolResult atmospherePulse(foundation::CampaignId campaignId, const YAML::Node& args);
    ToolResult narrativeAnchor(foundation::CampaignId campaignId, const YAML::Node& args);
    ToolResult groupInsight(foundation::CampaignId campaignId, const YAML::Node& args);
    ToolResult logPlayerRoll(foundation::CampaignId campaignId, const YAML::Node& args);
    ToolResult readAloudText(foundation::CampaignId campaignId, const YAML::Node& args);
    ToolResult updateSceneImage(foundation::CampaignId campaignId, const YAML::Node& args);

    ToolResult claimCharacter(foundation::CampaignId campaignId, const YAML::Node& args);
    ToolResult releaseCharacter(foundation::CampaignId campaignId, const YAML::Node& args);
    ToolResult playerConnected(foundation::CampaignId campaignId, const YAML::Node& args);
    ToolResult playerDisconnected(foundation::CampaignId campaignId, const YAML::Node& args);
    ToolResult playerPresence(foundation::CampaignId campaignId, const YAML::Node& args,
                              bool online);

    CombatCoordinator& coordinator_;
};

}  // namespace tts::service
