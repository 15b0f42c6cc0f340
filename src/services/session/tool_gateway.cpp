/// @file tool_gateway.cpp
/// @brief ToolGateway implementation: argument decoding and dispatch.

#include "tts/service/tool_gateway.hpp"

#include <array>
#include <cctype>
#include <initializer_list>
#include <optional>
#include <utility>

#include "tts/foundation/game_logger.hpp"
#include "tts/service/campaign_codec.hpp"

namespace tts::service {

using tts::foundation::CampaignId;
using tts::foundation::ErrorCode;
using tts::foundation::GameError;
using tts::foundation::GameLogger;
using tts::foundation::GameResult;
using tts::foundation::LogCategory;
using tts::foundation::LogContext;
using tts::foundation::LogLevel;
using tts::game::CharacterType;
using tts::game::CombatantSeed;

namespace {

// -- Argument decoding -------------------------------------------------------

GameError missingArgument(std::string_view key) {
    return GameError(ErrorCode::MissingArgument,
                     "missing argument '" + std::string(key) + "'");
}

GameError argumentMismatch(std::string_view key, std::string_view expected) {
    return GameError(ErrorCode::ArgumentTypeMismatch,
                     "argument '" + std::string(key) + "' must be " + std::string(expected));
}

/// First present, non-null field among @p keys.
std::optional<YAML::Node> lookup(const YAML::Node& args,
                                 std::initializer_list<const char*> keys) {
    for (const char* key : keys) {
        const YAML::Node node = args[key];
        if (node && !node.IsNull()) {
            return node;
        }
    }
    return std::nullopt;
}

GameResult<std::optional<std::string>> optString(const YAML::Node& args, const char* key) {
    auto node = lookup(args, {key});
    if (!node) {
        return GameResult<std::optional<std::string>>::ok(std::nullopt);
    }
    if (!node->IsScalar()) {
        return GameResult<std::optional<std::string>>::err(argumentMismatch(key, "a string"));
    }
    return GameResult<std::optional<std::string>>::ok(node->Scalar());
}

GameResult<std::string> argString(const YAML::Node& args, const char* key) {
    auto value = optString(args, key);
    if (!value) {
        return GameResult<std::string>::err(value.error());
    }
    if (!value.value()) {
        return GameResult<std::string>::err(missingArgument(key));
    }
    return GameResult<std::string>::ok(*value.value());
}

GameResult<std::optional<int32_t>> optInt(const YAML::Node& args,
                                          std::initializer_list<const char*> keys) {
    auto node = lookup(args, keys);
    if (!node) {
        return GameResult<std::optional<int32_t>>::ok(std::nullopt);
    }
    int32_t value = 0;
    if (!node->IsScalar() || !YAML::convert<int32_t>::decode(*node, value)) {
        return GameResult<std::optional<int32_t>>::err(
            argumentMismatch(*keys.begin(), "an integer"));
    }
    return GameResult<std::optional<int32_t>>::ok(value);
}

GameResult<int32_t> argInt(const YAML::Node& args, const char* key) {
    auto value = optInt(args, {key});
    if (!value) {
        return GameResult<int32_t>::err(value.error());
    }
    if (!value.value()) {
        return GameResult<int32_t>::err(missingArgument(key));
    }
    return GameResult<int32_t>::ok(*value.value());
}

GameResult<std::optional<bool>> optBool(const YAML::Node& args, const char* key) {
    auto node = lookup(args, {key});
    if (!node) {
        return GameResult<std::optional<bool>>::ok(std::nullopt);
    }
    bool value = false;
    if (!node->IsScalar() || !YAML::convert<bool>::decode(*node, value)) {
        return GameResult<std::optional<bool>>::err(argumentMismatch(key, "a boolean"));
    }
    return GameResult<std::optional<bool>>::ok(value);
}

/// A string list, given either as a sequence or as a scalar holding a
/// JSON array ("[\"Poisoned\"]"). A plain scalar is a one-element list.
GameResult<std::vector<std::string>> argStringList(const YAML::Node& args, const char* key) {
    auto node = lookup(args, {key});
    if (!node) {
        return GameResult<std::vector<std::string>>::err(missingArgument(key));
    }

    YAML::Node list = *node;
    if (list.IsScalar()) {
        const std::string& text = list.Scalar();
        if (text.empty()) {
            return GameResult<std::vector<std::string>>::ok({});
        }
        if (text.front() == '[') {
            try {
                list = YAML::Load(text);
            } catch (const YAML::Exception&) {
                return GameResult<std::vector<std::string>>::err(
                    argumentMismatch(key, "a list of strings"));
            }
        } else {
            return GameResult<std::vector<std::string>>::ok({text});
        }
    }
    if (!list.IsSequence()) {
        return GameResult<std::vector<std::string>>::err(
            argumentMismatch(key, "a list of strings"));
    }

    std::vector<std::string> values;
    for (const auto& entry : list) {
        if (!entry.IsScalar()) {
            return GameResult<std::vector<std::string>>::err(
                argumentMismatch(key, "a list of strings"));
        }
        values.push_back(entry.Scalar());
    }
    return GameResult<std::vector<std::string>>::ok(std::move(values));
}

GameResult<std::string> characterRef(const YAML::Node& args) {
    if (auto node = lookup(args, {"character_id", "character_name"})) {
        if (node->IsScalar() && !node->Scalar().empty()) {
            return GameResult<std::string>::ok(node->Scalar());
        }
        return GameResult<std::string>::err(argumentMismatch("character_id", "a string"));
    }
    return GameResult<std::string>::err(missingArgument("character_id"));
}

/// "PC", "npc", "Enemy", ... (case-insensitive).
std::optional<CharacterType> parseTypeLoose(std::string text) {
    for (auto& ch : text) {
        ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
    }
    if (text == "pc" || text == "player") return CharacterType::PC;
    if (text == "npc") return CharacterType::NPC;
    if (text == "enemy") return CharacterType::Enemy;
    return std::nullopt;
}

GameResult<CombatantSeed> parseCombatant(const YAML::Node& entry) {
    if (!entry.IsMap()) {
        return GameResult<CombatantSeed>::err(argumentMismatch("combatants", "a list of objects"));
    }

    CombatantSeed seed;
    auto id = argString(entry, "id");
    if (!id) {
        return GameResult<CombatantSeed>::err(id.error());
    }
    seed.id = id.value();

    auto name = optString(entry, "name");
    if (!name) {
        return GameResult<CombatantSeed>::err(name.error());
    }
    seed.name = name.value().value_or(seed.id);

    auto type = optString(entry, "type");
    if (!type) {
        return GameResult<CombatantSeed>::err(type.error());
    }
    if (type.value()) {
        auto parsed = parseTypeLoose(*type.value());
        if (!parsed) {
            return GameResult<CombatantSeed>::err(GameError(
                ErrorCode::ArgumentTypeMismatch, "unknown combatant type: " + *type.value()));
        }
        seed.type = *parsed;
    }

    auto initiative = argInt(entry, "initiative");
    if (!initiative) {
        return GameResult<CombatantSeed>::err(initiative.error());
    }
    seed.initiative = initiative.value();

    auto currentHp = optInt(entry, {"currentHp", "current_hp"});
    if (!currentHp) {
        return GameResult<CombatantSeed>::err(currentHp.error());
    }
    auto maxHp = optInt(entry, {"maxHp", "max_hp"});
    if (!maxHp) {
        return GameResult<CombatantSeed>::err(maxHp.error());
    }
    seed.currentHp = currentHp.value().value_or(maxHp.value().value_or(0));
    seed.maxHp = maxHp.value().value_or(seed.currentHp);

    auto surprised = optBool(entry, "surprised");
    if (!surprised) {
        return GameResult<CombatantSeed>::err(surprised.error());
    }
    seed.surprised = surprised.value().value_or(false);
    return GameResult<CombatantSeed>::ok(std::move(seed));
}

GameResult<StateValue> parseStateValue(StateKey key, const YAML::Node& args) {
    switch (stateValueType(key)) {
        case StateValueType::Int: {
            auto value = argInt(args, "value");
            if (!value) {
                return GameResult<StateValue>::err(value.error());
            }
            return GameResult<StateValue>::ok(value.value());
        }
        case StateValueType::Bool: {
            auto value = optBool(args, "value");
            if (!value) {
                return GameResult<StateValue>::err(value.error());
            }
            return GameResult<StateValue>::ok(value.value().value_or(true));
        }
        case StateValueType::String: {
            auto value = optString(args, "value");
            if (!value) {
                return GameResult<StateValue>::err(value.error());
            }
            return GameResult<StateValue>::ok(value.value().value_or(std::string()));
        }
        case StateValueType::StringList: {
            auto value = argStringList(args, "value");
            if (!value) {
                return GameResult<StateValue>::err(value.error());
            }
            return GameResult<StateValue>::ok(std::move(value).value());
        }
    }
    return GameResult<StateValue>::err(missingArgument("value"));
}

// -- Results -----------------------------------------------------------------

ToolResult failure(GameError error) {
    ToolResult result;
    result.success = false;
    result.error = std::move(error);
    return result;
}

ToolResult fromOutcome(GameResult<MutationOutcome> outcome) {
    if (!outcome) {
        return failure(outcome.error());
    }
    ToolResult result;
    result.success = true;
    result.event = std::move(outcome.value().event);
    result.routed = std::move(outcome.value().routed);
    return result;
}

}  // namespace

// ── ToolResult ──────────────────────────────────────────────────────────

std::string ToolResult::toResponse() const {
    YAML::Node root;
    root["success"] = success;
    if (error) {
        YAML::Node e;
        e["kind"] = std::string(foundation::errorKindName(error->kind()));
        e["subsystem"] = std::string(error->subsystem());
        e["code"] = static_cast<uint32_t>(error->code());
        e["message"] = std::string(error->message());
        root["error"] = e;
    }
    if (event) {
        root["event"] = std::string(eventName(event->kind));
        root["sequence"] = event->sequence;
    }
    if (!routed.empty()) {
        YAML::Node groups(YAML::NodeType::Sequence);
        for (const auto& message : routed) {
            YAML::Node entry;
            entry["audience"] = std::string(audienceName(message.audience));
            entry["delivered"] = message.delivered;
            groups.push_back(entry);
        }
        root["routed"] = groups;
    }
    if (data && !data.IsNull()) {
        root["data"] = data;
    }
    return toFlowString(root);
}

// ── Dispatch ────────────────────────────────────────────────────────────

std::vector<std::string_view> ToolGateway::toolNames() {
    return {"start_combat",        "set_initiative",        "advance_turn",
            "update_character_state", "mark_defeated",     "end_combat",
            "add_combatant",       "remove_combatant",      "get_combat_state",
            "present_player_choices", "submit_player_choice", "atmosphere_pulse",
            "narrative_anchor",    "group_insight",         "log_player_roll",
            "read_aloud_text",     "update_scene_image",    "claim_character",
            "release_character",   "player_connected",      "player_disconnected"};
}

ToolGateway::Handler ToolGateway::findHandler(std::string_view tool) {
    static const std::array<std::pair<std::string_view, Handler>, 21> kTools = {{
        {"start_combat", &ToolGateway::startCombat},
        {"set_initiative", &ToolGateway::setInitiative},
        {"advance_turn", &ToolGateway::advanceTurn},
        {"update_character_state", &ToolGateway::updateCharacterState},
        {"mark_defeated", &ToolGateway::markDefeated},
        {"end_combat", &ToolGateway::endCombat},
        {"add_combatant", &ToolGateway::addCombatant},
        {"remove_combatant", &ToolGateway::removeCombatant},
        {"get_combat_state", &ToolGateway::getCombatState},
        {"present_player_choices", &ToolGateway::presentPlayerChoices},
        {"submit_player_choice", &ToolGateway::submitPlayerChoice},
        {"atmosphere_pulse", &ToolGateway::atmospherePulse},
        {"narrative_anchor", &ToolGateway::narrativeAnchor},
        {"group_insight", &ToolGateway::groupInsight},
        {"log_player_roll", &ToolGateway::logPlayerRoll},
        {"read_aloud_text", &ToolGateway::readAloudText},
        {"update_scene_image", &ToolGateway::updateSceneImage},
        {"claim_character", &ToolGateway::claimCharacter},
        {"release_character", &ToolGateway::releaseCharacter},
        {"player_connected", &ToolGateway::playerConnected},
        {"player_disconnected", &ToolGateway::playerDisconnected},
    }};
    for (const auto& [name, handler] : kTools) {
        if (name == tool) {
            return handler;
        }
    }
    return nullptr;
}

ToolResult ToolGateway::execute(CampaignId campaignId, std::string_view tool,
                                std::string_view arguments) {
    YAML::Node args;
    if (arguments.find_first_not_of(" \t\r\n") != std::string_view::npos) {
        try {
            args = YAML::Load(std::string(arguments));
        } catch (const YAML::Exception& e) {
            return failure(GameError(ErrorCode::ArgumentTypeMismatch,
                                     std::string("arguments are not a JSON object: ") + e.what()));
        }
    }
    return execute(campaignId, tool, args);
}

ToolResult ToolGateway::execute(CampaignId campaignId, std::string_view tool,
                                const YAML::Node& arguments) {
    LogContext ctx;
    ctx.campaignId = campaignId;
    ctx.tool = std::string(tool);

    auto handler = findHandler(tool);
    ToolResult result;
    if (handler == nullptr) {
        result = failure(
            GameError(ErrorCode::UnknownTool, "unknown tool '" + std::string(tool) + "'"));
    } else if (arguments && !arguments.IsNull() && !arguments.IsMap()) {
        result = failure(argumentMismatch("arguments", "an object"));
    } else {
        try {
            result = (this->*handler)(campaignId, arguments);
        } catch (const YAML::Exception& e) {
            result = failure(GameError(ErrorCode::ArgumentTypeMismatch,
                                       std::string("malformed arguments: ") + e.what()));
        }
    }

    auto& logger = GameLogger::instance();
    if (result.success) {
        logger.logWithContext(LogLevel::Debug, LogCategory::Tool, "Tool succeeded", ctx);
    } else {
        ctx.extra["kind"] = std::string(foundation::errorKindName(result.error->kind()));
        logger.logWithContext(LogLevel::Info, LogCategory::Tool,
                              "Tool failed: " + std::string(result.error->message()), ctx);
    }
    return result;
}

// ── Combat tools ────────────────────────────────────────────────────────

ToolResult ToolGateway::startCombat(CampaignId campaignId, const YAML::Node& args) {
    auto list = lookup(args, {"combatants"});
    if (!list) {
        return failure(missingArgument("combatants"));
    }
    if (!list->IsSequence()) {
        return failure(argumentMismatch("combatants", "a list of objects"));
    }

    std::vector<CombatantSeed> seeds;
    for (const auto& entry : *list) {
        auto seed = parseCombatant(entry);
        if (!seed) {
            return failure(seed.error());
        }
        seeds.push_back(std::move(seed).value());
    }
    return fromOutcome(coordinator_.startCombat(campaignId, seeds));
}

ToolResult ToolGateway::setInitiative(CampaignId campaignId, const YAML::Node& args) {
    auto ref = characterRef(args);
    if (!ref) {
        return failure(ref.error());
    }
    auto value = argInt(args, "value");
    if (!value) {
        return failure(value.error());
    }
    return fromOutcome(coordinator_.setInitiative(campaignId, ref.value(), value.value()));
}

ToolResult ToolGateway::advanceTurn(CampaignId campaignId, const YAML::Node& /*args*/) {
    return fromOutcome(coordinator_.advanceTurn(campaignId));
}

ToolResult ToolGateway::updateCharacterState(CampaignId campaignId, const YAML::Node& args) {
    auto ref = characterRef(args);
    if (!ref) {
        return failure(ref.error());
    }
    auto keyName = argString(args, "key");
    if (!keyName) {
        return failure(keyName.error());
    }
    auto key = parseStateKey(keyName.value());
    if (!key) {
        return failure(GameError(ErrorCode::UnknownStateKey,
                                 "unknown state key '" + keyName.value() + "'"));
    }
    auto value = parseStateValue(*key, args);
    if (!value) {
        return failure(value.error());
    }
    return fromOutcome(coordinator_.updateCharacterState(
        campaignId, ref.value(), StateChange::of(*key, std::move(value).value())));
}

ToolResult ToolGateway::markDefeated(CampaignId campaignId, const YAML::Node& args) {
    auto ref = characterRef(args);
    if (!ref) {
        return failure(ref.error());
    }
    return fromOutcome(coordinator_.markDefeated(campaignId, ref.value()));
}

ToolResult ToolGateway::endCombat(CampaignId campaignId, const YAML::Node& /*args*/) {
    return fromOutcome(coordinator_.endCombat(campaignId));
}

ToolResult ToolGateway::addCombatant(CampaignId campaignId, const YAML::Node& args) {
    YAML::Node entry = args;
    if (auto nested = lookup(args, {"combatant"})) {
        entry = *nested;
    }
    auto seed = parseCombatant(entry);
    if (!seed) {
        return failure(seed.error());
    }
    return fromOutcome(coordinator_.addCombatant(campaignId, seed.value()));
}

ToolResult ToolGateway::removeCombatant(CampaignId campaignId, const YAML::Node& args) {
    auto ref = characterRef(args);
    if (!ref) {
        return failure(ref.error());
    }
    return fromOutcome(coordinator_.removeCombatant(campaignId, ref.value()));
}

ToolResult ToolGateway::getCombatState(CampaignId campaignId, const YAML::Node& /*args*/) {
    auto state = coordinator_.combatState(campaignId);
    if (!state) {
        return failure(state.error());
    }
    ToolResult result;
    result.success = true;
    if (state.value()) {
        result.data = encodeCombatState(*state.value());
    } else {
        result.data["is_active"] = false;
    }
    return result;
}

// ── Narrative tools ─────────────────────────────────────────────────────

ToolResult ToolGateway::presentPlayerChoices(CampaignId campaignId, const YAML::Node& args) {
    auto choices = argStringList(args, "choices");
    if (!choices) {
        return failure(choices.error());
    }
    if (choices.value().empty()) {
        return failure(GameError(ErrorCode::InvalidArgument, "choices must not be empty"));
    }
    PlayerChoicesPayload payload;
    payload.choices = std::move(choices).value();
    return fromOutcome(
        coordinator_.publishCue(campaignId, EventKind::PlayerChoicesPresented, payload));
}

ToolResult ToolGateway::submitPlayerChoice(CampaignId campaignId, const YAML::Node& args) {
    auto ref = characterRef(args);
    if (!ref) {
        return failure(ref.error());
    }
    auto choice = argString(args, "choice");
    if (!choice) {
        return failure(choice.error());
    }
    return fromOutcome(
        coordinator_.submitPlayerChoice(campaignId, ref.value(), std::move(choice).value()));
}

ToolResult ToolGateway::atmospherePulse(CampaignId campaignId, const YAML::Node& args) {
    auto text = argString(args, "text");
    if (!text) {
        return failure(text.error());
    }
    auto intensity = optString(args, "intensity");
    if (!intensity) {
        return failure(intensity.error());
    }
    auto sensory = optString(args, "sensory_type");
    if (!sensory) {
        return failure(sensory.error());
    }
    AtmospherePulsePayload payload;
    payload.text = text.value();
    payload.intensity = intensity.value();
    payload.sensoryType = sensory.value();
    return fromOutcome(coordinator_.publishCue(campaignId, EventKind::AtmospherePulse, payload));
}

ToolResult ToolGateway::narrativeAnchor(CampaignId campaignId, const YAML::Node& args) {
    auto text = argString(args, "short_text");
    if (!text) {
        return failure(text.error());
    }
    auto mood = optString(args, "mood_category");
    if (!mood) {
        return failure(mood.error());
    }
    NarrativeAnchorPayload payload;
    payload.shortText = text.value();
    payload.moodCategory = mood.value();
    return fromOutcome(coordinator_.publishCue(campaignId, EventKind::NarrativeAnchor, payload));
}

ToolResult ToolGateway::groupInsight(CampaignId campaignId, const YAML::Node& args) {
    auto text = argString(args, "text");
    if (!text) {
        return failure(text.error());
    }
    auto skill = argString(args, "relevant_skill");
    if (!skill) {
        return failure(skill.error());
    }
    auto highlight = optBool(args, "highlight");
    if (!highlight) {
        return failure(highlight.error());
    }
    GroupInsightPayload payload;
    payload.text = text.value();
    payload.relevantSkill = skill.value();
    payload.highlight = highlight.value().value_or(false);
    return fromOutcome(coordinator_.publishCue(campaignId, EventKind::GroupInsight, payload));
}

ToolResult ToolGateway::logPlayerRoll(CampaignId campaignId, const YAML::Node& args) {
    auto ref = characterRef(args);
    if (!ref) {
        return failure(ref.error());
    }
    auto checkType = argString(args, "check_type");
    if (!checkType) {
        return failure(checkType.error());
    }
    auto roll = argInt(args, "result");
    if (!roll) {
        return failure(roll.error());
    }
    auto outcome = optString(args, "outcome");
    if (!outcome) {
        return failure(outcome.error());
    }
    return fromOutcome(coordinator_.logPlayerRoll(campaignId, ref.value(),
                                                  std::move(checkType).value(), roll.value(),
                                                  std::move(outcome).value()));
}

ToolResult ToolGateway::readAloudText(CampaignId campaignId, const YAML::Node& args) {
    auto text = argString(args, "text");
    if (!text) {
        return failure(text.error());
    }
    if (text.value().empty()) {
        return failure(GameError(ErrorCode::InvalidArgument, "text must not be empty"));
    }
    ReadAloudPayload payload;
    payload.text = text.value();
    return fromOutcome(coordinator_.publishCue(campaignId, EventKind::ReadAloudText, payload));
}

ToolResult ToolGateway::updateSceneImage(CampaignId campaignId, const YAML::Node& args) {
    auto uri = argString(args, "image_uri");
    if (!uri) {
        return failure(uri.error());
    }
    if (uri.value().empty()) {
        return failure(GameError(ErrorCode::InvalidArgument, "image_uri must not be empty"));
    }
    SceneImagePayload payload;
    payload.imageUri = uri.value();
    return fromOutcome(
        coordinator_.publishCue(campaignId, EventKind::SceneImageUpdated, payload));
}

// ── Player tools ────────────────────────────────────────────────────────

ToolResult ToolGateway::claimCharacter(CampaignId campaignId, const YAML::Node& args) {
    auto ref = characterRef(args);
    if (!ref) {
        return failure(ref.error());
    }
    auto playerId = argString(args, "player_id");
    if (!playerId) {
        return failure(playerId.error());
    }
    auto playerName = optString(args, "player_name");
    if (!playerName) {
        return failure(playerName.error());
    }
    return fromOutcome(coordinator_.claimCharacter(
        campaignId, ref.value(), playerId.value(),
        playerName.value().value_or(playerId.value())));
}

ToolResult ToolGateway::releaseCharacter(CampaignId campaignId, const YAML::Node& args) {
    auto ref = characterRef(args);
    if (!ref) {
        return failure(ref.error());
    }
    return fromOutcome(coordinator_.releaseCharacter(campaignId, ref.value()));
}

ToolResult ToolGateway::playerConnected(CampaignId campaignId, const YAML::Node& args) {
    return playerPresence(campaignId, args, true);
}

ToolResult ToolGateway::playerDisconnected(CampaignId campaignId, const YAML::Node& args) {
    return playerPresence(campaignId, args, false);
}

ToolResult ToolGateway::playerPresence(CampaignId campaignId, const YAML::Node& args,
                                       bool online) {
    auto playerId = argString(args, "player_id");
    if (!playerId) {
        return failure(playerId.error());
    }
    auto playerName = optString(args, "player_name");
    if (!playerName) {
        return failure(playerName.error());
    }
    return fromOutcome(coordinator_.playerPresence(
        campaignId, playerId.value(), playerName.value().value_or(playerId.value()), online));
}

}  // namespace tts::service
