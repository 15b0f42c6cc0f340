/// @file campaign_codec.cpp
/// @brief YAML encode/decode for campaigns and change events.

#include "tts/service/campaign_codec.hpp"

#include <algorithm>
#include <cstdint>
#include <stdexcept>
#include <unordered_set>

namespace tts::service {

using tts::foundation::CampaignId;
using tts::foundation::ErrorCode;
using tts::foundation::GameError;
using tts::foundation::GameResult;
using tts::game::Character;
using tts::game::CharacterType;
using tts::game::CombatEncounter;
using tts::game::TurnSlot;

namespace {

/// Raised inside the decoder only; converted to AggregateCorrupted at the
/// public boundary.
class DecodeFailure : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

template <typename T>
T required(const YAML::Node& node, const char* key) {
    const YAML::Node child = node[key];
    if (!child) {
        throw DecodeFailure(std::string("missing field: ") + key);
    }
    return child.as<T>();
}

template <typename T>
T optionalField(const YAML::Node& node, const char* key, T fallback) {
    const YAML::Node child = node[key];
    if (!child || child.IsNull()) {
        return fallback;
    }
    return child.as<T>();
}

CharacterType requiredType(const YAML::Node& node, const char* key) {
    auto name = required<std::string>(node, key);
    auto type = game::parseCharacterType(name);
    if (!type) {
        throw DecodeFailure("unknown character type: " + name);
    }
    return *type;
}

void checkRange(int32_t value, int32_t low, int32_t high, const char* field) {
    if (value < low || value > high) {
        throw DecodeFailure(std::string(field) + " out of range: " + std::to_string(value));
    }
}

Character decodeCharacterNode(const YAML::Node& node) {
    if (!node.IsMap()) {
        throw DecodeFailure("character entry is not a map");
    }

    Character c;
    c.id = required<std::string>(node, "id");
    if (c.id.empty()) {
        throw DecodeFailure("character id must not be empty");
    }
    c.name = optionalField<std::string>(node, "name", c.id);
    c.type = requiredType(node, "type");
    c.maxHp = required<int32_t>(node, "max_hp");
    c.currentHp = required<int32_t>(node, "current_hp");
    c.temporaryHp = optionalField<int32_t>(node, "temporary_hp", 0);
    c.armorClass = optionalField<int32_t>(node, "armor_class", 0);
    c.initiative = optionalField<int32_t>(node, "initiative", 0);
    c.statusNotes = optionalField<std::string>(node, "status_notes", "");
    c.deathSaveSuccesses = optionalField<int32_t>(node, "death_save_successes", 0);
    c.deathSaveFailures = optionalField<int32_t>(node, "death_save_failures", 0);

    checkRange(c.maxHp, 0, INT32_MAX, "max_hp");
    checkRange(c.currentHp, 0, c.maxHp, "current_hp");
    checkRange(c.temporaryHp, 0, INT32_MAX, "temporary_hp");
    checkRange(c.deathSaveSuccesses, 0, game::kMaxDeathSaves, "death_save_successes");
    checkRange(c.deathSaveFailures, 0, game::kMaxDeathSaves, "death_save_failures");

    if (const YAML::Node conditions = node["conditions"]; conditions && !conditions.IsNull()) {
        for (const auto& entry : conditions) {
            c.addCondition(entry.as<std::string>());
        }
    }
    if (const YAML::Node player = node["player_id"]; player && !player.IsNull()) {
        c.playerId = player.as<std::string>();
    }
    if (const YAML::Node playerName = node["player_name"]; playerName && !playerName.IsNull()) {
        c.playerName = playerName.as<std::string>();
    }
    return c;
}

std::vector<Character> decodeRosterNode(const YAML::Node& node) {
    std::vector<Character> roster;
    if (!node || node.IsNull()) {
        return roster;
    }
    if (!node.IsSequence()) {
        throw DecodeFailure("roster is not a sequence");
    }
    std::unordered_set<std::string> ids;
    for (const auto& entry : node) {
        auto c = decodeCharacterNode(entry);
        if (!ids.insert(c.id).second) {
            throw DecodeFailure("duplicate character id: " + c.id);
        }
        roster.push_back(std::move(c));
    }
    return roster;
}

CombatEncounter decodeEncounterNode(const YAML::Node& node,
                                    const std::vector<Character>& roster) {
    CombatEncounter encounter;
    encounter.id = required<std::string>(node, "id");
    encounter.isActive = optionalField<bool>(node, "is_active", true);
    encounter.roundNumber = required<int32_t>(node, "round_number");
    encounter.nextJoinOrder = optionalField<uint32_t>(node, "next_join_order", 0);
    checkRange(encounter.roundNumber, 1, INT32_MAX, "round_number");

    std::unordered_set<std::string> rosterIds;
    for (const auto& c : roster) {
        rosterIds.insert(c.id);
    }

    uint32_t highestJoin = 0;
    if (const YAML::Node order = node["turn_order"]; order && !order.IsNull()) {
        for (const auto& entry : order) {
            TurnSlot slot;
            slot.characterId = required<std::string>(entry, "character_id");
            slot.type = requiredType(entry, "type");
            slot.initiative = required<int32_t>(entry, "initiative");
            slot.joinOrder = optionalField<uint32_t>(entry, "join_order", 0);
            if (rosterIds.count(slot.characterId) == 0) {
                throw DecodeFailure("turn slot references unknown character: " +
                                    slot.characterId);
            }
            if (encounter.contains(slot.characterId)) {
                throw DecodeFailure("character appears twice in turn order: " +
                                    slot.characterId);
            }
            highestJoin = std::max(highestJoin, slot.joinOrder + 1);
            encounter.turnOrder.push_back(std::move(slot));
        }
    }
    encounter.nextJoinOrder = std::max(encounter.nextJoinOrder, highestJoin);

    if (const YAML::Node index = node["current_turn_index"]; index && !index.IsNull()) {
        auto value = index.as<std::size_t>();
        if (value >= encounter.turnOrder.size()) {
            throw DecodeFailure("current_turn_index out of range: " + std::to_string(value));
        }
        encounter.currentTurnIndex = value;
    } else if (!encounter.turnOrder.empty()) {
        throw DecodeFailure("current_turn_index missing for non-empty turn order");
    }

    if (const YAML::Node surprised = node["surprised"]; surprised && !surprised.IsNull()) {
        for (const auto& entry : surprised) {
            encounter.surprisedEntities.insert(entry.as<std::string>());
        }
    }
    if (const YAML::Node defeated = node["defeated"]; defeated && !defeated.IsNull()) {
        for (const auto& entry : defeated) {
            encounter.defeatedIds.push_back(entry.as<std::string>());
        }
    }
    return encounter;
}

YAML::Node encodeEncounterNode(const CombatEncounter& encounter) {
    YAML::Node node;
    node["id"] = encounter.id;
    node["is_active"] = encounter.isActive;
    node["round_number"] = encounter.roundNumber;
    if (encounter.currentTurnIndex) {
        node["current_turn_index"] = static_cast<uint64_t>(*encounter.currentTurnIndex);
    }
    node["next_join_order"] = encounter.nextJoinOrder;

    YAML::Node order(YAML::NodeType::Sequence);
    for (const auto& slot : encounter.turnOrder) {
        YAML::Node entry;
        entry["character_id"] = slot.characterId;
        entry["type"] = std::string(game::characterTypeName(slot.type));
        entry["initiative"] = slot.initiative;
        entry["join_order"] = slot.joinOrder;
        order.push_back(entry);
    }
    node["turn_order"] = order;

    YAML::Node surprised(YAML::NodeType::Sequence);
    for (const auto& id : encounter.surprisedEntities) {
        surprised.push_back(id);
    }
    node["surprised"] = surprised;

    YAML::Node defeated(YAML::NodeType::Sequence);
    for (const auto& id : encounter.defeatedIds) {
        defeated.push_back(id);
    }
    node["defeated"] = defeated;
    return node;
}

YAML::Node encodeStringList(const std::vector<std::string>& values) {
    YAML::Node list(YAML::NodeType::Sequence);
    for (const auto& v : values) {
        list.push_back(v);
    }
    return list;
}

YAML::Node encodeViews(const std::vector<CombatantView>& views) {
    YAML::Node list(YAML::NodeType::Sequence);
    for (const auto& view : views) {
        YAML::Node entry;
        entry["id"] = view.id;
        entry["name"] = view.name;
        entry["type"] = std::string(game::characterTypeName(view.type));
        entry["initiative"] = view.initiative;
        entry["current_hp"] = view.currentHp;
        entry["max_hp"] = view.maxHp;
        entry["is_surprised"] = view.isSurprised;
        entry["status"] = std::string(game::combatStatusName(view.status));
        list.push_back(entry);
    }
    return list;
}

/// Visitor rendering each payload alternative.
struct PayloadEncoder {
    YAML::Node operator()(const CombatStatePayload& p) const { return encodeCombatState(p); }

    YAML::Node operator()(const CombatEndedPayload& p) const {
        YAML::Node node;
        node["combat_id"] = p.combatId;
        node["all_enemies_defeated"] = p.allEnemiesDefeated;
        return node;
    }

    YAML::Node operator()(const CharacterStatePayload& p) const {
        YAML::Node node;
        node["character"] = encodeCharacter(p.character);
        node["vitality"] = std::string(game::vitalityStateName(p.vitality));
        node["status"] = std::string(game::combatStatusName(p.status));
        node["changed_key"] = p.changedKey;
        if (p.combat) {
            node["combat"] = encodeCombatState(*p.combat);
        }
        node["combat_ended"] = p.combatEnded;
        return node;
    }

    YAML::Node operator()(const PlayerChoicePayload& p) const {
        YAML::Node node;
        node["character_id"] = p.characterId;
        node["character_name"] = p.characterName;
        node["choice"] = p.choice;
        return node;
    }

    YAML::Node operator()(const PlayerChoicesPayload& p) const {
        YAML::Node node;
        node["choices"] = encodeStringList(p.choices);
        return node;
    }

    YAML::Node operator()(const AtmospherePulsePayload& p) const {
        YAML::Node node;
        node["text"] = p.text;
        if (p.intensity) {
            node["intensity"] = *p.intensity;
        }
        if (p.sensoryType) {
            node["sensory_type"] = *p.sensoryType;
        }
        return node;
    }

    YAML::Node operator()(const NarrativeAnchorPayload& p) const {
        YAML::Node node;
        node["short_text"] = p.shortText;
        if (p.moodCategory) {
            node["mood_category"] = *p.moodCategory;
        }
        return node;
    }

    YAML::Node operator()(const GroupInsightPayload& p) const {
        YAML::Node node;
        node["text"] = p.text;
        node["relevant_skill"] = p.relevantSkill;
        node["highlight"] = p.highlight;
        return node;
    }

    YAML::Node operator()(const PlayerRollPayload& p) const {
        YAML::Node node;
        node["character_id"] = p.characterId;
        node["character_name"] = p.characterName;
        node["check_type"] = p.checkType;
        node["result"] = p.result;
        if (p.outcome) {
            node["outcome"] = *p.outcome;
        }
        return node;
    }

    YAML::Node operator()(const ReadAloudPayload& p) const {
        YAML::Node node;
        node["text"] = p.text;
        return node;
    }

    YAML::Node operator()(const SceneImagePayload& p) const {
        YAML::Node node;
        node["image_uri"] = p.imageUri;
        return node;
    }

    YAML::Node operator()(const CharacterClaimPayload& p) const {
        YAML::Node node;
        node["character_id"] = p.characterId;
        node["character_name"] = p.characterName;
        if (p.playerId) {
            node["player_id"] = *p.playerId;
        }
        if (p.playerName) {
            node["player_name"] = *p.playerName;
        }
        node["is_claimed"] = p.isClaimed;
        return node;
    }

    YAML::Node operator()(const PlayerConnectionPayload& p) const {
        YAML::Node node;
        node["player_id"] = p.playerId;
        node["player_name"] = p.playerName;
        if (p.characterId) {
            node["character_id"] = *p.characterId;
        }
        if (p.characterName) {
            node["character_name"] = *p.characterName;
        }
        node["is_online"] = p.isOnline;
        return node;
    }
};

template <typename T>
GameResult<T> corrupted(std::string message) {
    return GameResult<T>::err(GameError(ErrorCode::AggregateCorrupted, std::move(message)));
}

}  // namespace

// ── Characters ──────────────────────────────────────────────────────────

YAML::Node encodeCharacter(const Character& character) {
    YAML::Node node;
    node["id"] = character.id;
    node["name"] = character.name;
    node["type"] = std::string(game::characterTypeName(character.type));
    node["max_hp"] = character.maxHp;
    node["current_hp"] = character.currentHp;
    node["temporary_hp"] = character.temporaryHp;
    node["armor_class"] = character.armorClass;
    node["initiative"] = character.initiative;
    node["conditions"] = encodeStringList(character.conditions);
    node["status_notes"] = character.statusNotes;
    node["death_save_successes"] = character.deathSaveSuccesses;
    node["death_save_failures"] = character.deathSaveFailures;
    if (character.playerId) {
        node["player_id"] = *character.playerId;
    }
    if (character.playerName) {
        node["player_name"] = *character.playerName;
    }
    return node;
}

GameResult<Character> decodeCharacter(const YAML::Node& node) {
    try {
        return GameResult<Character>::ok(decodeCharacterNode(node));
    } catch (const DecodeFailure& e) {
        return corrupted<Character>(e.what());
    } catch (const YAML::Exception& e) {
        return corrupted<Character>(std::string("malformed character: ") + e.what());
    }
}

GameResult<std::vector<Character>> decodeRoster(const YAML::Node& node) {
    try {
        return GameResult<std::vector<Character>>::ok(decodeRosterNode(node));
    } catch (const DecodeFailure& e) {
        return corrupted<std::vector<Character>>(e.what());
    } catch (const YAML::Exception& e) {
        return corrupted<std::vector<Character>>(std::string("malformed roster: ") + e.what());
    }
}

// ── Campaigns ───────────────────────────────────────────────────────────

YAML::Node encodeCampaignNode(const CampaignAggregate& aggregate) {
    YAML::Node node;
    node["id"] = aggregate.id.value();
    node["name"] = aggregate.name;
    node["version"] = aggregate.version;

    YAML::Node roster(YAML::NodeType::Sequence);
    for (const auto& c : aggregate.roster) {
        roster.push_back(encodeCharacter(c));
    }
    node["roster"] = roster;

    if (aggregate.combat) {
        node["combat"] = encodeEncounterNode(*aggregate.combat);
    }
    return node;
}

std::string encodeCampaign(const CampaignAggregate& aggregate) {
    YAML::Emitter out;
    out << encodeCampaignNode(aggregate);
    return std::string(out.c_str()) + "\n";
}

GameResult<CampaignAggregate> decodeCampaign(std::string_view document) {
    try {
        YAML::Node root = YAML::Load(std::string(document));
        if (!root.IsMap()) {
            return corrupted<CampaignAggregate>("campaign document is not a map");
        }

        CampaignAggregate aggregate;
        aggregate.id = CampaignId(required<uint64_t>(root, "id"));
        aggregate.name = optionalField<std::string>(root, "name", "");
        aggregate.version = optionalField<uint64_t>(root, "version", 0);
        aggregate.roster = decodeRosterNode(root["roster"]);

        if (const YAML::Node combat = root["combat"]; combat && !combat.IsNull()) {
            aggregate.combat = decodeEncounterNode(combat, aggregate.roster);
        }
        return GameResult<CampaignAggregate>::ok(std::move(aggregate));
    } catch (const DecodeFailure& e) {
        return corrupted<CampaignAggregate>(e.what());
    } catch (const YAML::Exception& e) {
        return corrupted<CampaignAggregate>(std::string("malformed campaign: ") + e.what());
    }
}

// ── Events ──────────────────────────────────────────────────────────────

YAML::Node encodeCombatState(const CombatStatePayload& state) {
    YAML::Node node;
    node["combat_id"] = state.combatId;
    node["is_active"] = state.isActive;
    node["round_number"] = state.roundNumber;
    if (state.currentTurnIndex) {
        node["current_turn_index"] = static_cast<uint64_t>(*state.currentTurnIndex);
    }
    if (state.currentCombatantId) {
        node["current_combatant_id"] = *state.currentCombatantId;
    }

    node["turn_order"] = encodeViews(state.turnOrder);
    node["defeated"] = encodeViews(state.defeated);
    return node;
}

YAML::Node encodeEventNode(const ChangeEvent& event) {
    YAML::Node node;
    node["event"] = std::string(eventName(event.kind));
    node["campaign_id"] = event.campaignId.value();
    node["sequence"] = event.sequence;
    node["payload"] = std::visit(PayloadEncoder{}, event.payload);
    return node;
}

std::string encodeEvent(const ChangeEvent& event) {
    return toFlowString(encodeEventNode(event));
}

std::string toFlowString(const YAML::Node& node) {
    YAML::Emitter out;
    out.SetMapFormat(YAML::Flow);
    out.SetSeqFormat(YAML::Flow);
    out << node;
    return out.c_str();
}

}  // namespace tts::service
