#pragma once

/// @file state_change.hpp
/// @brief Typed form of an update_character_state request.

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace tts::service {

enum class StateKey : uint8_t {
    CurrentHp,         ///< int
    Conditions,        ///< string list, replaces the set
    StatusNotes,       ///< string
    Initiative,        ///< int, re-sorts the turn order in combat
    DeathSaveSuccess,  ///< int count
    DeathSaveFailure,  ///< int count
    AddCondition,      ///< string
    RemoveCondition,   ///< string
    Stabilize,         ///< bool (must be true)
    Damage,            ///< int
    Heal,              ///< int
    TemporaryHp        ///< int
};

/// What kind of value a key expects.
enum class StateValueType : uint8_t { Int, Bool, String, StringList };

constexpr std::string_view stateKeyName(StateKey key) {
    switch (key) {
        case StateKey::CurrentHp:        return "current_hp";
        case StateKey::Conditions:       return "conditions";
        case StateKey::StatusNotes:      return "status_notes";
        case StateKey::Initiative:       return "initiative";
        case StateKey::DeathSaveSuccess: return "death_save_success";
        case StateKey::DeathSaveFailure: return "death_save_failure";
        case StateKey::AddCondition:     return "add_condition";
        case StateKey::RemoveCondition:  return "remove_condition";
        case StateKey::Stabilize:        return "stabilize";
        case StateKey::Damage:           return "damage";
        case StateKey::Heal:             return "heal";
        case StateKey::TemporaryHp:      return "temporary_hp";
    }
    return "unknown";
}

constexpr std::optional<StateKey> parseStateKey(std::string_view name) {
    if (name == "current_hp") return StateKey::CurrentHp;
    if (name == "conditions") return StateKey::Conditions;
    if (name == "status_notes") return StateKey::StatusNotes;
    if (name == "initiative") return StateKey::Initiative;
    if (name == "death_save_success") return StateKey::DeathSaveSuccess;
    if (name == "death_save_failure") return StateKey::DeathSaveFailure;
    if (name == "add_condition") return StateKey::AddCondition;
    if (name == "remove_condition") return StateKey::RemoveCondition;
    if (name == "stabilize") return StateKey::Stabilize;
    if (name == "damage") return StateKey::Damage;
    if (name == "heal") return StateKey::Heal;
    if (name == "temporary_hp") return StateKey::TemporaryHp;
    return std::nullopt;
}

constexpr StateValueType stateValueType(StateKey key) {
    switch (key) {
        case StateKey::Conditions:
            return StateValueType::StringList;
        case StateKey::StatusNotes:
        case StateKey::AddCondition:
        case StateKey::RemoveCondition:
            return StateValueType::String;
        case StateKey::Stabilize:
            return StateValueType::Bool;
        default:
            return StateValueType::Int;
    }
}

using StateValue = std::variant<int32_t, bool, std::string, std::vector<std::string>>;

/// One key/value update for a single character.
struct StateChange {
    StateKey key = StateKey::CurrentHp;
    StateValue value = int32_t{0};

    static StateChange hp(int32_t hp) { return {StateKey::CurrentHp, hp}; }
    static StateChange of(StateKey key, StateValue value) { return {key, std::move(value)}; }
};

}  // namespace tts::service
