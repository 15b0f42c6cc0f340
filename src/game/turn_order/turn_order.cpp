/// @file turn_order.cpp
/// @brief TurnOrderManager implementation.

#include "tts/game/turn_order.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <unordered_set>

#include "tts/foundation/game_logger.hpp"

namespace tts::game {

using tts::foundation::CharacterId;
using tts::foundation::ErrorCode;
using tts::foundation::GameError;
using tts::foundation::GameResult;
using tts::foundation::LogCategory;

namespace {

bool turnsBefore(const TurnSlot& a, const TurnSlot& b) {
    if (a.initiative != b.initiative) {
        return a.initiative > b.initiative;
    }
    return a.joinOrder < b.joinOrder;
}

TurnSlot makeSlot(const CombatantSeed& seed, uint32_t joinOrder) {
    TurnSlot slot;
    slot.characterId = seed.id;
    slot.type = seed.type;
    slot.initiative = seed.initiative;
    slot.joinOrder = joinOrder;
    return slot;
}

/// Defeated non-players never hold a slot.
GameResult<void> requireStanding(const CombatantSeed& seed) {
    if (seed.type != CharacterType::PC && seed.currentHp <= 0) {
        return GameResult<void>::err(GameError(
            ErrorCode::InvalidHitPoints,
            "cannot join combat at 0 hit points: " + seed.id, seed.id));
    }
    return GameResult<void>::ok();
}

}  // namespace

std::string generateEncounterId() {
    static std::atomic<uint64_t> counter{0};
    auto serial = counter.fetch_add(1, std::memory_order_relaxed) + 1;
    auto now = std::chrono::duration_cast<std::chrono::microseconds>(
                   std::chrono::system_clock::now().time_since_epoch())
                   .count();
    return "enc-" + std::to_string(now) + "-" + std::to_string(serial);
}

// ── Lifecycle ───────────────────────────────────────────────────────────

GameResult<CombatEncounter> TurnOrderManager::start(
    std::string encounterId, const std::vector<CombatantSeed>& combatants) {
    if (combatants.empty()) {
        return GameResult<CombatEncounter>::err(
            GameError(ErrorCode::InvalidArgument, "combat needs at least one combatant"));
    }

    std::unordered_set<CharacterId> seen;
    for (const auto& c : combatants) {
        if (c.id.empty()) {
            return GameResult<CombatEncounter>::err(
                GameError(ErrorCode::InvalidArgument, "combatant id must not be empty"));
        }
        if (!seen.insert(c.id).second) {
            return GameResult<CombatEncounter>::err(GameError(
                ErrorCode::DuplicateCharacter, "combatant listed twice: " + c.id, c.id));
        }
        if (auto standing = requireStanding(c); !standing) {
            return GameResult<CombatEncounter>::err(standing.error());
        }
    }

    CombatEncounter encounter;
    encounter.id = std::move(encounterId);
    encounter.isActive = true;
    encounter.roundNumber = 1;
    for (const auto& c : combatants) {
        encounter.turnOrder.push_back(makeSlot(c, encounter.nextJoinOrder++));
        if (c.surprised) {
            encounter.surprisedEntities.insert(c.id);
        }
    }
    std::sort(encounter.turnOrder.begin(), encounter.turnOrder.end(), turnsBefore);
    encounter.currentTurnIndex = 0;

    return GameResult<CombatEncounter>::ok(std::move(encounter));
}

void TurnOrderManager::end() {
    encounter_.isActive = false;
}

// ── Ordering ────────────────────────────────────────────────────────────

GameResult<void> TurnOrderManager::setInitiative(const CharacterId& id, int32_t initiative) {
    auto index = requireSlot(id);
    if (!index) {
        return GameResult<void>::err(index.error());
    }
    encounter_.turnOrder[index.value()].initiative = initiative;
    sortKeepingCurrent();
    return GameResult<void>::ok();
}

GameResult<void> TurnOrderManager::add(const CombatantSeed& combatant) {
    if (encounter_.contains(combatant.id)) {
        return GameResult<void>::err(GameError(
            ErrorCode::CombatantAlreadyPresent,
            "combatant already in turn order: " + combatant.id, combatant.id));
    }
    if (auto standing = requireStanding(combatant); !standing) {
        return standing;
    }
    encounter_.turnOrder.push_back(makeSlot(combatant, encounter_.nextJoinOrder++));
    if (combatant.surprised) {
        encounter_.surprisedEntities.insert(combatant.id);
    }
    // Re-admitting a previously defeated combatant revives its slot.
    encounter_.defeatedIds.erase(
        std::remove(encounter_.defeatedIds.begin(), encounter_.defeatedIds.end(), combatant.id),
        encounter_.defeatedIds.end());

    if (!encounter_.currentTurnIndex) {
        encounter_.currentTurnIndex = 0;
    }
    sortKeepingCurrent();
    return GameResult<void>::ok();
}

void TurnOrderManager::sortKeepingCurrent() {
    const TurnSlot* holder = encounter_.current();
    std::optional<CharacterId> holderId;
    if (holder != nullptr) {
        holderId = holder->characterId;
    }

    std::sort(encounter_.turnOrder.begin(), encounter_.turnOrder.end(), turnsBefore);

    if (holderId) {
        encounter_.currentTurnIndex = encounter_.indexOf(*holderId);
    }
}

// ── Turn advancement ────────────────────────────────────────────────────

GameResult<bool> TurnOrderManager::advance() {
    if (encounter_.turnOrder.empty()) {
        return GameResult<bool>::err(
            GameError(ErrorCode::EmptyTurnOrder, "no combatants in turn order"));
    }

    std::size_t next = encounter_.currentTurnIndex.value_or(0) + 1;
    bool newRound = false;
    if (next >= encounter_.turnOrder.size()) {
        next = 0;
        ++encounter_.roundNumber;
        encounter_.surprisedEntities.clear();
        newRound = true;
    }
    encounter_.currentTurnIndex = next;
    return GameResult<bool>::ok(newRound);
}

// ── Removal ─────────────────────────────────────────────────────────────

GameResult<bool> TurnOrderManager::markDefeated(const CharacterId& id) {
    auto index = requireSlot(id);
    if (!index) {
        return GameResult<bool>::err(index.error());
    }
    if (encounter_.turnOrder[index.value()].type == CharacterType::PC) {
        return GameResult<bool>::err(GameError(
            ErrorCode::NotAnEnemy,
            "player characters are never defeated; use death saves instead", id));
    }

    removeAt(index.value());
    encounter_.defeatedIds.push_back(id);
    encounter_.surprisedEntities.erase(id);

    TTS_LOG_DEBUG(LogCategory::Combat, "Combatant defeated: " + id);
    return GameResult<bool>::ok(hasActiveEnemies());
}

GameResult<void> TurnOrderManager::remove(const CharacterId& id) {
    auto index = requireSlot(id);
    if (!index) {
        return GameResult<void>::err(index.error());
    }
    removeAt(index.value());
    encounter_.surprisedEntities.erase(id);
    return GameResult<void>::ok();
}

void TurnOrderManager::removeAt(std::size_t index) {
    encounter_.turnOrder.erase(encounter_.turnOrder.begin() +
                               static_cast<std::ptrdiff_t>(index));

    if (encounter_.turnOrder.empty()) {
        encounter_.currentTurnIndex.reset();
        return;
    }

    std::size_t current = encounter_.currentTurnIndex.value_or(0);
    if (index <= current && current > 0) {
        --current;
    }
    encounter_.currentTurnIndex = std::min(current, encounter_.turnOrder.size() - 1);
}

bool TurnOrderManager::hasActiveEnemies() const {
    return std::any_of(encounter_.turnOrder.begin(), encounter_.turnOrder.end(),
                       [](const TurnSlot& slot) { return slot.type != CharacterType::PC; });
}

GameResult<std::size_t> TurnOrderManager::requireSlot(const CharacterId& id) const {
    auto index = encounter_.indexOf(id);
    if (!index) {
        return GameResult<std::size_t>::err(GameError(
            ErrorCode::CombatantNotInTurnOrder,
            "character is not in the turn order: " + id, id));
    }
    return GameResult<std::size_t>::ok(*index);
}

}  // namespace tts::game
