/// @file combat_coordinator.cpp
/// @brief CombatCoordinator implementation.

#include "tts/service/combat_coordinator.hpp"

#include <algorithm>
#include <utility>

#include "tts/foundation/game_logger.hpp"
#include "tts/game/turn_order.hpp"
#include "tts/game/vitality.hpp"

namespace tts::service {

using tts::foundation::CampaignId;
using tts::foundation::CharacterId;
using tts::foundation::ErrorCode;
using tts::foundation::GameError;
using tts::foundation::GameLogger;
using tts::foundation::GameResult;
using tts::foundation::LogCategory;
using tts::foundation::LogContext;
using tts::foundation::LogLevel;
using tts::game::Character;
using tts::game::CharacterType;
using tts::game::CombatantSeed;
using tts::game::CombatStatus;
using tts::game::TurnOrderManager;
using tts::game::Vitality;

namespace {

template <typename T>
GameResult<T> fail(ErrorCode code, std::string message) {
    return GameResult<T>::err(GameError(code, std::move(message)));
}

ChangeEvent makeEvent(EventKind kind, EventPayload payload) {
    ChangeEvent event;
    event.kind = kind;
    event.payload = std::move(payload);
    return event;
}

GameResult<void> requireCombat(const CampaignAggregate& aggregate) {
    if (!aggregate.combat || !aggregate.combat->isActive) {
        return GameResult<void>::err(GameError(
            ErrorCode::NoActiveCombat,
            "campaign " + std::to_string(aggregate.id.value()) + " has no active combat"));
    }
    return GameResult<void>::ok();
}

/// Make @p seed agree with the roster, registering it if unknown.
GameResult<void> registerSeed(CampaignAggregate& aggregate, CombatantSeed& seed) {
    if (seed.id.empty()) {
        return GameResult<void>::err(
            GameError(ErrorCode::InvalidArgument, "combatant id must not be empty"));
    }

    if (auto* existing = aggregate.findCharacter(seed.id)) {
        seed.name = existing->name;
        seed.type = existing->type;
        seed.currentHp = existing->currentHp;
        seed.maxHp = existing->maxHp;
        existing->initiative = seed.initiative;
        return GameResult<void>::ok();
    }

    if (seed.maxHp < 0 || seed.currentHp < 0) {
        return GameResult<void>::err(GameError(
            ErrorCode::InvalidHitPoints, "hit points must not be negative: " + seed.id, seed.id));
    }

    Character c;
    c.id = seed.id;
    c.name = seed.name.empty() ? seed.id : seed.name;
    c.type = seed.type;
    c.maxHp = std::max(seed.maxHp, seed.currentHp);
    c.currentHp = seed.currentHp;
    c.initiative = seed.initiative;
    if (c.isPlayerCharacter() && c.currentHp == 0) {
        c.addCondition(game::kConditionUnconscious);
    }
    aggregate.roster.push_back(std::move(c));

    TTS_LOG_DEBUG(LogCategory::Combat, "Registered new combatant in roster: " + seed.id);
    return GameResult<void>::ok();
}

void endEncounter(CampaignAggregate& aggregate, std::string_view reason) {
    TurnOrderManager turns(*aggregate.combat);
    turns.end();

    LogContext ctx;
    ctx.campaignId = aggregate.id;
    ctx.extra["encounter"] = aggregate.combat->id;
    ctx.extra["round"] = std::to_string(aggregate.combat->roundNumber);
    GameLogger::instance().logWithContext(LogLevel::Info, LogCategory::Combat,
                                          "Combat ended: " + std::string(reason), ctx);
    aggregate.combat.reset();
}

/// A non-player at 0 hp in the active order is defeated; the last one
/// ends the encounter.
/// @return true when the encounter ended.
GameResult<bool> defeatIfDown(CampaignAggregate& aggregate, const Character& c) {
    if (c.isPlayerCharacter() || c.currentHp > 0 || !aggregate.inActiveCombat(c.id)) {
        return GameResult<bool>::ok(false);
    }

    TurnOrderManager turns(*aggregate.combat);
    auto remaining = turns.markDefeated(c.id);
    if (!remaining) {
        return GameResult<bool>::err(remaining.error());
    }
    if (!remaining.value()) {
        endEncounter(aggregate, "all enemies defeated");
        return GameResult<bool>::ok(true);
    }
    return GameResult<bool>::ok(false);
}

template <typename T>
GameResult<const T*> expectValue(const StateChange& change) {
    const auto* value = std::get_if<T>(&change.value);
    if (value == nullptr) {
        return GameResult<const T*>::err(GameError(
            ErrorCode::ArgumentTypeMismatch,
            "wrong value type for key '" + std::string(stateKeyName(change.key)) + "'"));
    }
    return GameResult<const T*>::ok(value);
}

GameResult<void> applyChange(CampaignAggregate& aggregate, Character& c,
                             const StateChange& change) {
    switch (stateValueType(change.key)) {
        case StateValueType::Int: {
            auto value = expectValue<int32_t>(change);
            if (!value) {
                return GameResult<void>::err(value.error());
            }
            int32_t v = *value.value();
            switch (change.key) {
                case StateKey::CurrentHp:        return Vitality::setHp(c, v);
                case StateKey::Damage:           return Vitality::applyDamage(c, v);
                case StateKey::Heal:             return Vitality::heal(c, v);
                case StateKey::TemporaryHp:      return Vitality::setTemporaryHp(c, v);
                case StateKey::DeathSaveSuccess: return Vitality::recordDeathSaveSuccess(c, v);
                case StateKey::DeathSaveFailure: return Vitality::recordDeathSaveFailure(c, v);
                case StateKey::Initiative: {
                    if (aggregate.inActiveCombat(c.id)) {
                        TurnOrderManager turns(*aggregate.combat);
                        if (auto sorted = turns.setInitiative(c.id, v); !sorted) {
                            return sorted;
                        }
                    }
                    c.initiative = v;
                    return GameResult<void>::ok();
                }
                default:
                    break;
            }
            break;
        }
        case StateValueType::Bool: {
            auto value = expectValue<bool>(change);
            if (!value) {
                return GameResult<void>::err(value.error());
            }
            if (!*value.value()) {
                return GameResult<void>::err(
                    GameError(ErrorCode::InvalidArgument, "stabilize expects true"));
            }
            return Vitality::stabilize(c);
        }
        case StateValueType::String: {
            auto value = expectValue<std::string>(change);
            if (!value) {
                return GameResult<void>::err(value.error());
            }
            const std::string& v = *value.value();
            if (change.key == StateKey::StatusNotes) {
                c.statusNotes = v;
                return GameResult<void>::ok();
            }
            if (v.empty()) {
                return GameResult<void>::err(
                    GameError(ErrorCode::InvalidArgument, "condition name must not be empty"));
            }
            if (change.key == StateKey::AddCondition) {
                Vitality::addCondition(c, v);
            } else {
                Vitality::removeCondition(c, v);
            }
            return GameResult<void>::ok();
        }
        case StateValueType::StringList: {
            auto value = expectValue<std::vector<std::string>>(change);
            if (!value) {
                return GameResult<void>::err(value.error());
            }
            Vitality::setConditions(c, *value.value());
            return GameResult<void>::ok();
        }
    }
    return GameResult<void>::err(GameError(
        ErrorCode::UnknownStateKey, "unsupported key: " + std::string(stateKeyName(change.key))));
}

/// Cues carry caller-built payloads and touch nothing in the roster.
bool isNarrativeCue(EventKind kind) {
    switch (kind) {
        case EventKind::PlayerChoicesPresented:
        case EventKind::AtmospherePulse:
        case EventKind::NarrativeAnchor:
        case EventKind::GroupInsight:
        case EventKind::ReadAloudText:
        case EventKind::SceneImageUpdated:
            return true;
        default:
            return false;
    }
}

/// Which payload alternative each cue kind carries.
bool cuePayloadMatches(EventKind kind, const EventPayload& payload) {
    switch (kind) {
        case EventKind::PlayerChoicesPresented:
            return std::holds_alternative<PlayerChoicesPayload>(payload);
        case EventKind::AtmospherePulse:
            return std::holds_alternative<AtmospherePulsePayload>(payload);
        case EventKind::NarrativeAnchor:
            return std::holds_alternative<NarrativeAnchorPayload>(payload);
        case EventKind::GroupInsight:
            return std::holds_alternative<GroupInsightPayload>(payload);
        case EventKind::ReadAloudText:
            return std::holds_alternative<ReadAloudPayload>(payload);
        case EventKind::SceneImageUpdated:
            return std::holds_alternative<SceneImagePayload>(payload);
        default:
            return false;
    }
}

}  // namespace

// ── Character resolution ────────────────────────────────────────────────

GameResult<std::size_t> resolveCharacter(const CampaignAggregate& aggregate,
                                         const std::string& characterRef) {
    for (std::size_t i = 0; i < aggregate.roster.size(); ++i) {
        if (aggregate.roster[i].id == characterRef) {
            return GameResult<std::size_t>::ok(i);
        }
    }

    std::vector<std::size_t> byName;
    for (std::size_t i = 0; i < aggregate.roster.size(); ++i) {
        if (aggregate.roster[i].name == characterRef) {
            byName.push_back(i);
        }
    }
    if (byName.empty()) {
        return GameResult<std::size_t>::err(GameError(
            ErrorCode::CharacterNotFound, "no character with id or name '" + characterRef + "'",
            characterRef));
    }
    if (byName.size() > 1) {
        return GameResult<std::size_t>::err(GameError(
            ErrorCode::AmbiguousCharacter,
            std::to_string(byName.size()) + " characters are named '" + characterRef + "'",
            characterRef));
    }
    return GameResult<std::size_t>::ok(byName.front());
}

// ── Construction / locking ──────────────────────────────────────────────

CombatCoordinator::CombatCoordinator(ICampaignStore& store, NotificationRouter& router)
    : store_(store), router_(router) {}

std::mutex& CombatCoordinator::campaignLock(CampaignId campaignId) {
    std::lock_guard guard(locksMutex_);
    auto& slot = locks_[campaignId];
    if (!slot) {
        slot = std::make_unique<std::mutex>();
    }
    return *slot;
}

template <typename Apply>
GameResult<MutationOutcome> CombatCoordinator::transact(CampaignId campaignId,
                                                        std::string_view operation,
                                                        Commit commit, Apply&& apply) {
    std::lock_guard guard(campaignLock(campaignId));

    auto loaded = store_.load(campaignId);
    if (!loaded) {
        return GameResult<MutationOutcome>::err(loaded.error());
    }
    CampaignAggregate working = std::move(loaded).value();

    GameResult<ChangeEvent> built = apply(working);
    if (!built) {
        LogContext ctx;
        ctx.campaignId = campaignId;
        ctx.extra["operation"] = std::string(operation);
        ctx.extra["kind"] = std::string(foundation::errorKindName(built.error().kind()));
        GameLogger::instance().logWithContext(
            LogLevel::Debug, LogCategory::Session,
            "Rejected: " + std::string(built.error().message()), ctx);
        return GameResult<MutationOutcome>::err(built.error());
    }

    if (commit == Commit::Persist) {
        ++working.version;
        auto saved = store_.save(working);
        if (!saved) {
            LogContext ctx;
            ctx.campaignId = campaignId;
            ctx.extra["operation"] = std::string(operation);
            ctx.extra["version"] = std::to_string(working.version);
            GameLogger::instance().logWithContext(
                LogLevel::Error, LogCategory::Persistence,
                "Save failed: " + std::string(saved.error().message()), ctx);
            return GameResult<MutationOutcome>::err(GameError(
                ErrorCode::PersistenceFailed,
                std::string(operation) + " not committed: " +
                    std::string(saved.error().message())));
        }
    }

    MutationOutcome outcome;
    outcome.event = std::move(built).value();
    outcome.event.campaignId = campaignId;
    outcome.routed = router_.dispatch(outcome.event);
    return GameResult<MutationOutcome>::ok(std::move(outcome));
}

// ── Combat lifecycle ────────────────────────────────────────────────────

GameResult<MutationOutcome> CombatCoordinator::startCombat(
    CampaignId campaignId, const std::vector<CombatantSeed>& combatants) {
    return transact(campaignId, "start_combat", Commit::Persist,
                    [&](CampaignAggregate& aggregate) -> GameResult<ChangeEvent> {
        if (aggregate.combat && aggregate.combat->isActive) {
            TTS_LOG_INFO(LogCategory::Combat,
                         "Replacing active encounter " + aggregate.combat->id);
        }

        std::vector<CombatantSeed> seeds = combatants;
        for (auto& seed : seeds) {
            if (auto registered = registerSeed(aggregate, seed); !registered) {
                return GameResult<ChangeEvent>::err(registered.error());
            }
        }

        auto encounter = TurnOrderManager::start(game::generateEncounterId(), seeds);
        if (!encounter) {
            return GameResult<ChangeEvent>::err(encounter.error());
        }
        aggregate.combat = std::move(encounter).value();

        LogContext ctx;
        ctx.campaignId = aggregate.id;
        ctx.extra["encounter"] = aggregate.combat->id;
        ctx.extra["combatants"] = std::to_string(aggregate.combat->turnOrder.size());
        GameLogger::instance().logWithContext(LogLevel::Info, LogCategory::Combat,
                                              "Combat started", ctx);

        return GameResult<ChangeEvent>::ok(
            makeEvent(EventKind::CombatStarted, buildCombatState(aggregate)));
    });
}

GameResult<MutationOutcome> CombatCoordinator::setInitiative(CampaignId campaignId,
                                                             const std::string& characterRef,
                                                             int32_t initiative) {
    return transact(campaignId, "set_initiative", Commit::Persist,
                    [&](CampaignAggregate& aggregate) -> GameResult<ChangeEvent> {
        if (auto active = requireCombat(aggregate); !active) {
            return GameResult<ChangeEvent>::err(active.error());
        }
        auto index = resolveCharacter(aggregate, characterRef);
        if (!index) {
            return GameResult<ChangeEvent>::err(index.error());
        }
        Character& c = aggregate.roster[index.value()];

        TurnOrderManager turns(*aggregate.combat);
        if (auto sorted = turns.setInitiative(c.id, initiative); !sorted) {
            return GameResult<ChangeEvent>::err(sorted.error());
        }
        c.initiative = initiative;

        return GameResult<ChangeEvent>::ok(
            makeEvent(EventKind::CombatStateUpdated, buildCombatState(aggregate)));
    });
}

GameResult<MutationOutcome> CombatCoordinator::advanceTurn(CampaignId campaignId) {
    return transact(campaignId, "advance_turn", Commit::Persist,
                    [&](CampaignAggregate& aggregate) -> GameResult<ChangeEvent> {
        if (auto active = requireCombat(aggregate); !active) {
            return GameResult<ChangeEvent>::err(active.error());
        }

        TurnOrderManager turns(*aggregate.combat);
        auto advanced = turns.advance();
        if (!advanced) {
            return GameResult<ChangeEvent>::err(advanced.error());
        }
        if (advanced.value()) {
            TTS_LOG_DEBUG(LogCategory::Combat,
                          "Round " + std::to_string(aggregate.combat->roundNumber) + " begins");
        }

        auto kind = advanced.value() ? EventKind::RoundAdvanced : EventKind::TurnAdvanced;
        return GameResult<ChangeEvent>::ok(makeEvent(kind, buildCombatState(aggregate)));
    });
}

GameResult<MutationOutcome> CombatCoordinator::markDefeated(CampaignId campaignId,
                                                            const std::string& characterRef) {
    return transact(campaignId, "mark_defeated", Commit::Persist,
                    [&](CampaignAggregate& aggregate) -> GameResult<ChangeEvent> {
        if (auto active = requireCombat(aggregate); !active) {
            return GameResult<ChangeEvent>::err(active.error());
        }
        auto index = resolveCharacter(aggregate, characterRef);
        if (!index) {
            return GameResult<ChangeEvent>::err(index.error());
        }
        Character& c = aggregate.roster[index.value()];
        if (c.isPlayerCharacter()) {
            return GameResult<ChangeEvent>::err(GameError(
                ErrorCode::NotAnEnemy,
                "player character '" + c.name + "' cannot be marked defeated", c.id));
        }

        c.currentHp = 0;
        TurnOrderManager turns(*aggregate.combat);
        auto remaining = turns.markDefeated(c.id);
        if (!remaining) {
            return GameResult<ChangeEvent>::err(remaining.error());
        }

        if (!remaining.value()) {
            CombatEndedPayload ended;
            ended.combatId = aggregate.combat->id;
            ended.allEnemiesDefeated = true;
            endEncounter(aggregate, "all enemies defeated");
            return GameResult<ChangeEvent>::ok(makeEvent(EventKind::CombatEnded, ended));
        }
        return GameResult<ChangeEvent>::ok(
            makeEvent(EventKind::CombatStateUpdated, buildCombatState(aggregate)));
    });
}

GameResult<MutationOutcome> CombatCoordinator::endCombat(CampaignId campaignId) {
    return transact(campaignId, "end_combat", Commit::Persist,
                    [&](CampaignAggregate& aggregate) -> GameResult<ChangeEvent> {
        if (auto active = requireCombat(aggregate); !active) {
            return GameResult<ChangeEvent>::err(active.error());
        }
        CombatEndedPayload ended;
        ended.combatId = aggregate.combat->id;
        endEncounter(aggregate, "ended by game master");
        return GameResult<ChangeEvent>::ok(makeEvent(EventKind::CombatEnded, ended));
    });
}

GameResult<MutationOutcome> CombatCoordinator::addCombatant(CampaignId campaignId,
                                                            const CombatantSeed& combatant) {
    return transact(campaignId, "add_combatant", Commit::Persist,
                    [&](CampaignAggregate& aggregate) -> GameResult<ChangeEvent> {
        if (auto active = requireCombat(aggregate); !active) {
            return GameResult<ChangeEvent>::err(active.error());
        }
        CombatantSeed seed = combatant;
        if (auto registered = registerSeed(aggregate, seed); !registered) {
            return GameResult<ChangeEvent>::err(registered.error());
        }

        TurnOrderManager turns(*aggregate.combat);
        if (auto added = turns.add(seed); !added) {
            return GameResult<ChangeEvent>::err(added.error());
        }
        return GameResult<ChangeEvent>::ok(
            makeEvent(EventKind::CombatStateUpdated, buildCombatState(aggregate)));
    });
}

GameResult<MutationOutcome> CombatCoordinator::removeCombatant(CampaignId campaignId,
                                                               const std::string& characterRef) {
    return transact(campaignId, "remove_combatant", Commit::Persist,
                    [&](CampaignAggregate& aggregate) -> GameResult<ChangeEvent> {
        if (auto active = requireCombat(aggregate); !active) {
            return GameResult<ChangeEvent>::err(active.error());
        }
        auto index = resolveCharacter(aggregate, characterRef);
        if (!index) {
            return GameResult<ChangeEvent>::err(index.error());
        }

        TurnOrderManager turns(*aggregate.combat);
        if (auto removed = turns.remove(aggregate.roster[index.value()].id); !removed) {
            return GameResult<ChangeEvent>::err(removed.error());
        }
        return GameResult<ChangeEvent>::ok(
            makeEvent(EventKind::CombatStateUpdated, buildCombatState(aggregate)));
    });
}

// ── Character state ─────────────────────────────────────────────────────

GameResult<MutationOutcome> CombatCoordinator::updateCharacterState(
    CampaignId campaignId, const std::string& characterRef, const StateChange& change) {
    return transact(campaignId, "update_character_state", Commit::Persist,
                    [&](CampaignAggregate& aggregate) -> GameResult<ChangeEvent> {
        auto index = resolveCharacter(aggregate, characterRef);
        if (!index) {
            return GameResult<ChangeEvent>::err(index.error());
        }
        Character& c = aggregate.roster[index.value()];

        if (auto applied = applyChange(aggregate, c, change); !applied) {
            return GameResult<ChangeEvent>::err(applied.error());
        }
        auto ended = defeatIfDown(aggregate, c);
        if (!ended) {
            return GameResult<ChangeEvent>::err(ended.error());
        }

        CharacterStatePayload payload;
        payload.character = c;
        payload.vitality = Vitality::state(c);
        payload.status = Vitality::combatStatus(c);
        payload.changedKey = std::string(stateKeyName(change.key));
        payload.combatEnded = ended.value();
        if (aggregate.combat) {
            payload.combat = buildCombatState(aggregate);
        }
        return GameResult<ChangeEvent>::ok(
            makeEvent(EventKind::CharacterStateUpdated, std::move(payload)));
    });
}

// ── Narrative cues ──────────────────────────────────────────────────────

GameResult<MutationOutcome> CombatCoordinator::submitPlayerChoice(CampaignId campaignId,
                                                                  const std::string& characterRef,
                                                                  std::string choice) {
    return transact(campaignId, "submit_player_choice", Commit::RouteOnly,
                    [&](CampaignAggregate& aggregate) -> GameResult<ChangeEvent> {
        if (choice.empty()) {
            return fail<ChangeEvent>(ErrorCode::InvalidArgument, "choice must not be empty");
        }
        auto index = resolveCharacter(aggregate, characterRef);
        if (!index) {
            return GameResult<ChangeEvent>::err(index.error());
        }
        const Character& c = aggregate.roster[index.value()];

        PlayerChoicePayload payload;
        payload.characterId = c.id;
        payload.characterName = c.name;
        payload.choice = std::move(choice);
        return GameResult<ChangeEvent>::ok(
            makeEvent(EventKind::PlayerChoiceSubmitted, std::move(payload)));
    });
}

GameResult<MutationOutcome> CombatCoordinator::logPlayerRoll(CampaignId campaignId,
                                                             const std::string& characterRef,
                                                             std::string checkType, int32_t result,
                                                             std::optional<std::string> outcome) {
    return transact(campaignId, "log_player_roll", Commit::RouteOnly,
                    [&](CampaignAggregate& aggregate) -> GameResult<ChangeEvent> {
        if (checkType.empty()) {
            return fail<ChangeEvent>(ErrorCode::InvalidArgument, "check type must not be empty");
        }
        auto index = resolveCharacter(aggregate, characterRef);
        if (!index) {
            return GameResult<ChangeEvent>::err(index.error());
        }
        const Character& c = aggregate.roster[index.value()];

        PlayerRollPayload payload;
        payload.characterId = c.id;
        payload.characterName = c.name;
        payload.checkType = std::move(checkType);
        payload.result = result;
        payload.outcome = std::move(outcome);
        return GameResult<ChangeEvent>::ok(
            makeEvent(EventKind::PlayerRollLogged, std::move(payload)));
    });
}

// ── Players ─────────────────────────────────────────────────────────────

GameResult<MutationOutcome> CombatCoordinator::claimCharacter(CampaignId campaignId,
                                                              const std::string& characterRef,
                                                              const std::string& playerId,
                                                              const std::string& playerName) {
    return transact(campaignId, "claim_character", Commit::Persist,
                    [&](CampaignAggregate& aggregate) -> GameResult<ChangeEvent> {
        if (playerId.empty()) {
            return fail<ChangeEvent>(ErrorCode::InvalidArgument, "player id must not be empty");
        }
        auto index = resolveCharacter(aggregate, characterRef);
        if (!index) {
            return GameResult<ChangeEvent>::err(index.error());
        }
        Character& c = aggregate.roster[index.value()];
        if (!c.isPlayerCharacter()) {
            return GameResult<ChangeEvent>::err(GameError(
                ErrorCode::NotAPlayerCharacter, "only player characters can be claimed", c.id));
        }
        if (c.playerId && *c.playerId != playerId) {
            return GameResult<ChangeEvent>::err(GameError(
                ErrorCode::CharacterAlreadyClaimed, c.name + " is claimed by " + *c.playerId,
                c.id));
        }
        c.playerId = playerId;
        c.playerName = playerName;

        CharacterClaimPayload payload;
        payload.characterId = c.id;
        payload.characterName = c.name;
        payload.playerId = c.playerId;
        payload.playerName = c.playerName;
        payload.isClaimed = true;
        return GameResult<ChangeEvent>::ok(
            makeEvent(EventKind::CharacterClaimed, std::move(payload)));
    });
}

GameResult<MutationOutcome> CombatCoordinator::releaseCharacter(CampaignId campaignId,
                                                                const std::string& characterRef) {
    return transact(campaignId, "release_character", Commit::Persist,
                    [&](CampaignAggregate& aggregate) -> GameResult<ChangeEvent> {
        auto index = resolveCharacter(aggregate, characterRef);
        if (!index) {
            return GameResult<ChangeEvent>::err(index.error());
        }
        Character& c = aggregate.roster[index.value()];
        if (!c.playerId) {
            return GameResult<ChangeEvent>::err(
                GameError(ErrorCode::CharacterNotClaimed, c.name + " is not claimed", c.id));
        }

        CharacterClaimPayload payload;
        payload.characterId = c.id;
        payload.characterName = c.name;
        payload.playerId = std::move(c.playerId);
        payload.playerName = std::move(c.playerName);
        payload.isClaimed = false;
        c.playerId.reset();
        c.playerName.reset();
        return GameResult<ChangeEvent>::ok(
            makeEvent(EventKind::CharacterReleased, std::move(payload)));
    });
}

GameResult<MutationOutcome> CombatCoordinator::playerPresence(CampaignId campaignId,
                                                              const std::string& playerId,
                                                              const std::string& playerName,
                                                              bool online) {
    return transact(campaignId, online ? "player_connected" : "player_disconnected",
                    Commit::RouteOnly,
                    [&](CampaignAggregate& aggregate) -> GameResult<ChangeEvent> {
        if (playerId.empty()) {
            return fail<ChangeEvent>(ErrorCode::InvalidArgument, "player id must not be empty");
        }
        PlayerConnectionPayload payload;
        payload.playerId = playerId;
        payload.playerName = playerName;
        payload.isOnline = online;
        for (const auto& c : aggregate.roster) {
            if (c.playerId == playerId) {
                payload.characterId = c.id;
                payload.characterName = c.name;
                break;
            }
        }
        return GameResult<ChangeEvent>::ok(makeEvent(
            online ? EventKind::PlayerConnected : EventKind::PlayerDisconnected,
            std::move(payload)));
    });
}

GameResult<MutationOutcome> CombatCoordinator::publishCue(CampaignId campaignId, EventKind kind,
                                                          EventPayload payload) {
    if (!isNarrativeCue(kind)) {
        return fail<MutationOutcome>(
            ErrorCode::InvalidArgument,
            std::string(eventName(kind)) + " is not a narrative cue");
    }
    if (!cuePayloadMatches(kind, payload)) {
        return fail<MutationOutcome>(
            ErrorCode::InvalidArgument,
            "payload does not match event " + std::string(eventName(kind)));
    }
    return transact(campaignId, eventName(kind), Commit::RouteOnly,
                    [&](CampaignAggregate&) -> GameResult<ChangeEvent> {
        return GameResult<ChangeEvent>::ok(makeEvent(kind, std::move(payload)));
    });
}

// ── Queries ─────────────────────────────────────────────────────────────

GameResult<std::optional<CombatStatePayload>> CombatCoordinator::combatState(
    CampaignId campaignId) {
    std::lock_guard guard(campaignLock(campaignId));
    auto loaded = store_.load(campaignId);
    if (!loaded) {
        return GameResult<std::optional<CombatStatePayload>>::err(loaded.error());
    }
    std::optional<CombatStatePayload> state;
    if (loaded.value().combat) {
        state = buildCombatState(loaded.value());
    }
    return GameResult<std::optional<CombatStatePayload>>::ok(std::move(state));
}

GameResult<Character> CombatCoordinator::character(CampaignId campaignId,
                                                   const std::string& characterRef) {
    std::lock_guard guard(campaignLock(campaignId));
    auto loaded = store_.load(campaignId);
    if (!loaded) {
        return GameResult<Character>::err(loaded.error());
    }
    auto index = resolveCharacter(loaded.value(), characterRef);
    if (!index) {
        return GameResult<Character>::err(index.error());
    }
    return GameResult<Character>::ok(loaded.value().roster[index.value()]);
}

CombatStatePayload CombatCoordinator::buildCombatState(const CampaignAggregate& aggregate) {
    CombatStatePayload state;
    if (!aggregate.combat) {
        return state;
    }

    const auto& encounter = *aggregate.combat;
    state.combatId = encounter.id;
    state.isActive = encounter.isActive;
    state.roundNumber = encounter.roundNumber;
    state.currentTurnIndex = encounter.currentTurnIndex;
    if (const auto* current = encounter.current()) {
        state.currentCombatantId = current->characterId;
    }

    auto makeView = [&](const CharacterId& id, CharacterType type, int32_t initiative) {
        CombatantView view;
        view.id = id;
        view.type = type;
        view.initiative = initiative;
        view.isSurprised = encounter.isSurprised(id);
        if (const auto* c = aggregate.findCharacter(id)) {
            view.name = c->name;
            view.currentHp = c->currentHp;
            view.maxHp = c->maxHp;
            view.status = Vitality::combatStatus(*c);
        } else {
            view.name = id;
        }
        return view;
    };

    state.turnOrder.reserve(encounter.turnOrder.size());
    for (const auto& slot : encounter.turnOrder) {
        state.turnOrder.push_back(makeView(slot.characterId, slot.type, slot.initiative));
    }
    for (const auto& id : encounter.defeatedIds) {
        const auto* c = aggregate.findCharacter(id);
        auto view = makeView(id, c != nullptr ? c->type : CharacterType::Enemy,
                             c != nullptr ? c->initiative : 0);
        view.status = CombatStatus::Defeated;
        state.defeated.push_back(std::move(view));
    }
    return state;
}

}  // namespace tts::service
