/// @file notification_router.cpp
/// @brief NotificationRouter implementation.

#include "tts/service/notification_router.hpp"

#include "tts/foundation/game_logger.hpp"

namespace tts::service {

using tts::foundation::CampaignId;
using tts::foundation::GameLogger;
using tts::foundation::LogCategory;
using tts::foundation::LogContext;
using tts::foundation::LogLevel;

std::string audienceGroup(CampaignId campaignId, Audience audience) {
    return "campaign_" + std::to_string(campaignId.value()) + "_" +
           std::string(audienceName(audience));
}

std::vector<Audience> NotificationRouter::audiencesFor(EventKind kind) {
    switch (kind) {
        case EventKind::PlayerChoiceSubmitted:
        case EventKind::ReadAloudText:
        case EventKind::CharacterClaimed:
        case EventKind::CharacterReleased:
        case EventKind::PlayerConnected:
        case EventKind::PlayerDisconnected:
            return {Audience::Dm};
        case EventKind::PlayerChoicesPresented:
        case EventKind::AtmospherePulse:
        case EventKind::NarrativeAnchor:
        case EventKind::GroupInsight:
            return {Audience::Players};
        case EventKind::CombatStarted:
        case EventKind::CombatStateUpdated:
        case EventKind::TurnAdvanced:
        case EventKind::RoundAdvanced:
        case EventKind::CombatEnded:
        case EventKind::CharacterStateUpdated:
        case EventKind::PlayerRollLogged:
        case EventKind::SceneImageUpdated:
            return {Audience::All};
    }
    return {Audience::All};
}

std::vector<RoutedMessage> NotificationRouter::dispatch(ChangeEvent& event) {
    {
        std::lock_guard lock(mutex_);
        event.sequence = ++sequences_[event.campaignId];
    }

    const auto name = eventName(event.kind);
    std::vector<RoutedMessage> routed;
    for (auto audience : audiencesFor(event.kind)) {
        RoutedMessage message;
        message.audience = audience;
        message.eventName = std::string(name);
        message.sequence = event.sequence;

        auto published = sink_.publish(event.campaignId, audience, name, event);
        message.delivered = published.hasValue();
        if (!published) {
            LogContext ctx;
            ctx.campaignId = event.campaignId;
            ctx.extra["event"] = message.eventName;
            ctx.extra["group"] = audienceGroup(event.campaignId, audience);
            GameLogger::instance().logWithContext(
                LogLevel::Warning, LogCategory::Notification,
                "Publish failed: " + std::string(published.error().message()), ctx);
        }
        routed.push_back(std::move(message));
    }
    return routed;
}

uint64_t NotificationRouter::lastSequence(CampaignId campaignId) const {
    std::lock_guard lock(mutex_);
    auto it = sequences_.find(campaignId);
    return it == sequences_.end() ? 0 : it->second;
}

}  // namespace tts::service
