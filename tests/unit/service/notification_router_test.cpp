#include <gtest/gtest.h>

#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "tts/service/notification_router.hpp"

using namespace tts::service;
using tts::foundation::CampaignId;
using tts::foundation::ErrorCode;
using tts::foundation::GameError;
using tts::foundation::GameResult;

namespace {

struct Published {
    CampaignId campaignId;
    Audience audience;
    std::string eventName;
    uint64_t sequence;
};

class CapturingSink : public INotificationSink {
public:
    GameResult<void> publish(CampaignId campaignId, Audience audience,
                             std::string_view eventName, const ChangeEvent& event) override {
        std::lock_guard lock(mutex_);
        published.push_back({campaignId, audience, std::string(eventName), event.sequence});
        if (rejectAudience && *rejectAudience == audience) {
            return GameResult<void>::err(GameError(ErrorCode::PublishFailed, "group gone"));
        }
        return GameResult<void>::ok();
    }

    std::mutex mutex_;
    std::vector<Published> published;
    std::optional<Audience> rejectAudience;
};

ChangeEvent event(EventKind kind, CampaignId campaignId) {
    ChangeEvent e;
    e.kind = kind;
    e.campaignId = campaignId;
    return e;
}

}  // namespace

TEST(NotificationRouterTest, GroupNames) {
    EXPECT_EQ(audienceGroup(CampaignId(7), Audience::Dm), "campaign_7_dm");
    EXPECT_EQ(audienceGroup(CampaignId(7), Audience::Players), "campaign_7_players");
    EXPECT_EQ(audienceGroup(CampaignId(42), Audience::All), "campaign_42_all");
}

TEST(NotificationRouterTest, RoutingTable) {
    using V = std::vector<Audience>;
    EXPECT_EQ(NotificationRouter::audiencesFor(EventKind::CombatStarted), V{Audience::All});
    EXPECT_EQ(NotificationRouter::audiencesFor(EventKind::CombatStateUpdated), V{Audience::All});
    EXPECT_EQ(NotificationRouter::audiencesFor(EventKind::TurnAdvanced), V{Audience::All});
    EXPECT_EQ(NotificationRouter::audiencesFor(EventKind::RoundAdvanced), V{Audience::All});
    EXPECT_EQ(NotificationRouter::audiencesFor(EventKind::CombatEnded), V{Audience::All});
    EXPECT_EQ(NotificationRouter::audiencesFor(EventKind::CharacterStateUpdated),
              V{Audience::All});
    EXPECT_EQ(NotificationRouter::audiencesFor(EventKind::PlayerChoiceSubmitted),
              V{Audience::Dm});
    EXPECT_EQ(NotificationRouter::audiencesFor(EventKind::PlayerChoicesPresented),
              V{Audience::Players});
    EXPECT_EQ(NotificationRouter::audiencesFor(EventKind::AtmospherePulse),
              V{Audience::Players});
    EXPECT_EQ(NotificationRouter::audiencesFor(EventKind::NarrativeAnchor),
              V{Audience::Players});
    EXPECT_EQ(NotificationRouter::audiencesFor(EventKind::GroupInsight), V{Audience::Players});
}

TEST(NotificationRouterTest, TableEventsRouting) {
    using V = std::vector<Audience>;
    EXPECT_EQ(NotificationRouter::audiencesFor(EventKind::PlayerRollLogged), V{Audience::All});
    EXPECT_EQ(NotificationRouter::audiencesFor(EventKind::SceneImageUpdated), V{Audience::All});
    EXPECT_EQ(NotificationRouter::audiencesFor(EventKind::ReadAloudText), V{Audience::Dm});
    EXPECT_EQ(NotificationRouter::audiencesFor(EventKind::CharacterClaimed), V{Audience::Dm});
    EXPECT_EQ(NotificationRouter::audiencesFor(EventKind::CharacterReleased), V{Audience::Dm});
    EXPECT_EQ(NotificationRouter::audiencesFor(EventKind::PlayerConnected), V{Audience::Dm});
    EXPECT_EQ(NotificationRouter::audiencesFor(EventKind::PlayerDisconnected), V{Audience::Dm});
}

TEST(NotificationRouterTest, EventNames) {
    EXPECT_EQ(eventName(EventKind::AtmospherePulse), "AtmospherePulseReceived");
    EXPECT_EQ(eventName(EventKind::NarrativeAnchor), "NarrativeAnchorUpdated");
    EXPECT_EQ(eventName(EventKind::GroupInsight), "GroupInsightTriggered");
    EXPECT_EQ(eventName(EventKind::CharacterStateUpdated), "CharacterStateUpdated");
    EXPECT_EQ(eventName(EventKind::PlayerRollLogged), "PlayerRollLogged");
    EXPECT_EQ(eventName(EventKind::ReadAloudText), "ReadAloudTextReceived");
    EXPECT_EQ(eventName(EventKind::SceneImageUpdated), "SceneImageUpdated");
    EXPECT_EQ(eventName(EventKind::CharacterClaimed), "CharacterClaimed");
    EXPECT_EQ(eventName(EventKind::PlayerDisconnected), "PlayerDisconnected");
    EXPECT_TRUE(isStateChange(EventKind::TurnAdvanced));
    EXPECT_FALSE(isStateChange(EventKind::PlayerChoiceSubmitted));
    EXPECT_FALSE(isStateChange(EventKind::CharacterClaimed));
}

TEST(NotificationRouterTest, DispatchPublishesOncePerGroup) {
    CapturingSink sink;
    NotificationRouter router(sink);

    auto e = event(EventKind::CombatStarted, CampaignId(3));
    auto routed = router.dispatch(e);

    ASSERT_EQ(routed.size(), 1u);
    EXPECT_EQ(routed[0].audience, Audience::All);
    EXPECT_EQ(routed[0].eventName, "CombatStarted");
    EXPECT_TRUE(routed[0].delivered);

    ASSERT_EQ(sink.published.size(), 1u);
    EXPECT_EQ(sink.published[0].campaignId, CampaignId(3));
    EXPECT_EQ(sink.published[0].eventName, "CombatStarted");
}

TEST(NotificationRouterTest, SequencesArePerCampaign) {
    CapturingSink sink;
    NotificationRouter router(sink);

    auto a1 = event(EventKind::TurnAdvanced, CampaignId(1));
    auto a2 = event(EventKind::TurnAdvanced, CampaignId(1));
    auto b1 = event(EventKind::TurnAdvanced, CampaignId(2));
    router.dispatch(a1);
    router.dispatch(b1);
    router.dispatch(a2);

    EXPECT_EQ(a1.sequence, 1u);
    EXPECT_EQ(a2.sequence, 2u);
    EXPECT_EQ(b1.sequence, 1u);
    EXPECT_EQ(router.lastSequence(CampaignId(1)), 2u);
    EXPECT_EQ(router.lastSequence(CampaignId(2)), 1u);
    EXPECT_EQ(router.lastSequence(CampaignId(9)), 0u);
}

TEST(NotificationRouterTest, FailedPublishIsReportedNotThrown) {
    CapturingSink sink;
    sink.rejectAudience = Audience::Dm;
    NotificationRouter router(sink);

    auto e = event(EventKind::PlayerChoiceSubmitted, CampaignId(5));
    auto routed = router.dispatch(e);
    ASSERT_EQ(routed.size(), 1u);
    EXPECT_FALSE(routed[0].delivered);
    EXPECT_EQ(routed[0].sequence, 1u);

    // A failed publish still consumes its sequence number.
    auto next = event(EventKind::CombatEnded, CampaignId(5));
    auto second = router.dispatch(next);
    ASSERT_EQ(second.size(), 1u);
    EXPECT_TRUE(second[0].delivered);
    EXPECT_EQ(second[0].sequence, 2u);
}
