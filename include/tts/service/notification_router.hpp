#pragma once

/// @file notification_router.hpp
/// @brief Audience routing for change events.
///
/// Routing table:
/// | Event                                          | Audience |
/// |------------------------------------------------|----------|
/// | Combat started/updated/turn/round/ended        | all      |
/// | Character state updated                        | all      |
/// | Player roll logged / scene image updated       | all      |
/// | Player choice submitted                        | dm       |
/// | Read-aloud text                                | dm       |
/// | Character claimed/released                     | dm       |
/// | Player connected/disconnected                  | dm       |
/// | Player choices presented                       | players  |
/// | Atmosphere pulse / narrative anchor / insight  | players  |
///
/// Exactly one message is published per audience group. A failed publish
/// is logged and reported in the RoutedMessage; it never undoes the
/// mutation that produced the event.

#include <cstdint>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "tts/foundation/game_result.hpp"
#include "tts/foundation/types.hpp"
#include "tts/service/change_event.hpp"

namespace tts::service {

enum class Audience : uint8_t {
    Dm,       ///< The game master only.
    Players,  ///< Every player, but not the DM.
    All       ///< DM and every player.
};

constexpr std::string_view audienceName(Audience audience) {
    switch (audience) {
        case Audience::Dm:      return "dm";
        case Audience::Players: return "players";
        case Audience::All:     return "all";
    }
    return "all";
}

/// Transport group name, e.g. "campaign_7_players".
std::string audienceGroup(foundation::CampaignId campaignId, Audience audience);

/// Transport boundary. Implementations push the event to every connection
/// subscribed to the audience group (at-least-once).
///
/// publish() runs while the campaign lock is held; an implementation must
/// not call back into CombatCoordinator for the same campaign.
class INotificationSink {
public:
    virtual ~INotificationSink() = default;

    virtual foundation::GameResult<void> publish(foundation::CampaignId campaignId,
                                                 Audience audience,
                                                 std::string_view eventName,
                                                 const ChangeEvent& event) = 0;
};

/// Outcome of publishing one event to one group.
struct RoutedMessage {
    Audience audience = Audience::All;
    std::string eventName;
    uint64_t sequence = 0;
    bool delivered = false;
};

class NotificationRouter {
public:
    explicit NotificationRouter(INotificationSink& sink) : sink_(sink) {}

    NotificationRouter(const NotificationRouter&) = delete;
    NotificationRouter& operator=(const NotificationRouter&) = delete;

    /// Audience groups interested in an event kind (never empty, no repeats).
    [[nodiscard]] static std::vector<Audience> audiencesFor(EventKind kind);

    /// Stamp the next per-campaign sequence number on @p event and publish
    /// it once to each interested group.
    std::vector<RoutedMessage> dispatch(ChangeEvent& event);

    /// Last sequence number issued for a campaign (0 if none).
    [[nodiscard]] uint64_t lastSequence(foundation::CampaignId campaignId) const;

private:
    INotificationSink& sink_;
    mutable std::mutex mutex_;
    std::unordered_map<foundation::CampaignId, uint64_t> sequences_;
};

}  // namespace tts::service
