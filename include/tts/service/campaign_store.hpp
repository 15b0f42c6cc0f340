#pragma once

/// @file campaign_store.hpp
/// @brief Persistence boundary for campaign aggregates.
///
/// The coordinator always saves the whole aggregate and treats any save
/// failure as "nothing committed". Implementations must therefore never
/// leave a half-written aggregate visible to a later load().

#include <filesystem>
#include <memory>
#include <mutex>
#include <unordered_map>

#include "tts/foundation/game_result.hpp"
#include "tts/foundation/types.hpp"
#include "tts/service/campaign_types.hpp"

namespace tts::service {

/// Abstract campaign repository.
class ICampaignStore {
public:
    virtual ~ICampaignStore() = default;

    /// @return CampaignNotFound when no aggregate exists for @p id.
    [[nodiscard]] virtual foundation::GameResult<CampaignAggregate> load(
        foundation::CampaignId id) const = 0;

    /// Replace the stored aggregate with @p aggregate.
    [[nodiscard]] virtual foundation::GameResult<void> save(
        const CampaignAggregate& aggregate) = 0;
};

/// Process-local store; the default backend and the test double.
class InMemoryCampaignStore : public ICampaignStore {
public:
    [[nodiscard]] foundation::GameResult<CampaignAggregate> load(
        foundation::CampaignId id) const override;

    [[nodiscard]] foundation::GameResult<void> save(const CampaignAggregate& aggregate) override;

    [[nodiscard]] bool contains(foundation::CampaignId id) const;

private:
    mutable std::mutex mutex_;
    std::unordered_map<foundation::CampaignId, CampaignAggregate> campaigns_;
};

/// Configuration for FileCampaignStore.
struct FileCampaignStoreConfig {
    std::filesystem::path directory = "campaigns";
};

/// One YAML document per campaign ("campaign_<id>.yaml").
///
/// Writes go to a temporary file that is renamed over the previous
/// document, so a failed write leaves the old version intact.
class FileCampaignStore : public ICampaignStore {
public:
    explicit FileCampaignStore(FileCampaignStoreConfig config);

    /// Create the storage directory.
    foundation::GameResult<void> open();

    [[nodiscard]] foundation::GameResult<CampaignAggregate> load(
        foundation::CampaignId id) const override;

    [[nodiscard]] foundation::GameResult<void> save(const CampaignAggregate& aggregate) override;

    [[nodiscard]] std::filesystem::path pathFor(foundation::CampaignId id) const;

private:
    FileCampaignStoreConfig config_;
    mutable std::mutex mutex_;
};

}  // namespace tts::service
