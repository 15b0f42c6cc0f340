#pragma once

/// @file service_runner.hpp
/// @brief Entry-point utilities for the session executable: config
///        discovery, settings, log levels and the initial campaign.

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>

#include "tts/foundation/config_manager.hpp"
#include "tts/foundation/game_logger.hpp"
#include "tts/foundation/game_result.hpp"
#include "tts/foundation/types.hpp"
#include "tts/service/campaign_types.hpp"

namespace tts::service {

enum class StoreBackend : uint8_t { Memory, File };

/// Settings read from the "session" and "store" sections.
struct SessionSettings {
    foundation::CampaignId campaignId{1};
    std::string campaignName = "Session";
    StoreBackend backend = StoreBackend::Memory;
    std::filesystem::path storeDirectory = "campaigns";
};

/// Load configuration from @p defaultPath, or from $TTS_CONFIG_PATH when
/// that variable is set.
foundation::GameResult<void> loadConfig(foundation::ConfigManager& config,
                                        const std::filesystem::path& defaultPath);

/// Extract the value of "--config <path>" from the command line.
///
/// @return An empty path if --config is not present.
std::filesystem::path parseConfigArg(int argc, char* argv[]);

/// @return ConfigTypeMismatch for an unknown store.backend or a zero
///         session.campaign_id.
foundation::GameResult<SessionSettings> buildSessionSettings(
    const foundation::ConfigManager& config);

/// Apply every "logging.<category>: <level>" entry to @p logger and watch
/// each category key, so a later config.set() takes effect immediately.
///
/// Unknown categories and levels are logged and skipped.
void applyLogLevels(foundation::ConfigManager& config, foundation::GameLogger& logger);

/// Campaign used when the store has none yet: name from settings, roster
/// from the optional "session.roster" sequence.
foundation::GameResult<CampaignAggregate> seedCampaign(const foundation::ConfigManager& config,
                                                       const SessionSettings& settings);

}  // namespace tts::service
