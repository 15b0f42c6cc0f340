/// @file service_runner.cpp
/// @brief Implementation of session entry-point utilities.

#include "tts/service/service_runner.hpp"

#include <cctype>
#include <cstdlib>

#include "tts/service/campaign_codec.hpp"

namespace tts::service {

using tts::foundation::CampaignId;
using tts::foundation::ConfigManager;
using tts::foundation::ErrorCode;
using tts::foundation::GameError;
using tts::foundation::GameLogger;
using tts::foundation::GameResult;
using tts::foundation::kLogCategoryCount;
using tts::foundation::LogCategory;

namespace {

constexpr std::string_view kLoggingPrefix = "logging";

std::string loggingKey(LogCategory cat) {
    std::string name(foundation::logCategoryName(cat));
    for (auto& ch : name) {
        ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
    }
    return std::string(kLoggingPrefix) + "." + name;
}

/// Read one logging.<category> key and apply it; missing keys are ignored.
void applyLevel(const ConfigManager& config, GameLogger& logger, LogCategory cat,
                const std::string& key) {
    auto text = config.get<std::string>(key);
    if (!text) {
        return;
    }
    auto level = foundation::parseLogLevel(text.value());
    if (!level) {
        TTS_LOG_WARN(LogCategory::Config,
                     "Ignoring unknown log level '" + text.value() + "' for " + key);
        return;
    }
    logger.setCategoryLevel(cat, *level);
}

}  // namespace

// -- Config loading ----------------------------------------------------------

GameResult<void> loadConfig(ConfigManager& config, const std::filesystem::path& defaultPath) {
    std::filesystem::path configPath = defaultPath;

    const char* envPath = std::getenv("TTS_CONFIG_PATH");
    if (envPath != nullptr && *envPath != '\0') {
        configPath = envPath;
    }

    return config.load(configPath);
}

// -- CLI argument parsing ----------------------------------------------------

std::filesystem::path parseConfigArg(int argc, char* argv[]) {
    for (int i = 1; i < argc - 1; ++i) {
        if (std::string_view(argv[i]) == "--config") {  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
            return argv[i + 1];  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
        }
    }
    return {};
}

// -- Settings ----------------------------------------------------------------

GameResult<SessionSettings> buildSessionSettings(const ConfigManager& config) {
    SessionSettings settings;

    auto campaignId = config.get<uint64_t>("session.campaign_id");
    if (campaignId) {
        if (campaignId.value() == 0) {
            return GameResult<SessionSettings>::err(GameError(
                ErrorCode::ConfigTypeMismatch, "session.campaign_id must be non-zero"));
        }
        settings.campaignId = CampaignId(campaignId.value());
    }

    settings.campaignName = config.getOr<std::string>("session.campaign_name",
                                                      settings.campaignName);

    auto backend = config.getOr<std::string>("store.backend", "memory");
    if (backend == "memory") {
        settings.backend = StoreBackend::Memory;
    } else if (backend == "file") {
        settings.backend = StoreBackend::File;
    } else {
        return GameResult<SessionSettings>::err(GameError(
            ErrorCode::ConfigTypeMismatch, "store.backend must be 'memory' or 'file', got '" +
                                               backend + "'"));
    }

    auto directory = config.get<std::string>("store.directory");
    if (directory) {
        settings.storeDirectory = directory.value();
    }
    return GameResult<SessionSettings>::ok(std::move(settings));
}

// -- Logging -----------------------------------------------------------------

void applyLogLevels(ConfigManager& config, GameLogger& logger) {
    for (const auto& key : config.keysWithPrefix(kLoggingPrefix)) {
        auto name = std::string_view(key).substr(kLoggingPrefix.size() + 1);
        if (!foundation::parseLogCategory(name)) {
            TTS_LOG_WARN(LogCategory::Config, "Ignoring unknown log category: " + key);
        }
    }

    for (std::size_t i = 0; i < kLogCategoryCount; ++i) {
        auto cat = static_cast<LogCategory>(i);
        auto key = loggingKey(cat);
        applyLevel(config, logger, cat, key);
        config.watch(key, [&config, &logger, cat, key](std::string_view) {
            applyLevel(config, logger, cat, key);
        });
    }
}

// -- Initial campaign --------------------------------------------------------

GameResult<CampaignAggregate> seedCampaign(const ConfigManager& config,
                                           const SessionSettings& settings) {
    CampaignAggregate aggregate;
    aggregate.id = settings.campaignId;
    aggregate.name = settings.campaignName;

    auto roster = config.get<YAML::Node>("session.roster");
    if (roster) {
        auto characters = decodeRoster(roster.value());
        if (!characters) {
            return GameResult<CampaignAggregate>::err(GameError(
                ErrorCode::ConfigTypeMismatch,
                "session.roster: " + std::string(characters.error().message())));
        }
        aggregate.roster = std::move(characters).value();
    }
    return GameResult<CampaignAggregate>::ok(std::move(aggregate));
}

}  // namespace tts::service
