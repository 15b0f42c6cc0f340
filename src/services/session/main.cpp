/// @file main.cpp
/// @brief Session service entry point.
///
/// Reads one tool invocation per line from stdin:
///
///   <tool> <arguments as a JSON object>
///
/// and prints the tool response to stdout. Every routed message is also
/// printed, prefixed with its audience group, standing in for the
/// real-time transport. Blank lines and lines starting with '#' are skipped.

#include <cstdlib>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>

#include "tts/foundation/config_manager.hpp"
#include "tts/foundation/game_logger.hpp"
#include "tts/service/campaign_codec.hpp"
#include "tts/service/campaign_store.hpp"
#include "tts/service/combat_coordinator.hpp"
#include "tts/service/notification_router.hpp"
#include "tts/service/service_runner.hpp"
#include "tts/service/tool_gateway.hpp"
#include "tts/version.hpp"

namespace {

/// Prints each published event as "[campaign_<id>_<audience>] <event>".
class ConsoleSink : public tts::service::INotificationSink {
public:
    tts::foundation::GameResult<void> publish(tts::foundation::CampaignId campaignId,
                                              tts::service::Audience audience,
                                              std::string_view /*eventName*/,
                                              const tts::service::ChangeEvent& event) override {
        std::lock_guard lock(mutex_);
        std::cout << "[" << tts::service::audienceGroup(campaignId, audience) << "] "
                  << tts::service::encodeEvent(event) << "\n";
        if (!std::cout) {
            return tts::foundation::GameResult<void>::err(tts::foundation::GameError(
                tts::foundation::ErrorCode::PublishFailed, "stdout is not writable"));
        }
        return tts::foundation::GameResult<void>::ok();
    }

private:
    std::mutex mutex_;
};

std::unique_ptr<tts::service::ICampaignStore> openStore(
    const tts::service::SessionSettings& settings) {
    if (settings.backend == tts::service::StoreBackend::File) {
        auto store = std::make_unique<tts::service::FileCampaignStore>(
            tts::service::FileCampaignStoreConfig{settings.storeDirectory});
        auto opened = store->open();
        if (!opened) {
            std::cerr << "Failed to open campaign store: " << opened.error().describe() << "\n";
            return nullptr;
        }
        return store;
    }
    return std::make_unique<tts::service::InMemoryCampaignStore>();
}

} // namespace

int main(int argc, char* argv[]) {
    auto configPath = tts::service::parseConfigArg(argc, argv);
    if (configPath.empty()) {
        configPath = "config/tts_session.yaml";
    }

    tts::foundation::ConfigManager config;
    auto loadResult = tts::service::loadConfig(config, configPath);
    if (!loadResult) {
        std::cerr << "Failed to load config: " << loadResult.error().describe() << "\n";
        return EXIT_FAILURE;
    }

    auto& logger = tts::foundation::GameLogger::instance();
    tts::service::applyLogLevels(config, logger);

    auto settings = tts::service::buildSessionSettings(config);
    if (!settings) {
        std::cerr << "Invalid session settings: " << settings.error().describe() << "\n";
        return EXIT_FAILURE;
    }
    const auto campaignId = settings.value().campaignId;

    auto store = openStore(settings.value());
    if (!store) {
        return EXIT_FAILURE;
    }

    // Seed the campaign unless the store already holds it.
    auto existing = store->load(campaignId);
    if (!existing) {
        if (existing.error().code() != tts::foundation::ErrorCode::CampaignNotFound) {
            std::cerr << "Failed to load campaign: " << existing.error().describe() << "\n";
            return EXIT_FAILURE;
        }
        auto seeded = tts::service::seedCampaign(config, settings.value());
        if (!seeded) {
            std::cerr << "Invalid session roster: " << seeded.error().describe() << "\n";
            return EXIT_FAILURE;
        }
        auto saved = store->save(seeded.value());
        if (!saved) {
            std::cerr << "Failed to create campaign: " << saved.error().describe() << "\n";
            return EXIT_FAILURE;
        }
    }

    ConsoleSink sink;
    tts::service::NotificationRouter router(sink);
    tts::service::CombatCoordinator coordinator(*store, router);
    tts::service::ToolGateway gateway(coordinator);

    TTS_LOG_INFO(tts::foundation::LogCategory::Core,
                 std::string("tts_session ") + tts::Version::string +
                     " ready for campaign " + std::to_string(campaignId.value()));

    std::string line;
    while (std::getline(std::cin, line)) {
        auto start = line.find_first_not_of(" \t\r");
        if (start == std::string::npos || line[start] == '#') {
            continue;
        }
        auto end = line.find_first_of(" \t", start);
        auto tool = line.substr(start, end == std::string::npos ? std::string::npos : end - start);
        auto arguments = end == std::string::npos ? std::string() : line.substr(end + 1);

        auto result = gateway.execute(campaignId, tool, arguments);
        std::cout << result.toResponse() << std::endl;
    }

    auto flushed = logger.flush();
    if (!flushed) {
        std::cerr << "Failed to flush logs: " << flushed.error().describe() << "\n";
    }
    return EXIT_SUCCESS;
}
