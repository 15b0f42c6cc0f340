/// @file campaign_store.cpp
/// @brief In-memory and YAML file campaign stores.

#include "tts/service/campaign_store.hpp"

#include <fstream>
#include <sstream>
#include <system_error>

#include "tts/foundation/game_logger.hpp"
#include "tts/service/campaign_codec.hpp"

namespace tts::service {

using tts::foundation::CampaignId;
using tts::foundation::ErrorCode;
using tts::foundation::GameError;
using tts::foundation::GameResult;
using tts::foundation::LogCategory;

namespace {

GameError campaignNotFound(CampaignId id) {
    return GameError(ErrorCode::CampaignNotFound,
                     "campaign not found: " + std::to_string(id.value()), id);
}

}  // namespace

// -- InMemoryCampaignStore ---------------------------------------------------

GameResult<CampaignAggregate> InMemoryCampaignStore::load(CampaignId id) const {
    std::lock_guard lock(mutex_);
    auto it = campaigns_.find(id);
    if (it == campaigns_.end()) {
        return GameResult<CampaignAggregate>::err(campaignNotFound(id));
    }
    return GameResult<CampaignAggregate>::ok(it->second);
}

GameResult<void> InMemoryCampaignStore::save(const CampaignAggregate& aggregate) {
    if (!aggregate.id.isValid()) {
        return GameResult<void>::err(
            GameError(ErrorCode::PersistenceFailed, "campaign id must be non-zero"));
    }
    std::lock_guard lock(mutex_);
    campaigns_[aggregate.id] = aggregate;
    return GameResult<void>::ok();
}

bool InMemoryCampaignStore::contains(CampaignId id) const {
    std::lock_guard lock(mutex_);
    return campaigns_.count(id) > 0;
}

// -- FileCampaignStore -------------------------------------------------------

FileCampaignStore::FileCampaignStore(FileCampaignStoreConfig config)
    : config_(std::move(config)) {}

GameResult<void> FileCampaignStore::open() {
    std::error_code ec;
    std::filesystem::create_directories(config_.directory, ec);
    if (ec) {
        return GameResult<void>::err(GameError(
            ErrorCode::PersistenceFailed, "failed to create campaign directory: " + ec.message()));
    }
    TTS_LOG_INFO(LogCategory::Persistence,
                 "Campaign store opened at " + config_.directory.string());
    return GameResult<void>::ok();
}

std::filesystem::path FileCampaignStore::pathFor(CampaignId id) const {
    return config_.directory / ("campaign_" + std::to_string(id.value()) + ".yaml");
}

GameResult<CampaignAggregate> FileCampaignStore::load(CampaignId id) const {
    std::lock_guard lock(mutex_);

    auto path = pathFor(id);
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return GameResult<CampaignAggregate>::err(campaignNotFound(id));
    }

    std::ifstream file(path);
    if (!file) {
        return GameResult<CampaignAggregate>::err(GameError(
            ErrorCode::PersistenceFailed, "cannot open campaign file: " + path.string()));
    }
    std::ostringstream buffer;
    buffer << file.rdbuf();

    auto decoded = decodeCampaign(buffer.str());
    if (!decoded) {
        TTS_LOG_ERROR(LogCategory::Persistence,
                      "Corrupted campaign file " + path.string() + ": " +
                          std::string(decoded.error().message()));
        return decoded;
    }
    if (decoded.value().id != id) {
        return GameResult<CampaignAggregate>::err(GameError(
            ErrorCode::AggregateCorrupted,
            "campaign file " + path.string() + " holds a different campaign id"));
    }
    return decoded;
}

GameResult<void> FileCampaignStore::save(const CampaignAggregate& aggregate) {
    std::lock_guard lock(mutex_);

    auto path = pathFor(aggregate.id);
    auto tmpPath = path;
    tmpPath += ".tmp";

    {
        std::ofstream file(tmpPath, std::ios::trunc);
        if (!file) {
            return GameResult<void>::err(GameError(
                ErrorCode::PersistenceFailed, "cannot open campaign file for writing: " +
                                                  tmpPath.string()));
        }
        file << encodeCampaign(aggregate);
        file.flush();
        if (!file) {
            return GameResult<void>::err(
                GameError(ErrorCode::PersistenceFailed, "failed to write campaign data"));
        }
    }

    std::error_code ec;
    std::filesystem::rename(tmpPath, path, ec);
    if (ec) {
        std::filesystem::remove(tmpPath, ec);
        return GameResult<void>::err(GameError(
            ErrorCode::PersistenceFailed, "failed to replace campaign file: " + path.string()));
    }
    return GameResult<void>::ok();
}

}  // namespace tts::service
