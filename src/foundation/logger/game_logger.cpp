/// @file game_logger.cpp
/// @brief GameLogger implementation on top of kcenon common_system.

#include "tts/foundation/game_logger.hpp"

// kcenon logger headers (hidden behind PIMPL)
#include <kcenon/common/interfaces/global_logger_registry.h>
#include <kcenon/common/interfaces/logger_interface.h>

#include <algorithm>
#include <array>
#include <atomic>
#include <cctype>
#include <sstream>
#include <string>

namespace tts::foundation {

namespace kc = kcenon::common::interfaces;

// ---------------------------------------------------------------------------
// Level mapping: TTS -> kcenon
// ---------------------------------------------------------------------------
static kc::log_level mapLevel(LogLevel level) {
    switch (level) {
        case LogLevel::Trace:    return kc::log_level::trace;
        case LogLevel::Debug:    return kc::log_level::debug;
        case LogLevel::Info:     return kc::log_level::info;
        case LogLevel::Warning:  return kc::log_level::warning;
        case LogLevel::Error:    return kc::log_level::error;
        case LogLevel::Critical: return kc::log_level::critical;
        case LogLevel::Off:      return kc::log_level::off;
    }
    return kc::log_level::info;
}

static constexpr std::array<LogLevel, kLogCategoryCount> kDefaultCategoryLevels = {
    LogLevel::Info,   // Core
    LogLevel::Debug,  // Vitality
    LogLevel::Debug,  // Combat
    LogLevel::Info,   // Session
    LogLevel::Info,   // Notification
    LogLevel::Info,   // Persistence
    LogLevel::Info,   // Config
    LogLevel::Info    // Tool
};

static std::string lowered(std::string_view text) {
    std::string out(text);
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char ch) {
        return static_cast<char>(std::tolower(ch));
    });
    return out;
}

// ---------------------------------------------------------------------------
// Name parsing
// ---------------------------------------------------------------------------
std::optional<LogLevel> parseLogLevel(std::string_view name) {
    auto key = lowered(name);
    if (key == "trace") return LogLevel::Trace;
    if (key == "debug") return LogLevel::Debug;
    if (key == "info") return LogLevel::Info;
    if (key == "warning" || key == "warn") return LogLevel::Warning;
    if (key == "error") return LogLevel::Error;
    if (key == "critical") return LogLevel::Critical;
    if (key == "off") return LogLevel::Off;
    return std::nullopt;
}

std::optional<LogCategory> parseLogCategory(std::string_view name) {
    auto key = lowered(name);
    for (std::size_t i = 0; i < kLogCategoryCount; ++i) {
        auto cat = static_cast<LogCategory>(i);
        if (lowered(logCategoryName(cat)) == key) {
            return cat;
        }
    }
    return std::nullopt;
}

// ---------------------------------------------------------------------------
// Context serialization
// ---------------------------------------------------------------------------
static std::string formatContext(const LogContext& ctx) {
    std::ostringstream oss;
    bool first = true;

    auto append = [&](std::string_view key, std::string_view val) {
        if (!first) {
            oss << ", ";
        }
        oss << key << '=' << val;
        first = false;
    };

    if (ctx.campaignId && ctx.campaignId->isValid()) {
        append("campaign_id", std::to_string(ctx.campaignId->value()));
    }
    if (ctx.characterId && !ctx.characterId->empty()) {
        append("character_id", *ctx.characterId);
    }
    if (ctx.tool && !ctx.tool->empty()) {
        append("tool", *ctx.tool);
    }
    for (const auto& [key, val] : ctx.extra) {
        append(key, val);
    }

    return oss.str();
}

// ---------------------------------------------------------------------------
// Impl
// ---------------------------------------------------------------------------
struct GameLogger::Impl {
    std::array<std::atomic<LogLevel>, kLogCategoryCount> categoryLevels;

    // Named loggers looked up in GlobalLoggerRegistry, one per category
    std::array<std::string, kLogCategoryCount> loggerNames;

    Impl() {
        for (std::size_t i = 0; i < kLogCategoryCount; ++i) {
            categoryLevels[i].store(kDefaultCategoryLevels[i],
                                    std::memory_order_relaxed);
            loggerNames[i] = std::string("tts.") +
                std::string(logCategoryName(static_cast<LogCategory>(i)));
        }
    }

    std::shared_ptr<kc::ILogger> getLogger(LogCategory cat) const {
        auto idx = static_cast<std::size_t>(cat);
        if (idx >= kLogCategoryCount) {
            return kc::GlobalLoggerRegistry::null_logger();
        }
        auto& registry = kc::GlobalLoggerRegistry::instance();
        auto logger = registry.get_logger(loggerNames[idx]);
        // A category without its own logger falls back to the default one
        if (logger == kc::GlobalLoggerRegistry::null_logger()) {
            return registry.get_default_logger();
        }
        return logger;
    }

    void emit(LogLevel level, LogCategory cat, std::string_view msg,
              std::string_view ctxStr) const {
        // Format: [Category] message {key=val, ...}
        std::string formatted;
        formatted.reserve(msg.size() + ctxStr.size() + 20);
        formatted += '[';
        formatted += logCategoryName(cat);
        formatted += "] ";
        formatted += msg;
        if (!ctxStr.empty()) {
            formatted += " {";
            formatted += ctxStr;
            formatted += '}';
        }
        // Logging is best effort; a sink error must not disturb the caller.
        (void)getLogger(cat)->log(mapLevel(level), formatted);
    }
};

GameLogger::GameLogger() : impl_(std::make_unique<Impl>()) {}

GameLogger::~GameLogger() = default;

GameLogger::GameLogger(GameLogger&&) noexcept = default;
GameLogger& GameLogger::operator=(GameLogger&&) noexcept = default;

void GameLogger::log(LogLevel level, LogCategory cat, std::string_view msg) {
    if (!isEnabled(level, cat)) {
        return;
    }
    impl_->emit(level, cat, msg, {});
}

void GameLogger::logWithContext(LogLevel level, LogCategory cat,
                                std::string_view msg, const LogContext& ctx) {
    if (!isEnabled(level, cat)) {
        return;
    }
    impl_->emit(level, cat, msg, formatContext(ctx));
}

void GameLogger::setCategoryLevel(LogCategory cat, LogLevel minLevel) {
    auto idx = static_cast<std::size_t>(cat);
    if (idx < kLogCategoryCount) {
        impl_->categoryLevels[idx].store(minLevel, std::memory_order_release);
    }
}

LogLevel GameLogger::getCategoryLevel(LogCategory cat) const {
    auto idx = static_cast<std::size_t>(cat);
    if (idx < kLogCategoryCount) {
        return impl_->categoryLevels[idx].load(std::memory_order_acquire);
    }
    return LogLevel::Off;
}

bool GameLogger::isEnabled(LogLevel level, LogCategory cat) const {
    auto idx = static_cast<std::size_t>(cat);
    if (idx >= kLogCategoryCount || level == LogLevel::Off) {
        return false;
    }
    auto minLevel = impl_->categoryLevels[idx].load(std::memory_order_acquire);
    return static_cast<uint8_t>(level) >= static_cast<uint8_t>(minLevel);
}

GameResult<void> GameLogger::flush() {
    auto& registry = kc::GlobalLoggerRegistry::instance();
    auto logger = registry.get_default_logger();
    auto result = logger->flush();
    if (result.is_err()) {
        return GameResult<void>::err(
            GameError(ErrorCode::LoggerFlushFailed, "failed to flush logger"));
    }
    return GameResult<void>::ok();
}

GameLogger& GameLogger::instance() {
    static GameLogger inst;
    return inst;
}

} // namespace tts::foundation
