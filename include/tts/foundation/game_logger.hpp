#pragma once

/// @file game_logger.hpp
/// @brief GameLogger wrapping kcenon common_system logging for the session core.
///
/// Category-based filtering, structured context, and per-category runtime
/// log level control. kcenon types stay behind a PIMPL.

#include <array>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

#include "tts/foundation/game_result.hpp"
#include "tts/foundation/types.hpp"

namespace tts::foundation {

/// Log severity levels.
///
/// Maps to kcenon::common::interfaces::log_level internally.
enum class LogLevel : uint8_t {
    Trace    = 0,
    Debug    = 1,
    Info     = 2,
    Warning  = 3,
    Error    = 4,
    Critical = 5,
    Off      = 6
};

/// Log categories, one per subsystem of the session core.
enum class LogCategory : uint8_t {
    Core         = 0, ///< Process lifecycle
    Vitality     = 1, ///< Hit points, conditions, death saves
    Combat       = 2, ///< Turn order and encounter lifecycle
    Session      = 3, ///< Mutation orchestration per campaign
    Notification = 4, ///< Audience routing and publishing
    Persistence  = 5, ///< Campaign store and codec
    Config       = 6, ///< Configuration loading
    Tool         = 7  ///< Tool invocation gateway
};

inline constexpr std::size_t kLogCategoryCount = 8;

constexpr std::string_view logCategoryName(LogCategory cat) {
    constexpr std::array<std::string_view, kLogCategoryCount> names = {
        "Core", "Vitality", "Combat", "Session",
        "Notification", "Persistence", "Config", "Tool"
    };
    auto idx = static_cast<std::size_t>(cat);
    return idx < kLogCategoryCount ? names[idx] : "Unknown";
}

constexpr std::string_view logLevelName(LogLevel level) {
    switch (level) {
        case LogLevel::Trace:    return "TRACE";
        case LogLevel::Debug:    return "DEBUG";
        case LogLevel::Info:     return "INFO";
        case LogLevel::Warning:  return "WARNING";
        case LogLevel::Error:    return "ERROR";
        case LogLevel::Critical: return "CRITICAL";
        case LogLevel::Off:      return "OFF";
    }
    return "UNKNOWN";
}

/// Parse a level name as written in configuration ("debug", "WARNING", ...).
std::optional<LogLevel> parseLogLevel(std::string_view name);

/// Parse a category name ("combat", "Notification", ...).
std::optional<LogCategory> parseLogCategory(std::string_view name);

/// Structured context attached to log entries.
///
/// Example:
/// @code
///   LogContext ctx;
///   ctx.campaignId = CampaignId(7);
///   ctx.characterId = "elara";
///   ctx.extra["hp"] = "0";
///   logger.logWithContext(LogLevel::Info, LogCategory::Vitality,
///                         "Character fell unconscious", ctx);
/// @endcode
struct LogContext {
    std::optional<CampaignId> campaignId;
    std::optional<CharacterId> characterId;
    std::optional<std::string> tool;
    std::unordered_map<std::string, std::string> extra;
};

/// Session-core logger wrapping kcenon's logging interfaces.
///
/// Default log levels per category:
/// | Category     | Default Level |
/// |--------------|---------------|
/// | Core         | Info          |
/// | Vitality     | Debug         |
/// | Combat       | Debug         |
/// | Session      | Info          |
/// | Notification | Info          |
/// | Persistence  | Info          |
/// | Config       | Info          |
/// | Tool         | Info          |
class GameLogger {
public:
    GameLogger();
    ~GameLogger();

    GameLogger(const GameLogger&) = delete;
    GameLogger& operator=(const GameLogger&) = delete;
    GameLogger(GameLogger&&) noexcept;
    GameLogger& operator=(GameLogger&&) noexcept;

    /// Log a message under the given category.
    /// No-op if the level is below the category's minimum level.
    void log(LogLevel level, LogCategory cat, std::string_view msg);

    /// Log a message with structured context appended as key=value pairs.
    void logWithContext(LogLevel level, LogCategory cat,
                        std::string_view msg, const LogContext& ctx);

    void setCategoryLevel(LogCategory cat, LogLevel minLevel);

    [[nodiscard]] LogLevel getCategoryLevel(LogCategory cat) const;

    [[nodiscard]] bool isEnabled(LogLevel level, LogCategory cat) const;

    GameResult<void> flush();

    static GameLogger& instance();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace tts::foundation

// ---------------------------------------------------------------------------
// Convenience macros (global, outside the namespace)
// ---------------------------------------------------------------------------

/// TTS_MIN_LOG_LEVEL may be defined before including this header to compile
/// out calls below the threshold.
/// Values: 0=Trace, 1=Debug, 2=Info, 3=Warning, 4=Error, 5=Critical, 6=Off

#ifndef TTS_MIN_LOG_LEVEL
    #define TTS_MIN_LOG_LEVEL 0
#endif

#define TTS_LOG(level, cat, msg)                                                 \
    do {                                                                         \
        _Pragma("GCC diagnostic push")                                           \
        _Pragma("GCC diagnostic ignored \"-Wtype-limits\"")                      \
        if (static_cast<int>(level) >= TTS_MIN_LOG_LEVEL &&                      \
            ::tts::foundation::GameLogger::instance().isEnabled((level), (cat)))  \
        {                                                                        \
            ::tts::foundation::GameLogger::instance().log((level), (cat), (msg)); \
        }                                                                        \
        _Pragma("GCC diagnostic pop")                                            \
    } while (0)

#define TTS_LOG_DEBUG(cat, msg) \
    TTS_LOG(::tts::foundation::LogLevel::Debug, (cat), (msg))

#define TTS_LOG_INFO(cat, msg) \
    TTS_LOG(::tts::foundation::LogLevel::Info, (cat), (msg))

#define TTS_LOG_WARN(cat, msg) \
    TTS_LOG(::tts::foundation::LogLevel::Warning, (cat), (msg))

#define TTS_LOG_ERROR(cat, msg) \
    TTS_LOG(::tts::foundation::LogLevel::Error, (cat), (msg))
