#pragma once

/// @file version.hpp
/// @brief Session engine version, logged by tts_session at startup.

#define TTS_VERSION_MAJOR 0
#define TTS_VERSION_MINOR 3
#define TTS_VERSION_PATCH 0
#define TTS_VERSION_STRING "0.3.0"

namespace tts {

struct Version {
    static constexpr int major = TTS_VERSION_MAJOR;
    static constexpr int minor = TTS_VERSION_MINOR;
    static constexpr int patch = TTS_VERSION_PATCH;
    static constexpr const char* string = TTS_VERSION_STRING;
};

}  // namespace tts
