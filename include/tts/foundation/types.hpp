#pragma once

/// @file types.hpp
/// @brief Identifier types shared across the session core.

#include <compare>
#include <cstdint>
#include <functional>
#include <string>

namespace tts::foundation {

/// Identifier of one campaign aggregate (roster plus optional encounter).
///
/// Zero is reserved: a default-constructed CampaignId is invalid and is
/// never stored.
class CampaignId {
public:
    constexpr CampaignId() = default;
    constexpr explicit CampaignId(uint64_t value) : value_(value) {}

    [[nodiscard]] constexpr uint64_t value() const noexcept { return value_; }
    [[nodiscard]] constexpr bool isValid() const noexcept { return value_ != 0; }

    constexpr auto operator<=>(const CampaignId&) const = default;

private:
    uint64_t value_ = 0;
};

/// Characters are keyed by the opaque string id issued by roster management.
using CharacterId = std::string;

}  // namespace tts::foundation

template <>
struct std::hash<tts::foundation::CampaignId> {
    std::size_t operator()(const tts::foundation::CampaignId& id) const noexcept {
        return std::hash<uint64_t>{}(id.value());
    }
};
