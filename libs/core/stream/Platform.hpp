#pragma once
#include <array>
#include <string>
#include <string_view>

enum class Platform { Twitch, Kick, YouTube };

inline constexpr std::array<Platform, 3> kAllPlatforms{Platform::Twitch, Platform::Kick, Platform::YouTube};

/// "twitch" / "kick" / "youtube"
[[nodiscard]] const char* toString(Platform platform);
/// Throws std::invalid_argument for anything outside the closed set.
[[nodiscard]] Platform platformFromString(std::string_view value);
[[nodiscard]] bool isValidPlatform(std::string_view value);
[[nodiscard]] const char* platformDisplayName(Platform platform);
