#include "Platform.hpp"
#include <stdexcept>

const char* toString(Platform platform) {
    switch (platform) {
        case Platform::Twitch:  return "twitch";
        case Platform::Kick:    return "kick";
        case Platform::YouTube: return "youtube";
    }
    return "unknown";
}

Platform platformFromString(std::string_view value) {
    if (value == "twitch")  return Platform::Twitch;
    if (value == "kick")    return Platform::Kick;
    if (value == "youtube") return Platform::YouTube;
    throw std::invalid_argument("Unsupported platform: " + std::string(value));
}

bool isValidPlatform(std::string_view value) {
    return value == "twitch" || value == "kick" || value == "youtube";
}

const char* platformDisplayName(Platform platform) {
    switch (platform) {
        case Platform::Twitch:  return "Twitch";
        case Platform::Kick:    return "Kick";
        case Platform::YouTube: return "YouTube";
    }
    return "Unknown";
}
