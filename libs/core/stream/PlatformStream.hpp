/*
Streamweave — PlatformStream
Role: Normalized per-platform snapshot of one broadcast as reported by Twitch, Kick or YouTube.
Inputs/Outputs: Produced by the platform converters; stored inside PlatformStreamRecord; serialized as tagged JSON.
Threading: Plain value types; no synchronization.
Integration: Consumed by StreamAdapter, StreamMatcher and StreamService implementations.
Related: PlatformStream.cpp, PlatformConverters.hpp, StreamAdapter.hpp.
Assumptions: startTime is always known; endTime is empty while the platform still reports the broadcast as live.
*/
#pragma once
#include <optional>
#include <string>
#include <variant>
#include <vector>
#include <nlohmann/json.hpp>
#include "Platform.hpp"
#include "util/TimeUtils.hpp"

struct TwitchStream {
    std::string                twitchId;
    std::string                username;
    std::string                title;
    std::string                categoryId;
    std::vector<std::string>   tags;
    bool                       isMature{false};
    std::string                language;
    std::optional<std::string> thumbnailUrl;
    int64_t                    channelPoints{0};
    TimePoint                  startTime{};
    std::optional<TimePoint>   endTime;

    bool operator==(const TwitchStream&) const = default;
};

struct KickStream {
    std::string                kickId;
    std::string                username;
    std::string                title;
    std::string                categorySlug;
    std::vector<std::string>   tags;
    std::string                language;
    std::optional<std::string> thumbnailUrl;
    double                     totalTipsUsd{0.0};
    TimePoint                  startTime{};
    std::optional<TimePoint>   endTime;

    bool operator==(const KickStream&) const = default;
};

struct YouTubeStream {
    std::string                videoId;
    std::string                channelTitle;
    std::string                title;
    std::string                categoryId;
    std::vector<std::string>   tags;
    std::string                privacyStatus;
    std::optional<std::string> thumbnailUrl;
    int64_t                    subscriberCount{0};
    double                     superChatTotal{0.0};
    TimePoint                  startTime{};
    std::optional<TimePoint>   endTime;

    bool operator==(const YouTubeStream&) const = default;
};

using PlatformStream = std::variant<TwitchStream, KickStream, YouTubeStream>;

[[nodiscard]] Platform                 platformOf(const PlatformStream& stream);
[[nodiscard]] TimePoint                startTimeOf(const PlatformStream& stream);
[[nodiscard]] std::optional<TimePoint> endTimeOf(const PlatformStream& stream);

void to_json(nlohmann::json& j, const TwitchStream& s);
void from_json(const nlohmann::json& j, TwitchStream& s);
void to_json(nlohmann::json& j, const KickStream& s);
void from_json(const nlohmann::json& j, KickStream& s);
void to_json(nlohmann::json& j, const YouTubeStream& s);
void from_json(const nlohmann::json& j, YouTubeStream& s);

// Storage form: the alternative's object tagged with "platform".
[[nodiscard]] nlohmann::json platformStreamToJson(const PlatformStream& stream);
/// Throws std::invalid_argument on a missing/unknown "platform" tag.
[[nodiscard]] PlatformStream platformStreamFromJson(const nlohmann::json& j);
