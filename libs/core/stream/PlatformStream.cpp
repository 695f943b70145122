#include "PlatformStream.hpp"
#include <stdexcept>

namespace {

std::string timeToJson(TimePoint tp) {
    return TimeUtils::formatIso8601(tp);
}

TimePoint timeFromJson(const nlohmann::json& j, const char* key) {
    const auto parsed = TimeUtils::parseIso8601(j.at(key).get<std::string>());
    if (!parsed) {
        throw std::invalid_argument(std::string("PlatformStream: invalid timestamp in '") + key + "'");
    }
    return *parsed;
}

void putOptionalTime(nlohmann::json& j, const char* key, const std::optional<TimePoint>& tp) {
    j[key] = tp ? nlohmann::json(timeToJson(*tp)) : nlohmann::json(nullptr);
}

std::optional<TimePoint> optionalTimeFromJson(const nlohmann::json& j, const char* key) {
    if (!j.contains(key) || j.at(key).is_null()) return std::nullopt;
    return timeFromJson(j, key);
}

void putOptionalString(nlohmann::json& j, const char* key, const std::optional<std::string>& value) {
    j[key] = value ? nlohmann::json(*value) : nlohmann::json(nullptr);
}

std::optional<std::string> optionalStringFromJson(const nlohmann::json& j, const char* key) {
    if (!j.contains(key) || j.at(key).is_null()) return std::nullopt;
    return j.at(key).get<std::string>();
}

} // namespace

Platform platformOf(const PlatformStream& stream) {
    return std::visit([](const auto& s) -> Platform {
        using T = std::decay_t<decltype(s)>;
        if constexpr (std::is_same_v<T, TwitchStream>) return Platform::Twitch;
        else if constexpr (std::is_same_v<T, KickStream>) return Platform::Kick;
        else return Platform::YouTube;
    }, stream);
}

TimePoint startTimeOf(const PlatformStream& stream) {
    return std::visit([](const auto& s) { return s.startTime; }, stream);
}

std::optional<TimePoint> endTimeOf(const PlatformStream& stream) {
    return std::visit([](const auto& s) { return s.endTime; }, stream);
}

void to_json(nlohmann::json& j, const TwitchStream& s) {
    j = nlohmann::json{
        {"platform", "twitch"},
        {"twitchId", s.twitchId},
        {"username", s.username},
        {"title", s.title},
        {"categoryId", s.categoryId},
        {"tags", s.tags},
        {"isMature", s.isMature},
        {"language", s.language},
        {"channelPoints", s.channelPoints},
        {"startTime", timeToJson(s.startTime)},
    };
    putOptionalString(j, "thumbnailUrl", s.thumbnailUrl);
    putOptionalTime(j, "endTime", s.endTime);
}

void from_json(const nlohmann::json& j, TwitchStream& s) {
    s.twitchId      = j.at("twitchId").get<std::string>();
    s.username      = j.at("username").get<std::string>();
    s.title         = j.at("title").get<std::string>();
    s.categoryId    = j.value("categoryId", "");
    s.tags          = j.value("tags", std::vector<std::string>{});
    s.isMature      = j.value("isMature", false);
    s.language      = j.value("language", "");
    s.thumbnailUrl  = optionalStringFromJson(j, "thumbnailUrl");
    s.channelPoints = j.value("channelPoints", int64_t{0});
    s.startTime     = timeFromJson(j, "startTime");
    s.endTime       = optionalTimeFromJson(j, "endTime");
}

void to_json(nlohmann::json& j, const KickStream& s) {
    j = nlohmann::json{
        {"platform", "kick"},
        {"kickId", s.kickId},
        {"username", s.username},
        {"title", s.title},
        {"categorySlug", s.categorySlug},
        {"tags", s.tags},
        {"language", s.language},
        {"totalTipsUsd", s.totalTipsUsd},
        {"startTime", timeToJson(s.startTime)},
    };
    putOptionalString(j, "thumbnailUrl", s.thumbnailUrl);
    putOptionalTime(j, "endTime", s.endTime);
}

void from_json(const nlohmann::json& j, KickStream& s) {
    s.kickId       = j.at("kickId").get<std::string>();
    s.username     = j.at("username").get<std::string>();
    s.title        = j.at("title").get<std::string>();
    s.categorySlug = j.value("categorySlug", "");
    s.tags         = j.value("tags", std::vector<std::string>{});
    s.language     = j.value("language", "");
    s.thumbnailUrl = optionalStringFromJson(j, "thumbnailUrl");
    s.totalTipsUsd = j.value("totalTipsUsd", 0.0);
    s.startTime    = timeFromJson(j, "startTime");
    s.endTime      = optionalTimeFromJson(j, "endTime");
}

void to_json(nlohmann::json& j, const YouTubeStream& s) {
    j = nlohmann::json{
        {"platform", "youtube"},
        {"videoId", s.videoId},
        {"channelTitle", s.channelTitle},
        {"title", s.title},
        {"categoryId", s.categoryId},
        {"tags", s.tags},
        {"privacyStatus", s.privacyStatus},
        {"subscriberCount", s.subscriberCount},
        {"superChatTotal", s.superChatTotal},
        {"startTime", timeToJson(s.startTime)},
    };
    putOptionalString(j, "thumbnailUrl", s.thumbnailUrl);
    putOptionalTime(j, "endTime", s.endTime);
}

void from_json(const nlohmann::json& j, YouTubeStream& s) {
    s.videoId         = j.at("videoId").get<std::string>();
    s.channelTitle    = j.at("channelTitle").get<std::string>();
    s.title           = j.at("title").get<std::string>();
    s.categoryId      = j.value("categoryId", "");
    s.tags            = j.value("tags", std::vector<std::string>{});
    s.privacyStatus   = j.value("privacyStatus", "");
    s.thumbnailUrl    = optionalStringFromJson(j, "thumbnailUrl");
    s.subscriberCount = j.value("subscriberCount", int64_t{0});
    s.superChatTotal  = j.value("superChatTotal", 0.0);
    s.startTime       = timeFromJson(j, "startTime");
    s.endTime         = optionalTimeFromJson(j, "endTime");
}

nlohmann::json platformStreamToJson(const PlatformStream& stream) {
    return std::visit([](const auto& s) { return nlohmann::json(s); }, stream);
}

PlatformStream platformStreamFromJson(const nlohmann::json& j) {
    if (!j.is_object() || !j.contains("platform") || !j.at("platform").is_string()) {
        throw std::invalid_argument("PlatformStream: missing 'platform' tag");
    }
    switch (platformFromString(j.at("platform").get<std::string>())) {
        case Platform::Twitch:  return j.get<TwitchStream>();
        case Platform::Kick:    return j.get<KickStream>();
        case Platform::YouTube: return j.get<YouTubeStream>();
    }
    throw std::invalid_argument("PlatformStream: unsupported platform");
}
