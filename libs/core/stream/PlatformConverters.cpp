#include "PlatformConverters.hpp"

namespace {

std::string stringOr(const nlohmann::json& j, const char* key, const std::string& fallback = {}) {
    if (!j.is_object() || !j.contains(key) || !j.at(key).is_string()) return fallback;
    return j.at(key).get<std::string>();
}

std::optional<std::string> optionalString(const nlohmann::json& j, const char* key) {
    auto value = stringOr(j, key);
    if (value.empty()) return std::nullopt;
    return value;
}

std::vector<std::string> tagsOf(const nlohmann::json& j, const char* key) {
    std::vector<std::string> tags;
    if (!j.is_object() || !j.contains(key) || !j.at(key).is_array()) return tags;
    for (const auto& tag : j.at(key)) {
        if (tag.is_string()) tags.emplace_back(tag.get<std::string>());
    }
    return tags;
}

TimePoint startOr(const nlohmann::json& j, const char* key) {
    if (auto parsed = TimeUtils::parseIso8601(stringOr(j, key))) return *parsed;
    return Clock::now();
}

std::optional<TimePoint> optionalTime(const nlohmann::json& j, const char* key) {
    return TimeUtils::parseIso8601(stringOr(j, key));
}

void require(bool present, const char* platform, const char* what) {
    if (!present) {
        throw ConversionError(std::string("Invalid ") + platform + " stream API response: missing " + what);
    }
}

} // namespace

TwitchStream convertTwitchStream(const nlohmann::json& raw) {
    const bool hasData = raw.is_object() && raw.contains("data") && raw.at("data").is_array()
                         && !raw.at("data").empty();
    require(hasData, "Twitch", "data field");
    const auto& s = raw.at("data").at(0);

    require(!stringOr(s, "id").empty(), "Twitch", "stream id");
    require(!stringOr(s, "user_login").empty(), "Twitch", "user_login");
    require(!stringOr(s, "title").empty(), "Twitch", "title");
    require(!stringOr(s, "language").empty(), "Twitch", "language");

    TwitchStream out;
    out.twitchId      = stringOr(s, "id");
    out.username      = stringOr(s, "user_login");
    out.title         = stringOr(s, "title");
    out.categoryId    = stringOr(s, "game_id");
    out.tags          = tagsOf(s, "tags");
    out.isMature      = s.contains("is_mature") && s.at("is_mature").is_boolean() && s.at("is_mature").get<bool>();
    out.language      = stringOr(s, "language");
    out.thumbnailUrl  = optionalString(s, "thumbnail_url");
    out.channelPoints = 0;
    out.startTime     = startOr(s, "started_at");
    out.endTime       = std::nullopt;
    return out;
}

KickStream convertKickStream(const nlohmann::json& raw) {
    require(raw.is_object(), "Kick", "object body");
    require(!stringOr(raw, "id").empty(), "Kick", "stream id");

    std::string username = stringOr(raw, "username");
    if (username.empty() && raw.contains("user")) {
        username = stringOr(raw.at("user"), "username");
    }
    require(!username.empty(), "Kick", "username");
    require(!stringOr(raw, "title").empty(), "Kick", "title");

    KickStream out;
    out.kickId       = stringOr(raw, "id");
    out.username     = std::move(username);
    out.title        = stringOr(raw, "title");
    out.categorySlug = stringOr(raw, "category_id");
    out.tags         = tagsOf(raw, "tags");
    out.language     = stringOr(raw, "language", "en");
    out.thumbnailUrl = optionalString(raw, "thumbnail");
    out.totalTipsUsd = 0.0;
    out.startTime    = startOr(raw, "created_at");
    out.endTime      = std::nullopt;
    return out;
}

YouTubeStream convertYouTubeStream(const nlohmann::json& raw) {
    const bool hasItems = raw.is_object() && raw.contains("items") && raw.at("items").is_array()
                          && !raw.at("items").empty();
    require(hasItems, "YouTube", "items or empty array");
    const auto& item = raw.at("items").at(0);

    require(!stringOr(item, "id").empty(), "YouTube", "video id");
    const nlohmann::json snippet = item.value("snippet", nlohmann::json::object());
    require(!stringOr(snippet, "channelTitle").empty(), "YouTube", "channel title");
    require(!stringOr(snippet, "title").empty(), "YouTube", "title");

    const nlohmann::json status = item.value("status", nlohmann::json::object());
    const nlohmann::json live   = item.value("liveStreamingDetails", nlohmann::json::object());

    YouTubeStream out;
    out.videoId       = stringOr(item, "id");
    out.channelTitle  = stringOr(snippet, "channelTitle");
    out.title         = stringOr(snippet, "title");
    out.categoryId    = stringOr(snippet, "categoryId", "0");
    out.tags          = tagsOf(snippet, "tags");
    out.privacyStatus = stringOr(status, "privacyStatus", "public");
    if (snippet.contains("thumbnails") && snippet.at("thumbnails").contains("default")) {
        out.thumbnailUrl = optionalString(snippet.at("thumbnails").at("default"), "url");
    }
    out.subscriberCount = 0;
    out.superChatTotal  = 0.0;
    out.startTime = live.contains("actualStartTime") ? startOr(live, "actualStartTime")
                                                     : startOr(snippet, "publishedAt");
    out.endTime   = optionalTime(live, "actualEndTime");
    return out;
}

PlatformStream convertPlatformStream(const nlohmann::json& raw, Platform platform) {
    switch (platform) {
        case Platform::Twitch:  return convertTwitchStream(raw);
        case Platform::Kick:    return convertKickStream(raw);
        case Platform::YouTube: return convertYouTubeStream(raw);
    }
    throw ConversionError("Unsupported platform");
}
