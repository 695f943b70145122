/*
Streamweave — PlatformConverters
Role: Translate raw platform REST payloads (Twitch Helix, Kick public API, YouTube Data API) into PlatformStream snapshots.
Inputs/Outputs: Raw nlohmann::json in; TwitchStream / KickStream / YouTubeStream out.
Threading: Stateless free functions.
Integration: Used by platform pollers ahead of StreamMatcher; createStreamAdapterFromRaw() composes them with the adapters.
Assumptions: A missing start timestamp means the broadcast was first observed now.
*/
#pragma once
#include <stdexcept>
#include <string>
#include <nlohmann/json.hpp>
#include "PlatformStream.hpp"

class ConversionError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// Expects the Helix /streams envelope: {"data": [{...}]}.
[[nodiscard]] TwitchStream convertTwitchStream(const nlohmann::json& raw);
/// Expects a single Kick livestream object.
[[nodiscard]] KickStream convertKickStream(const nlohmann::json& raw);
/// Expects the videos.list envelope: {"items": [{...}]}.
[[nodiscard]] YouTubeStream convertYouTubeStream(const nlohmann::json& raw);

[[nodiscard]] PlatformStream convertPlatformStream(const nlohmann::json& raw, Platform platform);
