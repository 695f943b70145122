/*
Streamweave — StreamAdapter
Role: Uniform read-only view over a platform snapshot (title, category, features) regardless of platform.
Inputs/Outputs: Wraps one PlatformStream alternative; toStorage() hands back the exact snapshot it wraps.
Threading: Immutable after construction; safe to share across threads.
Integration: Built by Stream::getPlatforms() and by createStreamAdapterFromRaw().
Related: StreamAdapter.cpp, PlatformStream.hpp, PlatformConverters.hpp.
*/
#pragma once
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "PlatformStream.hpp"

inline constexpr const char* kNoCategory = "No Category";

class StreamAdapter {
public:
    virtual ~StreamAdapter() = default;

    virtual Platform platform() const = 0;
    virtual std::string id() const = 0;
    virtual std::string title() const = 0;
    /// Category id as reported, or kNoCategory when the platform sent none.
    virtual std::string category() const = 0;
    virtual std::optional<std::string> thumbnail() const = 0;
    virtual std::vector<std::string> tags() const = 0;
    virtual bool hasFeature(const std::string& feature) const = 0;
    virtual std::optional<nlohmann::json> getFeature(const std::string& feature) const = 0;
    virtual PlatformStream toStorage() const = 0;
};

class TwitchStreamAdapter : public StreamAdapter {
public:
    explicit TwitchStreamAdapter(TwitchStream data) : m_data(std::move(data)) {}

    Platform platform() const override { return Platform::Twitch; }
    std::string id() const override { return m_data.twitchId; }
    std::string title() const override { return m_data.title; }
    std::string category() const override;
    std::optional<std::string> thumbnail() const override { return m_data.thumbnailUrl; }
    std::vector<std::string> tags() const override { return m_data.tags; }
    bool hasFeature(const std::string& feature) const override;
    std::optional<nlohmann::json> getFeature(const std::string& feature) const override;
    PlatformStream toStorage() const override { return m_data; }

private:
    TwitchStream m_data;
};

class KickStreamAdapter : public StreamAdapter {
public:
    explicit KickStreamAdapter(KickStream data) : m_data(std::move(data)) {}

    Platform platform() const override { return Platform::Kick; }
    std::string id() const override { return m_data.kickId; }
    std::string title() const override { return m_data.title; }
    std::string category() const override;
    std::optional<std::string> thumbnail() const override { return m_data.thumbnailUrl; }
    std::vector<std::string> tags() const override { return m_data.tags; }
    bool hasFeature(const std::string& feature) const override;
    std::optional<nlohmann::json> getFeature(const std::string& feature) const override;
    PlatformStream toStorage() const override { return m_data; }

private:
    KickStream m_data;
};

class YouTubeStreamAdapter : public StreamAdapter {
public:
    explicit YouTubeStreamAdapter(YouTubeStream data) : m_data(std::move(data)) {}

    Platform platform() const override { return Platform::YouTube; }
    std::string id() const override { return m_data.videoId; }
    std::string title() const override { return m_data.title; }
    std::string category() const override;
    std::optional<std::string> thumbnail() const override { return m_data.thumbnailUrl; }
    std::vector<std::string> tags() const override { return m_data.tags; }
    bool hasFeature(const std::string& feature) const override;
    std::optional<nlohmann::json> getFeature(const std::string& feature) const override;
    PlatformStream toStorage() const override { return m_data; }

private:
    YouTubeStream m_data;
};

[[nodiscard]] std::shared_ptr<StreamAdapter> createStreamAdapter(const PlatformStream& stream);
/// Convert a raw platform API payload and wrap it. Throws ConversionError.
[[nodiscard]] std::shared_ptr<StreamAdapter> createStreamAdapterFromRaw(const nlohmann::json& raw, Platform platform);
