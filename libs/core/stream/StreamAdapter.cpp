#include "StreamAdapter.hpp"
#include "PlatformConverters.hpp"

std::string TwitchStreamAdapter::category() const {
    return m_data.categoryId.empty() ? kNoCategory : m_data.categoryId;
}

bool TwitchStreamAdapter::hasFeature(const std::string& feature) const {
    return feature == "twitchChannelPoints";
}

std::optional<nlohmann::json> TwitchStreamAdapter::getFeature(const std::string& feature) const {
    if (feature == "twitchChannelPoints") {
        return nlohmann::json{{"current", m_data.channelPoints}};
    }
    return std::nullopt;
}

std::string KickStreamAdapter::category() const {
    return m_data.categorySlug.empty() ? kNoCategory : m_data.categorySlug;
}

bool KickStreamAdapter::hasFeature(const std::string& feature) const {
    return feature == "kickTips";
}

std::optional<nlohmann::json> KickStreamAdapter::getFeature(const std::string& feature) const {
    if (feature == "kickTips") {
        return nlohmann::json{{"value", m_data.totalTipsUsd}, {"currency", "USD"}};
    }
    return std::nullopt;
}

std::string YouTubeStreamAdapter::category() const {
    return m_data.categoryId.empty() ? kNoCategory : m_data.categoryId;
}

bool YouTubeStreamAdapter::hasFeature(const std::string& feature) const {
    return feature == "subscriberCount" || feature == "youtubeSuperChat";
}

std::optional<nlohmann::json> YouTubeStreamAdapter::getFeature(const std::string& feature) const {
    if (feature == "subscriberCount") {
        return nlohmann::json{{"total", m_data.subscriberCount}};
    }
    if (feature == "youtubeSuperChat") {
        return nlohmann::json{{"value", m_data.superChatTotal}, {"currency", "USD"}};
    }
    return std::nullopt;
}

std::shared_ptr<StreamAdapter> createStreamAdapter(const PlatformStream& stream) {
    return std::visit([](const auto& s) -> std::shared_ptr<StreamAdapter> {
        using T = std::decay_t<decltype(s)>;
        if constexpr (std::is_same_v<T, TwitchStream>) return std::make_shared<TwitchStreamAdapter>(s);
        else if constexpr (std::is_same_v<T, KickStream>) return std::make_shared<KickStreamAdapter>(s);
        else return std::make_shared<YouTubeStreamAdapter>(s);
    }, stream);
}

std::shared_ptr<StreamAdapter> createStreamAdapterFromRaw(const nlohmann::json& raw, Platform platform) {
    return createStreamAdapter(convertPlatformStream(raw, platform));
}
