#include "Stream.hpp"
#include "StreamService.hpp"

Stream::Stream(std::string commonId, TimePoint obsStartTime, StreamService& service, TimePoint createdAt)
    : m_data{std::move(commonId), obsStartTime, std::nullopt, createdAt}
    , m_service(&service)
{}

const Stream::PlatformMap& Stream::getPlatforms() {
    if (!m_cachedPlatforms) {
        PlatformMap map;
        for (const auto& record : m_service->getPlatformStreams(m_data.commonId)) {
            map[record.platform] = createStreamAdapter(record.data);
        }
        m_cachedPlatforms = std::move(map);
    }
    return *m_cachedPlatforms;
}
