#include "InMemoryStreamService.hpp"
#include "Log.hpp"
#include <algorithm>
#include <mutex>

InMemoryStreamService::InMemoryStreamService(NowFn now, IdGenerator ids)
    : m_now(std::move(now))
    , m_ids(std::move(ids))
{}

std::shared_ptr<Stream> InMemoryStreamService::makeHandle(const StreamData& data) {
    auto stream = std::make_shared<Stream>(data.commonId, data.obsStartTime, *this, data.createdAt);
    if (data.obsEndTime) stream->setObsEndTime(*data.obsEndTime);
    return stream;
}

void InMemoryStreamService::createStream(const std::string& commonId, TimePoint obsStartTime) {
    std::unique_lock lock(m_mutex);
    if (m_streams.count(commonId)) {
        throw PersistenceError("Stream already exists: " + commonId);
    }
    m_streams.emplace(commonId, Entry{StreamData{commonId, obsStartTime, std::nullopt, m_now()}, {}});
    LOG_D("store", "created stream {} starting {}", commonId, TimeUtils::formatIso8601(obsStartTime));
}

std::shared_ptr<Stream> InMemoryStreamService::getStream(const std::string& commonId) {
    StreamData data;
    {
        std::shared_lock lock(m_mutex);
        auto it = m_streams.find(commonId);
        if (it == m_streams.end()) return nullptr;
        data = it->second.data;
    }
    return makeHandle(data);
}

std::shared_ptr<Stream> InMemoryStreamService::getOrCreateStream(const std::string& commonId, TimePoint obsStartTime) {
    StreamData data;
    {
        std::unique_lock lock(m_mutex);
        auto it = m_streams.find(commonId);
        if (it == m_streams.end()) {
            it = m_streams.emplace(commonId, Entry{StreamData{commonId, obsStartTime, std::nullopt, m_now()}, {}}).first;
            LOG_D("store", "created stream {} on lookup", commonId);
        }
        data = it->second.data;
    }
    return makeHandle(data);
}

void InMemoryStreamService::updateStreamEnd(const std::string& commonId, TimePoint obsEndTime) {
    std::unique_lock lock(m_mutex);
    auto it = m_streams.find(commonId);
    if (it == m_streams.end()) {
        throw PersistenceError("Stream not found: " + commonId);
    }
    it->second.data.obsEndTime = obsEndTime;
    LOG_D("store", "stream {} ends {}", commonId, TimeUtils::formatIso8601(obsEndTime));
}

void InMemoryStreamService::deleteStream(const std::string& commonId) {
    std::unique_lock lock(m_mutex);
    if (m_streams.erase(commonId) == 0) {
        throw PersistenceError("Stream not found: " + commonId);
    }
    LOG_D("store", "deleted stream {}", commonId);
}

PlatformStreamRecord InMemoryStreamService::createPlatformStream(const std::string& commonId,
                                                                 const PlatformStream& platformStream) {
    std::unique_lock lock(m_mutex);
    auto it = m_streams.find(commonId);
    if (it == m_streams.end()) {
        throw PersistenceError("Stream not found: " + commonId);
    }
    const Platform platform = platformOf(platformStream);
    auto& records = it->second.records;
    const bool duplicate = std::any_of(records.begin(), records.end(),
                                       [platform](const PlatformStreamRecord& r) { return r.platform == platform; });
    if (duplicate) {
        throw PersistenceError(std::string("Stream ") + commonId + " already has a " + toString(platform) + " record");
    }

    PlatformStreamRecord record;
    record.id        = m_ids();
    record.commonId  = commonId;
    record.platform  = platform;
    record.data      = platformStream;
    record.createdAt = m_now();
    records.push_back(record);
    LOG_D("store", "attached {} record {} to stream {}", toString(platform), record.id, commonId);
    return record;
}

std::vector<PlatformStreamRecord> InMemoryStreamService::getPlatformStreams(const std::string& commonId) {
    std::shared_lock lock(m_mutex);
    auto it = m_streams.find(commonId);
    if (it == m_streams.end()) return {};
    return it->second.records;
}

void InMemoryStreamService::removePlatformFromStream(const std::string& commonId, Platform platform) {
    std::unique_lock lock(m_mutex);
    auto it = m_streams.find(commonId);
    if (it == m_streams.end()) {
        throw PersistenceError("Stream not found: " + commonId);
    }
    auto& records = it->second.records;
    records.erase(std::remove_if(records.begin(), records.end(),
                                 [platform](const PlatformStreamRecord& r) { return r.platform == platform; }),
                  records.end());
    LOG_D("store", "detached {} from stream {}", toString(platform), commonId);
}

std::shared_ptr<Stream> InMemoryStreamService::getStreamWithPlatforms(const std::string& commonId) {
    auto stream = getStream(commonId);
    if (!stream) {
        throw PersistenceError("Stream not found: " + commonId);
    }
    stream->getPlatforms();
    return stream;
}

std::size_t InMemoryStreamService::streamCount() const {
    std::shared_lock lock(m_mutex);
    return m_streams.size();
}

std::vector<StreamData> InMemoryStreamService::allStreams() const {
    std::shared_lock lock(m_mutex);
    std::vector<StreamData> out;
    out.reserve(m_streams.size());
    for (const auto& [id, entry] : m_streams) out.push_back(entry.data);
    return out;
}
