/*
Streamweave — InMemoryStreamService
Role: Process-local StreamService used by the daemon's default wiring and by tests.
Inputs/Outputs: Same contract as StreamService; data lives only for the process lifetime.
Threading: Fully thread-safe using a std::shared_mutex for concurrent reads and exclusive writes.
Performance: O(log n) lookup by commonId; platform records are kept per stream in insertion order.
Integration: Handed to ObsStreamDetector and StreamMatcher by apps/streamweaved.
Observability: Logs writes under the "store" category at DEBUG.
Related: InMemoryStreamService.cpp, StreamService.hpp.
Assumptions: A commonId is never reused after deleteStream.
*/
#pragma once
#include <map>
#include <shared_mutex>
#include <vector>
#include "StreamService.hpp"
#include "Stream.hpp"
#include "util/Ids.hpp"

class InMemoryStreamService : public StreamService {
public:
    explicit InMemoryStreamService(NowFn now = TimeUtils::systemNow(), IdGenerator ids = generateUuid);

    void createStream(const std::string& commonId, TimePoint obsStartTime) override;
    std::shared_ptr<Stream> getStream(const std::string& commonId) override;
    std::shared_ptr<Stream> getOrCreateStream(const std::string& commonId, TimePoint obsStartTime) override;
    void updateStreamEnd(const std::string& commonId, TimePoint obsEndTime) override;
    void deleteStream(const std::string& commonId) override;

    PlatformStreamRecord createPlatformStream(const std::string& commonId, const PlatformStream& platformStream) override;
    std::vector<PlatformStreamRecord> getPlatformStreams(const std::string& commonId) override;
    void removePlatformFromStream(const std::string& commonId, Platform platform) override;

    std::shared_ptr<Stream> getStreamWithPlatforms(const std::string& commonId) override;

    [[nodiscard]] std::size_t streamCount() const;
    [[nodiscard]] std::vector<StreamData> allStreams() const;

private:
    struct Entry {
        StreamData                        data;
        std::vector<PlatformStreamRecord> records;
    };

    std::shared_ptr<Stream> makeHandle(const StreamData& data);

    NowFn                         m_now;
    IdGenerator                   m_ids;
    mutable std::shared_mutex     m_mutex;
    std::map<std::string, Entry>  m_streams;
};
