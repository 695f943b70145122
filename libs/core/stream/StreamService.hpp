/*
Streamweave — StreamService
Role: Persistence boundary for canonical Streams and their per-platform records.
Inputs/Outputs: commonIds, timestamps and PlatformStream snapshots in; Stream handles and records out.
Threading: Implementations must tolerate concurrent calls; writes to the same commonId are serialized by the implementation.
Integration: Written by ObsStreamDetector (session lifecycle) and StreamMatcher (session composition).
Related: Stream.hpp, PlatformStreamRecord.hpp, InMemoryStreamService.hpp.
Assumptions: Every call may block on I/O and may throw; callers do not retry.
*/
#pragma once
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>
#include "PlatformStreamRecord.hpp"

class Stream;

class PersistenceError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class StreamService {
public:
    virtual ~StreamService() = default;

    virtual void createStream(const std::string& commonId, TimePoint obsStartTime) = 0;
    /// nullptr when no Stream has that commonId.
    virtual std::shared_ptr<Stream> getStream(const std::string& commonId) = 0;
    virtual std::shared_ptr<Stream> getOrCreateStream(const std::string& commonId, TimePoint obsStartTime) = 0;
    virtual void updateStreamEnd(const std::string& commonId, TimePoint obsEndTime) = 0;
    virtual void deleteStream(const std::string& commonId) = 0;

    virtual PlatformStreamRecord createPlatformStream(const std::string& commonId, const PlatformStream& platformStream) = 0;
    virtual std::vector<PlatformStreamRecord> getPlatformStreams(const std::string& commonId) = 0;
    virtual void removePlatformFromStream(const std::string& commonId, Platform platform) = 0;

    /// Stream with its platform cache already populated. Throws if absent.
    virtual std::shared_ptr<Stream> getStreamWithPlatforms(const std::string& commonId) = 0;
};
