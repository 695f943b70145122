/*
Streamweave — Stream
Role: Canonical session handle: one local recording interval plus the platform records attached to it.
Inputs/Outputs: Identity and OBS timestamps; platform adapters fetched lazily from the StreamService.
Threading: Not synchronized; a Stream handle belongs to whichever component is working with it.
Integration: Created by ObsStreamDetector and StreamService implementations; read by StreamMatcher.
Related: Stream.cpp, StreamService.hpp, StreamAdapter.hpp.
Assumptions: The StreamService outlives every Stream it hands out.
*/
#pragma once
#include <map>
#include <memory>
#include <optional>
#include <string>
#include "Platform.hpp"
#include "StreamAdapter.hpp"
#include "util/TimeUtils.hpp"

class StreamService;

struct StreamData {
    std::string              commonId;
    TimePoint                obsStartTime{};
    std::optional<TimePoint> obsEndTime;
    TimePoint                createdAt{};

    bool operator==(const StreamData&) const = default;
};

class Stream {
public:
    using PlatformMap = std::map<Platform, std::shared_ptr<StreamAdapter>>;

    Stream(std::string commonId, TimePoint obsStartTime, StreamService& service,
           TimePoint createdAt = Clock::now());

    [[nodiscard]] const std::string& getCommonId() const { return m_data.commonId; }
    [[nodiscard]] TimePoint getObsStartTime() const { return m_data.obsStartTime; }
    [[nodiscard]] std::optional<TimePoint> getObsEndTime() const { return m_data.obsEndTime; }
    void setObsEndTime(TimePoint endTime) { m_data.obsEndTime = endTime; }

    /// Platform adapters keyed by platform; loaded from the service on first use.
    const PlatformMap& getPlatforms();
    void invalidateCache() { m_cachedPlatforms.reset(); }

    [[nodiscard]] StreamData toStorage() const { return m_data; }

private:
    StreamData                 m_data;
    StreamService*             m_service;
    std::optional<PlatformMap> m_cachedPlatforms;
};
