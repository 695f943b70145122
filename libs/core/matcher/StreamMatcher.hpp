/*
Streamweave — StreamMatcher
Role: Groups independently reported platform streams into canonical Stream sessions by time overlap.
Inputs/Outputs: Per-platform PlatformStream lists and existing Streams in; Streams and attachments written through StreamService.
Threading: Synchronous apart from matchNewPlatformStreams, which creates unmatched sessions concurrently and joins them.
Performance: Greedy single pass, O(records x groups); not a globally optimal clustering.
Integration: Driven by the platform polling layer after each fetch; never talks to the OBS side.
Observability: Logs grouping decisions under the "matcher" category.
Related: StreamMatcher.cpp, Overlap.hpp, StreamService.hpp.
Assumptions: StreamService failures propagate; work already committed in a batch is not rolled back.
*/
#pragma once
#include <map>
#include <memory>
#include <string>
#include <vector>
#include "Overlap.hpp"
#include "stream/Stream.hpp"
#include "stream/StreamService.hpp"
#include "util/Ids.hpp"

inline constexpr double kDefaultOverlapThreshold = 0.85;

struct MatcherOptions {
    double      threshold{kDefaultOverlapThreshold};
    NowFn       now{TimeUtils::systemNow()};
    IdGenerator ids{generateUuid};
};

struct NewStreamMatchResult {
    std::map<std::string, std::vector<PlatformStream>> addedToExisting;  // keyed by commonId
    std::vector<std::shared_ptr<Stream>>               newStreams;
};

class StreamMatcher {
public:
    /// Throws std::invalid_argument unless 0 < threshold <= 1.
    explicit StreamMatcher(MatcherOptions options = {});

    [[nodiscard]] double threshold() const noexcept { return m_options.threshold; }

    /// Rebuild sessions from complete platform histories; one new Stream per group.
    std::vector<std::shared_ptr<Stream>> matchAllPlatformStreams(StreamService& service,
                                                                 const std::vector<PlatformStream>& twitchStreams,
                                                                 const std::vector<PlatformStream>& kickStreams,
                                                                 const std::vector<PlatformStream>& youtubeStreams);

    /// Attach freshly observed platform streams to existing sessions, or open new ones.
    NewStreamMatchResult matchNewPlatformStreams(StreamService& service,
                                                 const std::vector<std::shared_ptr<Stream>>& existingStreams,
                                                 const std::vector<PlatformStream>& newPlatformStreams);

    /// Detach the first misaligned platform record into its own Stream. One record per call.
    std::vector<std::shared_ptr<Stream>> splitStream(StreamService& service, const std::shared_ptr<Stream>& stream);

    [[nodiscard]] double calculateOverlapPercent(const DateRange& a, const DateRange& b) const {
        return ::calculateOverlapPercent(a, b);
    }

private:
    [[nodiscard]] bool meetsThreshold(const DateRange& a, const DateRange& b) const;

    MatcherOptions m_options;
};
