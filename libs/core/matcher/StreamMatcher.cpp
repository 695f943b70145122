/*
Streamweave — StreamMatcher
Role: Overlap-based reconciliation of platform streams into canonical sessions.
Threading: matchNewPlatformStreams fans out one std::async task per unmatched record and joins them all.
Observability: Grouping decisions at DEBUG, session creation and splits at INFO.
*/
#include "StreamMatcher.hpp"
#include "Log.hpp"
#include <algorithm>
#include <exception>
#include <future>
#include <set>
#include <stdexcept>

namespace {

TimePoint endOr(const std::optional<TimePoint>& end, TimePoint now) {
    return end ? *end : now;
}

DateRange rangeOf(const PlatformStream& s, TimePoint now) {
    return DateRange{startTimeOf(s), endOr(endTimeOf(s), now)};
}

DateRange rangeOf(const Stream& s, TimePoint now) {
    return DateRange{s.getObsStartTime(), endOr(s.getObsEndTime(), now)};
}

struct Group {
    std::vector<PlatformStream> members;
    std::set<Platform>          platforms;
    TimePoint                   start{};
    TimePoint                   end{};      // open ends counted as now
};

std::shared_ptr<Stream> fetchCreated(StreamService& service, const std::string& commonId) {
    auto stream = service.getStream(commonId);
    if (!stream) {
        throw PersistenceError("Stream vanished after creation: " + commonId);
    }
    return stream;
}

} // namespace

StreamMatcher::StreamMatcher(MatcherOptions options)
    : m_options(std::move(options))
{
    if (!(m_options.threshold > 0.0 && m_options.threshold <= 1.0)) {
        throw std::invalid_argument("StreamMatcher: threshold must be in (0, 1]");
    }
    if (!m_options.now) m_options.now = TimeUtils::systemNow();
    if (!m_options.ids) m_options.ids = generateUuid;
}

bool StreamMatcher::meetsThreshold(const DateRange& a, const DateRange& b) const {
    return ::calculateOverlapPercent(a, b) >= m_options.threshold;
}

std::vector<std::shared_ptr<Stream>> StreamMatcher::matchAllPlatformStreams(StreamService& service,
                                                                            const std::vector<PlatformStream>& twitchStreams,
                                                                            const std::vector<PlatformStream>& kickStreams,
                                                                            const std::vector<PlatformStream>& youtubeStreams) {
    const TimePoint now = m_options.now();

    std::vector<PlatformStream> all;
    all.reserve(twitchStreams.size() + kickStreams.size() + youtubeStreams.size());
    all.insert(all.end(), twitchStreams.begin(), twitchStreams.end());
    all.insert(all.end(), kickStreams.begin(), kickStreams.end());
    all.insert(all.end(), youtubeStreams.begin(), youtubeStreams.end());

    std::stable_sort(all.begin(), all.end(), [](const PlatformStream& a, const PlatformStream& b) {
        return startTimeOf(a) < startTimeOf(b);
    });

    std::vector<Group> groups;
    for (auto& item : all) {
        const Platform platform = platformOf(item);
        const DateRange itemRange = rangeOf(item, now);

        auto target = std::find_if(groups.begin(), groups.end(), [&](const Group& g) {
            return g.platforms.count(platform) == 0
                && meetsThreshold(DateRange{g.start, g.end}, itemRange);
        });

        if (target == groups.end()) {
            Group g;
            g.start = itemRange.startTime;
            g.end   = itemRange.endTime;
            groups.push_back(std::move(g));
            target = std::prev(groups.end());
        } else {
            LOG_D("matcher", "{} stream joins group #{}", toString(platform), std::distance(groups.begin(), target));
        }
        target->start = std::min(target->start, itemRange.startTime);
        target->end   = std::max(target->end, itemRange.endTime);
        target->platforms.insert(platform);
        target->members.push_back(std::move(item));
    }

    std::vector<std::shared_ptr<Stream>> result;
    result.reserve(groups.size());

    for (const auto& group : groups) {
        TimePoint earliestStart = startTimeOf(group.members.front());
        std::optional<TimePoint> latestEnd;
        bool allEnded = true;
        for (const auto& member : group.members) {
            earliestStart = std::min(earliestStart, startTimeOf(member));
            if (auto end = endTimeOf(member)) {
                latestEnd = latestEnd ? std::max(*latestEnd, *end) : *end;
            } else {
                allEnded = false;
            }
        }

        const std::string commonId = m_options.ids();
        service.createStream(commonId, earliestStart);
        auto stream = fetchCreated(service, commonId);

        for (const auto& member : group.members) {
            service.createPlatformStream(commonId, member);
        }

        if (allEnded && latestEnd) {
            service.updateStreamEnd(commonId, *latestEnd);
            stream->setObsEndTime(*latestEnd);
        }
        stream->invalidateCache();

        LOG_I("matcher", "session {} built from {} platform stream(s)", commonId, group.members.size());
        result.push_back(std::move(stream));
    }

    return result;
}

NewStreamMatchResult StreamMatcher::matchNewPlatformStreams(StreamService& service,
                                                            const std::vector<std::shared_ptr<Stream>>& existingStreams,
                                                            const std::vector<PlatformStream>& newPlatformStreams) {
    const TimePoint now = m_options.now();
    NewStreamMatchResult result;

    // Platforms each existing session holds, including ones attached during this call
    std::map<std::string, std::set<Platform>> occupied;
    auto platformsOf = [&](const std::shared_ptr<Stream>& stream) -> std::set<Platform>& {
        auto it = occupied.find(stream->getCommonId());
        if (it == occupied.end()) {
            std::set<Platform> held;
            for (const auto& [platform, adapter] : stream->getPlatforms()) held.insert(platform);
            it = occupied.emplace(stream->getCommonId(), std::move(held)).first;
        }
        return it->second;
    };

    std::vector<std::pair<std::string, PlatformStream>> unmatched;

    for (const auto& candidate : newPlatformStreams) {
        const Platform platform = platformOf(candidate);
        const DateRange candidateRange = rangeOf(candidate, now);
        bool matched = false;

        for (const auto& existing : existingStreams) {
            if (!existing) continue;
            auto& held = platformsOf(existing);
            if (held.count(platform)) continue;
            if (!meetsThreshold(rangeOf(*existing, now), candidateRange)) continue;

            const std::string& commonId = existing->getCommonId();
            service.createPlatformStream(commonId, candidate);
            existing->invalidateCache();
            held.insert(platform);
            result.addedToExisting[commonId].push_back(candidate);
            LOG_I("matcher", "{} stream attached to live session {}", toString(platform), commonId);
            matched = true;
            break;
        }

        if (!matched) {
            unmatched.emplace_back(m_options.ids(), candidate);
        }
    }

    std::vector<std::future<std::shared_ptr<Stream>>> pending;
    pending.reserve(unmatched.size());
    for (const auto& [commonId, candidate] : unmatched) {
        pending.push_back(std::async(std::launch::async, [&service, id = commonId, record = candidate]() {
            service.createStream(id, startTimeOf(record));
            service.createPlatformStream(id, record);
            if (auto end = endTimeOf(record)) {
                service.updateStreamEnd(id, *end);
            }
            return fetchCreated(service, id);
        }));
    }

    std::exception_ptr firstError;
    for (auto& f : pending) {
        try {
            result.newStreams.push_back(f.get());
        } catch (...) {
            if (!firstError) firstError = std::current_exception();
        }
    }
    if (firstError) {
        std::rethrow_exception(firstError);
    }

    if (!result.newStreams.empty()) {
        LOG_I("matcher", "{} new session(s) detected", result.newStreams.size());
    }
    return result;
}

std::vector<std::shared_ptr<Stream>> StreamMatcher::splitStream(StreamService& service,
                                                                const std::shared_ptr<Stream>& stream) {
    const TimePoint now = m_options.now();
    const DateRange span = rangeOf(*stream, now);

    // Store order (attach order), not platform order, decides which record leaves first
    std::optional<Platform> splitPlatform;
    PlatformStream splitData;
    for (const auto& record : service.getPlatformStreams(stream->getCommonId())) {
        if (!meetsThreshold(span, rangeOf(record.data, now))) {
            splitPlatform = record.platform;
            splitData = record.data;
            break;
        }
    }

    if (!splitPlatform) {
        return {stream};
    }

    const std::string& oldId = stream->getCommonId();
    const std::string newId = m_options.ids();
    service.createStream(newId, startTimeOf(splitData));
    auto newStream = fetchCreated(service, newId);
    service.createPlatformStream(newId, splitData);
    if (auto end = endTimeOf(splitData)) {
        service.updateStreamEnd(newId, *end);
        newStream->setObsEndTime(*end);
    }

    service.removePlatformFromStream(oldId, *splitPlatform);
    stream->invalidateCache();
    LOG_I("matcher", "split {} out of session {} into {}", toString(*splitPlatform), oldId, newId);

    const auto remaining = service.getPlatformStreams(oldId);
    if (remaining.empty()) {
        service.deleteStream(oldId);
        LOG_I("matcher", "session {} had no platforms left and was deleted", oldId);
        return {newStream};
    }

    std::optional<TimePoint> latestEnd;
    for (const auto& record : remaining) {
        if (auto end = endTimeOf(record.data)) {
            latestEnd = latestEnd ? std::max(*latestEnd, *end) : *end;
        }
    }
    if (latestEnd) {
        service.updateStreamEnd(oldId, *latestEnd);
        stream->setObsEndTime(*latestEnd);
    }

    return {stream, newStream};
}
