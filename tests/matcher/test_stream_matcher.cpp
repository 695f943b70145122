/*
Streamweave — StreamMatcher Tests
Role: Verify overlap-based grouping of platform streams into canonical sessions
Testing Strategy: InMemoryStreamService as the store; pinned clock and sequential session ids; hand-built platform snapshots
Coverage: Full rebuild grouping, one-record-per-platform, end-time rules, live attach, new-session fan-out, split paths, threshold validation
*/
#include <gtest/gtest.h>
#include <algorithm>
#include "matcher/StreamMatcher.hpp"
#include "stream/InMemoryStreamService.hpp"
#include "fixtures/platform_payloads.hpp"
#include "fixtures/test_clock.hpp"

using fixtures::at;
using fixtures::kickAt;
using fixtures::twitchAt;
using fixtures::youtubeAt;

namespace {

class StreamMatcherTest : public ::testing::Test {
protected:
    StreamMatcherTest()
        : clock(at("2025-03-02T00:00:00Z"))
        , service(clock.fn())
        , matcher(MatcherOptions{0.85, clock.fn(), fixtures::sequentialIds("session")})
    {}

    std::vector<Platform> platformsOf(const std::string& commonId) {
        std::vector<Platform> out;
        for (const auto& r : service.getPlatformStreams(commonId)) out.push_back(r.platform);
        std::sort(out.begin(), out.end());
        return out;
    }

    fixtures::ManualClock clock;
    InMemoryStreamService service;
    StreamMatcher matcher;
};

} // namespace

// =============================================================================
// Construction
// =============================================================================

TEST(StreamMatcherOptions, RejectsInvalidThreshold) {
    EXPECT_THROW(StreamMatcher(MatcherOptions{0.0}), std::invalid_argument);
    EXPECT_THROW(StreamMatcher(MatcherOptions{1.5}), std::invalid_argument);
    EXPECT_THROW(StreamMatcher(MatcherOptions{-0.1}), std::invalid_argument);
    EXPECT_NO_THROW(StreamMatcher(MatcherOptions{1.0}));
    EXPECT_DOUBLE_EQ(StreamMatcher().threshold(), kDefaultOverlapThreshold);
}

// =============================================================================
// matchAllPlatformStreams
// =============================================================================

TEST_F(StreamMatcherTest, DisjointStreamsBecomeSeparateSessions) {
    std::vector<PlatformStream> twitch{
        twitchAt(at("2025-03-01T10:00:00Z"), at("2025-03-01T11:00:00Z"), "a"),
        twitchAt(at("2025-03-01T13:00:00Z"), at("2025-03-01T14:00:00Z"), "b"),
    };
    std::vector<PlatformStream> kick{kickAt(at("2025-03-01T16:00:00Z"), at("2025-03-01T17:00:00Z"))};

    auto sessions = matcher.matchAllPlatformStreams(service, twitch, kick, {});
    ASSERT_EQ(sessions.size(), 3u);
    EXPECT_EQ(service.streamCount(), 3u);
    for (const auto& s : sessions) {
        EXPECT_EQ(service.getPlatformStreams(s->getCommonId()).size(), 1u);
    }
}

TEST_F(StreamMatcherTest, OverlappingPlatformsShareOneSession) {
    auto sessions = matcher.matchAllPlatformStreams(
        service,
        {twitchAt(at("2025-03-01T14:00:00Z"), at("2025-03-01T16:00:00Z"))},
        {kickAt(at("2025-03-01T14:02:00Z"), at("2025-03-01T15:58:00Z"))},
        {youtubeAt(at("2025-03-01T14:05:00Z"), at("2025-03-01T16:01:00Z"))});

    ASSERT_EQ(sessions.size(), 1u);
    const auto& session = sessions[0];
    EXPECT_EQ(session->getCommonId(), "session-1");
    EXPECT_EQ(session->getObsStartTime(), at("2025-03-01T14:00:00Z"));
    EXPECT_EQ(session->getObsEndTime(), at("2025-03-01T16:01:00Z"));
    EXPECT_EQ(platformsOf("session-1"), (std::vector<Platform>{Platform::Twitch, Platform::Kick, Platform::YouTube}));
    EXPECT_EQ(session->getPlatforms().size(), 3u);
}

TEST_F(StreamMatcherTest, SamePlatformNeverSharesSession) {
    // Two Twitch streams over the same window (e.g. a restart) stay apart
    auto sessions = matcher.matchAllPlatformStreams(
        service,
        {twitchAt(at("2025-03-01T14:00:00Z"), at("2025-03-01T16:00:00Z"), "a"),
         twitchAt(at("2025-03-01T14:01:00Z"), at("2025-03-01T16:00:00Z"), "b")},
        {}, {});
    ASSERT_EQ(sessions.size(), 2u);
    for (const auto& s : sessions) {
        EXPECT_EQ(platformsOf(s->getCommonId()), (std::vector<Platform>{Platform::Twitch}));
    }
}

TEST_F(StreamMatcherTest, OpenMemberLeavesSessionOpen) {
    auto sessions = matcher.matchAllPlatformStreams(
        service,
        {twitchAt(at("2025-03-01T23:00:00Z"), std::nullopt)},
        {kickAt(at("2025-03-01T23:01:00Z"), at("2025-03-01T23:59:00Z"))},
        {});
    ASSERT_EQ(sessions.size(), 1u);
    EXPECT_FALSE(sessions[0]->getObsEndTime().has_value());
    EXPECT_FALSE(service.getStream(sessions[0]->getCommonId())->getObsEndTime().has_value());
}

TEST_F(StreamMatcherTest, BelowThresholdSplitsGroups) {
    // 30 minutes shared out of a 2 hour stream: 25%
    auto sessions = matcher.matchAllPlatformStreams(
        service,
        {twitchAt(at("2025-03-01T14:00:00Z"), at("2025-03-01T16:00:00Z"))},
        {kickAt(at("2025-03-01T15:30:00Z"), at("2025-03-01T18:00:00Z"))},
        {});
    EXPECT_EQ(sessions.size(), 2u);
}

TEST_F(StreamMatcherTest, EmptyInputCreatesNothing) {
    EXPECT_TRUE(matcher.matchAllPlatformStreams(service, {}, {}, {}).empty());
    EXPECT_EQ(service.streamCount(), 0u);
}

// =============================================================================
// matchNewPlatformStreams
// =============================================================================

TEST_F(StreamMatcherTest, NewStreamAttachesToLiveSession) {
    clock.set(at("2025-03-01T16:00:00Z"));
    service.createStream("live-1", at("2025-03-01T14:00:00Z"));
    auto live = service.getStream("live-1");

    auto result = matcher.matchNewPlatformStreams(service, {live},
                                                  {youtubeAt(at("2025-03-01T14:03:00Z"), std::nullopt)});
    ASSERT_EQ(result.addedToExisting.count("live-1"), 1u);
    EXPECT_EQ(result.addedToExisting["live-1"].size(), 1u);
    EXPECT_TRUE(result.newStreams.empty());
    EXPECT_EQ(platformsOf("live-1"), (std::vector<Platform>{Platform::YouTube}));
    EXPECT_EQ(live->getPlatforms().size(), 1u);
}

TEST_F(StreamMatcherTest, OccupiedPlatformOpensNewSession) {
    clock.set(at("2025-03-01T16:00:00Z"));
    service.createStream("live-1", at("2025-03-01T14:00:00Z"));
    service.createPlatformStream("live-1", twitchAt(at("2025-03-01T14:00:00Z"), std::nullopt, "first"));
    auto live = service.getStream("live-1");

    auto result = matcher.matchNewPlatformStreams(service, {live},
                                                  {twitchAt(at("2025-03-01T14:02:00Z"), std::nullopt, "second")});
    EXPECT_TRUE(result.addedToExisting.empty());
    ASSERT_EQ(result.newStreams.size(), 1u);
    EXPECT_EQ(result.newStreams[0]->getCommonId(), "session-1");
    EXPECT_EQ(service.getPlatformStreams("live-1").size(), 1u);
}

TEST_F(StreamMatcherTest, SecondCandidateOfSamePlatformInOneCallIsNotAttached) {
    clock.set(at("2025-03-01T16:00:00Z"));
    service.createStream("live-1", at("2025-03-01T14:00:00Z"));
    auto live = service.getStream("live-1");

    auto result = matcher.matchNewPlatformStreams(service, {live},
        {kickAt(at("2025-03-01T14:00:00Z"), std::nullopt, "k1"), kickAt(at("2025-03-01T14:01:00Z"), std::nullopt, "k2")});
    EXPECT_EQ(result.addedToExisting["live-1"].size(), 1u);
    EXPECT_EQ(result.newStreams.size(), 1u);
}

TEST_F(StreamMatcherTest, UnmatchedStreamsEachGetSession) {
    clock.set(at("2025-03-01T20:00:00Z"));
    auto result = matcher.matchNewPlatformStreams(service, {},
        {twitchAt(at("2025-03-01T10:00:00Z"), at("2025-03-01T11:00:00Z")),
         kickAt(at("2025-03-01T18:00:00Z"), std::nullopt),
         youtubeAt(at("2025-03-01T19:00:00Z"), std::nullopt)});

    ASSERT_EQ(result.newStreams.size(), 3u);
    EXPECT_EQ(service.streamCount(), 3u);
    for (const auto& s : result.newStreams) {
        EXPECT_EQ(service.getPlatformStreams(s->getCommonId()).size(), 1u);
    }
    // The ended Twitch stream carries its end onto its session
    auto twitchSession = std::find_if(result.newStreams.begin(), result.newStreams.end(), [&](const auto& s) {
        return platformsOf(s->getCommonId()) == std::vector<Platform>{Platform::Twitch};
    });
    ASSERT_NE(twitchSession, result.newStreams.end());
    EXPECT_EQ((*twitchSession)->getObsEndTime(), at("2025-03-01T11:00:00Z"));
}

// =============================================================================
// splitStream
// =============================================================================

TEST_F(StreamMatcherTest, AlignedStreamIsNotSplit) {
    service.createStream("s-1", at("2025-03-01T14:00:00Z"));
    service.updateStreamEnd("s-1", at("2025-03-01T16:00:00Z"));
    service.createPlatformStream("s-1", twitchAt(at("2025-03-01T14:01:00Z"), at("2025-03-01T15:59:00Z")));
    auto stream = service.getStream("s-1");

    auto parts = matcher.splitStream(service, stream);
    ASSERT_EQ(parts.size(), 1u);
    EXPECT_EQ(parts[0], stream);
    EXPECT_EQ(service.streamCount(), 1u);
}

TEST_F(StreamMatcherTest, MisalignedRecordMovesToNewSession) {
    service.createStream("s-1", at("2025-03-01T14:00:00Z"));
    service.updateStreamEnd("s-1", at("2025-03-01T16:00:00Z"));
    service.createPlatformStream("s-1", twitchAt(at("2025-03-01T14:00:00Z"), at("2025-03-01T15:50:00Z")));
    service.createPlatformStream("s-1", kickAt(at("2025-03-01T19:00:00Z"), at("2025-03-01T20:00:00Z")));
    auto stream = service.getStream("s-1");

    auto parts = matcher.splitStream(service, stream);
    ASSERT_EQ(parts.size(), 2u);
    EXPECT_EQ(parts[0]->getCommonId(), "s-1");
    EXPECT_EQ(parts[1]->getCommonId(), "session-1");
    EXPECT_EQ(parts[1]->getObsStartTime(), at("2025-03-01T19:00:00Z"));
    EXPECT_EQ(parts[1]->getObsEndTime(), at("2025-03-01T20:00:00Z"));

    EXPECT_EQ(platformsOf("s-1"), (std::vector<Platform>{Platform::Twitch}));
    EXPECT_EQ(platformsOf("session-1"), (std::vector<Platform>{Platform::Kick}));
    EXPECT_EQ(service.getStream("s-1")->getObsEndTime(), at("2025-03-01T15:50:00Z"));
    EXPECT_EQ(stream->getPlatforms().size(), 1u);
}

TEST_F(StreamMatcherTest, SplittingSoleRecordDeletesOriginal) {
    service.createStream("s-1", at("2025-03-01T14:00:00Z"));
    service.updateStreamEnd("s-1", at("2025-03-01T16:00:00Z"));
    service.createPlatformStream("s-1", youtubeAt(at("2025-03-01T18:00:00Z"), at("2025-03-01T19:00:00Z")));

    auto parts = matcher.splitStream(service, service.getStream("s-1"));
    ASSERT_EQ(parts.size(), 1u);
    EXPECT_EQ(parts[0]->getCommonId(), "session-1");
    EXPECT_EQ(service.getStream("s-1"), nullptr);
    EXPECT_EQ(platformsOf("session-1"), (std::vector<Platform>{Platform::YouTube}));
}

TEST_F(StreamMatcherTest, SplitDetachesOneRecordPerCall) {
    service.createStream("s-1", at("2025-03-01T14:00:00Z"));
    service.updateStreamEnd("s-1", at("2025-03-01T16:00:00Z"));
    service.createPlatformStream("s-1", twitchAt(at("2025-03-01T14:00:00Z"), at("2025-03-01T16:00:00Z")));
    service.createPlatformStream("s-1", kickAt(at("2025-03-01T18:00:00Z"), at("2025-03-01T19:00:00Z")));
    service.createPlatformStream("s-1", youtubeAt(at("2025-03-01T20:00:00Z"), at("2025-03-01T21:00:00Z")));
    auto stream = service.getStream("s-1");

    auto first = matcher.splitStream(service, stream);
    ASSERT_EQ(first.size(), 2u);
    EXPECT_EQ(platformsOf(first[1]->getCommonId()), (std::vector<Platform>{Platform::Kick}));
    EXPECT_EQ(platformsOf("s-1").size(), 2u);
}

TEST_F(StreamMatcherTest, SplitFollowsAttachOrderNotPlatformOrder) {
    service.createStream("s-1", at("2025-03-01T14:00:00Z"));
    service.updateStreamEnd("s-1", at("2025-03-01T16:00:00Z"));
    service.createPlatformStream("s-1", youtubeAt(at("2025-03-01T18:00:00Z"), at("2025-03-01T19:00:00Z")));
    service.createPlatformStream("s-1", twitchAt(at("2025-03-01T20:00:00Z"), at("2025-03-01T21:00:00Z")));
    auto stream = service.getStream("s-1");
    (void)stream->getPlatforms();

    auto parts = matcher.splitStream(service, stream);
    ASSERT_EQ(parts.size(), 2u);
    EXPECT_EQ(parts[1]->getCommonId(), "session-1");
    EXPECT_EQ(platformsOf("session-1"), (std::vector<Platform>{Platform::YouTube}));
    EXPECT_EQ(platformsOf("s-1"), (std::vector<Platform>{Platform::Twitch}));
    EXPECT_EQ(service.getStream("s-1")->getObsEndTime(), at("2025-03-01T21:00:00Z"));
}

TEST_F(StreamMatcherTest, OverlapDelegatesToMetric) {
    const DateRange a{at("2025-03-01T14:00:00Z"), at("2025-03-01T16:00:00Z")};
    const DateRange b{at("2025-03-01T15:30:00Z"), at("2025-03-01T18:00:00Z")};
    EXPECT_NEAR(matcher.calculateOverlapPercent(a, b), 0.25, 1e-9);
}
