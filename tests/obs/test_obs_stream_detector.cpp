/*
Streamweave — ObsStreamDetector Tests
Role: Verify the output-state -> Stream session transitions
Testing Strategy: FakeObsClient drives events; RecordingStreamService observes writes; ManualClock pins time
Coverage: Full transition table, reconnect paths, initial-status backfill, disconnect reset, persistence failures, listener cleanup
*/
#include <gtest/gtest.h>
#include <vector>
#include "obs/ObsErrors.hpp"
#include "obs/ObsStreamDetector.hpp"
#include "fixtures/fake_obs_client.hpp"
#include "fixtures/recording_stream_service.hpp"
#include "fixtures/test_clock.hpp"

namespace {

class ObsStreamDetectorTest : public ::testing::Test {
protected:
    ObsStreamDetectorTest()
        : service(clock.fn(), fixtures::sequentialIds("rec"))
    {}

    void SetUp() override {
        callbacks.onStreamStarting = [this] { events.push_back("starting"); };
        callbacks.onStreamStart = [this](const std::shared_ptr<Stream>& s) { events.push_back("start:" + s->getCommonId()); };
        callbacks.onStreamStopping = [this] { events.push_back("stopping"); };
        callbacks.onStreamStop = [this](const std::shared_ptr<Stream>& s, TimePoint end) {
            events.push_back("stop:" + s->getCommonId());
            lastStopTime = end;
        };
        callbacks.onStreamReconnecting = [this] { events.push_back("reconnecting"); };
        callbacks.onStreamReconnected = [this] { events.push_back("reconnected"); };
        detector = std::make_unique<ObsStreamDetector>(client, service, callbacks,
                                                       DetectorOptions{clock.fn(), fixtures::sequentialIds("stream")});
    }

    void emit(ObsOutputState state, bool active = true) { client.emitState(active, state); }

    fixtures::ManualClock clock;
    fixtures::FakeObsClient client;
    fixtures::RecordingStreamService service;
    DetectorCallbacks callbacks;
    std::unique_ptr<ObsStreamDetector> detector;
    std::vector<std::string> events;
    TimePoint lastStopTime{};
};

} // namespace

// =============================================================================
// Transition table
// =============================================================================

TEST_F(ObsStreamDetectorTest, StartsOffline) {
    auto status = detector->getStatus();
    EXPECT_FALSE(status.isStreaming);
    EXPECT_EQ(status.state, StreamState::Offline);
    EXPECT_EQ(status.currentStream, nullptr);
}

TEST_F(ObsStreamDetectorTest, StartingThenStartedOpensStream) {
    emit(ObsOutputState::Starting, false);
    EXPECT_EQ(detector->getStatus().state, StreamState::Starting);

    const TimePoint startAt = clock.now();
    emit(ObsOutputState::Started);

    auto status = detector->getStatus();
    EXPECT_TRUE(status.isStreaming);
    EXPECT_EQ(status.state, StreamState::Live);
    ASSERT_NE(status.currentStream, nullptr);
    EXPECT_EQ(status.currentStream->getCommonId(), "stream-1");
    EXPECT_EQ(status.currentStream->getObsStartTime(), startAt);

    ASSERT_EQ(service.createCalls.size(), 1u);
    auto stored = service.getStream("stream-1");
    ASSERT_NE(stored, nullptr);
    EXPECT_EQ(stored->getObsStartTime(), startAt);
    EXPECT_EQ(events, (std::vector<std::string>{"starting", "start:stream-1"}));
}

TEST_F(ObsStreamDetectorTest, StoppingThenStoppedClosesStream) {
    emit(ObsOutputState::Started);
    clock.advance(std::chrono::minutes(90));
    emit(ObsOutputState::Stopping);
    EXPECT_EQ(detector->getStatus().state, StreamState::Stopping);
    emit(ObsOutputState::Stopped, false);

    auto status = detector->getStatus();
    EXPECT_EQ(status.state, StreamState::Offline);
    EXPECT_EQ(status.currentStream, nullptr);

    ASSERT_EQ(service.endCalls.size(), 1u);
    EXPECT_EQ(service.endCalls[0].commonId, "stream-1");
    EXPECT_EQ(service.endCalls[0].endTime, clock.now());
    EXPECT_EQ(lastStopTime, clock.now());
    EXPECT_EQ(service.getStream("stream-1")->getObsEndTime(), clock.now());
    EXPECT_EQ(events, (std::vector<std::string>{"start:stream-1", "stopping", "stop:stream-1"}));
}

TEST_F(ObsStreamDetectorTest, StoppedWithoutStreamOnlyChangesState) {
    emit(ObsOutputState::Starting, false);
    emit(ObsOutputState::Stopped, false);
    EXPECT_EQ(detector->getStatus().state, StreamState::Offline);
    EXPECT_TRUE(service.endCalls.empty());
    EXPECT_EQ(events, (std::vector<std::string>{"starting"}));
}

TEST_F(ObsStreamDetectorTest, StartedWhileLiveIsIgnored) {
    emit(ObsOutputState::Started);
    emit(ObsOutputState::Started);
    emit(ObsOutputState::Reconnected);
    EXPECT_EQ(service.createCalls.size(), 1u);
    EXPECT_EQ(detector->getStatus().currentStream->getCommonId(), "stream-1");
}

TEST_F(ObsStreamDetectorTest, ReconnectedAfterReconnectingOpensNewStream) {
    emit(ObsOutputState::Started);
    emit(ObsOutputState::Reconnecting);
    EXPECT_EQ(detector->getStatus().state, StreamState::Reconnecting);
    EXPECT_FALSE(detector->getStatus().isStreaming);

    emit(ObsOutputState::Reconnected);
    auto status = detector->getStatus();
    EXPECT_EQ(status.state, StreamState::Live);
    EXPECT_EQ(status.currentStream->getCommonId(), "stream-2");
    EXPECT_EQ(events, (std::vector<std::string>{"start:stream-1", "reconnecting", "start:stream-2", "reconnected"}));
}

TEST_F(ObsStreamDetectorTest, PausedAndUnknownLeaveStateAlone) {
    emit(ObsOutputState::Started);
    emit(ObsOutputState::Paused);
    emit(ObsOutputState::Resumed);
    emit(ObsOutputState::Unknown);
    EXPECT_EQ(detector->getStatus().state, StreamState::Live);
    EXPECT_EQ(service.createCalls.size(), 1u);
}

TEST_F(ObsStreamDetectorTest, StateNames) {
    EXPECT_STREQ(toString(StreamState::Offline), "offline");
    EXPECT_STREQ(toString(StreamState::Live), "live");
    EXPECT_STREQ(toString(StreamState::Reconnecting), "reconnecting");
}

// =============================================================================
// Initial status
// =============================================================================

TEST_F(ObsStreamDetectorTest, ConnectedWhileLiveBackfillsStartTime) {
    client.status = ObsStreamStatus{};
    client.status.active = true;
    client.status.durationMs = 3'600'000;
    client.emitConnected();

    EXPECT_EQ(client.statusCalls, 1);
    auto status = detector->getStatus();
    EXPECT_EQ(status.state, StreamState::Live);
    ASSERT_NE(status.currentStream, nullptr);
    EXPECT_EQ(status.currentStream->getObsStartTime(), clock.now() - std::chrono::hours(1));
    EXPECT_EQ(events, (std::vector<std::string>{"start:stream-1"}));

    // The later Started for the same output does not open a second session
    emit(ObsOutputState::Started);
    EXPECT_EQ(service.createCalls.size(), 1u);
}

TEST_F(ObsStreamDetectorTest, ConnectedWhileReconnectingWaitsForReconnected) {
    client.status.active = true;
    client.status.reconnecting = true;
    client.emitConnected();

    EXPECT_EQ(detector->getStatus().state, StreamState::Reconnecting);
    EXPECT_TRUE(service.createCalls.empty());

    emit(ObsOutputState::Reconnected);
    EXPECT_EQ(detector->getStatus().state, StreamState::Live);
    EXPECT_EQ(service.createCalls.size(), 1u);
    EXPECT_EQ(events.back(), "reconnected");
}

TEST_F(ObsStreamDetectorTest, ConnectedWhileOffline) {
    client.status.active = false;
    client.emitConnected();
    EXPECT_EQ(detector->getStatus().state, StreamState::Offline);
    EXPECT_TRUE(service.createCalls.empty());
}

TEST_F(ObsStreamDetectorTest, StatusQueryFailureIsNotFatal) {
    client.statusError = std::make_exception_ptr(RequestTimeoutError("Request timeout: GetStreamStatus"));
    client.emitConnected();
    EXPECT_EQ(detector->getStatus().state, StreamState::Offline);

    emit(ObsOutputState::Started);
    EXPECT_EQ(detector->getStatus().state, StreamState::Live);
}

TEST_F(ObsStreamDetectorTest, BackfillPersistenceFailureIsLogged) {
    service.failCreate = true;
    client.status.active = true;
    client.status.durationMs = 1000;
    EXPECT_NO_THROW(client.emitConnected());

    auto status = detector->getStatus();
    EXPECT_EQ(status.state, StreamState::Live);
    EXPECT_EQ(status.currentStream, nullptr);
    EXPECT_TRUE(events.empty());
}

// =============================================================================
// Disconnect and failures
// =============================================================================

TEST_F(ObsStreamDetectorTest, DisconnectResetsWithoutEndTime) {
    emit(ObsOutputState::Started);
    client.emitDisconnected();

    auto status = detector->getStatus();
    EXPECT_EQ(status.state, StreamState::Offline);
    EXPECT_EQ(status.currentStream, nullptr);
    EXPECT_TRUE(service.endCalls.empty());
    EXPECT_FALSE(service.getStream("stream-1")->getObsEndTime().has_value());
}

TEST_F(ObsStreamDetectorTest, CreateFailureLeavesStateUnchanged) {
    emit(ObsOutputState::Starting, false);
    service.failCreate = true;
    EXPECT_THROW(detector->handleStreamStateChanged({true, ObsOutputState::Started}), PersistenceError);

    auto status = detector->getStatus();
    EXPECT_EQ(status.state, StreamState::Starting);
    EXPECT_EQ(status.currentStream, nullptr);
}

TEST_F(ObsStreamDetectorTest, UpdateEndFailureKeepsCurrentStream) {
    emit(ObsOutputState::Started);
    service.failUpdateEnd = true;
    EXPECT_THROW(detector->handleStreamStateChanged({false, ObsOutputState::Stopped}), PersistenceError);

    auto status = detector->getStatus();
    EXPECT_EQ(status.state, StreamState::Live);
    ASSERT_NE(status.currentStream, nullptr);
    EXPECT_FALSE(status.currentStream->getObsEndTime().has_value());
}

TEST_F(ObsStreamDetectorTest, FailureThroughClientDispatchIsContained) {
    service.failCreate = true;
    EXPECT_NO_THROW(emit(ObsOutputState::Started));
    EXPECT_EQ(detector->getStatus().state, StreamState::Offline);
}

TEST_F(ObsStreamDetectorTest, DestructorUnregistersListeners) {
    EXPECT_EQ(client.listenerCount(), 4u);
    detector.reset();
    EXPECT_EQ(client.listenerCount(), 0u);
    EXPECT_NO_THROW(emit(ObsOutputState::Started));
}

TEST_F(ObsStreamDetectorTest, ConnectDelegatesToClient) {
    bool done = false;
    detector->connect(ConnectOptions{}, [&](std::exception_ptr err) { done = !err; });
    EXPECT_TRUE(done);
    EXPECT_EQ(client.connectCalls, 1);
    detector->disconnect();
    EXPECT_EQ(client.disconnectCalls, 1);
}
