/*
Streamweave — ObsStreamDetector
Role: Turns obs output-state changes into canonical Stream sessions: opens a Stream when the output goes live, closes it when the output stops.
Inputs/Outputs: StreamStateChanged events and the initial GetStreamStatus answer in; StreamService writes and DetectorCallbacks out.
Threading: Driven from the client's dispatch context; getStatus() may be called from any thread.
Integration: Registered on an IObsClient at construction and unregistered at destruction.
Related: IObsClient.hpp, stream/StreamService.hpp, stream/Stream.hpp.
Assumptions: The local obs recorder owns session truth; a dropped connection does not end a Stream.
*/
#pragma once
#include <functional>
#include <memory>
#include <mutex>
#include <vector>
#include <optional>
#include "IObsClient.hpp"
#include "stream/Stream.hpp"
#include "stream/StreamService.hpp"
#include "util/Ids.hpp"
#include "util/TimeUtils.hpp"

enum class StreamState { Offline, Starting, Live, Stopping, Reconnecting };

[[nodiscard]] const char* toString(StreamState state);

struct DetectorCallbacks {
    std::function<void()>                                   onStreamStarting;
    std::function<void(const std::shared_ptr<Stream>&)>     onStreamStart;
    std::function<void()>                                   onStreamStopping;
    std::function<void(const std::shared_ptr<Stream>&, TimePoint)> onStreamStop;
    std::function<void()>                                   onStreamReconnecting;
    std::function<void()>                                   onStreamReconnected;
};

struct DetectorOptions {
    NowFn       now{TimeUtils::systemNow()};
    IdGenerator ids{generateUuid};
};

struct DetectorStatus {
    bool                    isStreaming{false};
    StreamState             state{StreamState::Offline};
    std::shared_ptr<Stream> currentStream;
};

class ObsStreamDetector {
public:
    ObsStreamDetector(IObsClient& client, StreamService& service,
                      DetectorCallbacks callbacks = {}, DetectorOptions options = {});
    ~ObsStreamDetector();

    ObsStreamDetector(const ObsStreamDetector&) = delete;
    ObsStreamDetector& operator=(const ObsStreamDetector&) = delete;

    void connect(const ConnectOptions& options, ConnectHandler handler) { m_client.connect(options, std::move(handler)); }
    void disconnect() { m_client.disconnect(); }

    [[nodiscard]] DetectorStatus getStatus() const;

    /// Apply one output-state change. Throws PersistenceError if the store rejects the write;
    /// state and current stream are left as they were.
    void handleStreamStateChanged(const StreamStateChangedEvent& event);

private:
    IObsClient&       m_client;
    StreamService&    m_service;
    DetectorCallbacks m_callbacks;
    DetectorOptions   m_options;

    mutable std::mutex      m_mutex;
    StreamState             m_state{StreamState::Offline};
    std::shared_ptr<Stream> m_currentStream;

    std::vector<ListenerId> m_listenerIds;

    void handleConnected();
    void applyInitialStatus(const ObsStreamStatus& status);
    void handleDisconnected();
    std::shared_ptr<Stream> openStream(TimePoint startTime);
};
