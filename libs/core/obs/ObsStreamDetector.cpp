#include "ObsStreamDetector.hpp"
#include "Log.hpp"
#include "util/TimeUtils.hpp"

const char* toString(StreamState state) {
    switch (state) {
        case StreamState::Offline:      return "offline";
        case StreamState::Starting:     return "starting";
        case StreamState::Live:         return "live";
        case StreamState::Stopping:     return "stopping";
        case StreamState::Reconnecting: return "reconnecting";
    }
    return "unknown";
}

ObsStreamDetector::ObsStreamDetector(IObsClient& client, StreamService& service,
                                     DetectorCallbacks callbacks, DetectorOptions options)
    : m_client(client)
    , m_service(service)
    , m_callbacks(std::move(callbacks))
    , m_options(std::move(options))
{
    if (!m_options.now) m_options.now = TimeUtils::systemNow();
    if (!m_options.ids) m_options.ids = generateUuid;

    m_listenerIds.push_back(m_client.onConnected([this] { handleConnected(); }));
    m_listenerIds.push_back(m_client.onStreamStateChanged([this](const StreamStateChangedEvent& e) {
        handleStreamStateChanged(e);
    }));
    m_listenerIds.push_back(m_client.onError([](const std::exception_ptr& err) {
        try {
            if (err) std::rethrow_exception(err);
        } catch (const std::exception& e) {
            LOG_W("detector", "obs client error: {}", e.what());
        }
    }));
    m_listenerIds.push_back(m_client.onDisconnected([this] { handleDisconnected(); }));
}

ObsStreamDetector::~ObsStreamDetector() {
    for (ListenerId id : m_listenerIds) {
        m_client.removeListener(id);
    }
}

DetectorStatus ObsStreamDetector::getStatus() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return DetectorStatus{m_state == StreamState::Live, m_state, m_currentStream};
}

std::shared_ptr<Stream> ObsStreamDetector::openStream(TimePoint startTime) {
    const std::string commonId = m_options.ids();
    m_service.createStream(commonId, startTime);
    LOG_I("detector", "stream {} opened at {}", commonId, TimeUtils::formatIso8601(startTime));
    return std::make_shared<Stream>(commonId, startTime, m_service, m_options.now());
}

void ObsStreamDetector::handleStreamStateChanged(const StreamStateChangedEvent& event) {
    std::unique_lock<std::mutex> lock(m_mutex);
    const StreamState prior = m_state;

    switch (event.outputState) {
        case ObsOutputState::Starting:
            m_state = StreamState::Starting;
            lock.unlock();
            if (m_callbacks.onStreamStarting) m_callbacks.onStreamStarting();
            return;

        case ObsOutputState::Started:
        case ObsOutputState::Reconnected: {
            if (prior == StreamState::Live) return;
            auto stream = openStream(m_options.now());   // throws before any state change
            m_currentStream = stream;
            m_state = StreamState::Live;
            lock.unlock();
            if (m_callbacks.onStreamStart) m_callbacks.onStreamStart(stream);
            if (prior == StreamState::Reconnecting && m_callbacks.onStreamReconnected) {
                m_callbacks.onStreamReconnected();
            }
            return;
        }

        case ObsOutputState::Stopping:
            m_state = StreamState::Stopping;
            lock.unlock();
            if (m_callbacks.onStreamStopping) m_callbacks.onStreamStopping();
            return;

        case ObsOutputState::Stopped: {
            auto stream = m_currentStream;
            if (!stream) {
                m_state = StreamState::Offline;
                return;
            }
            const TimePoint endTime = m_options.now();
            m_service.updateStreamEnd(stream->getCommonId(), endTime);
            stream->setObsEndTime(endTime);
            m_currentStream.reset();
            m_state = StreamState::Offline;
            lock.unlock();
            LOG_I("detector", "stream {} closed at {}", stream->getCommonId(), TimeUtils::formatIso8601(endTime));
            if (m_callbacks.onStreamStop) m_callbacks.onStreamStop(stream, endTime);
            return;
        }

        case ObsOutputState::Reconnecting:
            m_state = StreamState::Reconnecting;
            lock.unlock();
            if (m_callbacks.onStreamReconnecting) m_callbacks.onStreamReconnecting();
            return;

        case ObsOutputState::Paused:
        case ObsOutputState::Resumed:
        case ObsOutputState::Unknown:
            LOG_D("detector", "ignoring output state {}", toString(event.outputState));
            return;
    }
}

void ObsStreamDetector::handleConnected() {
    m_client.getStreamStatus([this](std::exception_ptr err, ObsStreamStatus status) {
        if (err) {
            try {
                std::rethrow_exception(err);
            } catch (const std::exception& e) {
                LOG_W("detector", "failed to get initial stream status: {}", e.what());
            }
            return;
        }
        applyInitialStatus(status);
    });
}

void ObsStreamDetector::applyInitialStatus(const ObsStreamStatus& status) {
    std::unique_lock<std::mutex> lock(m_mutex);
    if (!status.active) {
        m_state = StreamState::Offline;
        m_currentStream.reset();
        return;
    }
    if (status.reconnecting) {
        m_state = StreamState::Reconnecting;
        return;
    }

    m_state = StreamState::Live;
    if (m_currentStream) return;

    const TimePoint estimatedStart = m_options.now() - std::chrono::milliseconds(status.durationMs);
    std::shared_ptr<Stream> stream;
    try {
        stream = openStream(estimatedStart);
    } catch (const std::exception& e) {
        LOG_E("detector", "failed to create stream from status: {}", e.what());
        return;
    }
    m_currentStream = stream;
    lock.unlock();
    LOG_I("detector", "already live for {} ms; backfilled stream {}", status.durationMs, stream->getCommonId());
    if (m_callbacks.onStreamStart) m_callbacks.onStreamStart(stream);
}

void ObsStreamDetector::handleDisconnected() {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_currentStream) {
        LOG_W("detector", "obs disconnected while stream {} was open; end time left unset", m_currentStream->getCommonId());
    }
    m_state = StreamState::Offline;
    m_currentStream.reset();
}
