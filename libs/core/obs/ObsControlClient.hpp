/*
Streamweave — ObsControlClient
Role: obs-websocket v5 control connection: hello/identify handshake with challenge-response auth, correlated requests with per-request timeouts, and typed event fan-out.
Inputs/Outputs: Raw frames from a WsTransport in; completion handlers and listener callbacks out.
Threading: All state lives on an internal strand. Public methods post onto it and may be called from any thread. Handlers and listeners run on the strand.
Integration: The daemon owns one instance; ObsStreamDetector consumes it through IObsClient.
Related: IObsClient.hpp, ws/WsTransport.hpp, protocol/ObsMessageParser.hpp, protocol/ObsAuth.hpp, ObsErrors.hpp.
Assumptions: The io_context outlives the client and is stopped before the client is destroyed.
*/
#pragma once
#include <atomic>
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>
#include "IObsClient.hpp"
#include "ws/WsTransport.hpp"
#include "util/Ids.hpp"

namespace net = boost::asio;

enum class ConnectionState { Disconnected, Connecting, Identifying, Connected };

[[nodiscard]] const char* toString(ConnectionState state);

struct ObsClientOptions {
    std::chrono::milliseconds requestTimeout{30000};
    std::chrono::milliseconds connectTimeout{10000};
    uint32_t                  eventSubscriptions{EventSubscription::Outputs};
    IdGenerator               ids{generateUuid};
};

class ObsControlClient : public IObsClient {
public:
    static constexpr int kRpcVersion = 1;

    ObsControlClient(net::io_context& ioc, std::unique_ptr<WsTransport> transport, ObsClientOptions options = {});
    ~ObsControlClient() override;

    ObsControlClient(const ObsControlClient&) = delete;
    ObsControlClient& operator=(const ObsControlClient&) = delete;

    using IObsClient::connect;
    using IObsClient::send;
    using IObsClient::getStreamStatus;

    void connect(const ConnectOptions& options, ConnectHandler handler) override;
    void disconnect() override;
    [[nodiscard]] bool isConnected() const override { return state() == ConnectionState::Connected; }
    [[nodiscard]] ConnectionState state() const { return m_state.load(); }

    void send(ObsRequest request, ResponseHandler handler) override;
    void getStreamStatus(StreamStatusHandler handler) override;

    ListenerId onConnected(LifecycleListener listener) override { return m_connectedListeners.add(std::move(listener)); }
    ListenerId onDisconnected(LifecycleListener listener) override { return m_disconnectedListeners.add(std::move(listener)); }
    ListenerId onError(ErrorListener listener) override { return m_errorListeners.add(std::move(listener)); }
    ListenerId onStreamStateChanged(StreamStateListener listener) override { return m_streamStateListeners.add(std::move(listener)); }
    ListenerId onMessage(MessageListener listener) override { return m_messageListeners.add(std::move(listener)); }
    void removeListener(ListenerId id) override;

    [[nodiscard]] size_t pendingRequestCount() const { return m_pendingCount.load(); }

private:
    struct PendingRequest {
        std::string                       requestType;
        ResponseHandler                   handler;
        std::unique_ptr<net::steady_timer> timer;
    };

    net::strand<net::io_context::executor_type> m_strand;
    std::unique_ptr<WsTransport> m_transport;
    ObsClientOptions m_options;

    std::atomic<ConnectionState> m_state{ConnectionState::Disconnected};
    uint64_t m_attempt{0};
    std::optional<std::string> m_password;
    std::vector<ConnectHandler> m_connectWaiters;
    net::steady_timer m_connectTimer;
    std::string m_lastTransportError;

    std::unordered_map<std::string, PendingRequest> m_pending;
    std::atomic<size_t> m_pendingCount{0};

    ListenerList<> m_connectedListeners;
    ListenerList<> m_disconnectedListeners;
    ListenerList<std::exception_ptr> m_errorListeners;
    ListenerList<StreamStateChangedEvent> m_streamStateListeners;
    ListenerList<nlohmann::json> m_messageListeners;

    // All below run on m_strand
    void bindTransport(uint64_t attempt);
    void startConnect(const ConnectOptions& options);
    void handleOpen(uint64_t attempt);
    void handleClosed(uint64_t attempt);
    void handleTransportError(uint64_t attempt, const std::string& what);
    void handleMessage(uint64_t attempt, const std::string& payload);
    void handleHello(const HelloFrame& hello);
    void handleIdentified(const IdentifiedFrame& identified);
    void handleResponse(ObsResponse response);
    void handleEvent(const EventFrame& event);
    void onRequestTimeout(const std::string& requestId);

    void finishConnect(std::exception_ptr err);
    void abortConnect(std::exception_ptr err);
    void rejectAllPending(const std::exception_ptr& err);
    void sendFrame(const nlohmann::json& frame);
};
