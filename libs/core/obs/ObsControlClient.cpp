#include "ObsControlClient.hpp"
#include "ObsErrors.hpp"
#include "Log.hpp"
#include "protocol/ObsAuth.hpp"
#include "protocol/ObsFrameBuilder.hpp"
#include "protocol/ObsMessageParser.hpp"
#include <boost/asio/post.hpp>
#include <algorithm>
#include <type_traits>
#include <variant>
#include <fmt/format.h>

namespace {

// Completion handlers are user code; a throw must not unwind through the strand.
template <class Fn, class... Args>
void invokeHandler(const char* what, Fn& fn, Args&&... args) {
    if (!fn) return;
    try {
        fn(std::forward<Args>(args)...);
    } catch (const std::exception& e) {
        LOG_E("obs", "{} handler threw: {}", what, e.what());
    }
}

} // namespace

const char* toString(ConnectionState state) {
    switch (state) {
        case ConnectionState::Disconnected: return "disconnected";
        case ConnectionState::Connecting:   return "connecting";
        case ConnectionState::Identifying:  return "identifying";
        case ConnectionState::Connected:    return "connected";
    }
    return "unknown";
}

ObsControlClient::ObsControlClient(net::io_context& ioc, std::unique_ptr<WsTransport> transport, ObsClientOptions options)
    : m_strand(net::make_strand(ioc))
    , m_transport(std::move(transport))
    , m_options(std::move(options))
    , m_connectTimer(m_strand)
{
    if (!m_transport) throw std::invalid_argument("ObsControlClient requires a transport");
    if (!m_options.ids) m_options.ids = generateUuid;
}

ObsControlClient::~ObsControlClient() {
    m_transport->onMessage(nullptr);
    m_transport->onStatus(nullptr);
    m_transport->onError(nullptr);
    m_connectTimer.cancel();
    for (auto& [id, pending] : m_pending) {
        if (pending.timer) pending.timer->cancel();
    }
}

// Callbacks are rebound per attempt; notifications from a superseded attempt are dropped on arrival.
void ObsControlClient::bindTransport(uint64_t attempt) {
    m_transport->onStatus([this, attempt](bool up) {
        net::post(m_strand, [this, attempt, up] {
            if (up) handleOpen(attempt);
            else    handleClosed(attempt);
        });
    });
    m_transport->onError([this, attempt](std::string what) {
        net::post(m_strand, [this, attempt, what = std::move(what)] { handleTransportError(attempt, what); });
    });
    m_transport->onMessage([this, attempt](std::string payload) {
        net::post(m_strand, [this, attempt, payload = std::move(payload)] { handleMessage(attempt, payload); });
    });
}

void ObsControlClient::connect(const ConnectOptions& options, ConnectHandler handler) {
    net::post(m_strand, [this, options, handler = std::move(handler)]() mutable {
        switch (m_state.load()) {
            case ConnectionState::Connected:
                invokeHandler("connect", handler, std::exception_ptr{});
                return;
            case ConnectionState::Connecting:
            case ConnectionState::Identifying:
                LOG_D("obs", "connect already in flight; joining");
                m_connectWaiters.push_back(std::move(handler));
                return;
            case ConnectionState::Disconnected:
                m_connectWaiters.push_back(std::move(handler));
                startConnect(options);
                return;
        }
    });
}

void ObsControlClient::startConnect(const ConnectOptions& options) {
    const uint64_t attempt = ++m_attempt;
    m_state = ConnectionState::Connecting;
    m_password = options.password;
    m_lastTransportError.clear();

    LOG_I("obs", "connecting to ws://{}:{}", options.host, options.port);
    bindTransport(attempt);

    m_connectTimer.expires_after(m_options.connectTimeout);
    m_connectTimer.async_wait([this, attempt](const boost::system::error_code& ec) {
        if (ec || attempt != m_attempt) return;
        const auto st = m_state.load();
        if (st != ConnectionState::Connecting && st != ConnectionState::Identifying) return;
        LOG_W("obs", "handshake timed out after {} ms", m_options.connectTimeout.count());
        abortConnect(std::make_exception_ptr(RequestTimeoutError(
            fmt::format("Connect timeout after {} ms", m_options.connectTimeout.count()))));
    });

    m_transport->connect(options.host, std::to_string(options.port), "/");
}

void ObsControlClient::handleOpen(uint64_t attempt) {
    if (attempt != m_attempt) return;
    LOG_D("obs", "socket open; awaiting Hello");
}

void ObsControlClient::handleClosed(uint64_t attempt) {
    if (attempt != m_attempt) return;
    const auto prev = m_state.exchange(ConnectionState::Disconnected);
    if (prev == ConnectionState::Disconnected) return;

    m_connectTimer.cancel();
    rejectAllPending(std::make_exception_ptr(TransportError("Connection closed")));

    switch (prev) {
        case ConnectionState::Connecting: {
            const std::string reason = m_lastTransportError.empty() ? "Connection closed" : m_lastTransportError;
            LOG_W("obs", "connection failed: {}", reason);
            finishConnect(std::make_exception_ptr(TransportError(reason)));
            break;
        }
        case ConnectionState::Identifying:
            // obs closes the socket (4009) on a bad auth string
            LOG_W("obs", "server closed the connection during identify");
            finishConnect(std::make_exception_ptr(AuthenticationError("Authentication failed: connection closed during identify")));
            break;
        case ConnectionState::Connected:
            LOG_I("obs", "disconnected");
            m_disconnectedListeners.emit();
            break;
        case ConnectionState::Disconnected:
            break;
    }
}

void ObsControlClient::handleTransportError(uint64_t attempt, const std::string& what) {
    if (attempt != m_attempt) return;
    m_lastTransportError = what;
    m_errorListeners.emit(std::make_exception_ptr(TransportError(what)));
}

void ObsControlClient::handleMessage(uint64_t attempt, const std::string& payload) {
    if (attempt != m_attempt) return;

    auto raw = nlohmann::json::parse(payload, nullptr, false);
    if (raw.is_discarded()) {
        LOG_W("obs", "dropping non-JSON frame ({} bytes)", payload.size());
        return;
    }
    m_messageListeners.emit(raw);

    ObsFrame frame;
    try {
        frame = ObsMessageParser::parse(raw);
    } catch (const ProtocolError& e) {
        LOG_W("obs", "dropping malformed frame: {}", e.what());
        return;
    }

    std::visit([this](auto& f) {
        using T = std::decay_t<decltype(f)>;
        if constexpr (std::is_same_v<T, HelloFrame>) handleHello(f);
        else if constexpr (std::is_same_v<T, IdentifiedFrame>) handleIdentified(f);
        else if constexpr (std::is_same_v<T, EventFrame>) handleEvent(f);
        else if constexpr (std::is_same_v<T, ObsResponse>) handleResponse(std::move(f));
        else LOG_D("obs", "ignoring frame with op {}", f.op);
    }, frame);
}

void ObsControlClient::handleHello(const HelloFrame& hello) {
    if (m_state.load() != ConnectionState::Connecting) {
        LOG_W("obs", "unexpected Hello in state {}", toString(m_state.load()));
        return;
    }
    LOG_I("obs", "Hello from obs-websocket {} (rpc v{})", hello.obsWebSocketVersion, hello.rpcVersion);

    std::optional<std::string> auth;
    if (hello.authentication) {
        if (!m_password) {
            abortConnect(std::make_exception_ptr(AuthenticationError(
                "obs-websocket requires authentication but no password is configured")));
            return;
        }
        try {
            auth = ObsAuth::computeAuthResponse(*m_password, hello.authentication->salt, hello.authentication->challenge);
        } catch (const std::runtime_error& e) {
            abortConnect(std::make_exception_ptr(AuthenticationError(std::string("Failed to compute auth response: ") + e.what())));
            return;
        }
    }

    const int rpcVersion = std::min(hello.rpcVersion, kRpcVersion);
    m_state = ConnectionState::Identifying;
    sendFrame(ObsFrameBuilder::identify(rpcVersion, auth, m_options.eventSubscriptions));
}

void ObsControlClient::handleIdentified(const IdentifiedFrame& identified) {
    if (m_state.load() != ConnectionState::Identifying) {
        LOG_W("obs", "unexpected Identified in state {}", toString(m_state.load()));
        return;
    }
    m_state = ConnectionState::Connected;
    m_connectTimer.cancel();
    LOG_I("obs", "identified (rpc v{})", identified.negotiatedRpcVersion);
    finishConnect(nullptr);
    m_connectedListeners.emit();
}

void ObsControlClient::handleResponse(ObsResponse response) {
    auto it = m_pending.find(response.requestId);
    if (it == m_pending.end()) {
        LOG_D("obs", "response for unknown request {}", response.requestId);
        return;
    }
    PendingRequest pending = std::move(it->second);
    m_pending.erase(it);
    m_pendingCount = m_pending.size();
    if (pending.timer) pending.timer->cancel();

    if (response.result) {
        invokeHandler("request", pending.handler, std::exception_ptr{}, std::move(response.responseData));
    } else {
        const std::string& type = response.requestType.empty() ? pending.requestType : response.requestType;
        LOG_D("obs", "{} rejected with code {}", type, response.code);
        invokeHandler("request", pending.handler,
                      std::make_exception_ptr(RequestFailedError(type, response.code, response.comment)),
                      nlohmann::json{});
    }
}

void ObsControlClient::handleEvent(const EventFrame& event) {
    if (event.eventType != ObsEvents::kStreamStateChanged) {
        LOG_T("obs", "event {}", event.eventType);
        return;
    }
    StreamStateChangedEvent parsed;
    try {
        parsed = ObsMessageParser::parseStreamStateChanged(event.eventData);
    } catch (const ProtocolError& e) {
        LOG_W("obs", "dropping StreamStateChanged: {}", e.what());
        return;
    }
    LOG_D("obs", "StreamStateChanged active={} state={}", parsed.outputActive, toString(parsed.outputState));
    m_streamStateListeners.emit(parsed);
}

void ObsControlClient::send(ObsRequest request, ResponseHandler handler) {
    net::post(m_strand, [this, request = std::move(request), handler = std::move(handler)]() mutable {
        if (m_state.load() != ConnectionState::Connected) {
            invokeHandler("request", handler, std::make_exception_ptr(TransportError("Not connected")), nlohmann::json{});
            return;
        }
        if (m_pending.count(request.requestId)) {
            invokeHandler("request", handler,
                          std::make_exception_ptr(ProtocolError("Duplicate request id: " + request.requestId)),
                          nlohmann::json{});
            return;
        }

        PendingRequest pending;
        pending.requestType = request.requestType;
        pending.handler = std::move(handler);
        pending.timer = std::make_unique<net::steady_timer>(m_strand);
        pending.timer->expires_after(m_options.requestTimeout);
        pending.timer->async_wait([this, id = request.requestId](const boost::system::error_code& ec) {
            if (ec) return;
            onRequestTimeout(id);
        });
        m_pending.emplace(request.requestId, std::move(pending));
        m_pendingCount = m_pending.size();

        LOG_T("obs", "-> {} ({})", request.requestType, request.requestId);
        sendFrame(ObsFrameBuilder::request(request));
    });
}

void ObsControlClient::onRequestTimeout(const std::string& requestId) {
    auto it = m_pending.find(requestId);
    if (it == m_pending.end()) return;
    PendingRequest pending = std::move(it->second);
    m_pending.erase(it);
    m_pendingCount = m_pending.size();
    LOG_W("obs", "request {} ({}) timed out", pending.requestType, requestId);
    invokeHandler("request", pending.handler,
                  std::make_exception_ptr(RequestTimeoutError("Request timeout: " + pending.requestType)),
                  nlohmann::json{});
}

void ObsControlClient::getStreamStatus(StreamStatusHandler handler) {
    ObsRequest request;
    request.requestType = ObsRequests::kGetStreamStatus;
    request.requestId = "status-" + m_options.ids();
    send(std::move(request), [handler = std::move(handler)](std::exception_ptr err, nlohmann::json data) mutable {
        if (err) {
            handler(err, ObsStreamStatus{});
            return;
        }
        ObsStreamStatus status;
        try {
            status = ObsMessageParser::parseStreamStatus(data);
        } catch (const ProtocolError&) {
            handler(std::current_exception(), ObsStreamStatus{});
            return;
        }
        handler(nullptr, status);
    });
}

void ObsControlClient::disconnect() {
    net::post(m_strand, [this] {
        const auto prev = m_state.exchange(ConnectionState::Disconnected);
        if (prev == ConnectionState::Disconnected) return;

        ++m_attempt;   // late transport notifications for this session are now stale
        m_connectTimer.cancel();
        rejectAllPending(std::make_exception_ptr(TransportError("Connection closed")));
        finishConnect(std::make_exception_ptr(TransportError("Disconnected before handshake completed")));
        m_transport->close();

        LOG_I("obs", "disconnect requested (was {})", toString(prev));
        if (prev == ConnectionState::Connected) {
            m_disconnectedListeners.emit();
        }
    });
}

void ObsControlClient::removeListener(ListenerId id) {
    if (m_connectedListeners.remove(id)) return;
    if (m_disconnectedListeners.remove(id)) return;
    if (m_errorListeners.remove(id)) return;
    if (m_streamStateListeners.remove(id)) return;
    m_messageListeners.remove(id);
}

void ObsControlClient::finishConnect(std::exception_ptr err) {
    auto waiters = std::move(m_connectWaiters);
    m_connectWaiters.clear();
    for (auto& waiter : waiters) {
        invokeHandler("connect", waiter, err);
    }
}

// Handshake failure: fail the waiters, then drop the socket.
void ObsControlClient::abortConnect(std::exception_ptr err) {
    ++m_attempt;
    m_state = ConnectionState::Disconnected;
    m_connectTimer.cancel();
    finishConnect(err);
    m_transport->close();
}

void ObsControlClient::rejectAllPending(const std::exception_ptr& err) {
    auto pending = std::move(m_pending);
    m_pending.clear();
    m_pendingCount = 0;
    for (auto& [id, request] : pending) {
        if (request.timer) request.timer->cancel();
        invokeHandler("request", request.handler, err, nlohmann::json{});
    }
}

void ObsControlClient::sendFrame(const nlohmann::json& frame) {
    m_transport->send(frame.dump());
}
