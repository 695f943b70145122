/*
Streamweave — IObsClient
Role: What the stream detector needs from an obs-websocket connection: connect, requests, status query, and event/lifecycle listeners.
Inputs/Outputs: Completion handlers receive (exception_ptr, value); a null exception_ptr means success.
Threading: Implementations may invoke handlers and listeners on their own executor; callers must not assume the calling thread.
Integration: Implemented by ObsControlClient; faked in tests/fixtures/fake_obs_client.hpp.
Related: ObsControlClient.hpp, ObsStreamDetector.hpp, ObsErrors.hpp.
*/
#pragma once
#include <chrono>
#include <cstdint>
#include <exception>
#include <functional>
#include <future>
#include <memory>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include "ListenerList.hpp"
#include "protocol/ObsTypes.hpp"

struct ConnectOptions {
    std::string                host{"localhost"};
    uint16_t                   port{4455};
    std::optional<std::string> password;
};

using ConnectHandler      = std::function<void(std::exception_ptr)>;
using ResponseHandler     = std::function<void(std::exception_ptr, nlohmann::json)>;
using StreamStatusHandler = std::function<void(std::exception_ptr, ObsStreamStatus)>;

using StreamStateListener  = std::function<void(const StreamStateChangedEvent&)>;
using MessageListener      = std::function<void(const nlohmann::json&)>;
using LifecycleListener    = std::function<void()>;
using ErrorListener        = std::function<void(const std::exception_ptr&)>;

class IObsClient {
public:
    virtual ~IObsClient() = default;

    virtual void connect(const ConnectOptions& options, ConnectHandler handler) = 0;
    virtual void disconnect() = 0;
    [[nodiscard]] virtual bool isConnected() const = 0;

    // Handler receives responseData of a successful request (null JSON when obs sent none).
    virtual void send(ObsRequest request, ResponseHandler handler) = 0;
    virtual void getStreamStatus(StreamStatusHandler handler) = 0;

    virtual ListenerId onConnected(LifecycleListener listener) = 0;
    virtual ListenerId onDisconnected(LifecycleListener listener) = 0;
    virtual ListenerId onError(ErrorListener listener) = 0;
    virtual ListenerId onStreamStateChanged(StreamStateListener listener) = 0;
    virtual ListenerId onMessage(MessageListener listener) = 0;   // every inbound frame, raw
    virtual void removeListener(ListenerId id) = 0;

    // Future forms, built on the handler forms.
    std::future<void> connect(const ConnectOptions& options) {
        auto promise = std::make_shared<std::promise<void>>();
        auto future = promise->get_future();
        connect(options, [promise](std::exception_ptr err) {
            if (err) promise->set_exception(err);
            else     promise->set_value();
        });
        return future;
    }

    std::future<nlohmann::json> send(ObsRequest request) {
        auto promise = std::make_shared<std::promise<nlohmann::json>>();
        auto future = promise->get_future();
        send(std::move(request), [promise](std::exception_ptr err, nlohmann::json data) {
            if (err) promise->set_exception(err);
            else     promise->set_value(std::move(data));
        });
        return future;
    }

    std::future<ObsStreamStatus> getStreamStatus() {
        auto promise = std::make_shared<std::promise<ObsStreamStatus>>();
        auto future = promise->get_future();
        getStreamStatus([promise](std::exception_ptr err, ObsStreamStatus status) {
            if (err) promise->set_exception(err);
            else     promise->set_value(std::move(status));
        });
        return future;
    }
};
