/*
Streamweave — ObsTypes
Role: Typed view of the obs-websocket v5 frames this daemon speaks (hello, identify, identified, event, request, requestResponse).
Inputs/Outputs: Plain structs; JSON mapping lives in ObsMessageParser and ObsFrameBuilder.
Related: ObsMessageParser.hpp, ObsFrameBuilder.hpp.
*/
#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <nlohmann/json.hpp>

enum class OpCode : int {
    Hello           = 0,
    Identify        = 1,
    Identified      = 2,
    Event           = 5,
    Request         = 6,
    RequestResponse = 7,
};

enum class ObsOutputState {
    Unknown,
    Starting,
    Started,
    Stopping,
    Stopped,
    Reconnecting,
    Reconnected,
    Paused,
    Resumed,
};

/// "OBS_WEBSOCKET_OUTPUT_STARTED" -> Started; unrecognized strings map to Unknown.
[[nodiscard]] ObsOutputState outputStateFromString(std::string_view value);
[[nodiscard]] const char* toString(ObsOutputState state);

// Identify.eventSubscriptions bits
namespace EventSubscription {
    inline constexpr uint32_t None        = 0;
    inline constexpr uint32_t General     = 1u << 0;
    inline constexpr uint32_t Config      = 1u << 1;
    inline constexpr uint32_t Scenes      = 1u << 2;
    inline constexpr uint32_t Inputs      = 1u << 3;
    inline constexpr uint32_t Transitions = 1u << 4;
    inline constexpr uint32_t Filters     = 1u << 5;
    inline constexpr uint32_t Outputs     = 1u << 6;
    inline constexpr uint32_t SceneItems  = 1u << 7;
    inline constexpr uint32_t MediaInputs = 1u << 8;
    inline constexpr uint32_t Vendors     = 1u << 9;
    inline constexpr uint32_t Ui          = 1u << 10;
}

namespace ObsEvents {
    inline constexpr const char* kStreamStateChanged = "StreamStateChanged";
}

namespace ObsRequests {
    inline constexpr const char* kGetStreamStatus = "GetStreamStatus";
}

inline constexpr int kRequestStatusSuccess = 100;

struct AuthChallenge {
    std::string salt;
    std::string challenge;
};

struct HelloFrame {
    std::string                  obsWebSocketVersion;
    int                          rpcVersion{1};
    std::optional<AuthChallenge> authentication;
};

struct IdentifiedFrame {
    int negotiatedRpcVersion{1};
};

struct EventFrame {
    std::string    eventType;
    int            eventIntent{0};
    nlohmann::json eventData;
};

struct ObsRequest {
    std::string    requestType;
    std::string    requestId;
    nlohmann::json requestData;   // null = omitted on the wire
};

struct ObsResponse {
    std::string                requestType;
    std::string                requestId;
    bool                       result{false};
    int                        code{0};
    std::optional<std::string> comment;
    nlohmann::json             responseData;   // null when obs sent none
};

struct UnknownFrame {
    int op{-1};
};

using ObsFrame = std::variant<HelloFrame, IdentifiedFrame, EventFrame, ObsResponse, UnknownFrame>;

struct StreamStateChangedEvent {
    bool           outputActive{false};
    ObsOutputState outputState{ObsOutputState::Unknown};
};

struct ObsStreamStatus {
    bool        active{false};
    bool        reconnecting{false};
    std::string timecode;
    int64_t     durationMs{0};
    double      congestion{0.0};
    int64_t     bytes{0};
    int64_t     skippedFrames{0};
    int64_t     totalFrames{0};
};
