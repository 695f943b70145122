#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

/// Golden obs-websocket v5 frames, shaped as obs-websocket 5.x sends them.
namespace fixtures {

// Values from the obs-websocket protocol documentation's authentication example
inline constexpr const char* kDocPassword  = "supersecretpassword";
inline constexpr const char* kDocSalt      = "lM1GncleQOaCu9lT1yeUZhFYnqhsLLP1G5lAGo3ixaI=";
inline constexpr const char* kDocChallenge = "+IxH4CnCiqpX1rM9scsNynZzbOe4KhDeYcTNS3PDaeY=";
inline constexpr const char* kDocAuth      = "1Ct943GAT+6YQUUX47Ia/ncufilbe6+oD6lY+5kaCu4=";

inline nlohmann::json obsHello(bool withAuth = false, int rpcVersion = 1) {
    nlohmann::json d{
        {"obsWebSocketVersion", "5.4.2"},
        {"rpcVersion", rpcVersion},
    };
    if (withAuth) {
        d["authentication"] = {{"challenge", kDocChallenge}, {"salt", kDocSalt}};
    }
    return {{"op", 0}, {"d", d}};
}

inline nlohmann::json obsIdentified(int rpcVersion = 1) {
    return {{"op", 2}, {"d", {{"negotiatedRpcVersion", rpcVersion}}}};
}

inline nlohmann::json obsStreamStateChanged(bool outputActive, const std::string& outputState) {
    return {
        {"op", 5},
        {"d", {
            {"eventType", "StreamStateChanged"},
            {"eventIntent", 64},
            {"eventData", {{"outputActive", outputActive}, {"outputState", outputState}}},
        }},
    };
}

inline nlohmann::json obsEvent(const std::string& eventType, nlohmann::json eventData = nlohmann::json::object()) {
    return {{"op", 5}, {"d", {{"eventType", eventType}, {"eventIntent", 1}, {"eventData", std::move(eventData)}}}};
}

inline nlohmann::json obsResponse(const std::string& requestId,
                                  const std::string& requestType,
                                  bool result = true,
                                  int code = 100,
                                  nlohmann::json responseData = nullptr,
                                  std::optional<std::string> comment = std::nullopt) {
    nlohmann::json status{{"result", result}, {"code", code}};
    if (comment) status["comment"] = *comment;
    nlohmann::json d{
        {"requestType", requestType},
        {"requestId", requestId},
        {"requestStatus", status},
    };
    if (!responseData.is_null()) d["responseData"] = std::move(responseData);
    return {{"op", 7}, {"d", d}};
}

inline nlohmann::json obsStreamStatusData(bool active, bool reconnecting = false, int64_t durationMs = 0) {
    return {
        {"outputActive", active},
        {"outputReconnecting", reconnecting},
        {"outputTimecode", "00:00:42.000"},
        {"outputDuration", durationMs},
        {"outputCongestion", 0.0},
        {"outputBytes", 1048576},
        {"outputSkippedFrames", 3},
        {"outputTotalFrames", 2520},
    };
}

} // namespace fixtures
