#include "ObsMessageParser.hpp"
#include "obs/ObsErrors.hpp"
#include <fmt/format.h>

namespace {

const nlohmann::json& requireObject(const nlohmann::json& j, const char* key, const char* context) {
    if (!j.contains(key) || !j.at(key).is_object()) {
        throw ProtocolError(fmt::format("{}: missing object '{}'", context, key));
    }
    return j.at(key);
}

std::string requireString(const nlohmann::json& j, const char* key, const char* context) {
    if (!j.contains(key) || !j.at(key).is_string()) {
        throw ProtocolError(fmt::format("{}: missing string '{}'", context, key));
    }
    return j.at(key).get<std::string>();
}

bool requireBool(const nlohmann::json& j, const char* key, const char* context) {
    if (!j.contains(key) || !j.at(key).is_boolean()) {
        throw ProtocolError(fmt::format("{}: missing boolean '{}'", context, key));
    }
    return j.at(key).get<bool>();
}

int requireInt(const nlohmann::json& j, const char* key, const char* context) {
    if (!j.contains(key) || !j.at(key).is_number_integer()) {
        throw ProtocolError(fmt::format("{}: missing integer '{}'", context, key));
    }
    return j.at(key).get<int>();
}

template <class T>
T numberOr(const nlohmann::json& j, const char* key, T fallback) {
    if (!j.contains(key) || !j.at(key).is_number()) return fallback;
    return j.at(key).get<T>();
}

HelloFrame parseHello(const nlohmann::json& d) {
    HelloFrame hello;
    hello.obsWebSocketVersion = d.value("obsWebSocketVersion", "");
    hello.rpcVersion = requireInt(d, "rpcVersion", "Hello");
    if (d.contains("authentication") && d.at("authentication").is_object()) {
        const auto& auth = d.at("authentication");
        hello.authentication = AuthChallenge{
            requireString(auth, "salt", "Hello.authentication"),
            requireString(auth, "challenge", "Hello.authentication"),
        };
    }
    return hello;
}

IdentifiedFrame parseIdentified(const nlohmann::json& d) {
    return IdentifiedFrame{requireInt(d, "negotiatedRpcVersion", "Identified")};
}

EventFrame parseEvent(const nlohmann::json& d) {
    EventFrame event;
    event.eventType   = requireString(d, "eventType", "Event");
    event.eventIntent = numberOr<int>(d, "eventIntent", 0);
    event.eventData   = d.contains("eventData") ? d.at("eventData") : nlohmann::json::object();
    return event;
}

ObsResponse parseResponse(const nlohmann::json& d) {
    ObsResponse response;
    response.requestType = d.value("requestType", "");
    response.requestId   = requireString(d, "requestId", "RequestResponse");
    const auto& status   = requireObject(d, "requestStatus", "RequestResponse");
    response.result      = requireBool(status, "result", "RequestResponse.requestStatus");
    response.code        = requireInt(status, "code", "RequestResponse.requestStatus");
    if (status.contains("comment") && status.at("comment").is_string()) {
        response.comment = status.at("comment").get<std::string>();
    }
    if (d.contains("responseData")) {
        response.responseData = d.at("responseData");
    }
    return response;
}

} // namespace

namespace ObsMessageParser {

ObsFrame parse(const nlohmann::json& frame) {
    if (!frame.is_object()) {
        throw ProtocolError("Frame is not a JSON object");
    }
    const int op = requireInt(frame, "op", "Frame");
    const auto& d = requireObject(frame, "d", "Frame");

    switch (static_cast<OpCode>(op)) {
        case OpCode::Hello:           return parseHello(d);
        case OpCode::Identified:      return parseIdentified(d);
        case OpCode::Event:           return parseEvent(d);
        case OpCode::RequestResponse: return parseResponse(d);
        default:                      return UnknownFrame{op};
    }
}

ObsFrame parse(const std::string& payload) {
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(payload);
    } catch (const nlohmann::json::parse_error& e) {
        throw ProtocolError(std::string("Frame is not valid JSON: ") + e.what());
    }
    return parse(j);
}

StreamStateChangedEvent parseStreamStateChanged(const nlohmann::json& eventData) {
    if (!eventData.is_object()) {
        throw ProtocolError("StreamStateChanged: eventData is not an object");
    }
    StreamStateChangedEvent event;
    event.outputActive = requireBool(eventData, "outputActive", "StreamStateChanged");
    event.outputState  = outputStateFromString(requireString(eventData, "outputState", "StreamStateChanged"));
    return event;
}

ObsStreamStatus parseStreamStatus(const nlohmann::json& responseData) {
    if (!responseData.is_object()) {
        throw ProtocolError("GetStreamStatus: responseData missing");
    }
    ObsStreamStatus status;
    status.active        = requireBool(responseData, "outputActive", "GetStreamStatus");
    status.reconnecting  = responseData.value("outputReconnecting", false);
    status.timecode      = responseData.value("outputTimecode", "");
    status.durationMs    = numberOr<int64_t>(responseData, "outputDuration", 0);
    status.congestion    = numberOr<double>(responseData, "outputCongestion", 0.0);
    status.bytes         = numberOr<int64_t>(responseData, "outputBytes", 0);
    status.skippedFrames = numberOr<int64_t>(responseData, "outputSkippedFrames", 0);
    status.totalFrames   = numberOr<int64_t>(responseData, "outputTotalFrames", 0);
    return status;
}

} // namespace ObsMessageParser
