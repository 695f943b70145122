#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include "ObsTypes.hpp"
#include "util/Ids.hpp"

// Deterministic construction of client -> server frames.
namespace ObsFrameBuilder {

inline nlohmann::json identify(int rpcVersion,
                               const std::optional<std::string>& authentication,
                               uint32_t eventSubscriptions) {
    nlohmann::json d;
    d["rpcVersion"] = rpcVersion;
    if (authentication) d["authentication"] = *authentication;
    d["eventSubscriptions"] = eventSubscriptions;

    nlohmann::json msg;
    msg["op"] = static_cast<int>(OpCode::Identify);
    msg["d"] = std::move(d);
    return msg;
}

inline nlohmann::json request(const ObsRequest& req) {
    nlohmann::json d;
    d["requestType"] = req.requestType;
    d["requestId"] = req.requestId;
    if (!req.requestData.is_null()) d["requestData"] = req.requestData;

    nlohmann::json msg;
    msg["op"] = static_cast<int>(OpCode::Request);
    msg["d"] = std::move(d);
    return msg;
}

} // namespace ObsFrameBuilder

/// Request with a fresh "<type>-<uuid>" id.
inline ObsRequest makeRequest(std::string requestType, nlohmann::json requestData = nullptr) {
    ObsRequest req;
    req.requestId   = requestType + "-" + generateUuid();
    req.requestType = std::move(requestType);
    req.requestData = std::move(requestData);
    return req;
}
