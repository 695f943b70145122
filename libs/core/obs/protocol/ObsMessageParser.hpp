#pragma once
#include <nlohmann/json.hpp>
#include "ObsTypes.hpp"

// Pure JSON -> frame parsing. Every function throws ProtocolError on malformed input.
namespace ObsMessageParser {

[[nodiscard]] ObsFrame parse(const nlohmann::json& frame);
[[nodiscard]] ObsFrame parse(const std::string& payload);

[[nodiscard]] StreamStateChangedEvent parseStreamStateChanged(const nlohmann::json& eventData);
[[nodiscard]] ObsStreamStatus parseStreamStatus(const nlohmann::json& responseData);

} // namespace ObsMessageParser
