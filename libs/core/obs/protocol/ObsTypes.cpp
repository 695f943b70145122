#include "ObsTypes.hpp"

ObsOutputState outputStateFromString(std::string_view value) {
    if (value == "OBS_WEBSOCKET_OUTPUT_STARTING")     return ObsOutputState::Starting;
    if (value == "OBS_WEBSOCKET_OUTPUT_STARTED")      return ObsOutputState::Started;
    if (value == "OBS_WEBSOCKET_OUTPUT_STOPPING")     return ObsOutputState::Stopping;
    if (value == "OBS_WEBSOCKET_OUTPUT_STOPPED")      return ObsOutputState::Stopped;
    if (value == "OBS_WEBSOCKET_OUTPUT_RECONNECTING") return ObsOutputState::Reconnecting;
    if (value == "OBS_WEBSOCKET_OUTPUT_RECONNECTED")  return ObsOutputState::Reconnected;
    if (value == "OBS_WEBSOCKET_OUTPUT_PAUSED")       return ObsOutputState::Paused;
    if (value == "OBS_WEBSOCKET_OUTPUT_RESUMED")      return ObsOutputState::Resumed;
    return ObsOutputState::Unknown;
}

const char* toString(ObsOutputState state) {
    switch (state) {
        case ObsOutputState::Starting:     return "OBS_WEBSOCKET_OUTPUT_STARTING";
        case ObsOutputState::Started:      return "OBS_WEBSOCKET_OUTPUT_STARTED";
        case ObsOutputState::Stopping:     return "OBS_WEBSOCKET_OUTPUT_STOPPING";
        case ObsOutputState::Stopped:      return "OBS_WEBSOCKET_OUTPUT_STOPPED";
        case ObsOutputState::Reconnecting: return "OBS_WEBSOCKET_OUTPUT_RECONNECTING";
        case ObsOutputState::Reconnected:  return "OBS_WEBSOCKET_OUTPUT_RECONNECTED";
        case ObsOutputState::Paused:       return "OBS_WEBSOCKET_OUTPUT_PAUSED";
        case ObsOutputState::Resumed:      return "OBS_WEBSOCKET_OUTPUT_RESUMED";
        default:                           return "OBS_WEBSOCKET_OUTPUT_UNKNOWN";
    }
}
