/*
Streamweave — DaemonConfig
Role: Loads and validates streamweaved settings from a JSON file plus environment overrides.
Inputs/Outputs: Reads config.json (optional) and STREAMWEAVE_OBS_* variables; produces a DaemonConfig value.
Threading: All functions execute on the calling thread.
Integration: Consumed once at daemon start-up; feeds ObsControlClient, StreamMatcher and the log level.
Related: DaemonConfig.cpp, apps/streamweaved/main.cpp.
Assumptions: A missing file is not an error; a malformed or out-of-range one is.
*/
#pragma once
#include <chrono>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <nlohmann/json.hpp>
#include "Log.hpp"

class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct DaemonConfig {
    struct Obs {
        std::string                host{"localhost"};
        uint16_t                   port{4455};
        std::optional<std::string> password;
        std::chrono::milliseconds  requestTimeout{30000};
        std::chrono::milliseconds  connectTimeout{10000};
        uint32_t                   eventSubscriptions{64};
    } obs;

    struct Matcher {
        double threshold{0.85};
    } matcher;

    struct Logging {
        Streamweave::Log::Level level{Streamweave::Log::Level::INFO};
    } logging;

    struct Reconnect {
        std::chrono::milliseconds initialBackoff{1000};
        std::chrono::milliseconds maxBackoff{60000};
    } reconnect;

    /// Parse a config document. Unknown keys are ignored; wrong types and out-of-range values throw ConfigError.
    static DaemonConfig fromJson(const nlohmann::json& j);

    /// Load `path` (defaults when it does not exist), then apply environment overrides.
    static DaemonConfig load(const std::string& path);

    /// Apply STREAMWEAVE_OBS_HOST / _PORT / _PASSWORD on top of the current values.
    void applyEnvironment();

    /// $XDG_CONFIG_HOME/streamweave/config.json, else ~/.config/streamweave/config.json.
    static std::string defaultPath();
};

[[nodiscard]] Streamweave::Log::Level parseLogLevel(const std::string& name);
