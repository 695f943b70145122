#include "DaemonConfig.hpp"
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <fmt/format.h>

namespace {

template <class T>
T readNumber(const nlohmann::json& section, const char* key, const char* path, T fallback) {
    if (!section.contains(key) || section.at(key).is_null()) return fallback;
    const auto& v = section.at(key);
    if (!v.is_number()) {
        throw ConfigError(fmt::format("{}.{} must be a number", path, key));
    }
    return v.get<T>();
}

std::string readString(const nlohmann::json& section, const char* key, const char* path, const std::string& fallback) {
    if (!section.contains(key) || section.at(key).is_null()) return fallback;
    const auto& v = section.at(key);
    if (!v.is_string()) {
        throw ConfigError(fmt::format("{}.{} must be a string", path, key));
    }
    return v.get<std::string>();
}

const nlohmann::json& section(const nlohmann::json& root, const char* name) {
    static const nlohmann::json kEmpty = nlohmann::json::object();
    if (!root.contains(name)) return kEmpty;
    const auto& s = root.at(name);
    if (!s.is_object()) {
        throw ConfigError(fmt::format("'{}' must be an object", name));
    }
    return s;
}

uint16_t checkPort(int64_t port) {
    if (port < 1 || port > 65535) {
        throw ConfigError(fmt::format("obs.port out of range: {}", port));
    }
    return static_cast<uint16_t>(port);
}

std::chrono::milliseconds positiveMs(int64_t ms, const char* what) {
    if (ms <= 0) {
        throw ConfigError(fmt::format("{} must be positive, got {}", what, ms));
    }
    return std::chrono::milliseconds(ms);
}

} // namespace

Streamweave::Log::Level parseLogLevel(const std::string& name) {
    using Streamweave::Log::Level;
    if (name == "trace") return Level::TRACE;
    if (name == "debug") return Level::DEBUG;
    if (name == "info")  return Level::INFO;
    if (name == "warn")  return Level::WARN;
    if (name == "error") return Level::ERROR;
    throw ConfigError("logging.level must be one of trace, debug, info, warn, error; got '" + name + "'");
}

DaemonConfig DaemonConfig::fromJson(const nlohmann::json& j) {
    if (!j.is_object()) {
        throw ConfigError("config root must be a JSON object");
    }
    DaemonConfig cfg;

    const auto& obs = section(j, "obs");
    cfg.obs.host = readString(obs, "host", "obs", cfg.obs.host);
    if (cfg.obs.host.empty()) throw ConfigError("obs.host must not be empty");
    cfg.obs.port = checkPort(readNumber<int64_t>(obs, "port", "obs", cfg.obs.port));
    if (obs.contains("password") && !obs.at("password").is_null()) {
        cfg.obs.password = readString(obs, "password", "obs", "");
    }
    cfg.obs.requestTimeout = positiveMs(readNumber<int64_t>(obs, "requestTimeoutMs", "obs", cfg.obs.requestTimeout.count()),
                                        "obs.requestTimeoutMs");
    cfg.obs.connectTimeout = positiveMs(readNumber<int64_t>(obs, "connectTimeoutMs", "obs", cfg.obs.connectTimeout.count()),
                                        "obs.connectTimeoutMs");
    const int64_t subs = readNumber<int64_t>(obs, "eventSubscriptions", "obs", cfg.obs.eventSubscriptions);
    if (subs < 0 || subs > static_cast<int64_t>(UINT32_MAX)) {
        throw ConfigError(fmt::format("obs.eventSubscriptions out of range: {}", subs));
    }
    cfg.obs.eventSubscriptions = static_cast<uint32_t>(subs);

    const auto& matcher = section(j, "matcher");
    cfg.matcher.threshold = readNumber<double>(matcher, "threshold", "matcher", cfg.matcher.threshold);
    if (!(cfg.matcher.threshold > 0.0 && cfg.matcher.threshold <= 1.0)) {
        throw ConfigError(fmt::format("matcher.threshold must be in (0, 1], got {}", cfg.matcher.threshold));
    }

    const auto& logging = section(j, "logging");
    cfg.logging.level = parseLogLevel(readString(logging, "level", "logging", "info"));

    const auto& reconnect = section(j, "reconnect");
    cfg.reconnect.initialBackoff = positiveMs(
        readNumber<int64_t>(reconnect, "initialBackoffMs", "reconnect", cfg.reconnect.initialBackoff.count()),
        "reconnect.initialBackoffMs");
    cfg.reconnect.maxBackoff = positiveMs(
        readNumber<int64_t>(reconnect, "maxBackoffMs", "reconnect", cfg.reconnect.maxBackoff.count()),
        "reconnect.maxBackoffMs");
    if (cfg.reconnect.maxBackoff < cfg.reconnect.initialBackoff) {
        throw ConfigError("reconnect.maxBackoffMs must be >= reconnect.initialBackoffMs");
    }

    return cfg;
}

DaemonConfig DaemonConfig::load(const std::string& path) {
    DaemonConfig cfg;
    std::ifstream file(path);
    if (!file.is_open()) {
        LOG_I("app", "no config at {}; using defaults", path);
    } else {
        nlohmann::json j;
        try {
            file >> j;
        } catch (const nlohmann::json::parse_error& e) {
            throw ConfigError("Failed to parse " + path + ": " + e.what());
        }
        cfg = fromJson(j);
        LOG_I("app", "loaded config from {}", path);
    }
    cfg.applyEnvironment();
    return cfg;
}

void DaemonConfig::applyEnvironment() {
    if (const char* host = std::getenv("STREAMWEAVE_OBS_HOST"); host && *host) {
        obs.host = host;
    }
    if (const char* port = std::getenv("STREAMWEAVE_OBS_PORT"); port && *port) {
        char* end = nullptr;
        const long value = std::strtol(port, &end, 10);
        if (end == port || *end != '\0') {
            throw ConfigError(std::string("STREAMWEAVE_OBS_PORT is not a number: ") + port);
        }
        obs.port = checkPort(value);
    }
    if (const char* password = std::getenv("STREAMWEAVE_OBS_PASSWORD")) {
        obs.password = std::string(password);
    }
}

std::string DaemonConfig::defaultPath() {
    namespace fs = std::filesystem;
    if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg) {
        return (fs::path(xdg) / "streamweave" / "config.json").string();
    }
    if (const char* home = std::getenv("HOME"); home && *home) {
        return (fs::path(home) / ".config" / "streamweave" / "config.json").string();
    }
    return "config.json";
}
