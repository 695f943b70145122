/*
Streamweave — streamweaved
Role: Headless daemon: watches the local obs-websocket server and records canonical stream sessions.
Inputs/Outputs: Optional config path argument; logs to stderr.
Threading: Single io_context thread; every component's strand runs on it.
Integration: BeastWsTransport -> ObsControlClient -> ObsStreamDetector -> InMemoryStreamService; StreamMatcher's overlap metric audits a session's platform records when it ends.
Related: config/DaemonConfig.hpp, obs/ObsStreamDetector.hpp.
*/
#include <csignal>
#include <exception>
#include <memory>
#include <random>
#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/asio/steady_timer.hpp>
#include "Log.hpp"
#include "config/DaemonConfig.hpp"
#include "matcher/StreamMatcher.hpp"
#include "obs/ObsControlClient.hpp"
#include "obs/ObsErrors.hpp"
#include "obs/ObsStreamDetector.hpp"
#include "obs/ws/BeastWsTransport.hpp"
#include "stream/InMemoryStreamService.hpp"
#include "util/TimeUtils.hpp"

namespace {

// Exponential backoff with full jitter, reset after every successful identify.
class Reconnector {
public:
    Reconnector(net::io_context& ioc, IObsClient& client, ConnectOptions target, const DaemonConfig::Reconnect& cfg)
        : m_timer(ioc)
        , m_client(client)
        , m_target(std::move(target))
        , m_initial(cfg.initialBackoff)
        , m_max(cfg.maxBackoff)
        , m_next(cfg.initialBackoff)
        , m_rng(std::random_device{}())
    {}

    void connectNow() {
        if (m_stopping) return;
        m_client.connect(m_target, [this](std::exception_ptr err) {
            if (!err) {
                m_next = m_initial;
                return;
            }
            try {
                std::rethrow_exception(err);
            } catch (const AuthenticationError& e) {
                LOG_E("app", "obs authentication failed: {}", e.what());
            } catch (const std::exception& e) {
                LOG_W("app", "obs connect failed: {}", e.what());
            }
            scheduleRetry();
        });
    }

    void scheduleRetry() {
        if (m_stopping) return;
        std::uniform_int_distribution<int64_t> jitter(0, m_next.count());
        const auto delay = std::chrono::milliseconds(m_next.count() / 2 + jitter(m_rng) / 2);
        m_next = std::min(m_next * 2, m_max);
        LOG_I("app", "reconnecting to obs in {} ms", delay.count());
        m_timer.expires_after(delay);
        m_timer.async_wait([this](const boost::system::error_code& ec) {
            if (ec) return;
            connectNow();
        });
    }

    void stop() {
        m_stopping = true;
        m_timer.cancel();
    }

private:
    net::steady_timer         m_timer;
    IObsClient&               m_client;
    ConnectOptions            m_target;
    std::chrono::milliseconds m_initial;
    std::chrono::milliseconds m_max;
    std::chrono::milliseconds m_next;
    std::mt19937_64           m_rng;
    bool                      m_stopping{false};
};

} // namespace

int main(int argc, char** argv) {
    const std::string configPath = argc > 1 ? argv[1] : DaemonConfig::defaultPath();

    DaemonConfig cfg;
    try {
        cfg = DaemonConfig::load(configPath);
    } catch (const ConfigError& e) {
        LOG_E("app", "invalid configuration: {}", e.what());
        return 2;
    }
    Streamweave::Log::setLevel(cfg.logging.level);

    net::io_context ioc;

    ObsClientOptions clientOptions;
    clientOptions.requestTimeout = cfg.obs.requestTimeout;
    clientOptions.connectTimeout = cfg.obs.connectTimeout;
    clientOptions.eventSubscriptions = cfg.obs.eventSubscriptions;
    ObsControlClient client(ioc, std::make_unique<BeastWsTransport>(ioc), clientOptions);

    InMemoryStreamService store;
    StreamMatcher matcher(MatcherOptions{cfg.matcher.threshold});

    DetectorCallbacks callbacks;
    callbacks.onStreamStarting = [] { LOG_I("app", "obs output starting"); };
    callbacks.onStreamStart = [](const std::shared_ptr<Stream>& stream) {
        LOG_I("app", "stream {} live since {}", stream->getCommonId(), TimeUtils::formatIso8601(stream->getObsStartTime()));
    };
    callbacks.onStreamStopping = [] { LOG_I("app", "obs output stopping"); };
    callbacks.onStreamStop = [&](const std::shared_ptr<Stream>& stream, TimePoint endTime) {
        LOG_I("app", "stream {} ended at {}", stream->getCommonId(), TimeUtils::formatIso8601(endTime));
        const DateRange session{stream->getObsStartTime(), endTime};
        stream->invalidateCache();
        for (const auto& [platform, adapter] : stream->getPlatforms()) {
            const PlatformStream data = adapter->toStorage();
            const double overlap = matcher.calculateOverlapPercent(
                session, DateRange{startTimeOf(data), endTimeOf(data).value_or(endTime)});
            if (overlap < matcher.threshold()) {
                LOG_W("app", "stream {}: {} record overlaps only {:.0f}%", stream->getCommonId(), toString(platform), overlap * 100);
            }
        }
    };
    callbacks.onStreamReconnecting = [] { LOG_W("app", "obs output reconnecting"); };
    callbacks.onStreamReconnected = [] { LOG_I("app", "obs output reconnected"); };

    ObsStreamDetector detector(client, store, callbacks);

    ConnectOptions target;
    target.host = cfg.obs.host;
    target.port = cfg.obs.port;
    target.password = cfg.obs.password;

    Reconnector reconnector(ioc, client, target, cfg.reconnect);
    client.onDisconnected([&reconnector] { reconnector.scheduleRetry(); });

    net::signal_set signals(ioc, SIGINT, SIGTERM);
    signals.async_wait([&](const boost::system::error_code& ec, int signo) {
        if (ec) return;
        LOG_I("app", "signal {} received; shutting down", signo);
        reconnector.stop();
        client.disconnect();
        // Let the close frame go out before stopping the loop.
        auto grace = std::make_shared<net::steady_timer>(ioc, std::chrono::milliseconds(250));
        grace->async_wait([&ioc, grace](const boost::system::error_code&) { ioc.stop(); });
    });

    LOG_I("app", "streamweaved starting; obs at {}:{}", target.host, target.port);
    reconnector.connectNow();
    ioc.run();

    const auto status = detector.getStatus();
    LOG_I("app", "stopped in state {}; {} streams recorded", toString(status.state), store.streamCount());
    return 0;
}
