/*
Streamweave — BeastWsTransport
Role: Boost.Beast websocket client over plain TCP for the local obs-websocket server.
Inputs/Outputs: connect(host, port, target) -> onStatus(true) after the upgrade; text frames -> onMessage; failures -> onError then onStatus(false).
Threading: All socket work runs on an internal strand. Callbacks are invoked on that strand.
Integration: Owned by ObsControlClient through the WsTransport interface.
Related: WsTransport.hpp, ObsControlClient.hpp.
Assumptions: obs-websocket listens without TLS; the "obswebsocket.json" subprotocol is requested on upgrade.
*/
#pragma once
#include "WsTransport.hpp"
#include <boost/beast/websocket.hpp>
#include <boost/asio/strand.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <cstdint>
#include <deque>
#include <memory>
#include <string>

namespace beast = boost::beast;
namespace websocket = beast::websocket;
namespace net = boost::asio;
using tcp = net::ip::tcp;

class BeastWsTransport : public WsTransport {
public:
    explicit BeastWsTransport(net::io_context& ioc)
        : strand_(net::make_strand(ioc))
        , resolver_(strand_)
        , pingTimer_(strand_)
    {}
    ~BeastWsTransport() override;

    void connect(std::string host, std::string port, std::string target) override;
    void close() override;
    void send(std::string msg) override;

    // Applied on the strand, in order with connect()/close()
    void onMessage(MessageCb cb) override;
    void onStatus(StatusCb cb) override;
    void onError(ErrorCb cb) override;

    static constexpr const char* kSubprotocol = "obswebsocket.json";

private:
    using Stream = websocket::stream<beast::tcp_stream>;

    // Callbacks
    MessageCb onMessage_;
    StatusCb  onStatus_;
    ErrorCb   onError_;

    // Beast state
    net::strand<net::io_context::executor_type> strand_;
    tcp::resolver resolver_;
    std::shared_ptr<Stream> ws_;      // recreated per session; handlers keep their own alive
    beast::flat_buffer buf_;
    net::steady_timer pingTimer_;
    std::deque<std::string> writeQueue_;

    // State
    std::string host_;
    std::string port_;
    std::string target_;
    uint64_t session_{0};
    bool open_{false};
    bool writing_{false};
    bool closedReported_{true};

    // Handlers
    void onResolve(uint64_t session, beast::error_code ec, tcp::resolver::results_type results);
    void onConnect(uint64_t session, beast::error_code ec);
    void onWsHandshake(uint64_t session, beast::error_code ec);
    void doRead(uint64_t session);
    void onRead(uint64_t session, beast::error_code ec, std::size_t bytes);
    void doWrite(uint64_t session);
    void schedulePing(uint64_t session);
    void fail(uint64_t session, const std::string& what);
    void reportClosed();
};
