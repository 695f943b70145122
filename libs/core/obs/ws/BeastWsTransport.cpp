#include "BeastWsTransport.hpp"
#include "Log.hpp"
#include <boost/beast/core.hpp>
#include <boost/beast/http/field.hpp>
#include <chrono>

BeastWsTransport::~BeastWsTransport() {
    // Outstanding handlers capture `this`; the owner stops the io_context first.
    onMessage_ = nullptr;
    onStatus_ = nullptr;
    onError_ = nullptr;
}

void BeastWsTransport::onMessage(MessageCb cb) {
    net::post(strand_, [this, cb = std::move(cb)]() mutable { onMessage_ = std::move(cb); });
}

void BeastWsTransport::onStatus(StatusCb cb) {
    net::post(strand_, [this, cb = std::move(cb)]() mutable { onStatus_ = std::move(cb); });
}

void BeastWsTransport::onError(ErrorCb cb) {
    net::post(strand_, [this, cb = std::move(cb)]() mutable { onError_ = std::move(cb); });
}

void BeastWsTransport::connect(std::string host, std::string port, std::string target) {
    net::post(strand_, [this, h = std::move(host), p = std::move(port), t = std::move(target)]() mutable {
        const uint64_t session = ++session_;
        host_ = std::move(h);
        port_ = std::move(p);
        target_ = std::move(t);

        beast::error_code ignored;
        if (ws_ && beast::get_lowest_layer(*ws_).socket().is_open()) {
            beast::get_lowest_layer(*ws_).socket().close(ignored);
        }
        pingTimer_.cancel();
        writeQueue_.clear();
        writing_ = false;
        buf_.consume(buf_.size());
        ws_ = std::make_shared<Stream>(strand_);
        open_ = false;
        closedReported_ = false;

        LOG_D("obs", "transport: resolving {}:{}", host_, port_);
        resolver_.async_resolve(host_, port_,
            [this, session](beast::error_code ec, tcp::resolver::results_type results){
                onResolve(session, ec, results);
            });
    });
}

void BeastWsTransport::close() {
    net::post(strand_, [this]{
        const uint64_t session = session_;
        pingTimer_.cancel();
        resolver_.cancel();
        if (ws_ && open_) {
            open_ = false;
            ws_->async_close(websocket::close_code::normal, [this, session, keep = ws_](beast::error_code ec){
                if (session != session_) return;
                if (ec && ec != net::error::operation_aborted) {
                    LOG_D("obs", "transport: close error {}", ec.message());
                }
                reportClosed();
            });
        } else {
            if (ws_) {
                beast::error_code ignored;
                beast::get_lowest_layer(*ws_).socket().close(ignored);
            }
            // Deferred so a connect() queued behind this close supersedes the report.
            net::post(strand_, [this, session]{
                if (session == session_) reportClosed();
            });
        }
    });
}

void BeastWsTransport::send(std::string msg) {
    net::post(strand_, [this, m = std::move(msg)]() mutable {
        if (!open_) {
            if (onError_) onError_("send on closed websocket");
            return;
        }
        writeQueue_.emplace_back(std::move(m));
        if (!writing_) {
            doWrite(session_);
        }
    });
}

void BeastWsTransport::onResolve(uint64_t session, beast::error_code ec, tcp::resolver::results_type results) {
    if (session != session_) return;
    if (ec) { fail(session, "resolve: " + ec.message()); return; }
    beast::get_lowest_layer(*ws_).expires_after(std::chrono::seconds(30));
    beast::get_lowest_layer(*ws_).async_connect(results,
        [this, session, keep = ws_](beast::error_code ec, tcp::resolver::results_type::endpoint_type){
            onConnect(session, ec);
        });
}

void BeastWsTransport::onConnect(uint64_t session, beast::error_code ec) {
    if (session != session_) return;
    if (ec) { fail(session, "connect: " + ec.message()); return; }
    beast::get_lowest_layer(*ws_).expires_never();
    ws_->set_option(websocket::stream_base::timeout::suggested(beast::role_type::client));
    ws_->set_option(websocket::stream_base::decorator([](websocket::request_type& req){
        req.set(beast::http::field::sec_websocket_protocol, kSubprotocol);
        req.set(beast::http::field::user_agent, "streamweaved");
    }));
    ws_->text(true);
    ws_->async_handshake(host_ + ":" + port_, target_,
        [this, session, keep = ws_](beast::error_code ec){ onWsHandshake(session, ec); });
}

void BeastWsTransport::onWsHandshake(uint64_t session, beast::error_code ec) {
    if (session != session_) return;
    if (ec) { fail(session, "handshake: " + ec.message()); return; }
    open_ = true;
    LOG_D("obs", "transport: websocket open");
    if (onStatus_) onStatus_(true);
    doRead(session);
    schedulePing(session);
}

void BeastWsTransport::doRead(uint64_t session) {
    ws_->async_read(buf_, [this, session, keep = ws_](beast::error_code ec, std::size_t bytes){ onRead(session, ec, bytes); });
}

void BeastWsTransport::onRead(uint64_t session, beast::error_code ec, std::size_t) {
    if (session != session_) return;
    if (ec) {
        if (ec == websocket::error::closed) {
            open_ = false;
            pingTimer_.cancel();
            reportClosed();
        } else {
            fail(session, "read: " + ec.message());
        }
        return;
    }

    auto b = buf_.data();
    std::string payload(static_cast<const char*>(b.data()), b.size());
    buf_.consume(buf_.size());
    if (onMessage_) onMessage_(std::move(payload));

    doRead(session);
}

void BeastWsTransport::doWrite(uint64_t session) {
    if (writeQueue_.empty() || !ws_ || !open_) { writing_ = false; return; }
    writing_ = true;
    // The frame owns its bytes until the write completes, even if the queue is cleared.
    auto frame = std::make_shared<std::string>(std::move(writeQueue_.front()));
    writeQueue_.pop_front();
    ws_->async_write(net::buffer(*frame), [this, session, keep = ws_, frame](beast::error_code ec, std::size_t){
        if (session != session_) return;
        writing_ = false;
        if (ec) { fail(session, "write: " + ec.message()); return; }
        doWrite(session);
    });
}

void BeastWsTransport::schedulePing(uint64_t session) {
    pingTimer_.expires_after(std::chrono::seconds(25));
    pingTimer_.async_wait([this, session](beast::error_code ec){
        if (ec || session != session_ || !open_) return;
        ws_->async_ping({}, [this, session, keep = ws_](beast::error_code ec2){
            if (session != session_) return;
            if (ec2) { fail(session, "ping: " + ec2.message()); return; }
            schedulePing(session);
        });
    });
}

void BeastWsTransport::fail(uint64_t session, const std::string& what) {
    if (session != session_) return;
    LOG_W("obs", "transport: {}", what);
    open_ = false;
    pingTimer_.cancel();
    writeQueue_.clear();
    if (ws_) {
        beast::error_code ignored;
        beast::get_lowest_layer(*ws_).socket().close(ignored);
    }
    if (onError_) onError_(what);
    reportClosed();
}

void BeastWsTransport::reportClosed() {
    if (closedReported_) return;
    closedReported_ = true;
    if (onStatus_) onStatus_(false);
}
