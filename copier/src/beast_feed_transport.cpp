#include "beast_feed_transport.hpp"
#include "util.hpp"
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/beast/websocket/ssl.hpp>
#include <openssl/ssl.h>
#include <spdlog/spdlog.h>
#include <stdexcept>
#include <string>
#include <utility>

namespace asio      = boost::asio;
namespace ssl       = asio::ssl;
namespace beast     = boost::beast;
namespace websocket = beast::websocket;
using tcp           = asio::ip::tcp;

namespace {

constexpr auto kCloseTimeout = std::chrono::seconds(2);
constexpr auto kDrainTimeout = std::chrono::milliseconds(100);
// Slack on top of the stream's own deadline before the io_context is abandoned
constexpr auto kDeadlineSlack = std::chrono::milliseconds(500);
const char* kUserAgent = "polycopy/1.0";

} // namespace

class BeastFeedTransport::Impl {
    using TlsStream = websocket::stream<beast::ssl_stream<beast::tcp_stream>>;
    using PlainStream = websocket::stream<beast::tcp_stream>;

public:
    Impl(std::chrono::milliseconds handshake_timeout, std::chrono::milliseconds idle_timeout)
        : ssl_ctx_(ssl::context::tls_client),
          resolver_(ioc_),
          handshake_timeout_(handshake_timeout),
          idle_timeout_(idle_timeout) {
        ssl_ctx_.set_default_verify_paths();
    }

    ~Impl() {
        close();
    }

    void connect(const std::string& url) {
        reset();

        auto parsed = util::parse_url(url);
        if (parsed.scheme != "ws" && parsed.scheme != "wss") {
            throw std::runtime_error("Unsupported feed URL scheme: " + parsed.scheme);
        }

        // Resolve
        tcp::resolver::results_type endpoints;
        begin_op();
        resolver_.async_resolve(parsed.host, parsed.port,
                                [this, &endpoints](beast::error_code ec, tcp::resolver::results_type results) {
                                    endpoints = std::move(results);
                                    finish_op(ec);
                                });
        if (!wait_op(handshake_timeout_)) {
            resolver_.cancel();
            drain();
            throw std::runtime_error("Timed out resolving " + parsed.host);
        }
        if (op_ec_) {
            throw std::runtime_error("Failed to resolve " + parsed.host + ": " + op_ec_.message());
        }

        // TCP connect, then TLS when needed
        if (parsed.is_tls()) {
            tls_ws_ = std::make_unique<TlsStream>(ioc_, ssl_ctx_);
            auto& tls = tls_ws_->next_layer();
            connect_tcp(beast::get_lowest_layer(*tls_ws_), endpoints, parsed.host);

            tls.set_verify_mode(ssl::verify_peer);
            tls.set_verify_callback(ssl::host_name_verification(parsed.host));
            // SNI must be set on the native handle before the TLS handshake
            if (!SSL_set_tlsext_host_name(tls.native_handle(), parsed.host.c_str())) {
                throw std::runtime_error("Failed to set SNI host name for " + parsed.host);
            }

            beast::get_lowest_layer(*tls_ws_).expires_after(handshake_timeout_);
            begin_op();
            tls.async_handshake(ssl::stream_base::client, [this](beast::error_code ec) { finish_op(ec); });
            run_bounded("TLS handshake with " + parsed.host);
        } else {
            plain_ws_ = std::make_unique<PlainStream>(ioc_);
            connect_tcp(beast::get_lowest_layer(*plain_ws_), endpoints, parsed.host);
        }

        // WebSocket upgrade. The websocket stream has its own timers from here on,
        // so the TCP deadline is switched off.
        with_stream([&](auto& ws) {
            beast::get_lowest_layer(ws).expires_never();

            auto timeouts = websocket::stream_base::timeout::suggested(beast::role_type::client);
            timeouts.handshake_timeout = handshake_timeout_;
            timeouts.idle_timeout = idle_timeout_;
            timeouts.keep_alive_pings = true;
            ws.set_option(timeouts);

            ws.set_option(websocket::stream_base::decorator(
                [](websocket::request_type& req) {
                    req.set(beast::http::field::user_agent, kUserAgent);
                }));
            ws.text(true);

            begin_op();
            ws.async_handshake(parsed.host, parsed.target, [this](beast::error_code ec) { finish_op(ec); });
        });
        run_bounded("WebSocket handshake with " + parsed.host);
        connected_ = true;

        spdlog::debug("Feed transport connected to {}{} ({})",
                      parsed.host, parsed.target, parsed.is_tls() ? "TLS" : "plain");
    }

    void send_text(const std::string& text) {
        require_open();

        begin_op();
        with_stream([&](auto& ws) {
            ws.async_write(asio::buffer(text), [this](beast::error_code ec, std::size_t) { finish_op(ec); });
        });
        run_bounded("feed write");
    }

    ReadResult read(std::chrono::milliseconds timeout) {
        ReadResult result;
        if (!is_open()) {
            result.status = ReadStatus::Closed;
            result.error = "not connected";
            return result;
        }

        // A read that timed out stays pending and is resumed on the next call,
        // so no frame is lost between polls.
        if (!read_pending_) {
            read_pending_ = true;
            read_done_ = false;
            with_stream([this](auto& ws) {
                ws.async_read(buffer_, [this](beast::error_code ec, std::size_t) {
                    read_ec_ = ec;
                    read_done_ = true;
                });
            });
        }

        ioc_.restart();
        ioc_.run_for(timeout);

        if (!read_done_) {
            result.status = ReadStatus::Timeout;
            return result;
        }

        read_pending_ = false;
        if (read_ec_ == websocket::error::closed) {
            result.status = ReadStatus::Closed;
            auto reason = with_stream([](auto& ws) { return ws.reason(); });
            result.error = "closed by peer (code " + std::to_string(static_cast<int>(reason.code)) + ") " +
                           std::string(reason.reason.data(), reason.reason.size());
            return result;
        }
        if (read_ec_) {
            // beast::error::timeout lands here when the idle peer stopped answering pings
            result.status = ReadStatus::Error;
            result.error = read_ec_.message();
            return result;
        }

        result.status = ReadStatus::Message;
        result.text = beast::buffers_to_string(buffer_.data());
        buffer_.consume(buffer_.size());
        return result;
    }

    void close() {
        if (!connected_ || !is_open()) {
            reset();
            return;
        }

        bool done = false;
        with_stream([&](auto& ws) {
            ws.async_close(websocket::close_code::normal, [&done](beast::error_code ec) {
                if (ec && ec != asio::error::operation_aborted) {
                    spdlog::debug("Feed close handshake ended with: {}", ec.message());
                }
                done = true;
            });
        });

        ioc_.restart();
        ioc_.run_for(kCloseTimeout);
        if (!done) {
            spdlog::debug("Feed close handshake timed out");
        }
        reset();
    }

private:
    template <typename Fn>
    auto with_stream(Fn&& fn) -> decltype(fn(std::declval<PlainStream&>())) {
        if (tls_ws_) {
            return fn(*tls_ws_);
        }
        if (plain_ws_) {
            return fn(*plain_ws_);
        }
        throw std::runtime_error("Feed transport is not connected");
    }

    void connect_tcp(beast::tcp_stream& stream, const tcp::resolver::results_type& endpoints,
                     const std::string& host) {
        stream.expires_after(handshake_timeout_);
        begin_op();
        stream.async_connect(endpoints, [this](beast::error_code ec, const tcp::endpoint&) { finish_op(ec); });
        run_bounded("connect to " + host);
    }

    void begin_op() {
        op_done_ = false;
        op_ec_ = {};
    }

    void finish_op(beast::error_code ec) {
        op_ec_ = ec;
        op_done_ = true;
    }

    bool wait_op(std::chrono::milliseconds timeout) {
        ioc_.restart();
        ioc_.run_for(timeout);
        return op_done_;
    }

    void check_op(const std::string& what) {
        if (op_ec_) {
            throw std::runtime_error(what + " failed: " + op_ec_.message());
        }
    }

    // Runs the pending operation against its deadline. The stream timers normally
    // fire first; the outer bound covers anything they do not govern.
    void run_bounded(const std::string& what) {
        bool finished = wait_op(handshake_timeout_ + kDeadlineSlack);
        if (finished && !op_ec_) {
            return;
        }

        // A failed step leaves the socket closed so later reads report Closed
        drain();
        if (!finished || op_ec_ == beast::error::timeout) {
            throw std::runtime_error(what + " timed out after " +
                                     std::to_string(handshake_timeout_.count()) + "ms");
        }
        check_op(what);
    }

    // Aborts whatever is in flight and lets the handlers run to completion
    void drain() {
        close_socket();
        ioc_.restart();
        ioc_.run_for(kDrainTimeout);
    }

    void close_socket() {
        beast::error_code ignored;
        if (tls_ws_) {
            beast::get_lowest_layer(*tls_ws_).socket().close(ignored);
        }
        if (plain_ws_) {
            beast::get_lowest_layer(*plain_ws_).socket().close(ignored);
        }
    }

    bool is_open() const {
        return (tls_ws_ && tls_ws_->is_open()) || (plain_ws_ && plain_ws_->is_open());
    }

    void require_open() const {
        if (!is_open()) {
            throw std::runtime_error("Feed transport is not connected");
        }
    }

    void reset() {
        if (read_pending_ || is_open()) {
            drain();
        }
        ioc_.stop();
        tls_ws_.reset();
        plain_ws_.reset();
        connected_ = false;
        read_pending_ = false;
        read_done_ = false;
        buffer_.consume(buffer_.size());
    }

    asio::io_context ioc_;
    ssl::context ssl_ctx_;
    tcp::resolver resolver_;
    std::chrono::milliseconds handshake_timeout_;
    std::chrono::milliseconds idle_timeout_;

    std::unique_ptr<TlsStream> tls_ws_;
    std::unique_ptr<PlainStream> plain_ws_;
    beast::flat_buffer buffer_;
    bool connected_ = false;

    // State of the one in-flight connect/handshake/write
    bool op_done_ = false;
    beast::error_code op_ec_;

    bool read_pending_ = false;
    bool read_done_ = false;
    beast::error_code read_ec_;
};

// Public interface implementation
BeastFeedTransport::BeastFeedTransport(std::chrono::milliseconds handshake_timeout,
                                       std::chrono::milliseconds idle_timeout)
    : pImpl_(std::make_unique<Impl>(handshake_timeout, idle_timeout)) {}

BeastFeedTransport::~BeastFeedTransport() = default;

void BeastFeedTransport::connect(const std::string& url) {
    pImpl_->connect(url);
}

void BeastFeedTransport::send_text(const std::string& text) {
    pImpl_->send_text(text);
}

ReadResult BeastFeedTransport::read(std::chrono::milliseconds timeout) {
    return pImpl_->read(timeout);
}

void BeastFeedTransport::close() {
    pImpl_->close();
}
