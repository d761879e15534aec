#pragma once
#include "feed_transport.hpp"
#include <chrono>
#include <memory>

// WebSocket transport over Boost.Beast. wss:// URLs go through OpenSSL with SNI
// and peer verification against the system CA store; ws:// is plain TCP.
//
// Every step is bounded: resolve, TCP connect, TLS and WebSocket handshakes and
// writes fail after `handshake_timeout`. Once streaming, the stream pings an idle
// peer and a read fails with an error after `idle_timeout` without traffic.
class BeastFeedTransport : public FeedTransport {
public:
    static constexpr std::chrono::milliseconds kDefaultHandshakeTimeout{10000};
    static constexpr std::chrono::milliseconds kDefaultIdleTimeout{30000};

    explicit BeastFeedTransport(std::chrono::milliseconds handshake_timeout = kDefaultHandshakeTimeout,
                                std::chrono::milliseconds idle_timeout = kDefaultIdleTimeout);
    ~BeastFeedTransport() override;

    void connect(const std::string& url) override;
    void send_text(const std::string& text) override;
    ReadResult read(std::chrono::milliseconds timeout) override;
    void close() override;

    // Non-copyable
    BeastFeedTransport(const BeastFeedTransport&) = delete;
    BeastFeedTransport& operator=(const BeastFeedTransport&) = delete;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl_;
};
