#pragma once
#include <chrono>
#include <functional>
#include <memory>
#include <string>

enum class ReadStatus {
    Message,
    Timeout,
    Closed,
    Error
};

struct ReadResult {
    ReadStatus status = ReadStatus::Timeout;
    std::string text;  // frame payload when status == Message
    std::string error; // reason when status == Closed or Error
};

// One streaming connection. Instances are single-use: the monitor creates a
// fresh one for each connection attempt.
class FeedTransport {
public:
    virtual ~FeedTransport() = default;

    // Throws std::runtime_error when the connection cannot be established.
    virtual void connect(const std::string& url) = 0;

    // Throws std::runtime_error on a write failure.
    virtual void send_text(const std::string& text) = 0;

    // Waits at most `timeout` for the next text frame.
    virtual ReadResult read(std::chrono::milliseconds timeout) = 0;

    virtual void close() = 0;
};

using FeedTransportFactory = std::function<std::unique_ptr<FeedTransport>()>;
