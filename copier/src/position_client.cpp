#include "position_client.hpp"
#include "util.hpp"
#include <cpr/cpr.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <chrono>
#include <thread>

namespace {

constexpr double kBaseBackoffSeconds = 1.0;
constexpr double kMaxBackoffSeconds = 8.0;

} // namespace

class PositionClient::Impl {
public:
    explicit Impl(const Config& config)
        : base_url_(config.data_api_url),
          timeout_ms_(config.request_timeout_ms),
          max_attempts_(std::max(1, config.network_retry_limit)) {
        while (!base_url_.empty() && base_url_.back() == '/') {
            base_url_.pop_back();
        }
    }

    std::optional<std::vector<Position>> fetch_positions(const std::string& address) {
        auto url = base_url_ + "/positions";

        auto response = make_request_with_backoff([&]() {
            return cpr::Get(
                cpr::Url{url},
                cpr::Parameters{{"user", address}},
                cpr::Timeout{timeout_ms_},
                cpr::Header{{"User-Agent", "polycopy/1.0"}, {"Accept", "application/json"}}
            );
        });

        if (response.error) {
            spdlog::error("Failed to fetch positions for {}: {}",
                          util::format_address(address), response.error.message);
            return std::nullopt;
        }

        if (response.status_code != 200) {
            spdlog::error("Failed to fetch positions for {}, status: {}",
                          util::format_address(address), response.status_code);
            return std::nullopt;
        }

        try {
            auto json_res = nlohmann::json::parse(response.text);
            auto positions = positions_from_json(json_res);
            spdlog::debug("Fetched {} positions for {}", positions.size(), util::format_address(address));
            return positions;
        } catch (const std::exception& e) {
            spdlog::error("Malformed positions response for {}: {}", util::format_address(address), e.what());
            return std::nullopt;
        }
    }

private:
    template <typename RequestFunc>
    cpr::Response make_request_with_backoff(RequestFunc request_func) {
        double backoff_seconds = kBaseBackoffSeconds;
        int attempts = 0;

        while (true) {
            auto response = request_func();
            ++attempts;

            if (!response.error && response.status_code >= 200 && response.status_code < 300) {
                return response;
            }

            int status = response.error ? 0 : static_cast<int>(response.status_code);
            if (!util::should_retry_request(status, attempts, max_attempts_)) {
                return response;
            }

            double sleep_seconds = util::random_jitter(backoff_seconds, 0.3);
            spdlog::debug("Position request failed (status {}), backing off for {:.2f} seconds (attempt {}/{})",
                          status, sleep_seconds, attempts, max_attempts_);
            std::this_thread::sleep_for(std::chrono::milliseconds(static_cast<int>(sleep_seconds * 1000)));

            backoff_seconds = std::min(backoff_seconds * 2.0, kMaxBackoffSeconds);
        }
    }

    std::string base_url_;
    int timeout_ms_;
    int max_attempts_;
};

// Public interface implementation
PositionClient::PositionClient(const Config& config)
    : pImpl_(std::make_unique<Impl>(config)) {}

PositionClient::~PositionClient() = default;

std::optional<std::vector<Position>> PositionClient::fetch_positions(const std::string& address) {
    return pImpl_->fetch_positions(address);
}
