
#pragma once
#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace util {

// Environment variable helpers
std::string get_env_var(const std::string& name, const std::string& default_value = "");
std::string get_required_env_var(const std::string& name);
bool has_env_var(const std::string& name);

// String utilities
std::vector<std::string> split_string(const std::string& str, char delimiter);
std::string trim(const std::string& str);
std::string to_lower(const std::string& str);
std::string to_upper(const std::string& str);
bool starts_with(const std::string& str, const std::string& prefix);
bool ends_with(const std::string& str, const std::string& suffix);
bool iequals(const std::string& a, const std::string& b);

// Time utilities
std::string current_iso8601();
std::string format_timestamp(const std::chrono::system_clock::time_point& tp);
int64_t now_millis();

// Epoch values above 1e12 are taken as milliseconds, anything else as seconds.
int64_t normalize_epoch_millis(int64_t epoch);

// Validation utilities
bool is_valid_evm_address(const std::string& address);
std::string strip_hex_prefix(const std::string& hex);

// Short form used in log lines: 0x1234…abcd
std::string format_address(const std::string& address);

// URL utilities
struct ParsedUrl {
    std::string scheme; // lowercase, e.g. "https", "wss"
    std::string host;
    std::string port;   // defaulted from the scheme when absent
    std::string target; // path and query, at least "/"

    bool is_tls() const { return scheme == "https" || scheme == "wss"; }
};

// Throws std::invalid_argument on a URL without scheme or host.
ParsedUrl parse_url(const std::string& url);

// Random utilities
double random_jitter(double base_value, double jitter_factor = 0.1);

// Network utilities
bool is_network_error(int http_status);
bool should_retry_request(int http_status, int attempt_count, int max_attempts);

} // namespace util
