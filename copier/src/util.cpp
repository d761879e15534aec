
#include "util.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <iomanip>
#include <random>
#include <sstream>
#include <stdexcept>

namespace util {

std::string get_env_var(const std::string& name, const std::string& default_value) {
    const char* value = std::getenv(name.c_str());
    return value ? std::string(value) : default_value;
}

std::string get_required_env_var(const std::string& name) {
    const char* value = std::getenv(name.c_str());
    if (!value || trim(value).empty()) {
        throw std::runtime_error("Required environment variable " + name + " is not set");
    }
    return std::string(value);
}

bool has_env_var(const std::string& name) {
    return std::getenv(name.c_str()) != nullptr;
}

std::vector<std::string> split_string(const std::string& str, char delimiter) {
    std::vector<std::string> tokens;
    std::stringstream ss(str);
    std::string token;

    while (std::getline(ss, token, delimiter)) {
        if (!token.empty()) {
            tokens.push_back(token);
        }
    }

    return tokens;
}

std::string trim(const std::string& str) {
    auto start = str.find_first_not_of(" \t\n\r");
    if (start == std::string::npos) return "";

    auto end = str.find_last_not_of(" \t\n\r");
    return str.substr(start, end - start + 1);
}

std::string to_lower(const std::string& str) {
    std::string out = str;
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

std::string to_upper(const std::string& str) {
    std::string out = str;
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return out;
}

bool starts_with(const std::string& str, const std::string& prefix) {
    return str.length() >= prefix.length() &&
           str.compare(0, prefix.length(), prefix) == 0;
}

bool ends_with(const std::string& str, const std::string& suffix) {
    return str.length() >= suffix.length() &&
           str.compare(str.length() - suffix.length(), suffix.length(), suffix) == 0;
}

bool iequals(const std::string& a, const std::string& b) {
    return a.size() == b.size() && to_lower(a) == to_lower(b);
}

std::string current_iso8601() {
    return format_timestamp(std::chrono::system_clock::now());
}

std::string format_timestamp(const std::chrono::system_clock::time_point& tp) {
    auto time_t = std::chrono::system_clock::to_time_t(tp);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        tp.time_since_epoch() % std::chrono::seconds(1)).count();

    std::stringstream ss;
    ss << std::put_time(std::gmtime(&time_t), "%Y-%m-%dT%H:%M:%S");
    ss << '.' << std::setfill('0') << std::setw(3) << ms << 'Z';

    return ss.str();
}

int64_t now_millis() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

int64_t normalize_epoch_millis(int64_t epoch) {
    return epoch > 1000000000000LL ? epoch : epoch * 1000;
}

std::string strip_hex_prefix(const std::string& hex) {
    if (starts_with(hex, "0x") || starts_with(hex, "0X")) {
        return hex.substr(2);
    }
    return hex;
}

bool is_valid_evm_address(const std::string& address) {
    std::string body = strip_hex_prefix(trim(address));
    if (body.length() != 40) {
        return false;
    }
    return std::all_of(body.begin(), body.end(),
                       [](unsigned char c) { return std::isxdigit(c) != 0; });
}

std::string format_address(const std::string& address) {
    if (address.length() <= 10) {
        return address;
    }
    return address.substr(0, 6) + "…" + address.substr(address.length() - 4);
}

ParsedUrl parse_url(const std::string& url) {
    std::string trimmed = trim(url);
    auto scheme_end = trimmed.find("://");
    if (scheme_end == std::string::npos || scheme_end == 0) {
        throw std::invalid_argument("URL has no scheme: " + url);
    }

    ParsedUrl parsed;
    parsed.scheme = to_lower(trimmed.substr(0, scheme_end));
    std::string rest = trimmed.substr(scheme_end + 3);

    auto path_start = rest.find_first_of("/?");
    std::string authority = rest.substr(0, path_start);
    parsed.target = path_start == std::string::npos ? "/" : rest.substr(path_start);
    if (starts_with(parsed.target, "?")) {
        parsed.target = "/" + parsed.target;
    }

    auto colon = authority.rfind(':');
    if (colon != std::string::npos) {
        parsed.host = authority.substr(0, colon);
        parsed.port = authority.substr(colon + 1);
    } else {
        parsed.host = authority;
        parsed.port = parsed.is_tls() ? "443" : "80";
    }

    if (parsed.host.empty()) {
        throw std::invalid_argument("URL has no host: " + url);
    }
    return parsed;
}

double random_jitter(double base_value, double jitter_factor) {
    static thread_local std::mt19937 gen(std::random_device{}());
    std::uniform_real_distribution<> dis(-jitter_factor, jitter_factor);

    double jitter = dis(gen);
    return base_value * (1.0 + jitter);
}

bool is_network_error(int http_status) {
    return http_status == 0 ||   // Connection failed
           http_status == 408 || // Request timeout
           http_status == 429 || // Too many requests
           http_status == 502 || // Bad gateway
           http_status == 503 || // Service unavailable
           http_status == 504;   // Gateway timeout
}

bool should_retry_request(int http_status, int attempt_count, int max_attempts) {
    if (attempt_count >= max_attempts) return false;

    return is_network_error(http_status) ||
           (http_status >= 500 && http_status < 600);
}

} // namespace util
