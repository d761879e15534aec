#include "test_macros.hpp"
#include "../copier/src/copier_service.hpp"

#include <spdlog/sinks/ostream_sink.h>
#include <spdlog/spdlog.h>
#include <memory>
#include <sstream>
#include <string>

namespace {

Config make_config() {
    Config config;
    config.service_name = "copier-under-test";
    config.user_addresses = {"0x1111111111111111111111111111111111111111"};
    config.proxy_wallet = "0x9999999999999999999999999999999999999999";
    config.rpc_url = "http://127.0.0.1:1";
    config.usdc_contract_address = "0x2791bca1f2de4661ed88a30c99a7a9449aa84174";
    config.data_api_url = "http://127.0.0.1:1";
    config.dry_run = true;
    config.health_port = 0;
    return config;
}

size_t count_lines(const std::string& text, const std::string& needle) {
    size_t count = 0;
    for (size_t pos = text.find(needle); pos != std::string::npos; pos = text.find(needle, pos + 1)) {
        ++count;
    }
    return count;
}

// Routes the default logger into a string for the lifetime of the object
class CapturedLog {
public:
    CapturedLog() : previous_(spdlog::default_logger()) {
        auto sink = std::make_shared<spdlog::sinks::ostream_sink_mt>(out_);
        auto logger = std::make_shared<spdlog::logger>("capture", sink);
        logger->set_level(spdlog::level::info);
        spdlog::set_default_logger(logger);
    }

    ~CapturedLog() {
        spdlog::set_default_logger(previous_);
    }

    std::string text() {
        spdlog::default_logger()->flush();
        return out_.str();
    }

private:
    std::shared_ptr<spdlog::logger> previous_;
    std::ostringstream out_;
};

} // namespace

TEST(test_shutdown_runs_once) {
    CapturedLog log;
    {
        CopierService service(make_config());
        service.stop();
        service.shutdown();
        service.shutdown();
    } // destructor calls shutdown() again

    ASSERT_EQ(count_lines(log.text(), "copier-under-test stopped"), 1u);
}

TEST(test_destructor_shuts_down_unstarted_service) {
    CapturedLog log;
    {
        CopierService service(make_config());
    }

    auto text = log.text();
    ASSERT_EQ(count_lines(text, "copier-under-test stopped"), 1u);
    ASSERT_EQ(count_lines(text, "Shutdown requested"), 1u);
}

TEST(test_health_status_before_run) {
    CapturedLog log;
    CopierService service(make_config());

    auto status = service.health_status();

    ASSERT_EQ(status["service"].get<std::string>(), std::string("copier-under-test"));
    ASSERT_EQ(status["status"].get<std::string>(), std::string("healthy"));
    ASSERT_TRUE(status["dry_run"].get<bool>());
    ASSERT_FALSE(status.contains("audit_db"));
}

int main() {
    std::cout << "=== Copier Service Tests ===\n";

    RUN_TEST(test_shutdown_runs_once);
    RUN_TEST(test_destructor_shuts_down_unstarted_service);
    RUN_TEST(test_health_status_before_run);

    return TEST_SUMMARY();
}
