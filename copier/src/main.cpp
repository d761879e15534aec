#include "config.hpp"
#include "config_error.hpp"
#include "copier_service.hpp"
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <pthread.h>
#include <signal.h>
#include <memory>
#include <thread>

namespace {

void setup_logging(const Config& config) {
    auto logger = spdlog::stdout_color_mt(config.service_name);
    spdlog::set_default_logger(logger);
    spdlog::set_level(spdlog::level::from_str(config.log_level));
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [tid %t] %v");
    spdlog::flush_on(spdlog::level::info);
}

} // namespace

int main() {
    // Block termination signals before any thread starts so only the waiter sees them
    sigset_t signals;
    sigemptyset(&signals);
    sigaddset(&signals, SIGINT);
    sigaddset(&signals, SIGTERM);
    sigaddset(&signals, SIGUSR1); // internal wake-up for the waiter
    pthread_sigmask(SIG_BLOCK, &signals, nullptr);

    int exit_code = CopierService::kExitOk;

    try {
        // 1. Load configuration
        Config config = Config::from_env();
        config.validate();

        // 2. Setup logging
        setup_logging(config);
        spdlog::info("Log level set to '{}'", config.log_level);
        spdlog::info("Starting {}...", config.service_name);

        // 3. Create the service and route SIGINT/SIGTERM to its stop()
        auto service = std::make_unique<CopierService>(config);

        std::thread signal_thread([&signals, &service]() {
            int signum = 0;
            if (sigwait(&signals, &signum) == 0 && signum != SIGUSR1) {
                spdlog::info("Caught signal {}, shutting down...", signum);
                service->stop();
            }
        });

        // 4. Run until stopped or the feed gives up
        try {
            exit_code = service->run();
        } catch (...) {
            pthread_kill(signal_thread.native_handle(), SIGUSR1);
            signal_thread.join();
            throw;
        }

        // Release the waiter if the service stopped on its own
        pthread_kill(signal_thread.native_handle(), SIGUSR1);
        signal_thread.join();

    } catch (const ConfigError& e) {
        spdlog::critical("Configuration error: {}", e.what());
        return 1;
    } catch (const std::exception& e) {
        spdlog::critical("A critical error occurred: {}", e.what());
        return 1;
    }

    if (exit_code == CopierService::kExitGaveUp) {
        spdlog::critical("Feed monitor gave up; restart required.");
    } else {
        spdlog::info("Copier has shut down gracefully.");
    }
    return exit_code;
}
