#include "audio/audio_io.h"
#include "core/config.h"
#include "errors.h"
#include "logger.h"
#include "session/session.h"
#include <atomic>
#include <chrono>
#include <csignal>
#include <thread>

namespace parley {

static volatile std::sig_atomic_t g_signals = 0;

void signal_handler(int) {
    g_signals = g_signals + 1;
}

/// Turns signals into stop() (first) and cancel() (second) off the handler
class SignalForwarder {
public:
    explicit SignalForwarder(Session& session)
        : session_(session)
        , thread_(&SignalForwarder::run, this) {}

    ~SignalForwarder() {
        done_ = true;
        thread_.join();
    }

private:
    void run() {
        int handled = 0;
        while (!done_) {
            int seen = g_signals;
            if (seen > handled) {
                handled = seen;
                if (handled == 1) {
                    Logger::info("Shutting down (signal again to abort)...");
                    session_.stop();
                } else {
                    session_.cancel("signal");
                }
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
        }
    }

    Session& session_;
    std::atomic<bool> done_{false};
    std::thread thread_;
};

Result<Config> load_config(const std::string& path) {
    if (!path.empty()) {
        return Config::load(path);
    }
    Config config = Config::defaults();
    config.apply_env_overrides();
    config.normalize();
    std::string error = config.validate();
    if (!error.empty()) {
        return Result<Config>::failure("Config validation failed: " + error);
    }
    return Result<Config>::success(std::move(config));
}

} // namespace parley

int main(int argc, char* argv[]) {
    // Initialize logger (default to INFO level, console output)
    parley::Logger::initialize(parley::LogLevel::INFO);

    std::string config_path;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--list-devices") {
            parley::AudioDevice::list_devices();
            parley::Logger::shutdown();
            return 0;
        }
        config_path = arg;
    }

    auto loaded = parley::load_config(config_path);
    if (!loaded.ok()) {
        parley::Logger::error(loaded.error);
        parley::Logger::shutdown();
        return 2;
    }
    parley::Config config = std::move(*loaded.value);

    // Re-initialize with the configured level and file
    parley::Logger::shutdown();
    parley::Logger::initialize(parley::parse_log_level(config.logging.level), config.logging.file);

    int exit_code = 0;
    try {
        parley::SessionServices services = parley::SessionServices::from_config(config);
        parley::Session session(config, std::move(services));

        std::signal(SIGINT, parley::signal_handler);
        std::signal(SIGTERM, parley::signal_handler);

        parley::pipeline::RunStatus status;
        {
            parley::SignalForwarder forwarder(session);
            status = session.run();
        }
        exit_code = status.kind == parley::pipeline::RunStatus::Kind::Failed ? 1 : 0;
    } catch (const parley::ConfigurationError& e) {
        parley::Logger::error(std::string("Configuration error: ") + e.what());
        exit_code = 2;
    }

    parley::Logger::shutdown();
    return exit_code;
}
