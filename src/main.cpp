#include "live_client.h"
#include "audio_io.h"
#include "config.h"
#include "logger.h"
#include "path_utils.h"
#include <csignal>
#include <fstream>

namespace helios {

static LiveClient* g_client = nullptr;

void signal_handler(int signal) {
    if (!g_client) return;
    if (signal == SIGUSR1) {
        g_client->toggle_mute();
        return;
    }
    g_client->shutdown();
}

} // namespace helios

int main(int argc, char* argv[]) {
    // Initialize logger (default to INFO level, console output)
    helios::Logger::initialize(helios::LogLevel::INFO);

    if (argc > 1 && std::string(argv[1]) == "--list-devices") {
        helios::list_audio_devices();
        helios::Logger::shutdown();
        return 0;
    }

    std::string config_path = "config/config.json";
    if (argc > 1) {
        config_path = argv[1];
    } else {
        // Try config relative to executable (e.g. build/../config)
        std::string exe_dir = helios::executable_dir();
        if (!exe_dir.empty()) {
            std::string candidate = exe_dir + "/../config/config.json";
            std::ifstream test(candidate);
            if (test.good()) {
                config_path = candidate;
            }
        }
    }

    helios::Config config = helios::Config::load_from_file(config_path);

    helios::Logger::shutdown();
    helios::Logger::initialize(helios::Logger::parse_level(config.logging.level), config.logging.file);

    auto valid = config.validate();
    if (valid.is_error()) {
        helios::Logger::error(valid.error().to_string());
        helios::Logger::shutdown();
        return 1;
    }

    helios::LiveClient client(config);
    if (!client.initialize()) {
        helios::Logger::error("Failed to initialize live client");
        helios::Logger::shutdown();
        return 1;
    }
    helios::g_client = &client;

    std::signal(SIGINT, helios::signal_handler);
    std::signal(SIGTERM, helios::signal_handler);
    std::signal(SIGUSR1, helios::signal_handler);

    helios::Logger::info("Session starting. Ctrl+C to stop, SIGUSR1 to toggle mute.");
    int result = client.run();

    helios::g_client = nullptr;

    helios::Logger::shutdown();

    return result;
}
