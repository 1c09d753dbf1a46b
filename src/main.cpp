#include "agent.h"
#include "audio_capture.h"
#include "config.h"
#include "logger.h"
#include "path_utils.h"
#include <csignal>
#include <string>

namespace live_scribe {

static ScribeAgent* g_agent = nullptr;

void signal_handler(int /*signal*/) {
    if (g_agent) {
        g_agent->shutdown();
    }
}

} // namespace live_scribe

int main(int argc, char* argv[]) {
    // Initialize logger (default to INFO level, console output)
    live_scribe::Logger::initialize(live_scribe::LogLevel::INFO);

    // List devices if requested (check before loading config)
    if (argc > 1 && std::string(argv[1]) == "--list-devices") {
        live_scribe::PortAudioCapture::list_devices();
        live_scribe::Logger::shutdown();
        return 0;
    }

    std::string config_path = live_scribe::resolve_config_path(argc > 1 ? argv[1] : "");

    live_scribe::Config config = live_scribe::Config::load_from_file(config_path);

    // Re-initialize with configured level and optional file sink
    live_scribe::Logger::shutdown();
    live_scribe::Logger::initialize(live_scribe::parse_log_level(config.log_level), config.log_file);

    live_scribe::ScribeAgent agent(config);
    live_scribe::g_agent = &agent;

    std::signal(SIGINT, live_scribe::signal_handler);
    std::signal(SIGTERM, live_scribe::signal_handler);

    int result = agent.run();

    live_scribe::g_agent = nullptr;
    live_scribe::Logger::info("Shutting down...");
    live_scribe::Logger::shutdown();

    return result;
}
