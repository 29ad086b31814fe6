#include "config.hpp"
#include "http/curl_utils.hpp"
#include "platform/linux/linux_event_loop.hpp"

#include <print>
#include <signal.h>

int main(int argc, char* argv[]) {
    bool verbose = false;
    std::string config_path;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--verbose" || arg == "-v") {
            verbose = true;
        } else if (arg == "--config" || arg == "-c") {
            if (i + 1 < argc) config_path = argv[++i];
        } else if (arg == "--help" || arg == "-h") {
            std::println("Usage: voicescribe [options]");
            std::println("Options:");
            std::println("  -v, --verbose       Enable verbose logging");
            std::println("  -c, --config PATH   Config file path");
            std::println("  -h, --help          Show this help");
            std::println("");
            std::println("The bot token may also be given in the BOT_TOKEN environment variable.");
            return 0;
        } else {
            std::println(stderr, "Unknown option: {}", arg);
            return 2;
        }
    }

    // Load config
    Config config;
    if (!config_path.empty()) {
        config = Config::load(config_path);
    } else {
        config = Config::load_default();
    }
    config.apply_environment();

    // A closed peer must surface as an error, not kill the process
    signal(SIGPIPE, SIG_IGN);

    http::CurlGlobalGuard curl_guard;

    if (verbose) {
        std::println(stderr, "[voicescribe] Starting (transcriber: {} @ {}, correction @ {})",
                     config.transcriber.api_format, config.transcriber.url,
                     config.correction.url);
    }

    LinuxEventLoop loop(std::move(config), verbose);
    if (!loop.init()) {
        std::println(stderr, "Failed to initialize event loop");
        return 1;
    }

    loop.run();
    return 0;
}
