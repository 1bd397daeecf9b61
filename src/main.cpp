#include "errors.hpp"
#include "hyprpomo.hpp"

#include <cstdio>
#include <string>
#include <vector>

#include <fmt/format.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

int main(int argc, char *argv[]) {
    // Status line owns stdout, logs go to stderr.
    spdlog::set_default_logger(spdlog::stderr_color_mt("hyprpomo"));
    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");

    LogLevel log_level = LOG_WARN;
    std::vector<std::string> args;
    bool flags = true;
    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (flags && arg == "--debug") {
            log_level = LOG_DEBUG;
        } else if (flags && arg == "--verbose") {
            log_level = LOG_INFO;
        } else if (flags && arg == "--quiet") {
            log_level = LOG_OFF;
        } else {
            flags = false;
            args.push_back(arg);
        }
    }

    try {
        HyprPomo app(log_level);
        return app.Run(args);
    } catch (const InvalidCommandError &e) {
        fmt::print(stderr, "hyprpomo: {}\n", e.what());
        return 1;
    } catch (const DurationParseError &e) {
        fmt::print(stderr, "hyprpomo: {}\n", e.what());
        return 1;
    } catch (const ConfigError &e) {
        spdlog::error("Configuration error: {}", e.what());
        return 1;
    } catch (const std::exception &e) {
        spdlog::error("{}", e.what());
        return 1;
    }
}
