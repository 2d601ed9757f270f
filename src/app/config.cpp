#include "app/config.hpp"
#include <cstdlib>
#include <stdexcept>
#include <iostream>

namespace app {

namespace {

long parse_number(const std::string& option, const std::string& value, long min, long max) {
    size_t consumed = 0;
    long number = 0;
    try {
        number = std::stol(value, &consumed);
    } catch (const std::exception&) {
        throw std::invalid_argument(option + " expects a number, got '" + value + "'");
    }
    if (consumed != value.size()) {
        throw std::invalid_argument(option + " expects a number, got '" + value + "'");
    }
    if (number < min || number > max) {
        throw std::invalid_argument(option + " must be in " + std::to_string(min) + "-" +
                                    std::to_string(max) + ", got " + value);
    }
    return number;
}

}

session::SessionConfig Config::session_config() const {
    session::SessionConfig config;
    config.server_url = server_url;
    config.sample_rate = sample_rate;
    config.frame_size = frame_size;
    config.handshake_timeout = handshake_timeout;
    return config;
}

bool validate_url(const std::string& url) {
    if (url.rfind("ws://", 0) != 0) {
        std::cerr << "❌ ERROR: URL must start with ws:// : " << url << std::endl;
        return false;
    }
    if (url.size() == 5 || url[5] == '/' || url[5] == ':') {
        std::cerr << "❌ ERROR: URL has no host: " << url << std::endl;
        return false;
    }
    return true;
}

Config parse_arguments(int argc, char* argv[]) {
    Config config;

    if (const char* env_url = std::getenv("SLIDE_VOICE_URL")) {
        if (*env_url != '\0') {
            config.server_url = env_url;
        }
    }

    bool url_given = false;
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];

        auto value = [&](const std::string& option) -> std::string {
            if (i + 1 >= argc) {
                throw std::invalid_argument(option + " requires a value");
            }
            return argv[++i];
        };

        if (arg == "--slides") {
            config.slides_path = value(arg);
        } else if (arg == "--timeout-ms") {
            config.handshake_timeout = std::chrono::milliseconds(parse_number(arg, value(arg), 100, 120000));
        } else if (arg == "--sample-rate") {
            config.sample_rate = static_cast<int>(parse_number(arg, value(arg), 8000, 48000));
        } else if (arg == "--frame-size") {
            config.frame_size = static_cast<std::size_t>(parse_number(arg, value(arg), 160, 48000));
        } else if (arg == "--no-aec") {
            config.echo_cancellation = false;
        } else if (arg == "--no-ns") {
            config.noise_suppression = false;
        } else if (arg.rfind("--", 0) == 0) {
            throw std::invalid_argument("unknown option " + arg);
        } else if (!url_given) {
            config.server_url = arg;
            url_given = true;
        } else {
            throw std::invalid_argument("unexpected argument " + arg);
        }
    }

    if (!validate_url(config.server_url)) {
        throw std::invalid_argument("invalid server URL " + config.server_url);
    }
    return config;
}

}
