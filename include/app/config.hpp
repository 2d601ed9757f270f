#ifndef SLIDE_VOICE_CONFIG_HPP
#define SLIDE_VOICE_CONFIG_HPP

#include "session/session_types.hpp"
#include <string>
#include <chrono>
#include <cstddef>

namespace app {
    struct Config {
        std::string server_url = "ws://localhost:8000/ws";
        std::string slides_path;  // empty: deck is filled from slide.changed events
        int sample_rate = 24000;
        std::size_t frame_size = 4800;
        std::chrono::milliseconds handshake_timeout{10000};
        bool echo_cancellation = true;
        bool noise_suppression = true;

        session::SessionConfig session_config() const;
    };

    // slide_voice [ws_url] [--slides FILE] [--timeout-ms N] [--sample-rate HZ]
    //             [--frame-size N] [--no-aec] [--no-ns]
    // SLIDE_VOICE_URL replaces the default URL when no URL argument is given.
    // Throws std::invalid_argument.
    Config parse_arguments(int argc, char* argv[]);

    bool validate_url(const std::string& url);
}

#endif
