#ifndef SLIDE_VOICE_SESSION_TYPES_HPP
#define SLIDE_VOICE_SESSION_TYPES_HPP

#include <string>
#include <chrono>
#include <cstddef>

namespace session {
    enum class Phase {
        Idle,
        Connecting,
        Processing,  // channel open, waiting for the first remote turn signal
        Speaking,
        Listening
    };

    // Whose turn the channel believes is active; what the UI shows.
    enum class VoiceActivityState { Idle, Connecting, Listening, Speaking };

    const char* to_string(Phase phase);
    const char* to_string(VoiceActivityState state);

    VoiceActivityState voice_activity_for(Phase phase);

    inline bool is_active(Phase phase) {
        return phase == Phase::Processing || phase == Phase::Speaking || phase == Phase::Listening;
    }

    struct SessionConfig {
        std::string server_url = "ws://localhost:8000/ws";
        int sample_rate = 24000;
        std::size_t frame_size = 4800;  // 200 ms at 24 kHz
        std::chrono::milliseconds handshake_timeout{10000};
    };
}

#endif
