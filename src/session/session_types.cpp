#include "session/session_types.hpp"

namespace session {

const char* to_string(Phase phase) {
    switch (phase) {
        case Phase::Idle:       return "Idle";
        case Phase::Connecting: return "Connecting";
        case Phase::Processing: return "Active/Processing";
        case Phase::Speaking:   return "Active/Speaking";
        case Phase::Listening:  return "Active/Listening";
    }
    return "Unknown";
}

const char* to_string(VoiceActivityState state) {
    switch (state) {
        case VoiceActivityState::Idle:       return "idle";
        case VoiceActivityState::Connecting: return "connecting";
        case VoiceActivityState::Listening:  return "listening";
        case VoiceActivityState::Speaking:   return "speaking";
    }
    return "unknown";
}

VoiceActivityState voice_activity_for(Phase phase) {
    switch (phase) {
        case Phase::Idle:       return VoiceActivityState::Idle;
        case Phase::Connecting:
        case Phase::Processing: return VoiceActivityState::Connecting;
        case Phase::Speaking:   return VoiceActivityState::Speaking;
        case Phase::Listening:  return VoiceActivityState::Listening;
    }
    return VoiceActivityState::Idle;
}

}
