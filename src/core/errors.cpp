#include "core/errors.hpp"

namespace core {

const char* to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::ConnectionFailed:      return "ConnectionFailed";
        case ErrorKind::ConnectionTimeout:     return "ConnectionTimeout";
        case ErrorKind::ConnectionLost:        return "ConnectionLost";
        case ErrorKind::CaptureUnavailable:    return "CaptureUnavailable";
        case ErrorKind::PlaybackUnavailable:   return "PlaybackUnavailable";
        case ErrorKind::MalformedAudioPayload: return "MalformedAudioPayload";
        case ErrorKind::RemoteReportedError:   return "RemoteReportedError";
        case ErrorKind::ProtocolDecodeError:   return "ProtocolDecodeError";
    }
    return "Unknown";
}

VoiceError::VoiceError(ErrorKind kind, const std::string& message)
    : std::runtime_error(message), kind_(kind) {}

}
