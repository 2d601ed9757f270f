#ifndef SLIDE_VOICE_ERRORS_HPP
#define SLIDE_VOICE_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace core {
    enum class ErrorKind {
        ConnectionFailed,
        ConnectionTimeout,
        ConnectionLost,         // channel closed without a local stop()
        CaptureUnavailable,
        PlaybackUnavailable,    // per-frame, recoverable
        MalformedAudioPayload,  // per-frame, recoverable
        RemoteReportedError,
        ProtocolDecodeError
    };

    const char* to_string(ErrorKind kind);

    class VoiceError : public std::runtime_error {
    public:
        VoiceError(ErrorKind kind, const std::string& message);

        ErrorKind kind() const noexcept { return kind_; }

    private:
        ErrorKind kind_;
    };
}

#endif
