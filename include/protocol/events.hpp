#ifndef SLIDE_VOICE_PROTOCOL_EVENTS_HPP
#define SLIDE_VOICE_PROTOCOL_EVENTS_HPP

#include <string>
#include <vector>
#include <optional>
#include <variant>

// JSON text messages exchanged with the presentation server. One message per
// WebSocket text frame, keyed by "type".
namespace protocol {
    enum class Direction { Next, Previous };
    enum class Speaker { User, Ai };

    // ---- Client -> Server ----
    struct SessionStart {};
    struct SessionStop {};
    struct AudioInput { std::string audio; };
    struct SlideNavigate { Direction direction; };
    struct SlideGoTo { int slide_id; };
    struct ResponseCancel {};

    using ClientEvent = std::variant<SessionStart, SessionStop, AudioInput,
                                     SlideNavigate, SlideGoTo, ResponseCancel>;

    std::string serialize(const ClientEvent& event);

    // ---- Server -> Client ----
    struct SessionStarted { std::string session_id; };
    struct SessionStopped {};
    struct AudioOutput { std::string audio; };
    struct AudioDone {};
    struct AudioInterrupted {};

    struct SlideChanged {
        int slide_id = 1;  // 1-based
        std::string title;
        std::vector<std::string> content;
        std::string narration;
        int total_slides = 0;
        bool has_next = false;
        bool has_previous = false;
    };

    struct Transcript {
        std::string text;
        bool is_final = false;
        Speaker speaker = Speaker::Ai;
    };

    struct RemoteError {
        std::string message;
        std::optional<std::string> code;
    };

    struct ConnectionStatus {
        std::string status;
        std::optional<std::string> message;
    };

    using ServerEvent = std::variant<SessionStarted, SessionStopped, AudioOutput,
                                     AudioDone, AudioInterrupted, SlideChanged,
                                     Transcript, RemoteError, ConnectionStatus>;

    // Throws core::VoiceError(ProtocolDecodeError) for invalid JSON, unknown
    // types and missing or ill-typed fields.
    ServerEvent parse_server_event(const std::string& text);

    const char* type_name(const ServerEvent& event);
    const char* to_string(Speaker speaker);

    template <class... Ts> struct overloaded : Ts... { using Ts::operator()...; };
    template <class... Ts> overloaded(Ts...) -> overloaded<Ts...>;
}

#endif
