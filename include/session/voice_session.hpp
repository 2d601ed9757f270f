#ifndef SLIDE_VOICE_VOICE_SESSION_HPP
#define SLIDE_VOICE_VOICE_SESSION_HPP

#include "core/non_copyable.hpp"
#include "core/errors.hpp"
#include "session/session_types.hpp"
#include "session/event_queue.hpp"
#include "audio/audio_device.hpp"
#include "audio/capture_pipeline.hpp"
#include "audio/playback_scheduler.hpp"
#include "network/transport_channel.hpp"
#include "presentation/presentation_bridge.hpp"
#include "protocol/events.hpp"
#include <memory>
#include <optional>
#include <functional>
#include <string>
#include <chrono>
#include <cstdint>

namespace session {
    // Fresh device and channel handles for every start().
    struct SessionDependencies {
        std::function<std::unique_ptr<network::TransportChannel>()> make_transport;
        std::function<std::unique_ptr<audio::InputDevice>()> make_input;
        std::function<std::unique_ptr<audio::OutputContext>()> make_output;
        audio::CapturePipeline::Processors capture_processors;
    };

    // Orchestrates one voice interaction at a time. Transport, capture and
    // command sources only post() events; poll() applies them in order on
    // the owning thread, one at a time, so transitions never interleave.
    // start(), stop() and the slide commands must be called on that thread.
    class VoiceSession : private core::NonCopyable {
    public:
        VoiceSession(SessionConfig config, SessionDependencies deps,
                     presentation::PresentationBridge& bridge);
        ~VoiceSession();

        void start();
        void stop();

        void navigate(protocol::Direction direction);
        void go_to_slide(int slide_id);
        void cancel_response();

        // Thread-safe.
        void post(SessionEvent event);

        // Waits up to `max_wait` for events, handles everything queued, then
        // enforces the handshake deadline. Returns the number of events handled.
        size_t poll(std::chrono::milliseconds max_wait = std::chrono::milliseconds(0));

        Phase phase() const { return phase_; }
        bool is_active() const { return session::is_active(phase_); }
        const std::optional<std::string>& session_id() const { return session_id_; }
        const std::optional<std::string>& last_error() const { return last_error_; }
        std::optional<core::ErrorKind> last_error_kind() const { return last_error_kind_; }

        const audio::PlaybackScheduler& playback() const { return playback_; }
        bool has_transport() const { return transport_ != nullptr; }
        bool has_capture() const { return capture_ != nullptr; }
        size_t frames_sent() const { return frames_sent_; }
        size_t frames_dropped() const { return frames_dropped_; }

    private:
        class ChannelEvents;

        void handle(const SessionEvent& event);
        void on_transport_opened();
        void on_transport_failed(core::ErrorKind kind, const std::string& message);
        void on_transport_message(const std::string& text);
        void on_transport_closed(const std::string& reason);
        void on_frame_captured(const std::vector<int16_t>& samples);
        void on_user_command(const UserCommand& command);

        void on_server_event(const protocol::ServerEvent& event);
        void on_audio_output(const protocol::AudioOutput& event);
        void on_audio_interrupted();
        void on_slide_changed(const protocol::SlideChanged& event);

        void check_handshake_deadline();
        bool send(const protocol::ClientEvent& event);
        void transition(Phase next);
        void fail(core::ErrorKind kind, const std::string& message);
        void cleanup();

        SessionConfig config_;
        SessionDependencies deps_;
        presentation::PresentationBridge& bridge_;
        EventQueue queue_;

        Phase phase_ = Phase::Idle;
        std::uint64_t generation_ = 0;
        std::optional<std::chrono::steady_clock::time_point> handshake_deadline_;
        std::optional<std::string> session_id_;
        std::optional<std::string> last_error_;
        std::optional<core::ErrorKind> last_error_kind_;

        std::unique_ptr<network::TransportChannel> transport_;
        std::unique_ptr<audio::CapturePipeline> capture_;
        audio::PlaybackScheduler playback_;

        size_t frames_sent_ = 0;
        size_t frames_dropped_ = 0;
    };
}

#endif
