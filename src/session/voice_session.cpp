#include "session/voice_session.hpp"
#include "codec/pcm16_codec.hpp"
#include <iostream>

namespace session {

// Forwards channel callbacks into the session queue, stamped with the
// generation of the connection that produced them.
class VoiceSession::ChannelEvents : public network::ChannelListener {
public:
    ChannelEvents(EventQueue& queue, std::uint64_t generation)
        : queue_(queue), generation_(generation) {}

    void on_open() override {
        queue_.push(TransportOpened{generation_});
    }
    void on_message(std::string text) override {
        queue_.push(TransportMessage{generation_, std::move(text)});
    }
    void on_error(core::ErrorKind kind, const std::string& message) override {
        queue_.push(TransportFailed{generation_, kind, message});
    }
    void on_close(const std::string& reason) override {
        queue_.push(TransportClosed{generation_, reason});
    }

private:
    EventQueue& queue_;
    std::uint64_t generation_;
};

VoiceSession::VoiceSession(SessionConfig config, SessionDependencies deps,
                           presentation::PresentationBridge& bridge)
    : config_(std::move(config)),
      deps_(std::move(deps)),
      bridge_(bridge),
      playback_(deps_.make_output) {
    bridge_.set_voice_state(VoiceActivityState::Idle);
}

VoiceSession::~VoiceSession() {
    stop();
}

// ---------------------------------------------------------------------------
// Commands
// ---------------------------------------------------------------------------

void VoiceSession::start() {
    if (phase_ != Phase::Idle) {
        std::cout << "ℹ️  Session already " << to_string(phase_) << ", start ignored" << std::endl;
        return;
    }

    // Nothing from a previous attempt may survive into this one
    cleanup();

    session_id_.reset();
    last_error_.reset();
    last_error_kind_.reset();
    bridge_.clear_error();

    std::cout << "🚀 Starting voice session..." << std::endl;
    transition(Phase::Connecting);
    handshake_deadline_ = std::chrono::steady_clock::now() + config_.handshake_timeout;

    try {
        transport_ = deps_.make_transport ? deps_.make_transport() : nullptr;
        if (!transport_) {
            throw core::VoiceError(core::ErrorKind::ConnectionFailed, "no transport available");
        }
        transport_->open(config_.server_url, std::make_shared<ChannelEvents>(queue_, generation_));
    } catch (const core::VoiceError& e) {
        fail(e.kind(), e.what());
    }
}

void VoiceSession::stop() {
    if (phase_ == Phase::Idle) {
        return;
    }

    std::cout << "🛑 Stopping voice session" << std::endl;
    if (transport_ && transport_->is_open()) {
        send(protocol::SessionStop{});
    }
    cleanup();
    transition(Phase::Idle);
}

void VoiceSession::navigate(protocol::Direction direction) {
    if (!is_active()) {
        std::cout << "ℹ️  No active session, navigation ignored" << std::endl;
        return;
    }
    send(protocol::SlideNavigate{direction});
}

void VoiceSession::go_to_slide(int slide_id) {
    if (!is_active()) {
        std::cout << "ℹ️  No active session, goto ignored" << std::endl;
        return;
    }
    if (slide_id < 1) {
        std::cerr << "⚠️  Slide ids start at 1, got " << slide_id << std::endl;
        return;
    }
    send(protocol::SlideGoTo{slide_id});
}

void VoiceSession::cancel_response() {
    if (!is_active()) {
        return;
    }
    send(protocol::ResponseCancel{});
}

// ---------------------------------------------------------------------------
// Event loop
// ---------------------------------------------------------------------------

void VoiceSession::post(SessionEvent event) {
    queue_.push(std::move(event));
}

size_t VoiceSession::poll(std::chrono::milliseconds max_wait) {
    auto deadline = std::chrono::steady_clock::now() + max_wait;
    if (handshake_deadline_ && *handshake_deadline_ < deadline) {
        deadline = *handshake_deadline_;
    }

    auto events = queue_.wait_and_take(deadline);
    for (const auto& event : events) {
        try {
            handle(event);
        } catch (const core::VoiceError& e) {
            std::cerr << "❌ [" << core::to_string(e.kind()) << "] " << e.what() << std::endl;
        } catch (const std::exception& e) {
            std::cerr << "❌ Event handling failed: " << e.what() << std::endl;
        }
    }

    check_handshake_deadline();
    return events.size();
}

void VoiceSession::handle(const SessionEvent& event) {
    std::visit(protocol::overloaded{
        [this](const TransportOpened& e) {
            if (e.generation == generation_) on_transport_opened();
        },
        [this](const TransportFailed& e) {
            if (e.generation == generation_) on_transport_failed(e.kind, e.message);
        },
        [this](const TransportMessage& e) {
            if (e.generation == generation_) on_transport_message(e.text);
        },
        [this](const TransportClosed& e) {
            if (e.generation == generation_) on_transport_closed(e.reason);
        },
        [this](const FrameCaptured& e) {
            if (e.generation == generation_) {
                on_frame_captured(e.samples);
            } else {
                ++frames_dropped_;
            }
        },
        [this](const UserCommand& e) { on_user_command(e); },
    }, event);
}

void VoiceSession::check_handshake_deadline() {
    if (phase_ != Phase::Connecting || !handshake_deadline_) {
        return;
    }
    if (std::chrono::steady_clock::now() >= *handshake_deadline_) {
        fail(core::ErrorKind::ConnectionTimeout,
             "Connection timeout after " + std::to_string(config_.handshake_timeout.count()) + " ms");
    }
}

// ---------------------------------------------------------------------------
// Transport
// ---------------------------------------------------------------------------

void VoiceSession::on_transport_opened() {
    if (phase_ != Phase::Connecting) {
        return;
    }
    handshake_deadline_.reset();
    std::cout << "✓ Channel open" << std::endl;

    try {
        auto device = deps_.make_input ? deps_.make_input() : nullptr;
        if (!device) {
            throw core::VoiceError(core::ErrorKind::CaptureUnavailable, "no input device available");
        }

        const auto generation = generation_;
        capture_ = std::make_unique<audio::CapturePipeline>(
            std::move(device), config_.frame_size, deps_.capture_processors,
            [this, generation](std::vector<int16_t>&& frame) {
                post(FrameCaptured{generation, std::move(frame)});
            });
        capture_->start();
    } catch (const core::VoiceError& e) {
        fail(e.kind(), e.what());
        return;
    } catch (const std::exception& e) {
        fail(core::ErrorKind::CaptureUnavailable, e.what());
        return;
    }

    transition(Phase::Processing);
    send(protocol::SessionStart{});
}

void VoiceSession::on_transport_failed(core::ErrorKind kind, const std::string& message) {
    if (phase_ != Phase::Connecting) {
        return;
    }
    fail(kind, "WebSocket connection failed: " + message);
}

void VoiceSession::on_transport_closed(const std::string& reason) {
    if (phase_ == Phase::Idle) {
        return;
    }
    if (phase_ == Phase::Connecting) {
        fail(core::ErrorKind::ConnectionFailed, "Connection closed during handshake: " + reason);
        return;
    }
    fail(core::ErrorKind::ConnectionLost, "Connection closed: " + reason);
}

void VoiceSession::on_transport_message(const std::string& text) {
    if (phase_ == Phase::Idle) {
        return;
    }

    protocol::ServerEvent event;
    try {
        event = protocol::parse_server_event(text);
    } catch (const core::VoiceError& e) {
        std::cerr << "❌ [" << core::to_string(e.kind()) << "] " << e.what() << std::endl;
        return;
    }

    on_server_event(event);
}

void VoiceSession::on_frame_captured(const std::vector<int16_t>& samples) {
    if (!is_active() || !transport_ || !transport_->is_open()) {
        static int drop_counter = 0;
        if (++drop_counter % 50 == 1) {
            std::cout << "🔇 Captured frame dropped, channel not ready" << std::endl;
        }
        ++frames_dropped_;
        return;
    }

    if (send(protocol::AudioInput{codec::encode(samples)})) {
        ++frames_sent_;
        if (frames_sent_ % 50 == 0) {
            std::cout << "🚀 Sent " << frames_sent_ << " frames" << std::endl;
        }
    } else {
        ++frames_dropped_;
    }
}

void VoiceSession::on_user_command(const UserCommand& command) {
    switch (command.kind) {
        case CommandKind::Start:    start(); break;
        case CommandKind::Stop:     stop(); break;
        case CommandKind::Next:     navigate(protocol::Direction::Next); break;
        case CommandKind::Previous: navigate(protocol::Direction::Previous); break;
        case CommandKind::GoTo:     go_to_slide(command.slide_id); break;
        case CommandKind::Cancel:   cancel_response(); break;
    }
}

// ---------------------------------------------------------------------------
// Server events
// ---------------------------------------------------------------------------

void VoiceSession::on_server_event(const protocol::ServerEvent& event) {
    std::visit(protocol::overloaded{
        [this](const protocol::SessionStarted& e) {
            session_id_ = e.session_id;
            std::cout << "✓ Session started: " << e.session_id << std::endl;
            if (phase_ == Phase::Processing) {
                transition(Phase::Speaking);
            }
        },
        [this](const protocol::SessionStopped&) {
            // Remote ended the presentation: a clean stop, not an error
            std::cout << "📴 Session stopped by server" << std::endl;
            cleanup();
            transition(Phase::Idle);
        },
        [this](const protocol::AudioOutput& e) { on_audio_output(e); },
        [this](const protocol::AudioDone&) {
            // End of turn: queued audio keeps draining
            if (phase_ == Phase::Speaking) {
                transition(Phase::Listening);
            }
        },
        [this](const protocol::AudioInterrupted&) { on_audio_interrupted(); },
        [this](const protocol::SlideChanged& e) { on_slide_changed(e); },
        [this](const protocol::Transcript& e) {
            if (e.is_final) {
                std::cout << "📝 [" << protocol::to_string(e.speaker) << "] " << e.text << std::endl;
            }
            bridge_.on_transcript(e);
        },
        [this](const protocol::RemoteError& e) {
            // Not fatal by itself; a fatal error is followed by a close
            std::cerr << "❌ [" << core::to_string(core::ErrorKind::RemoteReportedError) << "] "
                      << e.message << (e.code ? " (" + *e.code + ")" : std::string()) << std::endl;
            last_error_ = e.message;
            last_error_kind_ = core::ErrorKind::RemoteReportedError;
            bridge_.set_error(e.message);
        },
        [](const protocol::ConnectionStatus& e) {
            std::cout << "📡 Server connection status: " << e.status
                      << (e.message ? " - " + *e.message : std::string()) << std::endl;
        },
    }, event);
}

void VoiceSession::on_audio_output(const protocol::AudioOutput& event) {
    std::vector<int16_t> samples;
    try {
        samples = codec::decode(event.audio);
    } catch (const core::VoiceError& e) {
        std::cerr << "❌ [" << core::to_string(e.kind()) << "] audio frame dropped: " << e.what() << std::endl;
        return;
    }
    if (samples.empty()) {
        return;
    }

    const size_t count = samples.size();
    try {
        const auto start = playback_.schedule(std::move(samples));

        static int schedule_counter = 0;
        if (++schedule_counter % 50 == 0) {
            std::cout << "🔊 Scheduled " << count << " samples at sample " << start << std::endl;
        }
    } catch (const core::VoiceError& e) {
        std::cerr << "❌ [" << core::to_string(e.kind()) << "] audio frame dropped: " << e.what() << std::endl;
        return;
    }

    transition(Phase::Speaking);
}

void VoiceSession::on_audio_interrupted() {
    std::cout << "✋ Barge-in: discarding queued playback" << std::endl;
    playback_.interrupt();
    transition(Phase::Listening);
}

void VoiceSession::on_slide_changed(const protocol::SlideChanged& event) {
    std::cout << "📽️  Slide changed to " << event.slide_id << std::endl;
    bridge_.sync_slide(event);
    bridge_.go_to_slide(static_cast<size_t>(event.slide_id - 1));
}

// ---------------------------------------------------------------------------
// Helpers
// ---------------------------------------------------------------------------

bool VoiceSession::send(const protocol::ClientEvent& event) {
    if (!transport_) {
        std::cerr << "⚠️  No channel, event not sent" << std::endl;
        return false;
    }
    return transport_->send(protocol::serialize(event));
}

void VoiceSession::transition(Phase next) {
    if (next == phase_) {
        return;
    }
    std::cout << "🔄 " << to_string(phase_) << " → " << to_string(next) << std::endl;
    phase_ = next;
    bridge_.set_voice_state(voice_activity_for(next));
}

void VoiceSession::fail(core::ErrorKind kind, const std::string& message) {
    std::cerr << "❌ [" << core::to_string(kind) << "] " << message << std::endl;
    last_error_ = message;
    last_error_kind_ = kind;
    bridge_.set_error(message);

    cleanup();
    transition(Phase::Idle);
}

void VoiceSession::cleanup() {
    handshake_deadline_.reset();

    if (capture_) {
        capture_->stop();
        capture_.reset();
    }

    playback_.close();

    if (transport_) {
        transport_->close();
        transport_.reset();
    }

    // Anything still queued for the old connection is now stale
    ++generation_;
}

}
