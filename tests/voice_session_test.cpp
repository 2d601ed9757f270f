#include "session/voice_session.hpp"
#include "codec/pcm16_codec.hpp"
#include "fakes.hpp"
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include <chrono>

using nlohmann::json;
using session::Phase;
using session::VoiceActivityState;

namespace {

class VoiceSessionTest : public ::testing::Test {
protected:
    void SetUp() override {
        config.server_url = "ws://presenter.test/ws";
        config.frame_size = 4;
        config.handshake_timeout = std::chrono::milliseconds(5000);
        build();
    }

    void build() {
        session::SessionDependencies deps;
        deps.make_transport = [this]() -> std::unique_ptr<network::TransportChannel> {
            auto probe = std::make_shared<fakes::TransportProbe>();
            probe->throw_on_open = transport_throws;
            transports.push_back(probe);
            return std::make_unique<fakes::FakeTransport>(probe);
        };
        deps.make_input = [this]() -> std::unique_ptr<audio::InputDevice> {
            ++inputs_made;
            return std::make_unique<fakes::FakeInputDevice>(input);
        };
        deps.make_output = [this]() -> std::unique_ptr<audio::OutputContext> {
            auto probe = std::make_shared<fakes::OutputProbe>();
            probe->now = output_now;
            outputs.push_back(probe);
            return std::make_unique<fakes::FakeOutputContext>(probe);
        };
        voice = std::make_unique<session::VoiceSession>(config, std::move(deps), bridge);
    }

    fakes::TransportProbe& transport() { return *transports.back(); }

    // start() plus a completed handshake
    void connect() {
        voice->start();
        ASSERT_EQ(voice->phase(), Phase::Connecting);
        transport().fire_open();
        voice->poll();
        ASSERT_EQ(voice->phase(), Phase::Processing);
    }

    void receive(const std::string& text) {
        transport().fire_message(text);
        voice->poll();
    }

    void receive_started() {
        receive(R"({"type":"session.started","session_id":"sess-42"})");
    }

    static std::string audio_message(size_t samples) {
        json message{{"type", "audio.output"}, {"audio", codec::encode(std::vector<int16_t>(samples, 100))}};
        return message.dump();
    }

    std::vector<std::string> sent_types(const fakes::TransportProbe& probe) const {
        std::vector<std::string> types;
        for (const auto& text : probe.sent) {
            types.push_back(json::parse(text).at("type").get<std::string>());
        }
        return types;
    }

    std::vector<json> sent_of_type(const fakes::TransportProbe& probe, const std::string& type) const {
        std::vector<json> matching;
        for (const auto& text : probe.sent) {
            auto message = json::parse(text);
            if (message.at("type") == type) {
                matching.push_back(message);
            }
        }
        return matching;
    }

    // Polls until `count` audio frames went out or two seconds pass.
    bool wait_for_audio_sent(size_t count) {
        const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(2);
        while (std::chrono::steady_clock::now() < deadline) {
            voice->poll(std::chrono::milliseconds(10));
            if (voice->frames_sent() >= count) {
                return true;
            }
        }
        return false;
    }

    session::SessionConfig config;
    fakes::RecordingBridge bridge;
    std::shared_ptr<fakes::InputProbe> input = std::make_shared<fakes::InputProbe>();
    std::vector<std::shared_ptr<fakes::TransportProbe>> transports;
    std::vector<std::shared_ptr<fakes::OutputProbe>> outputs;
    bool transport_throws = false;
    int inputs_made = 0;
    audio::SampleTime output_now = 0;

    // Last, so it goes first
    std::unique_ptr<session::VoiceSession> voice;
};

}

// ---------------------------------------------------------------------------
// Lifecycle
// ---------------------------------------------------------------------------

TEST_F(VoiceSessionTest, StartsIdle) {
    EXPECT_EQ(voice->phase(), Phase::Idle);
    EXPECT_FALSE(voice->is_active());
    EXPECT_EQ(bridge.voice_state(), VoiceActivityState::Idle);
    EXPECT_TRUE(transports.empty());
}

TEST_F(VoiceSessionTest, HandshakeStartsCaptureAndSendsSessionStart) {
    voice->start();
    EXPECT_EQ(voice->phase(), Phase::Connecting);
    EXPECT_EQ(bridge.voice_state(), VoiceActivityState::Connecting);
    ASSERT_EQ(transports.size(), 1u);
    EXPECT_EQ(transport().url, "ws://presenter.test/ws");
    EXPECT_FALSE(input->open);

    transport().fire_open();
    voice->poll();

    EXPECT_EQ(voice->phase(), Phase::Processing);
    EXPECT_TRUE(voice->is_active());
    EXPECT_EQ(bridge.voice_state(), VoiceActivityState::Connecting);
    EXPECT_TRUE(input->open);
    EXPECT_TRUE(voice->has_capture());
    EXPECT_EQ(sent_types(transport()), (std::vector<std::string>{"session.start"}));
}

TEST_F(VoiceSessionTest, SessionStartedEntersSpeaking) {
    connect();
    receive_started();

    EXPECT_EQ(voice->phase(), Phase::Speaking);
    EXPECT_EQ(bridge.voice_state(), VoiceActivityState::Speaking);
    ASSERT_TRUE(voice->session_id().has_value());
    EXPECT_EQ(*voice->session_id(), "sess-42");
}

TEST_F(VoiceSessionTest, SecondStartDoesNotOpenAnotherSession) {
    voice->start();
    voice->start();
    EXPECT_EQ(transports.size(), 1u);

    transport().fire_open();
    voice->poll();
    voice->start();
    voice->post(session::UserCommand{session::CommandKind::Start});
    voice->poll();

    EXPECT_EQ(transports.size(), 1u);
    EXPECT_EQ(inputs_made, 1);
    EXPECT_EQ(input->open_calls.load(), 1);
    EXPECT_TRUE(voice->is_active());
}

TEST_F(VoiceSessionTest, StopSendsSessionStopAndReleasesEverything) {
    connect();
    receive_started();
    receive(audio_message(480));
    ASSERT_EQ(outputs.size(), 1u);

    voice->stop();

    EXPECT_EQ(voice->phase(), Phase::Idle);
    EXPECT_EQ(bridge.voice_state(), VoiceActivityState::Idle);
    EXPECT_EQ(sent_types(*transports[0]).back(), "session.stop");
    EXPECT_EQ(transports[0]->close_calls, 1);
    EXPECT_FALSE(input->open);
    EXPECT_TRUE(outputs[0]->closed);
    EXPECT_FALSE(voice->has_transport());
    EXPECT_FALSE(voice->has_capture());
    EXPECT_FALSE(voice->playback().has_context());
    EXPECT_FALSE(voice->last_error().has_value());
}

TEST_F(VoiceSessionTest, StopThenLateCloseIsHarmless) {
    connect();
    receive_started();

    voice->stop();
    // The channel reports its close after the session already let go of it
    EXPECT_NO_THROW(transports[0]->fire_close("closed locally"));
    EXPECT_NO_THROW(voice->poll());
    EXPECT_NO_THROW(voice->stop());

    EXPECT_EQ(voice->phase(), Phase::Idle);
    EXPECT_FALSE(voice->last_error().has_value());
    EXPECT_FALSE(bridge.error.has_value());
    EXPECT_FALSE(voice->has_transport());
    EXPECT_FALSE(voice->has_capture());
    EXPECT_FALSE(voice->playback().has_context());
}

TEST_F(VoiceSessionTest, RestartIgnoresEventsFromPreviousConnection) {
    connect();
    voice->stop();
    auto old_connection = transports[0];

    connect();
    ASSERT_EQ(transports.size(), 2u);

    old_connection->fire_message(R"({"type":"session.started","session_id":"stale"})");
    old_connection->fire_close("late");
    voice->poll();

    EXPECT_EQ(voice->phase(), Phase::Processing);
    EXPECT_FALSE(voice->session_id().has_value());
    EXPECT_FALSE(voice->last_error().has_value());
}

TEST_F(VoiceSessionTest, ServerStopEndsSessionCleanly) {
    connect();
    receive_started();
    receive(R"({"type":"session.stopped"})");

    EXPECT_EQ(voice->phase(), Phase::Idle);
    EXPECT_EQ(bridge.voice_state(), VoiceActivityState::Idle);
    EXPECT_FALSE(voice->last_error().has_value());
    EXPECT_FALSE(voice->has_transport());
    EXPECT_FALSE(input->open);
}

// ---------------------------------------------------------------------------
// Connection failures
// ---------------------------------------------------------------------------

TEST_F(VoiceSessionTest, UnexpectedCloseWhileListeningIsReportedAsLost) {
    connect();
    receive_started();
    receive(R"({"type":"audio.done"})");
    ASSERT_EQ(voice->phase(), Phase::Listening);
    ASSERT_TRUE(input->open);

    transport().fire_close("closed by peer (code 1011)");
    voice->poll();

    EXPECT_EQ(voice->phase(), Phase::Idle);
    EXPECT_EQ(bridge.voice_state(), VoiceActivityState::Idle);
    EXPECT_FALSE(input->open);
    EXPECT_FALSE(voice->has_capture());
    EXPECT_FALSE(voice->has_transport());
    ASSERT_TRUE(voice->last_error_kind().has_value());
    EXPECT_EQ(*voice->last_error_kind(), core::ErrorKind::ConnectionLost);
    EXPECT_TRUE(bridge.error.has_value());
}

TEST_F(VoiceSessionTest, HandshakeTimeout) {
    config.handshake_timeout = std::chrono::milliseconds(50);
    build();

    voice->start();
    voice->poll(std::chrono::milliseconds(500));

    EXPECT_EQ(voice->phase(), Phase::Idle);
    ASSERT_TRUE(voice->last_error_kind().has_value());
    EXPECT_EQ(*voice->last_error_kind(), core::ErrorKind::ConnectionTimeout);
    EXPECT_EQ(transports[0]->close_calls, 1);
    EXPECT_FALSE(voice->has_transport());

    // A handshake completing after the timeout is ignored
    transports[0]->fire_open();
    voice->poll();
    EXPECT_EQ(voice->phase(), Phase::Idle);
    EXPECT_EQ(inputs_made, 0);
}

TEST_F(VoiceSessionTest, ConnectionErrorBeforeOpen) {
    voice->start();
    transport().fire_error(core::ErrorKind::ConnectionFailed, "connect: Connection refused");
    voice->poll();

    EXPECT_EQ(voice->phase(), Phase::Idle);
    ASSERT_TRUE(voice->last_error_kind().has_value());
    EXPECT_EQ(*voice->last_error_kind(), core::ErrorKind::ConnectionFailed);
    EXPECT_EQ(inputs_made, 0);
}

TEST_F(VoiceSessionTest, CloseDuringHandshakeIsConnectionFailure) {
    voice->start();
    transport().fire_close("handshake: declined");
    voice->poll();

    EXPECT_EQ(voice->phase(), Phase::Idle);
    EXPECT_EQ(*voice->last_error_kind(), core::ErrorKind::ConnectionFailed);
}

TEST_F(VoiceSessionTest, UnusableUrlFailsImmediately) {
    transport_throws = true;
    voice->start();

    EXPECT_EQ(voice->phase(), Phase::Idle);
    EXPECT_EQ(*voice->last_error_kind(), core::ErrorKind::ConnectionFailed);
    EXPECT_FALSE(voice->has_transport());
    EXPECT_TRUE(bridge.error.has_value());
}

TEST_F(VoiceSessionTest, CaptureUnavailableAbortsStart) {
    input->fail_open = true;
    voice->start();
    transport().fire_open();
    voice->poll();

    EXPECT_EQ(voice->phase(), Phase::Idle);
    EXPECT_EQ(*voice->last_error_kind(), core::ErrorKind::CaptureUnavailable);
    EXPECT_EQ(transports[0]->close_calls, 1);
    EXPECT_TRUE(transports[0]->sent.empty());
    EXPECT_FALSE(voice->has_transport());
    EXPECT_FALSE(voice->has_capture());
    EXPECT_EQ(bridge.voice_state(), VoiceActivityState::Idle);
}

TEST_F(VoiceSessionTest, NewStartClearsPreviousError) {
    voice->start();
    transport().fire_error(core::ErrorKind::ConnectionFailed, "refused");
    voice->poll();
    ASSERT_TRUE(bridge.error.has_value());

    connect();
    EXPECT_FALSE(voice->last_error().has_value());
    EXPECT_FALSE(bridge.error.has_value());
}

// ---------------------------------------------------------------------------
// Playback
// ---------------------------------------------------------------------------

TEST_F(VoiceSessionTest, BackToBackAudioIsScheduledWithoutGaps) {
    connect();
    receive_started();

    output_now = 1200;
    receive(audio_message(9600));
    receive(audio_message(9600));

    ASSERT_EQ(outputs.size(), 1u);
    const auto& scheduled = outputs[0]->scheduled;
    ASSERT_EQ(scheduled.size(), 2u);
    EXPECT_EQ(scheduled[0].start, 1200);
    EXPECT_EQ(scheduled[0].length, 9600u);
    // 9600 samples at 24 kHz is 400 ms
    EXPECT_EQ((scheduled[1].start - scheduled[0].start) * 1000 / config.sample_rate, 400);
    EXPECT_EQ(voice->phase(), Phase::Speaking);
}

TEST_F(VoiceSessionTest, AudioDoneLetsQueuedAudioFinish) {
    connect();
    receive_started();
    receive(audio_message(4800));
    receive(R"({"type":"audio.done"})");

    EXPECT_EQ(voice->phase(), Phase::Listening);
    EXPECT_EQ(bridge.voice_state(), VoiceActivityState::Listening);
    ASSERT_EQ(outputs.size(), 1u);
    EXPECT_FALSE(outputs[0]->closed);
    EXPECT_EQ(outputs[0]->scheduled.size(), 1u);
}

TEST_F(VoiceSessionTest, InterruptionDiscardsQueuedAudio) {
    connect();
    receive_started();
    for (int i = 0; i < 3; ++i) {
        receive(audio_message(9600));
    }
    ASSERT_EQ(outputs.size(), 1u);
    outputs[0]->now = 4000;

    output_now = 9000;
    receive(R"({"type":"audio.interrupted"})");

    EXPECT_TRUE(outputs[0]->closed);
    ASSERT_EQ(outputs.size(), 2u);
    EXPECT_TRUE(outputs[1]->scheduled.empty());
    EXPECT_EQ(voice->playback().cursor(), 9000);
    EXPECT_EQ(voice->phase(), Phase::Listening);

    // Next turn plays from the new context's "now"
    receive(audio_message(480));
    ASSERT_EQ(outputs[1]->scheduled.size(), 1u);
    EXPECT_EQ(outputs[1]->scheduled[0].start, 9000);
    EXPECT_EQ(voice->phase(), Phase::Speaking);
}

TEST_F(VoiceSessionTest, MalformedAudioIsDroppedWithoutEndingSession) {
    connect();
    receive_started();
    receive(R"({"type":"audio.output","audio":"not base64!"})");
    receive(R"({"type":"audio.output","audio":"AQD/"})");

    EXPECT_EQ(voice->phase(), Phase::Speaking);
    EXPECT_TRUE(voice->is_active());
    EXPECT_FALSE(voice->last_error().has_value());
    EXPECT_TRUE(outputs.empty() || outputs[0]->scheduled.empty());

    receive(audio_message(240));
    ASSERT_FALSE(outputs.empty());
    EXPECT_EQ(outputs[0]->scheduled.size(), 1u);
}

// ---------------------------------------------------------------------------
// Inbound events
// ---------------------------------------------------------------------------

TEST_F(VoiceSessionTest, SlideChangeNavigatesPresentation) {
    connect();
    receive_started();
    receive(R"({"type":"slide.changed","slide_id":3,"title":"Roadmap","content":["Q1"],
                "narration":"Next up","total_slides":5,"has_next":true,"has_previous":true})");

    ASSERT_FALSE(bridge.navigations.empty());
    EXPECT_EQ(bridge.navigations.back(), 2u);
    EXPECT_EQ(bridge.current_index(), 2u);
    EXPECT_EQ(bridge.synced, (std::vector<int>{3}));
}

TEST_F(VoiceSessionTest, UnknownMessagesAreIgnored) {
    connect();
    receive_started();
    receive(R"({"type":"session.teleported"})");
    receive("{{{{");

    EXPECT_EQ(voice->phase(), Phase::Speaking);
    EXPECT_FALSE(voice->last_error().has_value());
}

TEST_F(VoiceSessionTest, RemoteErrorIsSurfacedWithoutStopping) {
    connect();
    receive_started();
    receive(R"({"type":"error","message":"upstream model unavailable","code":"503"})");

    EXPECT_EQ(voice->phase(), Phase::Speaking);
    ASSERT_TRUE(voice->last_error().has_value());
    EXPECT_EQ(*voice->last_error(), "upstream model unavailable");
    EXPECT_EQ(*voice->last_error_kind(), core::ErrorKind::RemoteReportedError);
    EXPECT_EQ(bridge.error.value_or(""), "upstream model unavailable");
}

TEST_F(VoiceSessionTest, TranscriptsReachPresentation) {
    connect();
    receive(R"({"type":"transcript","text":"Welcome everyone","is_final":true,"speaker":"ai"})");
    receive(R"({"type":"connection.status","status":"connected"})");

    EXPECT_EQ(bridge.transcripts, (std::vector<std::string>{"Welcome everyone"}));
    EXPECT_EQ(voice->phase(), Phase::Processing);
}

// ---------------------------------------------------------------------------
// Outbound traffic
// ---------------------------------------------------------------------------

TEST_F(VoiceSessionTest, CapturedFramesAreSentAsAudioInput) {
    connect();
    input->feed({0.0f, 0.5f, -0.5f, 1.0f, -1.0f, 0.0f, 0.0f, 0.0f, 0.25f});

    ASSERT_TRUE(wait_for_audio_sent(2));
    auto frames = sent_of_type(transport(), "audio.input");
    ASSERT_EQ(frames.size(), 2u);
    EXPECT_EQ(codec::decode(frames[0].at("audio").get<std::string>()),
              (std::vector<int16_t>{0, 16384, -16384, 32767}));
    EXPECT_EQ(codec::decode(frames[1].at("audio").get<std::string>()),
              (std::vector<int16_t>{-32768, 0, 0, 0}));
}

TEST_F(VoiceSessionTest, FramesFromStaleCaptureAreDropped) {
    connect();
    voice->post(session::FrameCaptured{12345, std::vector<int16_t>(4, 1)});
    voice->poll();

    EXPECT_EQ(voice->frames_dropped(), 1u);
    EXPECT_TRUE(sent_of_type(transport(), "audio.input").empty());
}

TEST_F(VoiceSessionTest, UserCommandsBecomeClientEvents) {
    connect();
    receive_started();

    voice->post(session::UserCommand{session::CommandKind::Next});
    voice->post(session::UserCommand{session::CommandKind::Previous});
    voice->post(session::UserCommand{session::CommandKind::GoTo, 4});
    voice->post(session::UserCommand{session::CommandKind::GoTo, 0});
    voice->post(session::UserCommand{session::CommandKind::Cancel});
    voice->poll();

    auto navigate = sent_of_type(transport(), "slide.navigate");
    ASSERT_EQ(navigate.size(), 2u);
    EXPECT_EQ(navigate[0].at("direction"), "next");
    EXPECT_EQ(navigate[1].at("direction"), "prev");

    auto go_to = sent_of_type(transport(), "slide.goto");
    ASSERT_EQ(go_to.size(), 1u);
    EXPECT_EQ(go_to[0].at("slide_id"), 4);

    EXPECT_EQ(sent_of_type(transport(), "response.cancel").size(), 1u);

    voice->post(session::UserCommand{session::CommandKind::Stop});
    voice->poll();
    EXPECT_EQ(voice->phase(), Phase::Idle);
}

TEST_F(VoiceSessionTest, CommandsWhileIdleSendNothing) {
    voice->navigate(protocol::Direction::Next);
    voice->go_to_slide(2);
    voice->cancel_response();
    EXPECT_TRUE(transports.empty());
    EXPECT_EQ(voice->phase(), Phase::Idle);

    voice->post(session::UserCommand{session::CommandKind::Start});
    voice->poll();
    EXPECT_EQ(voice->phase(), Phase::Connecting);
}
