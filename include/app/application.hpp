#ifndef SLIDE_VOICE_APPLICATION_HPP
#define SLIDE_VOICE_APPLICATION_HPP

#include "core/non_copyable.hpp"
#include "app/config.hpp"
#include "presentation/slide_deck.hpp"
#include "processing/echo_canceller.hpp"
#include "processing/noise_suppressor.hpp"
#include "session/voice_session.hpp"
#include <string>
#include <memory>
#include <thread>
#include <atomic>

namespace app {
    class Application : private core::NonCopyable {
    public:
        explicit Application(Config config);
        ~Application();

        // Reads commands from stdin until "quit", end of input or `shutdown`.
        void run(const std::atomic<bool>& shutdown);

    private:
        // Session thread: the only thread that touches session_ after run() starts
        void session_loop(const std::atomic<bool>& shutdown);

        // Returns false when the user asked to quit
        bool handle_command(const std::string& line);
        void print_help() const;
        void print_status() const;

        Config config_;
        std::unique_ptr<presentation::SlideDeck> deck_;

        // Capture-side processing, shared by every session's capture pipeline
        std::shared_ptr<processing::EchoCanceller>   echo_canceller_;
        std::shared_ptr<processing::NoiseSuppressor> noise_suppressor_;

        std::unique_ptr<session::VoiceSession> session_;
        std::thread session_thread_;
        std::atomic<bool> running_{false};
    };
}

#endif
