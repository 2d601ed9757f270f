#include "app/application.hpp"
#include "audio/portaudio_device.hpp"
#include "network/websocket_channel.hpp"
#include <iostream>
#include <sstream>
#include <chrono>
#include <functional>

namespace app {

Application::Application(Config config) : config_(std::move(config)) {
    try {
        std::vector<presentation::Slide> slides;
        if (!config_.slides_path.empty()) {
            slides = presentation::load_slides(config_.slides_path);
            std::cout << "✓ " << slides.size() << " slides loaded from " << config_.slides_path << std::endl;
        }
        deck_ = std::make_unique<presentation::SlideDeck>(std::move(slides));

        session::SessionDependencies deps;

        if (config_.echo_cancellation) {
            echo_canceller_ = std::make_shared<processing::EchoCanceller>(512, 0.1f,
                                                                          static_cast<size_t>(config_.sample_rate));
            deps.capture_processors.push_back(echo_canceller_);
        }
        if (config_.noise_suppression) {
            noise_suppressor_ = std::make_shared<processing::NoiseSuppressor>(512, 1.5f, 0.08f);
            deps.capture_processors.push_back(noise_suppressor_);
        }

        const int sample_rate = config_.sample_rate;
        const unsigned long frames_per_buffer = static_cast<unsigned long>(sample_rate / 50);  // 20ms
        const auto timeout = config_.handshake_timeout;
        auto echo_canceller = echo_canceller_;

        deps.make_transport = [timeout]() {
            return std::make_unique<network::WebSocketChannel>(timeout);
        };
        deps.make_input = [sample_rate, frames_per_buffer]() {
            return std::make_unique<audio::PortAudioInput>(sample_rate, frames_per_buffer);
        };
        deps.make_output = [sample_rate, frames_per_buffer, echo_canceller]() {
            audio::PortAudioOutput::RenderTap tap;
            if (echo_canceller) {
                // Rendered speaker audio is the echo reference
                tap = [echo_canceller](const int16_t* samples, size_t count) {
                    echo_canceller->on_playback(samples, count);
                };
            }
            return std::make_unique<audio::PortAudioOutput>(sample_rate, frames_per_buffer, tap);
        };

        session_ = std::make_unique<session::VoiceSession>(config_.session_config(), std::move(deps), *deck_);

        std::cout << "All components created." << std::endl;
    } catch (const std::exception& e) {
        std::cerr << "Critical error while creating the application: " << e.what() << std::endl;
        throw;
    }
}

Application::~Application() {
    running_ = false;
    if (session_thread_.joinable()) {
        session_thread_.join();
    }
}

void Application::run(const std::atomic<bool>& shutdown) {
    std::cout << "\n🎙️ === Slide Voice ===" << std::endl;
    std::cout << "📡 Server: " << config_.server_url << std::endl;
    std::cout << "🔊 Audio: " << config_.sample_rate << " Hz, mono, "
              << config_.frame_size << " samples/frame ("
              << (config_.frame_size * 1000 / static_cast<size_t>(config_.sample_rate)) << " ms)" << std::endl;
    std::cout << "🎛️  Echo cancellation: " << (config_.echo_cancellation ? "on" : "off")
              << ", noise suppression: " << (config_.noise_suppression ? "on" : "off") << std::endl;
    print_help();

    running_ = true;
    session_thread_ = std::thread(&Application::session_loop, this, std::cref(shutdown));

    std::string line;
    while (running_ && !shutdown && std::getline(std::cin, line)) {
        if (!handle_command(line)) {
            break;
        }
    }

    std::cout << "\nShutting down..." << std::endl;
    running_ = false;
    session_thread_.join();
    std::cout << "✓ All components shut down safely." << std::endl;
}

void Application::session_loop(const std::atomic<bool>& shutdown) {
    while (running_ && !shutdown) {
        session_->poll(std::chrono::milliseconds(100));
    }
    session_->stop();
    running_ = false;
}

bool Application::handle_command(const std::string& line) {
    std::istringstream input(line);
    std::string command;
    input >> command;

    if (command.empty()) {
        return true;
    }
    if (command == "quit" || command == "exit") {
        return false;
    }
    if (command == "help") {
        print_help();
    } else if (command == "status") {
        print_status();
    } else if (command == "start") {
        session_->post(session::UserCommand{session::CommandKind::Start});
    } else if (command == "stop") {
        session_->post(session::UserCommand{session::CommandKind::Stop});
    } else if (command == "next") {
        session_->post(session::UserCommand{session::CommandKind::Next});
    } else if (command == "prev") {
        session_->post(session::UserCommand{session::CommandKind::Previous});
    } else if (command == "cancel") {
        session_->post(session::UserCommand{session::CommandKind::Cancel});
    } else if (command == "goto") {
        int slide_id = 0;
        if (!(input >> slide_id) || slide_id < 1) {
            std::cerr << "❌ Usage: goto <slide number, from 1>" << std::endl;
        } else {
            session_->post(session::UserCommand{session::CommandKind::GoTo, slide_id});
        }
    } else {
        std::cerr << "❌ Unknown command: " << command << " (type 'help')" << std::endl;
    }
    return true;
}

void Application::print_help() const {
    std::cout << "\nCommands: start | stop | next | prev | goto N | cancel | status | help | quit\n" << std::endl;
}

void Application::print_status() const {
    std::cout << "🎙️  Voice: " << session::to_string(deck_->voice_state()) << std::endl;
    if (auto slide = deck_->current_slide()) {
        std::cout << "📽️  Slide " << (deck_->current_index() + 1) << "/" << deck_->size()
                  << ": " << (slide->title.empty() ? "(untitled)" : slide->title) << std::endl;
    } else {
        std::cout << "📽️  No slides yet" << std::endl;
    }
    if (auto error = deck_->error()) {
        std::cout << "❌ Last error: " << *error << std::endl;
    }
}

}
