// src/tools/transport_probe.cpp - checks that a voice server speaks the session protocol

#include "network/websocket_channel.hpp"
#include "protocol/events.hpp"
#include "core/errors.hpp"
#include <iostream>
#include <string>
#include <atomic>
#include <chrono>
#include <thread>
#include <memory>

// ANSI codes for colored output
#define RESET   "\033[0m"
#define RED     "\033[31m"
#define GREEN   "\033[32m"
#define YELLOW  "\033[33m"
#define BLUE    "\033[34m"
#define MAGENTA "\033[35m"
#define CYAN    "\033[36m"

class ProbeListener : public network::ChannelListener {
public:
    void on_open() override {
        opened_ = true;
        std::cout << GREEN << "✅ Connected" << RESET << std::endl;
    }

    void on_message(std::string text) override {
        ++messages_;
        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start_time_).count();

        try {
            auto event = protocol::parse_server_event(text);
            std::cout << GREEN << "📨 #" << messages_ << " [+" << elapsed << "ms]: " << RESET
                      << protocol::type_name(event);

            std::visit(protocol::overloaded{
                [](const protocol::SessionStarted& e) { std::cout << " id=" << e.session_id; },
                [this](const protocol::AudioOutput& e) {
                    audio_bytes_ += e.audio.size();
                    std::cout << " (" << e.audio.size() << " base64 chars)";
                },
                [](const protocol::SlideChanged& e) {
                    std::cout << " " << e.slide_id << "/" << e.total_slides << " \"" << e.title << "\"";
                },
                [](const protocol::Transcript& e) {
                    std::cout << " [" << protocol::to_string(e.speaker) << (e.is_final ? ", final" : "")
                              << "] " << e.text;
                },
                [](const protocol::RemoteError& e) { std::cout << RED << " " << e.message << RESET; },
                [](const protocol::ConnectionStatus& e) { std::cout << " " << e.status; },
                [](const auto&) {}
            }, event);
            std::cout << std::endl;
        } catch (const core::VoiceError& e) {
            ++rejected_;
            std::cout << YELLOW << "⚠️  #" << messages_ << " [+" << elapsed << "ms]: rejected - "
                      << e.what() << RESET << std::endl;
        }
    }

    void on_error(core::ErrorKind kind, const std::string& message) override {
        failed_ = true;
        std::cerr << RED << "❌ [" << core::to_string(kind) << "] " << message << RESET << std::endl;
    }

    void on_close(const std::string& reason) override {
        closed_ = true;
        std::cout << BLUE << "🔌 Closed: " << reason << RESET << std::endl;
    }

    bool opened() const { return opened_; }
    bool failed() const { return failed_; }
    bool closed() const { return closed_; }
    int messages() const { return messages_; }
    int rejected() const { return rejected_; }
    size_t audio_bytes() const { return audio_bytes_; }

private:
    std::chrono::steady_clock::time_point start_time_ = std::chrono::steady_clock::now();
    std::atomic<bool> opened_{false};
    std::atomic<bool> failed_{false};
    std::atomic<bool> closed_{false};
    std::atomic<int> messages_{0};
    std::atomic<int> rejected_{0};
    std::atomic<size_t> audio_bytes_{0};
};

void print_probe_usage(const char* program_name) {
    std::cout << "\n" << CYAN << "🧪 Slide Voice Transport Probe v1.0" << RESET << "\n" << std::endl;
    std::cout << "  " << program_name << " <ws_url> [seconds]" << std::endl;
    std::cout << "\n" << GREEN << "Example:" << RESET << std::endl;
    std::cout << "  " << program_name << " ws://localhost:8000/ws 5" << std::endl;
    std::cout << "\n" << MAGENTA << "💡 Sends session.start, prints every server event, then sends session.stop." << RESET << std::endl;
}

int main(int argc, char* argv[]) {
    std::cout << CYAN << "🚀 Slide Voice Transport Probe" << RESET << std::endl;
    std::cout << "================================" << std::endl;

    if (argc < 2 || argc > 3) {
        print_probe_usage(argv[0]);
        return 1;
    }

    try {
        const std::string url = argv[1];
        const int seconds = argc == 3 ? std::stoi(argv[2]) : 5;
        if (seconds < 1 || seconds > 600) {
            std::cerr << RED << "❌ Duration must be 1-600 seconds" << RESET << std::endl;
            return 1;
        }

        auto listener = std::make_shared<ProbeListener>();
        network::WebSocketChannel channel(std::chrono::seconds(10));

        std::cout << BLUE << "📡 Connecting to " << url << RESET << std::endl;
        channel.open(url, listener);

        auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(10);
        while (!listener->opened() && !listener->failed() && std::chrono::steady_clock::now() < deadline) {
            std::this_thread::sleep_for(std::chrono::milliseconds(20));
        }
        if (!listener->opened()) {
            std::cerr << RED << "❌ Could not connect" << RESET << std::endl;
            return 2;
        }

        channel.send(protocol::serialize(protocol::SessionStart{}));
        std::cout << YELLOW << "📤 session.start sent, listening for " << seconds << "s..." << RESET << std::endl;

        deadline = std::chrono::steady_clock::now() + std::chrono::seconds(seconds);
        while (!listener->closed() && std::chrono::steady_clock::now() < deadline) {
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
        }

        if (channel.is_open()) {
            channel.send(protocol::serialize(protocol::SessionStop{}));
            std::cout << YELLOW << "📤 session.stop sent" << RESET << std::endl;
            std::this_thread::sleep_for(std::chrono::milliseconds(300));
        }
        channel.close();

        std::cout << "\n" << MAGENTA << "📊 Probe Results:" << RESET << std::endl;
        std::cout << "   " << GREEN << "Messages received: " << listener->messages() << RESET << std::endl;
        std::cout << "   " << GREEN << "Audio payload: " << listener->audio_bytes() << " base64 chars" << RESET << std::endl;
        if (listener->rejected() > 0) {
            std::cout << "   " << YELLOW << "⚠️  Rejected messages: " << listener->rejected() << RESET << std::endl;
        }

    } catch (const std::exception& e) {
        std::cerr << RED << "❌ ERROR: " << e.what() << RESET << std::endl;
        return 1;
    }

    return 0;
}
