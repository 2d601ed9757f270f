#include "app/application.hpp"
#include "app/config.hpp"
#include <iostream>
#include <string>
#include <csignal>
#include <atomic>

// Global flag for signal handling
std::atomic<bool> g_shutdown_requested{false};

void signal_handler(int signal) {
    std::cout << "\n🛑 Shutdown signal received (" << signal << "), press Enter to finish..." << std::endl;
    g_shutdown_requested = true;
}

void print_usage(const char* program_name) {
    std::cout << "\n🎙️ Slide Voice\n" << std::endl;
    std::cout << "Usage: " << program_name << " [ws_url] [options]\n" << std::endl;
    std::cout << "Options:" << std::endl;
    std::cout << "  --slides FILE       Load the slide deck from a JSON file" << std::endl;
    std::cout << "  --timeout-ms N      Connection handshake timeout (default 10000)" << std::endl;
    std::cout << "  --sample-rate HZ    Audio sample rate (default 24000)" << std::endl;
    std::cout << "  --frame-size N      Samples per uploaded frame (default 4800)" << std::endl;
    std::cout << "  --no-aec            Disable echo cancellation" << std::endl;
    std::cout << "  --no-ns             Disable noise suppression" << std::endl;
    std::cout << "\nExamples:" << std::endl;
    std::cout << "  " << program_name << " ws://localhost:8000/ws --slides data/slides.json" << std::endl;
    std::cout << "  SLIDE_VOICE_URL=ws://10.0.0.5:8000/ws " << program_name << " --no-ns" << std::endl;
}

int main(int argc, char* argv[]) {
    std::signal(SIGINT, signal_handler);   // Ctrl+C
    std::signal(SIGTERM, signal_handler);  // Terminate
#ifndef _WIN32
    std::signal(SIGHUP, signal_handler);   // Hangup (Unix/Linux)
#endif

    std::cout << "🎙️ Slide Voice v1.0" << std::endl;
    std::cout << "===================" << std::endl;

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            return 0;
        }
    }

    try {
        app::Config config = app::parse_arguments(argc, argv);

        std::cout << "\n✅ Parameters validated:" << std::endl;
        std::cout << "   📡 Server: " << config.server_url << std::endl;
        if (!config.slides_path.empty()) {
            std::cout << "   📽️  Slides: " << config.slides_path << std::endl;
        }

        std::cout << "\n🚀 Starting application..." << std::endl;
        app::Application app(config);

        if (g_shutdown_requested) {
            std::cout << "🛑 Stop signal received during startup." << std::endl;
            return 0;
        }

        app.run(g_shutdown_requested);

    } catch (const std::invalid_argument& e) {
        std::cerr << "❌ ERROR: Invalid argument - " << e.what() << std::endl;
        print_usage(argv[0]);
        return 1;
    } catch (const std::runtime_error& e) {
        std::cerr << "❌ RUNTIME ERROR: " << e.what() << std::endl;
        std::cerr << "\n🔧 Possible fixes:" << std::endl;
        std::cerr << "   • Check that the slide file exists and is valid JSON" << std::endl;
        std::cerr << "   • Make sure PortAudio is installed and an audio device is present" << std::endl;
        std::cerr << "   • Check that the voice server is reachable" << std::endl;
        return 2;
    } catch (const std::exception& e) {
        std::cerr << "❌ UNEXPECTED ERROR: " << e.what() << std::endl;
        return 3;
    }

    std::cout << "\n✅ Program finished successfully." << std::endl;
    return 0;
}
