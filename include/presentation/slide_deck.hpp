#ifndef SLIDE_VOICE_SLIDE_DECK_HPP
#define SLIDE_VOICE_SLIDE_DECK_HPP

#include "presentation/presentation_bridge.hpp"
#include <string>
#include <vector>
#include <optional>
#include <mutex>

namespace presentation {
    struct Slide {
        int id = 0;  // 1-based
        std::string title;
        std::vector<std::string> content;
        std::string narration;
        std::optional<std::string> icon;
    };

    // Reads a JSON array of slides. Throws std::runtime_error.
    std::vector<Slide> parse_slides(const std::string& json_text);
    std::vector<Slide> load_slides(const std::string& path);

    // Console read model for the deck. Written by the session thread, read by
    // the command thread.
    class SlideDeck : public PresentationBridge {
    public:
        // Upper bound on placeholders created from server slide counts
        static constexpr size_t kMaxServerSlides = 1000;

        explicit SlideDeck(std::vector<Slide> slides = {}, bool verbose = true);

        void go_to_slide(size_t index) override;
        size_t current_index() const override;

        void set_voice_state(session::VoiceActivityState state) override;
        session::VoiceActivityState voice_state() const override;

        void set_error(const std::string& message) override;
        void clear_error() override;

        void sync_slide(const protocol::SlideChanged& event) override;
        void on_transcript(const protocol::Transcript& event) override;

        bool next();
        bool prev();

        size_t size() const;
        std::optional<Slide> current_slide() const;
        std::optional<std::string> error() const;

    private:
        void print_slide_locked() const;

        mutable std::mutex mutex_;
        std::vector<Slide> slides_;
        bool server_owned_;
        size_t current_index_ = 0;
        session::VoiceActivityState voice_state_ = session::VoiceActivityState::Idle;
        std::optional<std::string> error_;
        bool verbose_;
    };
}

#endif
