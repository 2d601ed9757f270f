#ifndef SLIDE_VOICE_PRESENTATION_BRIDGE_HPP
#define SLIDE_VOICE_PRESENTATION_BRIDGE_HPP

#include "session/session_types.hpp"
#include "protocol/events.hpp"
#include <string>
#include <cstddef>

namespace presentation {
    // What the voice session may read and change in the UI/data store.
    class PresentationBridge {
    public:
        virtual ~PresentationBridge() = default;

        // Out-of-range indices clamp to the nearest valid slide.
        virtual void go_to_slide(size_t index) = 0;
        virtual size_t current_index() const = 0;

        virtual void set_voice_state(session::VoiceActivityState state) = 0;
        virtual session::VoiceActivityState voice_state() const = 0;

        virtual void set_error(const std::string& message) = 0;
        virtual void clear_error() = 0;

        virtual void sync_slide(const protocol::SlideChanged&) {}
        virtual void on_transcript(const protocol::Transcript&) {}
    };
}

#endif
