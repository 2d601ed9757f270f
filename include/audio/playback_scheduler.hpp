#ifndef SLIDE_VOICE_PLAYBACK_SCHEDULER_HPP
#define SLIDE_VOICE_PLAYBACK_SCHEDULER_HPP

#include "core/non_copyable.hpp"
#include "audio/audio_device.hpp"
#include <memory>
#include <vector>
#include <functional>
#include <cstdint>

namespace audio {
    // Gapless playback of arbitrary-length frames. Each frame starts exactly
    // where the previous one ended, or at the device's "now" when playback
    // has fallen behind.
    class PlaybackScheduler : private core::NonCopyable {
    public:
        using ContextFactory = std::function<std::unique_ptr<OutputContext>()>;

        explicit PlaybackScheduler(ContextFactory factory);
        ~PlaybackScheduler();

        // Opens an output context on first use. Returns the scheduled start time.
        // Throws core::VoiceError(PlaybackUnavailable) if no context can be opened.
        SampleTime schedule(std::vector<int16_t> samples);

        // Barge-in: drop everything queued, replace the context, cursor = now.
        void interrupt();

        // Releases the output context. Safe to call repeatedly.
        void close();

        SampleTime cursor() const { return cursor_; }
        bool has_context() const { return context_ != nullptr; }
        int sample_rate() const;

    private:
        void open_context();

        ContextFactory factory_;
        std::unique_ptr<OutputContext> context_;
        SampleTime cursor_ = 0;
    };
}

#endif
