#ifndef SLIDE_VOICE_AUDIO_DEVICE_HPP
#define SLIDE_VOICE_AUDIO_DEVICE_HPP

#include <vector>
#include <functional>
#include <cstdint>
#include <cstddef>

namespace audio {
    // Position on an output device's clock, in samples since the context opened.
    using SampleTime = std::int64_t;

    // Microphone side. Samples arrive on the device's own thread.
    class InputDevice {
    public:
        using SampleCallback = std::function<void(const float* samples, size_t count)>;

        virtual ~InputDevice() = default;

        // Throws core::VoiceError(CaptureUnavailable) when the device cannot be acquired.
        virtual void open(SampleCallback callback) = 0;
        virtual void close() = 0;
        virtual bool is_open() const = 0;
    };

    // One playback context: a device clock plus a timeline of scheduled samples.
    class OutputContext {
    public:
        virtual ~OutputContext() = default;

        virtual SampleTime now() const = 0;
        virtual int sample_rate() const = 0;

        // Plays `samples` starting at `start` on this context's clock.
        virtual void schedule(SampleTime start, std::vector<int16_t> samples) = 0;

        // Drops everything not yet rendered and releases the device.
        virtual void close() = 0;
    };
}

#endif
