#ifndef SLIDE_VOICE_PORTAUDIO_DEVICE_HPP
#define SLIDE_VOICE_PORTAUDIO_DEVICE_HPP

#include "core/non_copyable.hpp"
#include "audio/audio_device.hpp"
#include <portaudio.h>
#include <vector>
#include <deque>
#include <functional>
#include <cstdint>
#include <atomic>
#include <mutex>

namespace audio {
    // Default microphone, mono float32.
    class PortAudioInput : public InputDevice, private core::NonCopyable {
    public:
        static constexpr int NUM_CHANNELS = 1;
        static constexpr PaSampleFormat FORMAT = paFloat32;

        PortAudioInput(int sample_rate, unsigned long frames_per_buffer);
        ~PortAudioInput() override;

        void open(SampleCallback callback) override;
        void close() override;
        bool is_open() const override { return stream_ != nullptr; }

    private:
        static int pa_callback(const void* input, void* output, unsigned long frame_count,
                               const PaStreamCallbackTimeInfo* time_info,
                               PaStreamCallbackFlags status_flags, void* user_data);

        int sample_rate_;
        unsigned long frames_per_buffer_;
        PaStream* stream_ = nullptr;
        SampleCallback callback_;
    };

    // Default speaker, mono PCM16. The stream is opened by the constructor and
    // renders scheduled segments against its own rendered-sample clock.
    class PortAudioOutput : public OutputContext, private core::NonCopyable {
    public:
        using RenderTap = std::function<void(const int16_t* samples, size_t count)>;

        static constexpr int NUM_CHANNELS = 1;
        static constexpr PaSampleFormat FORMAT = paInt16;

        PortAudioOutput(int sample_rate, unsigned long frames_per_buffer, RenderTap tap = nullptr);
        ~PortAudioOutput() override;

        SampleTime now() const override { return rendered_; }
        int sample_rate() const override { return sample_rate_; }
        void schedule(SampleTime start, std::vector<int16_t> samples) override;
        void close() override;

    private:
        struct Segment {
            SampleTime start;
            std::vector<int16_t> samples;
            SampleTime end() const { return start + static_cast<SampleTime>(samples.size()); }
        };

        static int pa_callback(const void* input, void* output, unsigned long frame_count,
                               const PaStreamCallbackTimeInfo* time_info,
                               PaStreamCallbackFlags status_flags, void* user_data);

        int render(int16_t* output, unsigned long frame_count);

        int sample_rate_;
        PaStream* stream_ = nullptr;
        RenderTap tap_;

        std::mutex mutex_;
        std::deque<Segment> segments_;
        std::atomic<SampleTime> rendered_{0};
    };
}

#endif
