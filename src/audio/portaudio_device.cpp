#include "audio/portaudio_device.hpp"
#include "core/errors.hpp"
#include <iostream>
#include <algorithm>
#include <cstring>

namespace audio {

// Initializes PortAudio once for the process and terminates it at exit.
class PortAudioInitializer {
public:
    PortAudioInitializer() {
        err_ = Pa_Initialize();
        if (err_ != paNoError) {
            std::cerr << "❌ PortAudio: Pa_Initialize() - " << Pa_GetErrorText(err_) << std::endl;
        }
    }
    ~PortAudioInitializer() {
        if (err_ == paNoError) {
            Pa_Terminate();
        }
    }
    PaError get_error() const { return err_; }
private:
    PaError err_;
};

namespace {

const PortAudioInitializer& portaudio() {
    static PortAudioInitializer initializer;
    return initializer;
}

void require_portaudio(core::ErrorKind kind) {
    if (portaudio().get_error() != paNoError) {
        throw core::VoiceError(kind, std::string("PortAudio unavailable: ") +
                                     Pa_GetErrorText(portaudio().get_error()));
    }
}

}

// ---------------------------------------------------------------------------
// PortAudioInput
// ---------------------------------------------------------------------------

PortAudioInput::PortAudioInput(int sample_rate, unsigned long frames_per_buffer)
    : sample_rate_(sample_rate), frames_per_buffer_(frames_per_buffer) {}

PortAudioInput::~PortAudioInput() {
    close();
}

void PortAudioInput::open(SampleCallback callback) {
    if (stream_) {
        return;
    }
    require_portaudio(core::ErrorKind::CaptureUnavailable);

    PaStreamParameters input_parameters;
    input_parameters.device = Pa_GetDefaultInputDevice();
    if (input_parameters.device == paNoDevice) {
        throw core::VoiceError(core::ErrorKind::CaptureUnavailable, "no default input device");
    }
    input_parameters.channelCount = NUM_CHANNELS;
    input_parameters.sampleFormat = FORMAT;
    input_parameters.suggestedLatency = Pa_GetDeviceInfo(input_parameters.device)->defaultLowInputLatency;
    input_parameters.hostApiSpecificStreamInfo = nullptr;

    callback_ = std::move(callback);

    PaError err = Pa_OpenStream(&stream_, &input_parameters, nullptr, sample_rate_,
                                frames_per_buffer_, paClipOff, &PortAudioInput::pa_callback, this);
    if (err != paNoError) {
        stream_ = nullptr;
        throw core::VoiceError(core::ErrorKind::CaptureUnavailable,
                               std::string("Pa_OpenStream(input) - ") + Pa_GetErrorText(err));
    }

    err = Pa_StartStream(stream_);
    if (err != paNoError) {
        Pa_CloseStream(stream_);
        stream_ = nullptr;
        throw core::VoiceError(core::ErrorKind::CaptureUnavailable,
                               std::string("Pa_StartStream(input) - ") + Pa_GetErrorText(err));
    }

    std::cout << "✓ Microphone open (" << sample_rate_ << " Hz, mono)" << std::endl;
}

void PortAudioInput::close() {
    if (!stream_) {
        return;
    }
    Pa_StopStream(stream_);
    Pa_CloseStream(stream_);
    stream_ = nullptr;
    std::cout << "✓ Microphone released" << std::endl;
}

int PortAudioInput::pa_callback(const void* input, void*, unsigned long frame_count,
                                const PaStreamCallbackTimeInfo*, PaStreamCallbackFlags, void* user_data) {
    auto* self = static_cast<PortAudioInput*>(user_data);
    if (input && self->callback_) {
        self->callback_(static_cast<const float*>(input), frame_count * NUM_CHANNELS);
    }
    return paContinue;
}

// ---------------------------------------------------------------------------
// PortAudioOutput
// ---------------------------------------------------------------------------

PortAudioOutput::PortAudioOutput(int sample_rate, unsigned long frames_per_buffer, RenderTap tap)
    : sample_rate_(sample_rate), tap_(std::move(tap)) {
    require_portaudio(core::ErrorKind::PlaybackUnavailable);

    PaStreamParameters output_parameters;
    output_parameters.device = Pa_GetDefaultOutputDevice();
    if (output_parameters.device == paNoDevice) {
        throw core::VoiceError(core::ErrorKind::PlaybackUnavailable, "no default output device");
    }
    output_parameters.channelCount = NUM_CHANNELS;
    output_parameters.sampleFormat = FORMAT;
    output_parameters.suggestedLatency = Pa_GetDeviceInfo(output_parameters.device)->defaultLowOutputLatency;
    output_parameters.hostApiSpecificStreamInfo = nullptr;

    PaError err = Pa_OpenStream(&stream_, nullptr, &output_parameters, sample_rate_,
                                frames_per_buffer, paClipOff, &PortAudioOutput::pa_callback, this);
    if (err != paNoError) {
        stream_ = nullptr;
        throw core::VoiceError(core::ErrorKind::PlaybackUnavailable,
                               std::string("Pa_OpenStream(output) - ") + Pa_GetErrorText(err));
    }

    err = Pa_StartStream(stream_);
    if (err != paNoError) {
        Pa_CloseStream(stream_);
        stream_ = nullptr;
        throw core::VoiceError(core::ErrorKind::PlaybackUnavailable,
                               std::string("Pa_StartStream(output) - ") + Pa_GetErrorText(err));
    }

    std::cout << "🔊 Playback context open (" << sample_rate_ << " Hz)" << std::endl;
}

PortAudioOutput::~PortAudioOutput() {
    close();
}

void PortAudioOutput::schedule(SampleTime start, std::vector<int16_t> samples) {
    if (samples.empty()) {
        return;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    segments_.push_back(Segment{start, std::move(samples)});
}

void PortAudioOutput::close() {
    if (stream_) {
        // Abort rather than stop: queued host buffers are discarded, not drained
        Pa_AbortStream(stream_);
        Pa_CloseStream(stream_);
        stream_ = nullptr;
        std::cout << "🔊 Playback context closed" << std::endl;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    segments_.clear();
}

int PortAudioOutput::pa_callback(const void*, void* output, unsigned long frame_count,
                                 const PaStreamCallbackTimeInfo*, PaStreamCallbackFlags, void* user_data) {
    return static_cast<PortAudioOutput*>(user_data)->render(static_cast<int16_t*>(output), frame_count);
}

int PortAudioOutput::render(int16_t* output, unsigned long frame_count) {
    const SampleTime begin = rendered_;
    const SampleTime end = begin + static_cast<SampleTime>(frame_count);

    // Silence wherever nothing is scheduled
    std::memset(output, 0, frame_count * NUM_CHANNELS * sizeof(int16_t));

    {
        std::lock_guard<std::mutex> lock(mutex_);
        while (!segments_.empty() && segments_.front().end() <= begin) {
            segments_.pop_front();
        }

        // Segments are ordered and non-overlapping on the timeline
        for (const auto& segment : segments_) {
            if (segment.start >= end) {
                break;
            }
            const SampleTime from = std::max(segment.start, begin);
            const SampleTime to = std::min(segment.end(), end);
            std::memcpy(output + (from - begin),
                        segment.samples.data() + (from - segment.start),
                        static_cast<size_t>(to - from) * sizeof(int16_t));
        }
    }

    rendered_ = end;

    if (tap_) {
        tap_(output, frame_count);
    }
    return paContinue;
}

}
