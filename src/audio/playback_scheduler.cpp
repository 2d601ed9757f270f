#include "audio/playback_scheduler.hpp"
#include "core/errors.hpp"
#include <iostream>
#include <algorithm>

namespace audio {

PlaybackScheduler::PlaybackScheduler(ContextFactory factory) : factory_(std::move(factory)) {}

PlaybackScheduler::~PlaybackScheduler() {
    close();
}

void PlaybackScheduler::open_context() {
    context_ = factory_ ? factory_() : nullptr;
    if (!context_) {
        throw core::VoiceError(core::ErrorKind::PlaybackUnavailable, "no output context available");
    }
    cursor_ = context_->now();
}

SampleTime PlaybackScheduler::schedule(std::vector<int16_t> samples) {
    if (!context_) {
        open_context();
    }

    const SampleTime now = context_->now();
    const SampleTime start = std::max(now, cursor_);
    const auto duration = static_cast<SampleTime>(samples.size());

    // Arrivals slower than real time leave a gap here; the frame plays at "now"
    static int underrun_counter = 0;
    if (cursor_ < now && ++underrun_counter % 50 == 1) {
        std::cout << "🔇 Playback fell behind by " << (now - cursor_) << " samples" << std::endl;
    }

    context_->schedule(start, std::move(samples));
    cursor_ = start + duration;
    return start;
}

void PlaybackScheduler::interrupt() {
    if (context_) {
        context_->close();
        context_.reset();
    }
    cursor_ = 0;

    try {
        open_context();
    } catch (const core::VoiceError& e) {
        // Next schedule() retries the open
        std::cerr << "❌ [" << core::to_string(e.kind()) << "] " << e.what() << std::endl;
        context_.reset();
        cursor_ = 0;
    }
}

void PlaybackScheduler::close() {
    if (context_) {
        context_->close();
        context_.reset();
    }
    cursor_ = 0;
}

int PlaybackScheduler::sample_rate() const {
    return context_ ? context_->sample_rate() : 0;
}

}
