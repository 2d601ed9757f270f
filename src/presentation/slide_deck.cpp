#include "presentation/slide_deck.hpp"
#include <nlohmann/json.hpp>
#include <fstream>
#include <sstream>
#include <iostream>
#include <stdexcept>
#include <algorithm>

namespace presentation {

using nlohmann::json;

std::vector<Slide> parse_slides(const std::string& json_text) {
    std::vector<Slide> slides;
    try {
        const json document = json::parse(json_text);
        if (!document.is_array()) {
            throw std::runtime_error("slide data must be a JSON array");
        }

        for (const auto& item : document) {
            Slide slide;
            slide.id = item.at("id").get<int>();
            slide.title = item.at("title").get<std::string>();
            slide.content = item.value("content", std::vector<std::string>{});
            slide.narration = item.value("narration", std::string{});
            if (item.contains("iconName")) {
                slide.icon = item.at("iconName").get<std::string>();
            } else if (item.contains("icon")) {
                slide.icon = item.at("icon").get<std::string>();
            }
            slides.push_back(std::move(slide));
        }
    } catch (const json::exception& e) {
        throw std::runtime_error(std::string("invalid slide data: ") + e.what());
    }

    std::sort(slides.begin(), slides.end(),
              [](const Slide& a, const Slide& b) { return a.id < b.id; });
    return slides;
}

std::vector<Slide> load_slides(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        throw std::runtime_error("cannot open slide file: " + path);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return parse_slides(buffer.str());
}

SlideDeck::SlideDeck(std::vector<Slide> slides, bool verbose)
    : slides_(std::move(slides)), server_owned_(slides_.empty()), verbose_(verbose) {}

void SlideDeck::go_to_slide(size_t index) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (slides_.empty()) {
        current_index_ = 0;
        return;
    }
    const size_t clamped = std::min(index, slides_.size() - 1);
    if (clamped == current_index_) {
        return;
    }
    current_index_ = clamped;
    print_slide_locked();
}

size_t SlideDeck::current_index() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return current_index_;
}

void SlideDeck::set_voice_state(session::VoiceActivityState state) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state == voice_state_) {
        return;
    }
    voice_state_ = state;
    if (verbose_) {
        std::cout << "🎙️  Voice: " << session::to_string(state) << std::endl;
    }
}

session::VoiceActivityState SlideDeck::voice_state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return voice_state_;
}

void SlideDeck::set_error(const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex_);
    error_ = message;
    if (verbose_) {
        std::cerr << "❌ " << message << std::endl;
    }
}

void SlideDeck::clear_error() {
    std::lock_guard<std::mutex> lock(mutex_);
    error_.reset();
}

void SlideDeck::sync_slide(const protocol::SlideChanged& event) {
    std::lock_guard<std::mutex> lock(mutex_);

    // Only a deck that started empty follows the server's slide count
    if (server_owned_) {
        const size_t announced = std::max<size_t>(static_cast<size_t>(std::max(event.total_slides, 0)),
                                                  static_cast<size_t>(std::max(event.slide_id, 0)));
        const size_t wanted = std::min(announced, kMaxServerSlides);
        while (slides_.size() < wanted) {
            Slide placeholder;
            placeholder.id = static_cast<int>(slides_.size()) + 1;
            slides_.push_back(std::move(placeholder));
        }
    }

    if (event.slide_id < 1 || static_cast<size_t>(event.slide_id) > slides_.size()) {
        return;
    }
    const size_t index = static_cast<size_t>(event.slide_id) - 1;
    Slide& slide = slides_[index];
    if (!event.title.empty()) {
        slide.title = event.title;
        slide.content = event.content;
        slide.narration = event.narration;
    }
    if (index == current_index_) {
        print_slide_locked();
    }
}

void SlideDeck::on_transcript(const protocol::Transcript& event) {
    if (!verbose_ || !event.is_final) {
        return;
    }
    std::cout << "💬 [" << protocol::to_string(event.speaker) << "] " << event.text << std::endl;
}

bool SlideDeck::next() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (current_index_ + 1 >= slides_.size()) {
        return false;
    }
    ++current_index_;
    print_slide_locked();
    return true;
}

bool SlideDeck::prev() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (current_index_ == 0) {
        return false;
    }
    --current_index_;
    print_slide_locked();
    return true;
}

size_t SlideDeck::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return slides_.size();
}

std::optional<Slide> SlideDeck::current_slide() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (slides_.empty()) {
        return std::nullopt;
    }
    return slides_[current_index_];
}

std::optional<std::string> SlideDeck::error() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return error_;
}

void SlideDeck::print_slide_locked() const {
    if (!verbose_ || slides_.empty()) {
        return;
    }
    const Slide& slide = slides_[current_index_];
    std::cout << "\n📽️  [" << (current_index_ + 1) << "/" << slides_.size() << "] "
              << (slide.title.empty() ? "(untitled)" : slide.title) << std::endl;
    for (const auto& line : slide.content) {
        std::cout << "   • " << line << std::endl;
    }
}

}
