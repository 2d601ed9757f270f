#include "presentation/slide_deck.hpp"
#include <gtest/gtest.h>
#include <stdexcept>

#ifndef SLIDE_VOICE_DATA_DIR
#define SLIDE_VOICE_DATA_DIR "data"
#endif

namespace {

presentation::SlideDeck make_deck(size_t count) {
    std::vector<presentation::Slide> slides;
    for (size_t i = 0; i < count; ++i) {
        presentation::Slide slide;
        slide.id = static_cast<int>(i) + 1;
        slide.title = "Slide " + std::to_string(i + 1);
        slides.push_back(slide);
    }
    return presentation::SlideDeck(std::move(slides), false);
}

}

TEST(SlideData, ParsesAndOrdersById) {
    auto slides = presentation::parse_slides(R"([
        {"id": 2, "title": "Second", "content": ["b"], "narration": "two", "icon": "cpu"},
        {"id": 1, "title": "First", "content": ["a", "aa"], "narration": "one", "iconName": "mic"}
    ])");
    ASSERT_EQ(slides.size(), 2u);
    EXPECT_EQ(slides[0].id, 1);
    EXPECT_EQ(slides[0].title, "First");
    EXPECT_EQ(slides[0].content.size(), 2u);
    EXPECT_EQ(slides[0].icon.value_or(""), "mic");
    EXPECT_EQ(slides[1].icon.value_or(""), "cpu");
}

TEST(SlideData, RejectsBadDocuments) {
    EXPECT_THROW(presentation::parse_slides("{}"), std::runtime_error);
    EXPECT_THROW(presentation::parse_slides("[{\"title\": \"no id\"}]"), std::runtime_error);
    EXPECT_THROW(presentation::parse_slides("[ nope"), std::runtime_error);
    EXPECT_THROW(presentation::load_slides("/nonexistent/slides.json"), std::runtime_error);
}

TEST(SlideData, LoadsBundledDeck) {
    auto slides = presentation::load_slides(std::string(SLIDE_VOICE_DATA_DIR) + "/slides.json");
    ASSERT_FALSE(slides.empty());
    for (size_t i = 0; i < slides.size(); ++i) {
        EXPECT_EQ(slides[i].id, static_cast<int>(i) + 1);
        EXPECT_FALSE(slides[i].title.empty());
    }
}

TEST(SlideDeck, GoToSlideClampsToValidRange) {
    auto deck = make_deck(5);
    deck.go_to_slide(2);
    EXPECT_EQ(deck.current_index(), 2u);
    deck.go_to_slide(99);
    EXPECT_EQ(deck.current_index(), 4u);
    deck.go_to_slide(0);
    EXPECT_EQ(deck.current_index(), 0u);

    auto empty = make_deck(0);
    empty.go_to_slide(3);
    EXPECT_EQ(empty.current_index(), 0u);
    EXPECT_FALSE(empty.current_slide().has_value());
}

TEST(SlideDeck, NextAndPrevStopAtEnds) {
    auto deck = make_deck(2);
    EXPECT_FALSE(deck.prev());
    EXPECT_TRUE(deck.next());
    EXPECT_FALSE(deck.next());
    EXPECT_EQ(deck.current_slide()->title, "Slide 2");
}

TEST(SlideDeck, SyncFillsDeckFromServer) {
    presentation::SlideDeck deck({}, false);

    protocol::SlideChanged event;
    event.slide_id = 3;
    event.title = "Roadmap";
    event.content = {"Q1", "Q2"};
    event.total_slides = 6;
    deck.sync_slide(event);
    deck.go_to_slide(2);

    EXPECT_EQ(deck.size(), 6u);
    EXPECT_EQ(deck.current_index(), 2u);
    EXPECT_EQ(deck.current_slide()->title, "Roadmap");
    EXPECT_EQ(deck.current_slide()->id, 3);
}

TEST(SlideDeck, SyncKeepsLocalContentWhenEventHasNoTitle) {
    auto deck = make_deck(3);
    protocol::SlideChanged event;
    event.slide_id = 2;
    deck.sync_slide(event);
    deck.go_to_slide(1);
    EXPECT_EQ(deck.current_slide()->title, "Slide 2");
}

TEST(SlideDeck, LoadedDeckDoesNotGrowPastItsSlides) {
    auto deck = make_deck(3);
    protocol::SlideChanged event;
    event.slide_id = 7;
    event.title = "Unknown here";
    event.total_slides = 9;
    deck.sync_slide(event);
    deck.go_to_slide(static_cast<size_t>(event.slide_id) - 1);

    EXPECT_EQ(deck.size(), 3u);
    EXPECT_EQ(deck.current_index(), 2u);
    EXPECT_EQ(deck.current_slide()->title, "Slide 3");
}

TEST(SlideDeck, ServerDeckGrowthIsBounded) {
    presentation::SlideDeck deck({}, false);
    protocol::SlideChanged event;
    event.slide_id = 2147483647;
    event.total_slides = 2147483647;
    deck.sync_slide(event);
    deck.go_to_slide(static_cast<size_t>(event.slide_id) - 1);

    EXPECT_EQ(deck.size(), presentation::SlideDeck::kMaxServerSlides);
    EXPECT_EQ(deck.current_index(), presentation::SlideDeck::kMaxServerSlides - 1);
}

TEST(SlideDeck, TracksVoiceStateAndError) {
    auto deck = make_deck(1);
    EXPECT_EQ(deck.voice_state(), session::VoiceActivityState::Idle);
    deck.set_voice_state(session::VoiceActivityState::Speaking);
    EXPECT_EQ(deck.voice_state(), session::VoiceActivityState::Speaking);

    deck.set_error("Connection closed");
    EXPECT_EQ(deck.error().value_or(""), "Connection closed");
    deck.clear_error();
    EXPECT_FALSE(deck.error().has_value());
}
