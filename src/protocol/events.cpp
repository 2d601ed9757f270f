#include "protocol/events.hpp"
#include "core/errors.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <limits>

namespace protocol {

using nlohmann::json;

namespace {

[[noreturn]] void reject(const std::string& message) {
    throw core::VoiceError(core::ErrorKind::ProtocolDecodeError, message);
}

std::optional<std::string> optional_string(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        return std::nullopt;
    }
    return it->get<std::string>();
}

// Whole numbers only, within [minimum, INT_MAX]; no truncation of 3.7 or wrap of 2^32
int integer_field(const json& value, const char* key, int minimum) {
    if (!value.is_number_integer()) {
        reject(std::string("slide.changed: ") + key + " must be an integer, got " + value.dump());
    }
    const bool too_large = value.is_number_unsigned()
                               ? value.get<uint64_t>() > static_cast<uint64_t>(std::numeric_limits<int>::max())
                               : value.get<int64_t>() > std::numeric_limits<int>::max();
    if (too_large || (!value.is_number_unsigned() && value.get<int64_t>() < minimum)) {
        reject(std::string("slide.changed: ") + key + " out of range: " + value.dump());
    }
    return static_cast<int>(value.get<int64_t>());
}

SlideChanged parse_slide_changed(const json& j) {
    SlideChanged event;
    event.slide_id = integer_field(j.at("slide_id"), "slide_id", 1);
    event.title = j.value("title", std::string{});
    event.content = j.value("content", std::vector<std::string>{});
    event.narration = j.value("narration", std::string{});
    if (j.contains("total_slides") && !j.at("total_slides").is_null()) {
        event.total_slides = integer_field(j.at("total_slides"), "total_slides", 0);
    }
    event.has_next = j.value("has_next", false);
    event.has_previous = j.value("has_previous", false);
    return event;
}

Transcript parse_transcript(const json& j) {
    Transcript event;
    event.text = j.at("text").get<std::string>();
    event.is_final = j.value("is_final", false);

    const auto speaker = j.at("speaker").get<std::string>();
    if (speaker == "user") {
        event.speaker = Speaker::User;
    } else if (speaker == "ai") {
        event.speaker = Speaker::Ai;
    } else {
        reject("transcript: unknown speaker '" + speaker + "'");
    }
    return event;
}

ServerEvent parse_object(const json& j) {
    if (!j.is_object()) {
        reject("message is not a JSON object");
    }

    const auto type = j.at("type").get<std::string>();

    if (type == "session.started") {
        return SessionStarted{j.at("session_id").get<std::string>()};
    }
    if (type == "session.stopped") {
        return SessionStopped{};
    }
    if (type == "audio.output") {
        return AudioOutput{j.at("audio").get<std::string>()};
    }
    if (type == "audio.done") {
        return AudioDone{};
    }
    if (type == "audio.interrupted") {
        return AudioInterrupted{};
    }
    if (type == "slide.changed") {
        return parse_slide_changed(j);
    }
    if (type == "transcript") {
        return parse_transcript(j);
    }
    if (type == "error") {
        return RemoteError{j.at("message").get<std::string>(), optional_string(j, "code")};
    }
    if (type == "connection.status") {
        return ConnectionStatus{j.at("status").get<std::string>(), optional_string(j, "message")};
    }
    reject("unknown event type '" + type + "'");
}

}

std::string serialize(const ClientEvent& event) {
    json j = std::visit(overloaded{
        [](const SessionStart&) { return json{{"type", "session.start"}}; },
        [](const SessionStop&) { return json{{"type", "session.stop"}}; },
        [](const AudioInput& e) { return json{{"type", "audio.input"}, {"audio", e.audio}}; },
        [](const SlideNavigate& e) {
            return json{{"type", "slide.navigate"},
                        {"direction", e.direction == Direction::Next ? "next" : "prev"}};
        },
        [](const SlideGoTo& e) { return json{{"type", "slide.goto"}, {"slide_id", e.slide_id}}; },
        [](const ResponseCancel&) { return json{{"type", "response.cancel"}}; },
    }, event);
    return j.dump();
}

ServerEvent parse_server_event(const std::string& text) {
    try {
        return parse_object(json::parse(text));
    } catch (const json::exception& e) {
        throw core::VoiceError(core::ErrorKind::ProtocolDecodeError, e.what());
    }
}

const char* type_name(const ServerEvent& event) {
    return std::visit(overloaded{
        [](const SessionStarted&) { return "session.started"; },
        [](const SessionStopped&) { return "session.stopped"; },
        [](const AudioOutput&) { return "audio.output"; },
        [](const AudioDone&) { return "audio.done"; },
        [](const AudioInterrupted&) { return "audio.interrupted"; },
        [](const SlideChanged&) { return "slide.changed"; },
        [](const Transcript&) { return "transcript"; },
        [](const RemoteError&) { return "error"; },
        [](const ConnectionStatus&) { return "connection.status"; },
    }, event);
}

const char* to_string(Speaker speaker) {
    return speaker == Speaker::User ? "user" : "ai";
}

}
