#include "protocol/event_stream.hpp"
#include "utils/text.hpp"

namespace event_stream {

static const std::string EVENT_FIELD = "event:";
static const std::string DATA_FIELD = "data:";

void Parser::feed(const std::string &chunk) {
    pending_bytes_ += chunk;

    size_t line_start = 0;
    size_t newline_position = pending_bytes_.find('\n', line_start);
    while (newline_position != std::string::npos) {
        std::string line = pending_bytes_.substr(line_start, newline_position - line_start);
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        apply_line(line);
        line_start = newline_position + 1;
        newline_position = pending_bytes_.find('\n', line_start);
    }
    pending_bytes_.erase(0, line_start);
}

bool Parser::next_event(Event &output_event) {
    if (ready_events_.empty()) {
        return false;
    }
    output_event = std::move(ready_events_.front());
    ready_events_.erase(ready_events_.begin());
    return true;
}

bool Parser::finish(Event &output_event) {
    if (next_event(output_event)) {
        return true;
    }
    if (finished_) {
        return false;
    }
    finished_ = true;

    if (!pending_bytes_.empty()) {
        std::string line = pending_bytes_;
        pending_bytes_.clear();
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        apply_line(line);
    }

    if (current_has_fields_) {
        ready_events_.push_back(std::move(current_event_));
        current_event_ = Event();
        current_has_fields_ = false;
    }
    return next_event(output_event);
}

bool Parser::apply_line(const std::string &line) {
    if (line.empty()) {
        if (!current_has_fields_) {
            return false;
        }
        ready_events_.push_back(std::move(current_event_));
        current_event_ = Event();
        current_has_fields_ = false;
        return true;
    }

    if (line[0] == ':') {
        return false;
    }

    if (text::starts_with(line, EVENT_FIELD)) {
        current_event_.name = text::trim(line.substr(EVENT_FIELD.size()));
        current_has_fields_ = true;
    } else if (text::starts_with(line, DATA_FIELD)) {
        std::string part = text::trim(line.substr(DATA_FIELD.size()));
        if (current_event_.data.empty()) {
            current_event_.data = part;
        } else {
            current_event_.data += "\n" + part;
        }
        current_has_fields_ = true;
    }
    // Other fields (id:, retry:) carry nothing this client uses.
    return false;
}

std::vector<Event> parse_all(const std::string &body) {
    Parser parser;
    parser.feed(body);

    std::vector<Event> events;
    Event event;
    while (parser.next_event(event)) {
        events.push_back(event);
    }
    while (parser.finish(event)) {
        events.push_back(event);
    }
    return events;
}

bool looks_like_event_stream(const std::string &body, const std::string &content_type) {
    if (text::to_lower(content_type).find("text/event-stream") != std::string::npos) {
        return true;
    }
    std::string trimmed = text::trim(body);
    return text::starts_with(trimmed, EVENT_FIELD) || text::starts_with(trimmed, DATA_FIELD);
}

} // namespace event_stream
