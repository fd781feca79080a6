#ifndef MCPLINK_EVENT_STREAM_HPP
#define MCPLINK_EVENT_STREAM_HPP

// Server-Sent Events (text/event-stream) framing.
//
// Events are separated by a blank line. "event:" sets the event name, "data:"
// lines accumulate (joined with '\n'), lines starting with ':' are comments or
// heartbeats and are ignored. Input may arrive in arbitrary chunks; a partial
// line is kept until the rest of it arrives.

#include <string>
#include <vector>

namespace event_stream {

struct Event {
    std::string name;
    std::string data;
};

class Parser {
public:
    // Append raw bytes received from the stream.
    void feed(const std::string &chunk);

    // Extract the next complete event. Returns false if no complete event is
    // buffered yet.
    bool next_event(Event &output_event);

    // Signal end of input. Emits the in-progress event (including one whose
    // last line had no terminating newline) exactly once; returns false when
    // nothing was pending, which means the stream has ended.
    bool finish(Event &output_event);

private:
    // Applies one line (without its line terminator). Returns true when the
    // line completed an event.
    bool apply_line(const std::string &line);

    std::string pending_bytes_;
    Event current_event_;
    bool current_has_fields_ = false;
    std::vector<Event> ready_events_;
    bool finished_ = false;
};

// Convenience for bodies that are already complete (inline event-stream replies).
std::vector<Event> parse_all(const std::string &body);

// True when a body looks like an event stream rather than plain JSON.
bool looks_like_event_stream(const std::string &body, const std::string &content_type);

} // namespace event_stream

#endif // MCPLINK_EVENT_STREAM_HPP
