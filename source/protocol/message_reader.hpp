#ifndef MCPLINK_MESSAGE_READER_HPP
#define MCPLINK_MESSAGE_READER_HPP

// Framing for JSON messages exchanged over standard-IO pipes.
// Uses brace-counting with string/escape awareness, so it works both with
// newline-delimited JSON and with objects split across reads. Bytes outside of
// an object (blank lines, stray log output) are skipped.

#include <cstddef>
#include <deque>
#include <string>

namespace message_reader {

class JsonMessageReader {
public:
    // Consume one character. Returns true when it completed a JSON object,
    // which is then available from next_message().
    bool consume(char character);

    // Consume a block of bytes read from a pipe.
    void feed(const char *data, size_t length);

    // Pop the oldest completed message. Returns false if none is complete yet.
    bool next_message(std::string &output_message);

    // True while an object has been started but not closed.
    bool has_partial_message() const;

private:
    std::string buffer_;
    int brace_depth_ = 0;
    bool inside_string_ = false;
    bool escape_next_ = false;
    bool started_ = false;
    std::deque<std::string> completed_messages_;
};

// Serialize a message for the wire: compact JSON followed by a newline.
std::string frame_line(const std::string &json_text);

} // namespace message_reader

#endif // MCPLINK_MESSAGE_READER_HPP
