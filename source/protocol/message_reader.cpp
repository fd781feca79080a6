#include "protocol/message_reader.hpp"

namespace message_reader {

bool JsonMessageReader::consume(char character) {
    // Skip anything before the opening brace.
    if (!started_) {
        if (character == '{') {
            started_ = true;
            brace_depth_ = 1;
            buffer_ += character;
        }
        return false;
    }

    buffer_ += character;

    if (escape_next_) {
        escape_next_ = false;
        return false;
    }

    if (character == '\\' && inside_string_) {
        escape_next_ = true;
        return false;
    }

    if (character == '"') {
        inside_string_ = !inside_string_;
        return false;
    }

    if (inside_string_) {
        return false;
    }

    if (character == '{') {
        brace_depth_++;
    } else if (character == '}') {
        brace_depth_--;
        if (brace_depth_ == 0) {
            completed_messages_.push_back(std::move(buffer_));
            buffer_.clear();
            started_ = false;
            return true;
        }
    }
    return false;
}

void JsonMessageReader::feed(const char *data, size_t length) {
    for (size_t index = 0; index < length; ++index) {
        consume(data[index]);
    }
}

bool JsonMessageReader::next_message(std::string &output_message) {
    if (completed_messages_.empty()) {
        return false;
    }
    output_message = std::move(completed_messages_.front());
    completed_messages_.pop_front();
    return true;
}

bool JsonMessageReader::has_partial_message() const {
    return started_;
}

std::string frame_line(const std::string &json_text) {
    return json_text + "\n";
}

} // namespace message_reader
