#include "gateway/gateway_stdio.hpp"
#include "protocol/message_reader.hpp"

namespace gateway_stdio {

std::string read_message(std::istream &input) {
    message_reader::JsonMessageReader reader;
    std::string message;

    char character;
    while (input.get(character)) {
        if (reader.consume(character) && reader.next_message(message)) {
            return message;
        }
    }

    // EOF reached without a complete message.
    return "";
}

void write_message(std::ostream &output, const std::string &json_string) {
    output << message_reader::frame_line(json_string);
    output.flush();
}

} // namespace gateway_stdio
