#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include "protocol/message.hpp"

namespace protocol {

constexpr char kDelimiter = '\n';
constexpr size_t kDefaultMaxLineBytes = 1024 * 1024;

// Serialize one message to a single JSON line, delimiter included.
std::string encode(const Message& message);

// Parse one line (delimiter already stripped). Throws FramingError.
Message decode_line(const std::string& line);

// Buffers stream bytes and hands out complete lines / messages.
// Returning std::nullopt means "need more data", never an error.
class FrameDecoder {
public:
    explicit FrameDecoder(size_t max_line_bytes = kDefaultMaxLineBytes);

    void feed(const char* data, size_t size);
    void feed(const std::string& data) { feed(data.data(), data.size()); }

    // Next raw line with any trailing '\r' removed. Throws FramingError when
    // the buffered bytes exceed the line limit without a delimiter.
    std::optional<std::string> next_line();

    // Next decoded message. Throws FramingError on a malformed line.
    std::optional<Message> next_message();

    size_t buffered() const { return buffer_.size() - consumed_; }

private:
    void compact();

    std::string buffer_;
    size_t consumed_ = 0;
    size_t scanned_ = 0;
    size_t max_line_bytes_;
};

} // namespace protocol
