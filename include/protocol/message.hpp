#pragma once

#include <cstdint>
#include <string>
#include <variant>
#include <vector>
#include "protocol/file_meta.hpp"

namespace protocol {

using Bytes = std::vector<uint8_t>;

enum class Kind {
    OK,
    ERROR,
    READY,
    WELCOME,
    FILE_BEGIN,
    FILE_CHUNK,
    FILE_END
};

const char* to_string(Kind kind);
bool kind_from_string(const std::string& name, Kind& out);

struct Chunk {
    uint32_t index = 0;
    Bytes bytes;
};

bool operator==(const Chunk& a, const Chunk& b);

using Payload = std::variant<std::monostate, FileList, FileMeta, Chunk, FileEnd>;

// One protocol unit. Immutable once built; use the named constructors.
class Message {
public:
    Message(Kind kind, std::string text, Payload payload = {});

    static Message ok(std::string text);
    static Message ok_files(std::string text, std::vector<std::string> files);
    static Message ok_meta(std::string text, std::string filename, uint64_t size);
    static Message error(std::string text);
    static Message ready(std::string text);
    static Message welcome(std::string text);
    static Message file_begin(std::string filename, uint64_t size);
    static Message file_chunk(uint32_t index, Bytes bytes);
    static Message file_end(std::string filename, uint64_t size, std::string checksum);

    Kind kind() const { return kind_; }
    const std::string& text() const { return text_; }
    const Payload& payload() const { return payload_; }

    const FileList* files() const { return std::get_if<FileList>(&payload_); }
    const FileMeta* meta() const { return std::get_if<FileMeta>(&payload_); }
    const Chunk* chunk() const { return std::get_if<Chunk>(&payload_); }
    const FileEnd* end() const { return std::get_if<FileEnd>(&payload_); }

    bool operator==(const Message& other) const;
    bool operator!=(const Message& other) const { return !(*this == other); }

private:
    Kind kind_;
    std::string text_;
    Payload payload_;
};

// Whether `payload` is a shape that `kind` may carry.
bool payload_allowed(Kind kind, const Payload& payload);

} // namespace protocol
