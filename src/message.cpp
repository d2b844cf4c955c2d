#include "protocol/message.hpp"
#include <stdexcept>
#include <utility>

namespace protocol {

namespace {

struct KindName {
    Kind kind;
    const char* name;
};

const KindName kKindNames[] = {
    {Kind::OK, "OK"},
    {Kind::ERROR, "ERROR"},
    {Kind::READY, "READY"},
    {Kind::WELCOME, "WELCOME"},
    {Kind::FILE_BEGIN, "FILE_BEGIN"},
    {Kind::FILE_CHUNK, "FILE_CHUNK"},
    {Kind::FILE_END, "FILE_END"},
};

} // namespace

const char* to_string(Kind kind) {
    for (const auto& entry : kKindNames) {
        if (entry.kind == kind) return entry.name;
    }
    return "UNKNOWN";
}

bool kind_from_string(const std::string& name, Kind& out) {
    for (const auto& entry : kKindNames) {
        if (name == entry.name) {
            out = entry.kind;
            return true;
        }
    }
    return false;
}

bool operator==(const FileList& a, const FileList& b) { return a.files == b.files; }

bool operator==(const FileMeta& a, const FileMeta& b) {
    return a.filename == b.filename && a.size == b.size;
}

bool operator==(const Chunk& a, const Chunk& b) {
    return a.index == b.index && a.bytes == b.bytes;
}

bool operator==(const FileEnd& a, const FileEnd& b) {
    return a.filename == b.filename && a.size == b.size && a.checksum == b.checksum;
}

bool payload_allowed(Kind kind, const Payload& payload) {
    switch (kind) {
        case Kind::OK:
            return std::holds_alternative<std::monostate>(payload) ||
                   std::holds_alternative<FileList>(payload) ||
                   std::holds_alternative<FileMeta>(payload);
        case Kind::READY:
            return std::holds_alternative<std::monostate>(payload) ||
                   std::holds_alternative<FileMeta>(payload);
        case Kind::ERROR:
        case Kind::WELCOME:
            return std::holds_alternative<std::monostate>(payload);
        case Kind::FILE_BEGIN:
            return std::holds_alternative<FileMeta>(payload);
        case Kind::FILE_CHUNK:
            return std::holds_alternative<Chunk>(payload);
        case Kind::FILE_END:
            return std::holds_alternative<FileEnd>(payload);
    }
    return false;
}

Message::Message(Kind kind, std::string text, Payload payload)
    : kind_(kind), text_(std::move(text)), payload_(std::move(payload)) {
    if (!payload_allowed(kind_, payload_)) {
        throw std::invalid_argument(std::string("payload not allowed for ") + to_string(kind_));
    }
}

Message Message::ok(std::string text) { return Message(Kind::OK, std::move(text)); }

Message Message::ok_files(std::string text, std::vector<std::string> files) {
    return Message(Kind::OK, std::move(text), FileList{std::move(files)});
}

Message Message::ok_meta(std::string text, std::string filename, uint64_t size) {
    return Message(Kind::OK, std::move(text), FileMeta{std::move(filename), size});
}

Message Message::error(std::string text) { return Message(Kind::ERROR, std::move(text)); }

Message Message::ready(std::string text) { return Message(Kind::READY, std::move(text)); }

Message Message::welcome(std::string text) { return Message(Kind::WELCOME, std::move(text)); }

Message Message::file_begin(std::string filename, uint64_t size) {
    return Message(Kind::FILE_BEGIN, "", FileMeta{std::move(filename), size});
}

Message Message::file_chunk(uint32_t index, Bytes bytes) {
    return Message(Kind::FILE_CHUNK, "", Chunk{index, std::move(bytes)});
}

Message Message::file_end(std::string filename, uint64_t size, std::string checksum) {
    return Message(Kind::FILE_END, "", FileEnd{std::move(filename), size, std::move(checksum)});
}

bool Message::operator==(const Message& other) const {
    return kind_ == other.kind_ && text_ == other.text_ && payload_ == other.payload_;
}

} // namespace protocol
