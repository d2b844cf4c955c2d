#include "protocol/codec.hpp"
#include "errors.hpp"
#include "security.hpp"
#include <limits>
#include <nlohmann/json.hpp>

namespace protocol {

namespace {

using nlohmann::json;

json payload_to_json(const Payload& payload) {
    if (const auto* list = std::get_if<FileList>(&payload)) return *list;
    if (const auto* meta = std::get_if<FileMeta>(&payload)) return *meta;
    if (const auto* end = std::get_if<FileEnd>(&payload)) return *end;
    if (const auto* chunk = std::get_if<Chunk>(&payload)) {
        return json{{"index", chunk->index}, {"bytes", security::base64_encode(chunk->bytes)}};
    }
    return json();
}

uint64_t require_unsigned(const json& data, const char* field) {
    const json& value = data.at(field);
    if (!value.is_number_unsigned()) {
        throw FramingError(std::string("field '") + field + "' must be an unsigned integer");
    }
    return value.get<uint64_t>();
}

Payload payload_from_json(Kind kind, const json& data) {
    if (!data.is_object()) {
        throw FramingError("data must be an object");
    }
    switch (kind) {
        case Kind::OK:
        case Kind::READY:
            if (data.contains("files")) {
                return data.get<FileList>();
            }
            require_unsigned(data, "size");
            return data.get<FileMeta>();
        case Kind::FILE_BEGIN:
            require_unsigned(data, "size");
            return data.get<FileMeta>();
        case Kind::FILE_END:
            require_unsigned(data, "size");
            return data.get<FileEnd>();
        case Kind::FILE_CHUNK: {
            uint64_t index = require_unsigned(data, "index");
            if (index > std::numeric_limits<uint32_t>::max()) {
                throw FramingError("chunk index out of range");
            }
            auto bytes = security::base64_decode(data.at("bytes").get<std::string>());
            if (!bytes) {
                throw FramingError("chunk bytes are not valid base64");
            }
            return Chunk{static_cast<uint32_t>(index), std::move(*bytes)};
        }
        case Kind::ERROR:
        case Kind::WELCOME:
            break;
    }
    throw FramingError(std::string(to_string(kind)) + " carries no data");
}

} // namespace

std::string encode(const Message& message) {
    json j;
    j["status"] = to_string(message.kind());
    j["message"] = message.text();
    if (!std::holds_alternative<std::monostate>(message.payload())) {
        j["data"] = payload_to_json(message.payload());
    }
    // dump() escapes control characters, so the delimiter never appears inside.
    // Invalid UTF-8 in peer-supplied names is replaced rather than thrown.
    return j.dump(-1, ' ', false, json::error_handler_t::replace) + kDelimiter;
}

Message decode_line(const std::string& line) {
    json j;
    try {
        j = json::parse(line);
    } catch (const json::parse_error& e) {
        throw FramingError(std::string("malformed message: ") + e.what());
    }
    if (!j.is_object()) {
        throw FramingError("message must be a JSON object");
    }

    try {
        Kind kind = Kind::OK;
        if (!kind_from_string(j.at("status").get<std::string>(), kind)) {
            throw FramingError("unknown message status: " + j.at("status").get<std::string>());
        }
        std::string text = j.value("message", std::string());

        Payload payload;
        auto data = j.find("data");
        if (data != j.end() && !data->is_null()) {
            payload = payload_from_json(kind, *data);
        }
        if (!payload_allowed(kind, payload)) {
            throw FramingError(std::string("missing or unexpected data for ") + to_string(kind));
        }
        return Message(kind, std::move(text), std::move(payload));
    } catch (const json::exception& e) {
        throw FramingError(std::string("malformed message fields: ") + e.what());
    }
}

FrameDecoder::FrameDecoder(size_t max_line_bytes) : max_line_bytes_(max_line_bytes) {}

void FrameDecoder::feed(const char* data, size_t size) {
    buffer_.append(data, size);
}

std::optional<std::string> FrameDecoder::next_line() {
    size_t pos = buffer_.find(kDelimiter, scanned_);
    if (pos == std::string::npos) {
        scanned_ = buffer_.size();
        if (buffered() > max_line_bytes_) {
            throw FramingError("line exceeds " + std::to_string(max_line_bytes_) + " bytes");
        }
        compact();
        return std::nullopt;
    }

    std::string line = buffer_.substr(consumed_, pos - consumed_);
    consumed_ = pos + 1;
    scanned_ = consumed_;
    if (!line.empty() && line.back() == '\r') {
        line.pop_back();
    }
    if (line.size() > max_line_bytes_) {
        throw FramingError("line exceeds " + std::to_string(max_line_bytes_) + " bytes");
    }
    compact();
    return line;
}

std::optional<Message> FrameDecoder::next_message() {
    auto line = next_line();
    if (!line) {
        return std::nullopt;
    }
    return decode_line(*line);
}

void FrameDecoder::compact() {
    // Drop consumed bytes once they dominate the buffer
    if (consumed_ > 0 && consumed_ >= buffer_.size() / 2) {
        buffer_.erase(0, consumed_);
        scanned_ -= consumed_;
        consumed_ = 0;
    }
}

} // namespace protocol
