#include "transfer.hpp"
#include "errors.hpp"
#include "file_store.hpp"
#include <algorithm>

namespace transfer {

using protocol::Kind;
using protocol::Message;
using protocol::ProtocolViolation;

// ─── MessageChannel ─────────────────────────────────────────────────────────

MessageChannel::MessageChannel(boost::asio::ip::tcp::socket& socket, size_t max_line_bytes)
    : socket_(socket), decoder_(max_line_bytes) {}

void MessageChannel::send(const Message& message) {
    std::string msg = protocol::encode(message);
    boost::asio::write(socket_, boost::asio::buffer(msg));
}

void MessageChannel::send_line(const std::string& line) {
    std::string msg = line + "\n";
    boost::asio::write(socket_, boost::asio::buffer(msg));
}

bool MessageChannel::fill() {
    boost::system::error_code ec;
    size_t len = socket_.read_some(boost::asio::buffer(read_buf_), ec);
    if (ec == boost::asio::error::eof) {
        return false;
    }
    if (ec) {
        throw boost::system::system_error(ec);
    }
    decoder_.feed(read_buf_.data(), len);
    return true;
}

std::optional<std::string> MessageChannel::receive_line() {
    while (true) {
        if (auto line = decoder_.next_line()) {
            return line;
        }
        if (!fill()) {
            return std::nullopt;
        }
    }
}

std::optional<Message> MessageChannel::receive() {
    auto line = receive_line();
    if (!line) {
        return std::nullopt;
    }
    return protocol::decode_line(*line);
}

MessageSink MessageChannel::sink() {
    return [this](const Message& message) { send(message); };
}

// ─── ChunkSender ────────────────────────────────────────────────────────────

ChunkSender::ChunkSender(std::string filename, uint64_t size, size_t chunk_size, MessageSink sink)
    : filename_(std::move(filename)), size_(size), chunk_size_(chunk_size), sink_(std::move(sink)) {
    if (chunk_size_ == 0) {
        throw std::invalid_argument("chunk size must be positive");
    }
    pending_.reserve(chunk_size_);
}

void ChunkSender::begin() {
    if (begun_) {
        throw std::logic_error("transfer already begun");
    }
    begun_ = true;
    sink_(Message::file_begin(filename_, size_));
}

void ChunkSender::push(const uint8_t* data, size_t size) {
    if (!begun_ || finished_) {
        throw std::logic_error("push outside of an open transfer");
    }
    digest_.update(data, size);
    while (size > 0) {
        size_t take = std::min(size, chunk_size_ - pending_.size());
        pending_.insert(pending_.end(), data, data + take);
        data += take;
        size -= take;
        if (pending_.size() == chunk_size_) {
            emit_chunk();
        }
    }
}

void ChunkSender::emit_chunk() {
    sent_ += pending_.size();
    sink_(Message::file_chunk(next_index_++, std::move(pending_)));
    pending_.clear();
    pending_.reserve(chunk_size_);
    if (progress_cb_) {
        progress_cb_(filename_, sent_, size_);
    }
}

void ChunkSender::finish() {
    if (!begun_ || finished_) {
        throw std::logic_error("finish outside of an open transfer");
    }
    if (!pending_.empty()) {
        emit_chunk();
    }
    finished_ = true;
    if (sent_ != size_) {
        throw ProtocolViolation("sent " + std::to_string(sent_) + " bytes of " + filename_ +
                                ", expected " + std::to_string(size_));
    }
    sink_(Message::file_end(filename_, sent_, digest_.finish()));
}

uint64_t send_file(storage::ChunkReader& reader, const std::string& filename,
                   size_t chunk_size, const MessageSink& sink,
                   TransferProgressCallback progress_cb) {
    ChunkSender sender(filename, reader.size(), chunk_size, sink);
    sender.set_progress_callback(std::move(progress_cb));
    sender.begin();

    protocol::Bytes buffer;
    while (reader.next(buffer, chunk_size)) {
        sender.push(buffer);
    }
    sender.finish();
    return sender.bytes_sent();
}

// ─── ChunkAccumulator ───────────────────────────────────────────────────────

ChunkAccumulator::ChunkAccumulator(std::string expected_name, uint64_t max_bytes, ByteSink sink)
    : expected_name_(std::move(expected_name)), max_bytes_(max_bytes), sink_(std::move(sink)) {}

bool ChunkAccumulator::accept(const Message& message) {
    if (complete_) {
        throw ProtocolViolation(std::string(protocol::to_string(message.kind())) +
                                " after FILE_END");
    }
    switch (message.kind()) {
        case Kind::FILE_BEGIN:
            on_begin(*message.meta());
            break;
        case Kind::FILE_CHUNK:
            on_chunk(*message.chunk());
            break;
        case Kind::FILE_END:
            on_end(*message.end());
            break;
        default:
            throw ProtocolViolation(std::string("unexpected ") + protocol::to_string(message.kind()) +
                                    " during file transfer");
    }
    return complete_;
}

void ChunkAccumulator::on_begin(const protocol::FileMeta& meta) {
    if (begun_ || next_index_ > 0) {
        throw ProtocolViolation("FILE_BEGIN must be the first frame of a transfer");
    }
    if (!expected_name_.empty() && !meta.filename.empty() && meta.filename != expected_name_) {
        throw ProtocolViolation("FILE_BEGIN names " + meta.filename + ", expected " + expected_name_);
    }
    if (meta.size > max_bytes_) {
        throw ProtocolViolation("declared size " + std::to_string(meta.size) +
                                " exceeds limit of " + std::to_string(max_bytes_) + " bytes");
    }
    begun_ = true;
    size_hint_ = meta.size;
}

void ChunkAccumulator::on_chunk(const protocol::Chunk& chunk) {
    if (chunk.index != next_index_) {
        throw ProtocolViolation("chunk index " + std::to_string(chunk.index) +
                                ", expected " + std::to_string(next_index_));
    }
    uint64_t total = received_ + chunk.bytes.size();
    if (total > max_bytes_) {
        throw ProtocolViolation("payload exceeds limit of " + std::to_string(max_bytes_) + " bytes");
    }
    if (size_hint_ && total > *size_hint_) {
        throw ProtocolViolation("payload exceeds declared size of " + std::to_string(*size_hint_) + " bytes");
    }

    if (sink_) {
        sink_(chunk.bytes.data(), chunk.bytes.size());
    } else {
        content_.insert(content_.end(), chunk.bytes.begin(), chunk.bytes.end());
    }
    digest_.update(chunk.bytes);
    received_ = total;
    ++next_index_;

    if (progress_cb_) {
        progress_cb_(expected_name_, received_, size_hint_ ? *size_hint_ : received_);
    }
}

void ChunkAccumulator::on_end(const protocol::FileEnd& end) {
    if (!expected_name_.empty() && !end.filename.empty() && end.filename != expected_name_) {
        throw ProtocolViolation("FILE_END names " + end.filename + ", expected " + expected_name_);
    }
    if (size_hint_ && received_ != *size_hint_) {
        throw ProtocolViolation("received " + std::to_string(received_) +
                                " bytes, declared " + std::to_string(*size_hint_));
    }
    if (end.size != received_) {
        throw ProtocolViolation("received " + std::to_string(received_) +
                                " bytes, FILE_END reports " + std::to_string(end.size));
    }
    std::string actual = digest_.finish();
    if (!end.checksum.empty() && end.checksum != actual) {
        throw ProtocolViolation("checksum mismatch");
    }
    complete_ = true;
}

} // namespace transfer
