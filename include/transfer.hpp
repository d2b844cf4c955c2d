#pragma once

#include <array>
#include <atomic>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <boost/asio.hpp>
#include "protocol/codec.hpp"
#include "protocol/message.hpp"
#include "security.hpp"

namespace storage {
class ChunkReader;
}

namespace transfer {

constexpr size_t kDefaultChunkSize = 4096;

using MessageSink = std::function<void(const protocol::Message&)>;
using ByteSink = std::function<void(const uint8_t*, size_t)>;

// Progress callback: filename, bytes_transferred, bytes_total
using TransferProgressCallback = std::function<void(const std::string&, uint64_t, uint64_t)>;

enum class Direction {
    UPLOAD,
    DOWNLOAD
};

// State of the single in-flight file operation of a session.
struct TransferContext {
    std::string filename;
    Direction direction = Direction::DOWNLOAD;
    uint64_t total_size = 0;
    uint64_t transferred = 0;
    size_t chunk_size = kDefaultChunkSize;
};

// Line-oriented view of a connected stream socket. Does not own the socket.
class MessageChannel {
public:
    explicit MessageChannel(boost::asio::ip::tcp::socket& socket,
                            size_t max_line_bytes = protocol::kDefaultMaxLineBytes);

    void send(const protocol::Message& message);
    void send_line(const std::string& line);

    // std::nullopt on orderly end-of-stream. Socket errors throw
    // boost::system::system_error, malformed frames throw FramingError.
    std::optional<std::string> receive_line();
    std::optional<protocol::Message> receive();

    MessageSink sink();

private:
    bool fill();

    boost::asio::ip::tcp::socket& socket_;
    protocol::FrameDecoder decoder_;
    std::array<char, 8192> read_buf_;
};

// Send path: slices a byte stream into FILE_BEGIN, FILE_CHUNK*, FILE_END.
class ChunkSender {
public:
    ChunkSender(std::string filename, uint64_t size, size_t chunk_size, MessageSink sink);

    void begin();
    void push(const uint8_t* data, size_t size);
    void push(const protocol::Bytes& bytes) { push(bytes.data(), bytes.size()); }
    // Flushes the final short chunk and emits FILE_END. Throws
    // ProtocolViolation when the pushed byte count differs from the size.
    void finish();

    uint32_t chunks_sent() const { return next_index_; }
    uint64_t bytes_sent() const { return sent_; }

    void set_progress_callback(TransferProgressCallback cb) { progress_cb_ = std::move(cb); }

private:
    void emit_chunk();

    std::string filename_;
    uint64_t size_;
    size_t chunk_size_;
    MessageSink sink_;
    protocol::Bytes pending_;
    security::ContentDigest digest_;
    uint32_t next_index_ = 0;
    uint64_t sent_ = 0;
    bool begun_ = false;
    bool finished_ = false;
    TransferProgressCallback progress_cb_;
};

// Streams a whole file through a ChunkSender. Returns bytes sent.
uint64_t send_file(storage::ChunkReader& reader, const std::string& filename,
                   size_t chunk_size, const MessageSink& sink,
                   TransferProgressCallback progress_cb = nullptr);

// Receive path: validates a FILE_BEGIN?, FILE_CHUNK*, FILE_END sequence and
// reassembles the payload. Bytes go to the sink if one is set, otherwise
// they are kept in memory.
class ChunkAccumulator {
public:
    static constexpr uint64_t kNoLimit = UINT64_MAX;

    explicit ChunkAccumulator(std::string expected_name = "", uint64_t max_bytes = kNoLimit,
                              ByteSink sink = nullptr);

    // Feed one frame. Returns true once FILE_END has been accepted.
    // Throws ProtocolViolation on an out-of-order or inconsistent frame;
    // in that case no byte of the offending frame has been appended.
    bool accept(const protocol::Message& message);

    bool complete() const { return complete_; }
    uint64_t received() const { return received_; }
    std::optional<uint64_t> size_hint() const { return size_hint_; }
    const protocol::Bytes& content() const { return content_; }
    protocol::Bytes take_content() { return std::move(content_); }

    void set_progress_callback(TransferProgressCallback cb) { progress_cb_ = std::move(cb); }

private:
    void on_begin(const protocol::FileMeta& meta);
    void on_chunk(const protocol::Chunk& chunk);
    void on_end(const protocol::FileEnd& end);

    std::string expected_name_;
    uint64_t max_bytes_;
    ByteSink sink_;
    protocol::Bytes content_;
    security::ContentDigest digest_;
    std::optional<uint64_t> size_hint_;
    uint32_t next_index_ = 0;
    uint64_t received_ = 0;
    bool begun_ = false;
    bool complete_ = false;
    TransferProgressCallback progress_cb_;
};

} // namespace transfer
