#pragma once

#include <atomic>
#include <memory>
#include <optional>
#include <string>
#include <boost/asio.hpp>
#include "file_store.hpp"
#include "transfer.hpp"

namespace session {

enum class State {
    GREETING,
    AWAITING_COMMAND,
    AWAITING_PUT_PAYLOAD,
    CLOSING,
    CLOSED
};

const char* to_string(State state);

struct SessionOptions {
    size_t chunk_size = transfer::kDefaultChunkSize;
    uint64_t max_upload_bytes = 64ull * 1024 * 1024;
    size_t max_line_bytes = protocol::kDefaultMaxLineBytes;
};

// Per-connection protocol controller. Exclusively owns its socket and runs
// the whole command loop on the calling thread.
class Session {
public:
    Session(std::shared_ptr<boost::asio::io_context> io_context,
            boost::asio::ip::tcp::socket socket,
            std::shared_ptr<const storage::FileStore> store,
            SessionOptions options,
            std::shared_ptr<const std::atomic<bool>> shutdown);
    ~Session();

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    // Blocks until the connection is closed. Never throws: every failure is
    // logged with the peer address and ends this session only.
    void run();

    State state() const { return state_; }
    const std::string& peer() const { return peer_; }

private:
    void greet();
    void handle_command(const std::string& line);
    void handle_ls();
    void handle_get(const std::string& name);
    void handle_put(const std::string& name);
    void receive_upload(storage::AtomicFile& file);
    void reply(const protocol::Message& message);
    void close();

    std::shared_ptr<boost::asio::io_context> io_context_;
    boost::asio::ip::tcp::socket socket_;
    std::shared_ptr<const storage::FileStore> store_;
    SessionOptions options_;
    std::shared_ptr<const std::atomic<bool>> shutdown_;
    transfer::MessageChannel channel_;
    std::string peer_;
    State state_ = State::GREETING;
    std::optional<transfer::TransferContext> transfer_;
};

} // namespace session
