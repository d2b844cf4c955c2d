#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <iosfwd>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>
#include <boost/asio.hpp>
#include "config.hpp"
#include "file_store.hpp"
#include "protocol/message.hpp"
#include "transfer.hpp"

namespace networking {

// Worker threads of live sessions. Only the supervisor adds and joins;
// size() may be read from any thread.
class SessionRegistry {
public:
    ~SessionRegistry();

    void add(std::thread worker, std::shared_ptr<std::atomic<bool>> done);

    // Joins workers that have finished. Returns how many were reaped.
    size_t reap();

    // Waits up to `grace` for each worker, then abandons the stragglers.
    // Returns the number abandoned.
    size_t drain(std::chrono::milliseconds grace);

    size_t size() const;

private:
    struct Entry {
        std::thread worker;
        std::shared_ptr<std::atomic<bool>> done;
    };

    mutable std::mutex mutex_;
    std::vector<Entry> entries_;
};

// Connection supervisor: accepts clients and runs one Session thread each.
class Server {
public:
    explicit Server(config::ServerConfig config);
    ~Server();

    // Opens the listening socket. Throws boost::system::system_error.
    void bind();

    // Accept loop. Returns after stop() once the sessions have drained.
    void run();

    // Safe to call from any thread, including signal handlers' completion.
    void stop();

    bool stopping() const { return stopping_->load(); }
    unsigned short port() const { return port_; }
    size_t active_sessions() const { return sessions_.size(); }
    // Sessions still running when the last shutdown grace expired
    size_t abandoned_sessions() const { return abandoned_.load(); }
    const storage::FileStore& store() const { return *store_; }

private:
    void spawn(boost::asio::ip::tcp::socket socket);

    config::ServerConfig config_;
    std::shared_ptr<boost::asio::io_context> io_context_;
    boost::asio::ip::tcp::acceptor acceptor_;
    std::shared_ptr<storage::FileStore> store_;
    std::shared_ptr<std::atomic<bool>> stopping_;
    std::atomic<unsigned short> port_{0};
    std::atomic<size_t> abandoned_{0};
    SessionRegistry sessions_;
};

class Client {
public:
    explicit Client(config::ClientConfig config);
    ~Client();

    // Connects and reads the WELCOME message. Returns false on failure.
    bool connect();
    bool connected() const { return connected_; }
    void disconnect();

    std::optional<std::vector<std::string>> list();
    bool get(const std::string& filename);
    bool put(const std::filesystem::path& path);
    bool exit();

    // Runs one command line (LS, GET x, PUT x, EXIT/QUIT, HELP).
    bool execute(const std::string& line);
    void run_interactive(std::istream& in);

    const std::optional<protocol::Message>& last_response() const { return last_response_; }
    const std::string& welcome() const { return welcome_; }

private:
    std::optional<protocol::Message> request(const std::string& line);
    std::optional<protocol::Message> receive();
    static void print_help();

    config::ClientConfig config_;
    boost::asio::io_context io_context_;
    boost::asio::ip::tcp::socket socket_;
    std::unique_ptr<transfer::MessageChannel> channel_;
    std::optional<protocol::Message> last_response_;
    std::string welcome_;
    bool connected_ = false;
};

} // namespace networking
