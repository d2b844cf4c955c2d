#pragma once

#include <chrono>
#include <filesystem>
#include <fstream>
#include <memory>
#include <string>
#include <thread>
#include <boost/asio.hpp>
#include <gtest/gtest.h>
#include "config.hpp"
#include "networking.hpp"
#include "security.hpp"
#include "transfer.hpp"

namespace testing_support {

// Fresh directory under the system temp dir, removed on destruction.
class TempDir {
public:
    TempDir() {
        path_ = std::filesystem::temp_directory_path() / ("lanftp-test-" + security::random_hex(8));
        std::filesystem::create_directories(path_);
    }
    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
};

inline protocol::Bytes to_bytes(const std::string& s) {
    return protocol::Bytes(s.begin(), s.end());
}

inline std::string read_text(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

inline void write_text(const std::filesystem::path& path, const std::string& content) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out << content;
}

// Server on an ephemeral loopback port, run on a background thread.
class RunningServer {
public:
    explicit RunningServer(const std::filesystem::path& root, uint64_t max_upload = 64ull * 1024 * 1024) {
        config::ServerConfig cfg;
        cfg.host = "127.0.0.1";
        cfg.port = 0;
        cfg.data_root = root;
        cfg.max_upload_bytes = max_upload;
        cfg.accept_poll = std::chrono::milliseconds(20);
        cfg.shutdown_grace = std::chrono::milliseconds(500);
        server_ = std::make_unique<networking::Server>(cfg);
        server_->bind();
        thread_ = std::thread([this]() { server_->run(); });
    }

    ~RunningServer() { stop(); }

    // Stops accepting and waits for run() to drain the sessions.
    void stop() {
        server_->stop();
        if (thread_.joinable()) thread_.join();
    }

    unsigned short port() const { return server_->port(); }
    networking::Server& server() { return *server_; }

private:
    std::unique_ptr<networking::Server> server_;
    std::thread thread_;
};

// Speaks the wire protocol directly, without the Client class.
class RawConnection {
public:
    explicit RawConnection(unsigned short port) : socket_(io_context_) {
        socket_.connect(boost::asio::ip::tcp::endpoint(boost::asio::ip::make_address("127.0.0.1"), port));
        channel_ = std::make_unique<transfer::MessageChannel>(socket_);
    }

    void send_line(const std::string& line) { channel_->send_line(line); }
    void send(const protocol::Message& message) { channel_->send(message); }
    void send_raw(const std::string& bytes) {
        boost::asio::write(socket_, boost::asio::buffer(bytes));
    }

    std::optional<protocol::Message> receive() { return channel_->receive(); }

    protocol::Message expect() {
        auto message = channel_->receive();
        if (!message) throw std::runtime_error("connection closed");
        return *message;
    }

    protocol::Message command(const std::string& line) {
        send_line(line);
        return expect();
    }

    transfer::MessageSink sink() { return channel_->sink(); }

    void close() {
        boost::system::error_code ec;
        socket_.shutdown(boost::asio::ip::tcp::socket::shutdown_both, ec);
        socket_.close(ec);
    }

private:
    boost::asio::io_context io_context_;
    boost::asio::ip::tcp::socket socket_;
    std::unique_ptr<transfer::MessageChannel> channel_;
};

} // namespace testing_support
