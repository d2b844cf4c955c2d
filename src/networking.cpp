#include "networking.hpp"
#include "errors.hpp"
#include "logging.hpp"
#include "session.hpp"

using boost::asio::ip::tcp;

namespace networking {

namespace {

const char* const kTag = "server";

} // namespace

// ─── SessionRegistry ────────────────────────────────────────────────────────

SessionRegistry::~SessionRegistry() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& entry : entries_) {
        if (entry.done->load()) {
            entry.worker.join();
        } else {
            entry.worker.detach();
        }
    }
}

void SessionRegistry::add(std::thread worker, std::shared_ptr<std::atomic<bool>> done) {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.push_back(Entry{std::move(worker), std::move(done)});
}

size_t SessionRegistry::reap() {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t reaped = 0;
    for (auto it = entries_.begin(); it != entries_.end();) {
        if (it->done->load()) {
            it->worker.join();
            it = entries_.erase(it);
            ++reaped;
        } else {
            ++it;
        }
    }
    return reaped;
}

size_t SessionRegistry::drain(std::chrono::milliseconds grace) {
    std::vector<Entry> entries;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        entries.swap(entries_);
    }

    size_t abandoned = 0;
    for (auto& entry : entries) {
        auto deadline = std::chrono::steady_clock::now() + grace;
        while (!entry.done->load() && std::chrono::steady_clock::now() < deadline) {
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
        if (entry.done->load()) {
            entry.worker.join();
        } else {
            // The socket is closed when the process exits
            entry.worker.detach();
            ++abandoned;
        }
    }
    return abandoned;
}

size_t SessionRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

// ─── Server ─────────────────────────────────────────────────────────────────

Server::Server(config::ServerConfig config)
    : config_(std::move(config)),
      io_context_(std::make_shared<boost::asio::io_context>()),
      acceptor_(*io_context_),
      stopping_(std::make_shared<std::atomic<bool>>(false)) {
    config_.validate();
    store_ = std::make_shared<storage::FileStore>(config_.data_root);
    logging::info(kTag, "Data directory: " + store_->root().string());
}

Server::~Server() {
    stop();
    boost::system::error_code ec;
    acceptor_.close(ec);
}

void Server::bind() {
    tcp::endpoint endpoint(boost::asio::ip::make_address(config_.host), config_.port);
    acceptor_.open(endpoint.protocol());
    acceptor_.set_option(boost::asio::socket_base::reuse_address(true));
    acceptor_.bind(endpoint);
    acceptor_.listen(boost::asio::socket_base::max_listen_connections);
    port_ = acceptor_.local_endpoint().port();

    logging::info(kTag, "FTP Server listening on " + config_.host + ":" + std::to_string(port_.load()));
}

void Server::stop() {
    if (!stopping_->exchange(true)) {
        logging::info(kTag, "Shutting down...");
    }
}

void Server::run() {
    if (!acceptor_.is_open()) {
        bind();
    }

    while (!stopping_->load()) {
        tcp::socket socket(*io_context_);
        bool accepted = false;
        boost::system::error_code accept_ec;

        acceptor_.async_accept(socket, [&accepted, &accept_ec](const boost::system::error_code& ec) {
            accept_ec = ec;
            accepted = true;
        });

        // Poll in bounded slices so the stop flag is observed
        while (!accepted && !stopping_->load()) {
            io_context_->restart();
            io_context_->run_for(config_.accept_poll);
            sessions_.reap();
        }

        if (!accepted) {
            acceptor_.cancel();
            io_context_->restart();
            io_context_->run();
            break;
        }
        if (accept_ec) {
            logging::warn(kTag, "accept failed: " + accept_ec.message());
            continue;
        }
        spawn(std::move(socket));
    }

    boost::system::error_code ec;
    acceptor_.close(ec);
    if (ec) {
        logging::warn(kTag, "closing listener: " + ec.message());
    }

    size_t live = sessions_.size();
    if (live > 0) {
        logging::info(kTag, "Waiting for " + std::to_string(live) + " session(s)");
    }
    size_t abandoned = sessions_.drain(config_.shutdown_grace);
    abandoned_ = abandoned;
    if (abandoned > 0) {
        logging::warn(kTag, "Abandoned " + std::to_string(abandoned) + " unfinished session(s)");
    }
    logging::info(kTag, "Server stopped");
}

void Server::spawn(tcp::socket socket) {
    session::SessionOptions options;
    options.chunk_size = config_.chunk_size;
    options.max_upload_bytes = config_.max_upload_bytes;
    options.max_line_bytes = config_.max_line_bytes;

    auto session = std::make_unique<session::Session>(io_context_, std::move(socket), store_, options, stopping_);
    auto done = std::make_shared<std::atomic<bool>>(false);

    try {
        std::thread worker([session = std::move(session), done]() mutable {
            session->run();
            session.reset();
            *done = true;
        });
        sessions_.add(std::move(worker), std::move(done));
    } catch (const std::system_error& e) {
        // The session (and its socket) died with the unstarted lambda
        logging::error(kTag, std::string("Failed to create session thread: ") + e.what());
    }
}

} // namespace networking
