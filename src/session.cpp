#include "session.hpp"
#include "errors.hpp"
#include "logging.hpp"
#include "protocol/codec.hpp"
#include "protocol/command.hpp"

#include <optional>

using boost::asio::ip::tcp;
using protocol::Kind;
using protocol::Message;

namespace session {

namespace {

const char* const kWelcome = "Welcome to FTP Server. Commands: LS, GET <file>, PUT <file>, EXIT";
const char* const kUsage = "Use LS, GET, PUT, or EXIT";
constexpr size_t kMaxEchoedVerb = 64;

// A protocol frame sent where a command line was expected, if `line` is one
std::optional<Kind> frame_kind(const std::string& line) {
    size_t first = line.find_first_not_of(" \t");
    if (first == std::string::npos || line[first] != '{') {
        return std::nullopt;
    }
    try {
        return protocol::decode_line(line).kind();
    } catch (const protocol::FramingError&) {
        // Not a frame after all; answered as an unknown command
        return std::nullopt;
    }
}

std::string echoed_verb(const std::string& verb) {
    if (verb.size() <= kMaxEchoedVerb) return verb;
    return verb.substr(0, kMaxEchoedVerb) + "...";
}

bool is_transfer_frame(Kind kind) {
    return kind == Kind::FILE_BEGIN || kind == Kind::FILE_CHUNK || kind == Kind::FILE_END;
}

std::string describe_peer(const tcp::socket& socket) {
    boost::system::error_code ec;
    auto endpoint = socket.remote_endpoint(ec);
    if (ec) return "unknown";
    return endpoint.address().to_string() + ":" + std::to_string(endpoint.port());
}

} // namespace

const char* to_string(State state) {
    switch (state) {
        case State::GREETING: return "Greeting";
        case State::AWAITING_COMMAND: return "AwaitingCommand";
        case State::AWAITING_PUT_PAYLOAD: return "AwaitingPutPayload";
        case State::CLOSING: return "Closing";
        case State::CLOSED: return "Closed";
    }
    return "?";
}

Session::Session(std::shared_ptr<boost::asio::io_context> io_context,
                 tcp::socket socket,
                 std::shared_ptr<const storage::FileStore> store,
                 SessionOptions options,
                 std::shared_ptr<const std::atomic<bool>> shutdown)
    : io_context_(std::move(io_context)),
      socket_(std::move(socket)),
      store_(std::move(store)),
      options_(options),
      shutdown_(std::move(shutdown)),
      channel_(socket_, options_.max_line_bytes),
      peer_(describe_peer(socket_)) {}

Session::~Session() {
    close();
}

void Session::run() {
    logging::info(peer_, "connected");
    try {
        greet();
        while (state_ == State::AWAITING_COMMAND) {
            if (shutdown_->load()) {
                logging::info(peer_, "server shutting down, closing session");
                break;
            }
            auto line = channel_.receive_line();
            if (!line) {
                break;
            }
            handle_command(*line);
        }
    } catch (const protocol::FramingError& e) {
        logging::error(peer_, std::string("framing error: ") + e.what());
    } catch (const protocol::ProtocolViolation& e) {
        logging::error(peer_, std::string("protocol violation: ") + e.what());
    } catch (const boost::system::system_error& e) {
        logging::warn(peer_, std::string("connection error: ") + e.what());
    } catch (const std::exception& e) {
        logging::error(peer_, std::string("session error: ") + e.what());
    }
    if (transfer_) {
        logging::warn(peer_, "transfer of " + transfer_->filename + " aborted after " +
                                 std::to_string(transfer_->transferred) + " bytes");
        transfer_.reset();
    }
    close();
}

void Session::greet() {
    reply(Message::welcome(kWelcome));
    state_ = State::AWAITING_COMMAND;
}

void Session::reply(const Message& message) {
    channel_.send(message);
}

void Session::handle_command(const std::string& line) {
    if (auto kind = frame_kind(line)) {
        throw protocol::ProtocolViolation(std::string(protocol::to_string(*kind)) + " without preceding READY");
    }

    protocol::Command command = protocol::CommandParser::parse(line);
    logging::info(peer_, "Command: " + echoed_verb(command.verb) +
                             (command.argument.empty() ? "" : " " + command.argument));

    // HELP is answered by the client itself; on the wire it is unknown
    if (!protocol::CommandParser::validate(command.verb) || command.verb == "HELP") {
        reply(Message::error("Unknown command: " + echoed_verb(command.verb) + ". " + kUsage));
        return;
    }
    if (protocol::CommandParser::requires_argument(command.verb) && command.argument.empty()) {
        reply(Message::error(command.verb + " requires a filename"));
        return;
    }

    if (command.verb == "EXIT") {
        reply(Message::ok("Goodbye"));
        state_ = State::CLOSING;
    } else if (command.verb == "LS") {
        handle_ls();
    } else if (command.verb == "GET") {
        handle_get(command.argument);
    } else if (command.verb == "PUT") {
        handle_put(command.argument);
    }
}

void Session::handle_ls() {
    std::vector<std::string> files;
    try {
        files = store_->list();
    } catch (const storage::StoreError& e) {
        logging::warn(peer_, e.what());
        reply(Message::error(std::string("Failed to list files: ") + e.what()));
        return;
    }
    std::string text = files.empty() ? "No files" : "Files: " + std::to_string(files.size());
    reply(Message::ok_files(text, std::move(files)));
}

void Session::handle_get(const std::string& name) {
    std::optional<storage::ChunkReader> reader;
    try {
        reader = store_->open(name);
    } catch (const storage::InvalidName& e) {
        reply(Message::error("GET requires a filename: " + std::string(e.what())));
        return;
    } catch (const storage::StoreError& e) {
        logging::warn(peer_, e.what());
        reply(Message::error("Failed to read file: " + name));
        return;
    }
    if (!reader) {
        reply(Message::error("File not found: " + name));
        return;
    }

    const uint64_t size = reader->size();
    reply(Message::ok_meta("Sending " + name, name, size));

    // From here on a failure leaves the peer mid-transfer; it ends the session
    transfer_ = transfer::TransferContext{name, transfer::Direction::DOWNLOAD, size, 0, options_.chunk_size};
    transfer::send_file(*reader, name, options_.chunk_size, channel_.sink(),
                        [this](const std::string&, uint64_t sent, uint64_t) { transfer_->transferred = sent; });
    logging::info(peer_, "Sent " + name + " (" + std::to_string(size) + " bytes)");
    transfer_.reset();
}

void Session::handle_put(const std::string& name) {
    std::optional<storage::AtomicFile> file;
    try {
        file.emplace(store_->create(name));
    } catch (const storage::InvalidName& e) {
        reply(Message::error("PUT requires a filename: " + std::string(e.what())));
        return;
    } catch (const storage::StoreError& e) {
        logging::warn(peer_, e.what());
        reply(Message::error("Failed to save file: " + name));
        return;
    }

    reply(Message::ready("Ready to receive " + name));
    state_ = State::AWAITING_PUT_PAYLOAD;
    transfer_ = transfer::TransferContext{name, transfer::Direction::UPLOAD, 0, 0, options_.chunk_size};

    receive_upload(*file);
    if (state_ == State::AWAITING_PUT_PAYLOAD) {
        state_ = State::AWAITING_COMMAND;
    }
    transfer_.reset();
}

void Session::receive_upload(storage::AtomicFile& file) {
    const std::string name = transfer_->filename;
    transfer::ChunkAccumulator accumulator(
        name, options_.max_upload_bytes,
        [&file](const uint8_t* data, size_t size) { file.write(data, size); });

    // Once rejected, the rest of the upload is read and dropped so the next
    // line is a command again
    std::string failure;
    while (true) {
        auto message = channel_.receive();
        if (!message) {
            state_ = State::CLOSING;
            throw boost::system::system_error(boost::asio::error::eof, "connection closed during upload");
        }
        if (!is_transfer_frame(message->kind())) {
            throw protocol::ProtocolViolation(std::string("unexpected ") + protocol::to_string(message->kind()) +
                                              " while awaiting PUT payload");
        }
        const bool last = message->kind() == Kind::FILE_END;
        if (!failure.empty()) {
            if (last) break;
            continue;
        }

        try {
            if (accumulator.accept(*message)) break;
            if (accumulator.size_hint()) transfer_->total_size = *accumulator.size_hint();
            transfer_->transferred = accumulator.received();
        } catch (const protocol::ProtocolViolation& e) {
            logging::warn(peer_, "upload of " + name + " rejected: " + e.what());
            failure = std::string("Upload rejected: ") + e.what();
            file.abort();
            if (last) break;
        } catch (const storage::StoreError& e) {
            logging::warn(peer_, e.what());
            failure = "Failed to save file: " + name;
            file.abort();
            if (last) break;
        }
    }

    if (!failure.empty()) {
        reply(Message::error(failure));
        return;
    }
    try {
        file.commit();
    } catch (const storage::StoreError& e) {
        logging::warn(peer_, e.what());
        reply(Message::error("Failed to save file: " + name));
        return;
    }
    logging::info(peer_, "Received " + name + " (" + std::to_string(accumulator.received()) + " bytes)");
    reply(Message::ok("File " + name + " saved successfully"));
}

void Session::close() {
    if (state_ == State::CLOSED) return;
    state_ = State::CLOSING;

    boost::system::error_code ec;
    socket_.shutdown(tcp::socket::shutdown_both, ec);
    socket_.close(ec);
    state_ = State::CLOSED;
    logging::info(peer_, "Disconnected");
}

} // namespace session
