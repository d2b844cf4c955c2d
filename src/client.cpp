#include "networking.hpp"
#include "errors.hpp"
#include "protocol/command.hpp"
#include <iomanip>
#include <iostream>
#include <sstream>

using boost::asio::ip::tcp;
using protocol::Kind;
using protocol::Message;

namespace networking {

namespace {

// Human-readable byte count for progress output, e.g. "1.5MB"
std::string format_size(uint64_t bytes) {
    static const char* const kUnits[] = {"B", "KB", "MB", "GB", "TB"};
    constexpr size_t kLastUnit = sizeof(kUnits) / sizeof(kUnits[0]) - 1;

    double value = static_cast<double>(bytes);
    size_t unit = 0;
    for (; value >= 1024.0 && unit < kLastUnit; ++unit) {
        value /= 1024.0;
    }
    std::ostringstream out;
    out << std::fixed << std::setprecision(1) << value << kUnits[unit];
    return out.str();
}

} // namespace

Client::Client(config::ClientConfig config)
    : config_(std::move(config)), socket_(io_context_) {
    config_.validate();
}

Client::~Client() {
    disconnect();
}

bool Client::connect() {
    try {
        tcp::resolver resolver(io_context_);
        boost::asio::connect(socket_, resolver.resolve(config_.host, std::to_string(config_.port)));
        channel_ = std::make_unique<transfer::MessageChannel>(socket_);
        connected_ = true;

        auto welcome = receive();
        if (!welcome || welcome->kind() != Kind::WELCOME) {
            std::cerr << "[error] Server did not send a welcome message\n";
            disconnect();
            return false;
        }
        welcome_ = welcome->text();
        std::cout << "[server] " << welcome_ << "\n";
        return true;
    } catch (std::exception& e) {
        std::cerr << "[error] Failed to connect: " << e.what() << "\n";
        disconnect();
        return false;
    }
}

void Client::disconnect() {
    if (!socket_.is_open()) {
        connected_ = false;
        return;
    }
    boost::system::error_code ec;
    socket_.shutdown(tcp::socket::shutdown_both, ec);
    socket_.close(ec);
    connected_ = false;
}

std::optional<Message> Client::receive() {
    try {
        auto message = channel_->receive();
        if (!message) {
            std::cerr << "[error] Server closed the connection\n";
            disconnect();
        }
        last_response_ = message;
        return message;
    } catch (std::exception& e) {
        // Framing cannot be trusted after a bad frame, so drop the connection
        std::cerr << "[error] Failed to receive response: " << e.what() << "\n";
        disconnect();
        last_response_.reset();
        return std::nullopt;
    }
}

std::optional<Message> Client::request(const std::string& line) {
    if (!connected_) {
        std::cerr << "[error] Not connected\n";
        return std::nullopt;
    }
    try {
        channel_->send_line(line);
    } catch (std::exception& e) {
        std::cerr << "[error] Failed to send command: " << e.what() << "\n";
        disconnect();
        return std::nullopt;
    }
    return receive();
}

std::optional<std::vector<std::string>> Client::list() {
    auto response = request("LS");
    if (!response) return std::nullopt;

    if (response->kind() != Kind::OK || !response->files()) {
        std::cout << "[server] Error: " << response->text() << "\n";
        return std::nullopt;
    }
    const auto& files = response->files()->files;
    std::cout << "\n[server] " << response->text() << "\n";
    if (files.empty()) {
        std::cout << "  (no files)\n";
    } else {
        std::cout << "Files on server:\n";
        for (const auto& file : files) {
            std::cout << "  - " << file << "\n";
        }
    }
    return files;
}

bool Client::get(const std::string& filename) {
    if (filename.empty()) {
        std::cerr << "[error] GET requires a filename\n";
        return false;
    }
    try {
        storage::FileStore::validate_name(filename);
    } catch (storage::InvalidName& e) {
        std::cerr << "[error] " << e.what() << "\n";
        return false;
    }

    auto response = request("GET " + filename);
    if (!response) return false;
    if (response->kind() != Kind::OK || !response->meta()) {
        std::cout << "[server] Error: " << response->text() << "\n";
        return false;
    }
    const protocol::FileMeta meta = *response->meta();
    std::cout << "[server] " << response->text() << "\n";
    std::cout << "  File: " << meta.filename << "\n";
    std::cout << "  Size: " << meta.size << " bytes (" << format_size(meta.size) << ")\n";

    try {
        std::filesystem::create_directories(config_.download_dir);
        storage::AtomicFile file(config_.download_dir / filename);
        transfer::ChunkAccumulator accumulator(
            meta.filename, transfer::ChunkAccumulator::kNoLimit,
            [&file](const uint8_t* data, size_t size) { file.write(data, size); });
        accumulator.set_progress_callback([](const std::string&, uint64_t done, uint64_t total) {
            int percent = (total > 0) ? static_cast<int>((done * 100.0) / total) : 100;
            std::cout << "\r" << percent << "% | " << format_size(done) << std::flush;
        });

        while (!accumulator.complete()) {
            auto frame = receive();
            if (!frame) {
                std::cerr << "\n[error] Download interrupted\n";
                return false;
            }
            accumulator.accept(*frame);
        }
        if (accumulator.received() > 0) {
            std::cout << "\n";
        }
        file.commit();
        std::cout << "[client] File saved: " << std::filesystem::absolute(file.target()).string() << "\n";
        return true;
    } catch (protocol::ProtocolViolation& e) {
        std::cerr << "\n[error] Download failed: " << e.what() << "\n";
        disconnect();
    } catch (std::exception& e) {
        std::cerr << "\n[error] Failed to save file: " << e.what() << "\n";
        disconnect();
    }
    return false;
}

bool Client::put(const std::filesystem::path& path) {
    if (path.empty()) {
        std::cerr << "[error] PUT requires a filename\n";
        return false;
    }
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        std::cerr << "[error] Local file not found: " << path.string() << "\n";
        return false;
    }
    if (!std::filesystem::is_regular_file(path, ec)) {
        std::cerr << "[error] Not a file: " << path.string() << "\n";
        return false;
    }

    std::optional<storage::ChunkReader> reader;
    try {
        reader.emplace(path);
    } catch (storage::StoreError& e) {
        std::cerr << "[error] " << e.what() << "\n";
        return false;
    }

    const std::string name = path.filename().string();
    auto response = request("PUT " + name);
    if (!response) return false;
    if (response->kind() != Kind::READY) {
        std::cout << "[server] Error: " << response->text() << "\n";
        return false;
    }
    std::cout << "[server] " << response->text() << "\n";

    try {
        transfer::send_file(*reader, name, config_.chunk_size, channel_->sink());
    } catch (std::exception& e) {
        // Partial upload leaves the server mid-payload
        std::cerr << "[error] Failed to read/send file: " << e.what() << "\n";
        disconnect();
        return false;
    }

    response = receive();
    if (!response) return false;
    if (response->kind() != Kind::OK) {
        std::cout << "[server] Error: " << response->text() << "\n";
        return false;
    }
    std::cout << "[server] " << response->text() << "\n";
    return true;
}

bool Client::exit() {
    auto response = request("EXIT");
    if (response) {
        std::cout << "[server] " << response->text() << "\n";
    }
    disconnect();
    return response.has_value();
}

void Client::print_help() {
    std::cout << "\nCommands:\n"
              << "  LS              - List files on server\n"
              << "  GET <filename>  - Download file from server\n"
              << "  PUT <filename>  - Upload file to server\n"
              << "  EXIT            - Disconnect and quit\n"
              << "  HELP            - Show this help\n\n";
}

bool Client::execute(const std::string& line) {
    protocol::Command command = protocol::CommandParser::parse(line);
    if (command.verb.empty()) return true;

    if (command.verb == "LS") return list().has_value();
    if (command.verb == "GET") return get(command.argument);
    if (command.verb == "PUT") return put(command.argument);
    if (command.verb == "EXIT" || command.verb == "QUIT") return exit();
    if (command.verb == "HELP") {
        print_help();
        return true;
    }
    std::cout << "[error] Unknown command: " << command.verb << "\n"
              << "Type HELP for available commands\n";
    return false;
}

void Client::run_interactive(std::istream& in) {
    print_help();
    std::string line;
    while (connected_) {
        std::cout << "ftp> " << std::flush;
        if (!std::getline(in, line)) {
            std::cout << "\n[client] End of input\n";
            exit();
            break;
        }
        execute(line);
    }
    std::cout << "[client] Disconnected\n";
}

} // namespace networking
