#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include "protocol/codec.hpp"
#include "transfer.hpp"

namespace config {

struct ServerConfig {
    std::string host = "0.0.0.0";
    unsigned short port = 5050;
    std::filesystem::path data_root = "server_data";
    size_t chunk_size = transfer::kDefaultChunkSize;
    uint64_t max_upload_bytes = 64ull * 1024 * 1024;
    size_t max_line_bytes = protocol::kDefaultMaxLineBytes;
    std::chrono::milliseconds accept_poll{1000};
    std::chrono::milliseconds shutdown_grace{1000};

    // Throws ConfigError describing the first invalid field.
    void validate() const;
};

struct ClientConfig {
    std::string host;
    unsigned short port = 0;
    std::optional<std::string> command;
    std::filesystem::path download_dir = ".";
    size_t chunk_size = transfer::kDefaultChunkSize;

    void validate() const;
};

// Both parsers return std::nullopt after printing usage for --help and
// throw ConfigError on bad arguments.
std::optional<ServerConfig> parse_server_args(int argc, const char* const argv[]);
std::optional<ClientConfig> parse_client_args(int argc, const char* const argv[]);

} // namespace config
