#include "config.hpp"
#include "errors.hpp"
#include <iostream>
#include <boost/program_options.hpp>

namespace po = boost::program_options;

namespace config {

namespace {

// Ports arrive as int so that out-of-range values are reported, not truncated
unsigned short checked_port(int port, bool allow_zero) {
    if (port < (allow_zero ? 0 : 1) || port > 65535) {
        throw ConfigError("port out of range: " + std::to_string(port));
    }
    return static_cast<unsigned short>(port);
}

} // namespace

void ServerConfig::validate() const {
    if (host.empty()) throw ConfigError("host must not be empty");
    if (data_root.empty()) throw ConfigError("data root must not be empty");
    if (chunk_size == 0) throw ConfigError("chunk size must be positive");
    if (chunk_size * 2 > max_line_bytes) {
        throw ConfigError("chunk size too large for the line limit");
    }
    if (accept_poll.count() <= 0) throw ConfigError("accept poll interval must be positive");
}

void ClientConfig::validate() const {
    if (host.empty()) throw ConfigError("host must not be empty");
    if (port == 0) throw ConfigError("port must be between 1 and 65535");
    if (chunk_size == 0) throw ConfigError("chunk size must be positive");
}

std::optional<ServerConfig> parse_server_args(int argc, const char* const argv[]) {
    ServerConfig cfg;
    int port = cfg.port;
    std::string root = cfg.data_root.string();
    uint64_t max_upload = cfg.max_upload_bytes;

    po::options_description desc("Multi-client file transfer server");
    desc.add_options()
        ("help,h", "Show this help")
        ("host", po::value<std::string>(&cfg.host)->default_value(cfg.host), "Host to bind to")
        ("port", po::value<int>(&port)->default_value(port), "Port to bind to (0 picks a free port)")
        ("root", po::value<std::string>(&root)->default_value(root), "Data directory")
        ("chunk-size", po::value<size_t>(&cfg.chunk_size)->default_value(cfg.chunk_size), "Bytes per FILE_CHUNK")
        ("max-upload", po::value<uint64_t>(&max_upload)->default_value(max_upload), "Largest accepted upload in bytes");

    try {
        po::variables_map vm;
        po::store(po::parse_command_line(argc, argv, desc), vm);
        if (vm.count("help")) {
            std::cout << desc << "\n";
            return std::nullopt;
        }
        po::notify(vm);
    } catch (const po::error& e) {
        throw ConfigError(e.what());
    }

    cfg.port = checked_port(port, true);
    cfg.data_root = root;
    cfg.max_upload_bytes = max_upload;
    cfg.validate();
    return cfg;
}

std::optional<ClientConfig> parse_client_args(int argc, const char* const argv[]) {
    ClientConfig cfg;
    int port = 0;
    std::string dir = cfg.download_dir.string();

    po::options_description desc("File transfer client");
    desc.add_options()
        ("help,h", "Show this help")
        ("host", po::value<std::string>(&cfg.host), "Server host/IP")
        ("port", po::value<int>(&port), "Server port")
        ("command,c", po::value<std::string>(), "Execute a single command and exit")
        ("dir", po::value<std::string>(&dir)->default_value(dir), "Directory for downloaded files");

    po::positional_options_description positional;
    positional.add("host", 1).add("port", 1);

    try {
        po::variables_map vm;
        po::store(po::command_line_parser(argc, argv).options(desc).positional(positional).run(), vm);
        if (vm.count("help")) {
            std::cout << "Usage: lanftp-client <host> <port> [options]\n" << desc << "\n";
            return std::nullopt;
        }
        po::notify(vm);
        if (!vm.count("host") || !vm.count("port")) {
            throw ConfigError("host and port are required");
        }
        if (vm.count("command")) {
            cfg.command = vm["command"].as<std::string>();
        }
    } catch (const po::error& e) {
        throw ConfigError(e.what());
    }

    cfg.port = checked_port(port, false);
    cfg.download_dir = dir;
    cfg.validate();
    return cfg;
}

} // namespace config
