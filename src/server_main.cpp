#include <csignal>
#include <iostream>
#include <thread>
#include <boost/asio.hpp>
#include "config.hpp"
#include "errors.hpp"
#include "logging.hpp"
#include "networking.hpp"

int main(int argc, char* argv[]) {
    std::optional<config::ServerConfig> cfg;
    try {
        cfg = config::parse_server_args(argc, argv);
    } catch (const config::ConfigError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 2;
    }
    if (!cfg) {
        return 0;
    }

    try {
        networking::Server server(*cfg);
        server.bind();

        // SIGINT/SIGTERM only set the shutdown flag; the accept loop notices it
        boost::asio::io_context signal_io;
        boost::asio::signal_set signals(signal_io, SIGINT, SIGTERM);
        signals.async_wait([&server](const boost::system::error_code& ec, int signum) {
            if (ec) return;
            logging::info("server", "Received signal " + std::to_string(signum) + "; shutting down...");
            server.stop();
        });
        std::thread signal_thread([&signal_io]() { signal_io.run(); });

        logging::info("server", "Commands: LS, GET <file>, PUT <file>, EXIT");
        logging::info("server", "Press Ctrl+C to stop");
        int status = 0;
        try {
            server.run();
        } catch (const std::exception& e) {
            logging::error("server", std::string("Server Exception: ") + e.what());
            status = 1;
        }

        signal_io.stop();
        signal_thread.join();
        return status;
    } catch (const std::exception& e) {
        logging::error("server", std::string("Server Exception: ") + e.what());
        return 1;
    }
}
