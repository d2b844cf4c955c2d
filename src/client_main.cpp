#include <iostream>
#include "config.hpp"
#include "errors.hpp"
#include "networking.hpp"

int main(int argc, char* argv[]) {
    std::optional<config::ClientConfig> cfg;
    try {
        cfg = config::parse_client_args(argc, argv);
    } catch (const config::ConfigError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 2;
    }
    if (!cfg) {
        return 0;
    }

    networking::Client client(*cfg);
    std::cout << "[client] Connecting to " << cfg->host << ":" << cfg->port << "...\n";
    if (!client.connect()) {
        std::cout << "[client] Failed to connect to server\n";
        return 1;
    }
    std::cout << "[client] Connected successfully\n";

    if (cfg->command) {
        client.execute(*cfg->command);
    } else {
        client.run_interactive(std::cin);
    }

    if (client.connected()) {
        client.disconnect();
    }
    return 0;
}
