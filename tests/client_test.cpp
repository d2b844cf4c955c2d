#include <sstream>
#include <gtest/gtest.h>
#include "errors.hpp"
#include "test_support.hpp"

using testing_support::RunningServer;
using testing_support::TempDir;
using testing_support::read_text;
using testing_support::write_text;

namespace {

config::ClientConfig client_config(unsigned short port, const std::filesystem::path& download_dir) {
    config::ClientConfig cfg;
    cfg.host = "127.0.0.1";
    cfg.port = port;
    cfg.download_dir = download_dir;
    return cfg;
}

} // namespace

TEST(ClientTest, ConnectReadsWelcome) {
    TempDir server_dir, local_dir;
    RunningServer server(server_dir.path());
    networking::Client client(client_config(server.port(), local_dir.path()));

    ASSERT_TRUE(client.connect());
    EXPECT_TRUE(client.connected());
    EXPECT_NE(client.welcome().find("Welcome"), std::string::npos);
    EXPECT_TRUE(client.exit());
    EXPECT_FALSE(client.connected());
}

TEST(ClientTest, ConnectFailureReturnsFalse) {
    TempDir local_dir;
    unsigned short port;
    {
        // Grab a free port, then release it so nothing listens there
        boost::asio::io_context io;
        boost::asio::ip::tcp::acceptor acceptor(io, {boost::asio::ip::make_address("127.0.0.1"), 0});
        port = acceptor.local_endpoint().port();
    }
    networking::Client client(client_config(port, local_dir.path()));
    EXPECT_FALSE(client.connect());
    EXPECT_FALSE(client.connected());
}

TEST(ClientTest, UploadListDownloadRoundTrip) {
    TempDir server_dir, local_dir, download_dir;
    RunningServer server(server_dir.path());

    std::string content;
    for (int i = 0; i < 5000; ++i) content += static_cast<char>(i % 251);
    write_text(local_dir.path() / "payload.bin", content);

    networking::Client client(client_config(server.port(), download_dir.path()));
    ASSERT_TRUE(client.connect());

    EXPECT_TRUE(client.put(local_dir.path() / "payload.bin"));
    EXPECT_EQ(read_text(server_dir.path() / "payload.bin"), content);

    auto files = client.list();
    ASSERT_TRUE(files.has_value());
    EXPECT_EQ(*files, std::vector<std::string>{"payload.bin"});

    EXPECT_TRUE(client.get("payload.bin"));
    EXPECT_EQ(read_text(download_dir.path() / "payload.bin"), content);
    EXPECT_TRUE(client.exit());
}

TEST(ClientTest, EmptyFileRoundTrip) {
    TempDir server_dir, local_dir, download_dir;
    RunningServer server(server_dir.path());
    write_text(local_dir.path() / "empty.txt", "");

    networking::Client client(client_config(server.port(), download_dir.path()));
    ASSERT_TRUE(client.connect());
    EXPECT_TRUE(client.put(local_dir.path() / "empty.txt"));
    EXPECT_TRUE(client.get("empty.txt"));
    EXPECT_TRUE(std::filesystem::exists(download_dir.path() / "empty.txt"));
    EXPECT_EQ(std::filesystem::file_size(download_dir.path() / "empty.txt"), 0u);
}

TEST(ClientTest, GetMissingFileFailsButStaysConnected) {
    TempDir server_dir, download_dir;
    RunningServer server(server_dir.path());
    networking::Client client(client_config(server.port(), download_dir.path()));
    ASSERT_TRUE(client.connect());

    EXPECT_FALSE(client.get("missing.txt"));
    ASSERT_TRUE(client.last_response().has_value());
    EXPECT_EQ(client.last_response()->kind(), protocol::Kind::ERROR);
    EXPECT_TRUE(client.connected());
    EXPECT_FALSE(std::filesystem::exists(download_dir.path() / "missing.txt"));
}

TEST(ClientTest, PutMissingLocalFileSendsNothing) {
    TempDir server_dir, download_dir;
    RunningServer server(server_dir.path());
    networking::Client client(client_config(server.port(), download_dir.path()));
    ASSERT_TRUE(client.connect());

    EXPECT_FALSE(client.put(download_dir.path() / "nope.txt"));
    EXPECT_FALSE(client.last_response().has_value() &&
                 client.last_response()->kind() == protocol::Kind::READY);
    EXPECT_TRUE(client.connected());
}

TEST(ClientTest, InteractiveLoopRunsScriptUntilExit) {
    TempDir server_dir, download_dir;
    write_text(server_dir.path() / "notes.txt", "remember");
    RunningServer server(server_dir.path());
    networking::Client client(client_config(server.port(), download_dir.path()));
    ASSERT_TRUE(client.connect());

    std::istringstream script("help\nls\nget notes.txt\nbogus\nquit\nls\n");
    client.run_interactive(script);

    EXPECT_FALSE(client.connected());
    EXPECT_EQ(read_text(download_dir.path() / "notes.txt"), "remember");
}

TEST(ClientTest, InteractiveLoopExitsOnEndOfInput) {
    TempDir server_dir, download_dir;
    RunningServer server(server_dir.path());
    networking::Client client(client_config(server.port(), download_dir.path()));
    ASSERT_TRUE(client.connect());

    std::istringstream script("ls\n");
    client.run_interactive(script);
    EXPECT_FALSE(client.connected());
}

TEST(ConfigTest, ServerArgumentsParse) {
    const char* argv[] = {"lanftp-server", "--host", "127.0.0.1", "--port", "6000", "--root", "/tmp/x"};
    auto cfg = config::parse_server_args(7, argv);
    ASSERT_TRUE(cfg.has_value());
    EXPECT_EQ(cfg->host, "127.0.0.1");
    EXPECT_EQ(cfg->port, 6000);
    EXPECT_EQ(cfg->data_root, std::filesystem::path("/tmp/x"));
    EXPECT_EQ(cfg->chunk_size, transfer::kDefaultChunkSize);
}

TEST(ConfigTest, ClientArgumentsParse) {
    const char* argv[] = {"lanftp-client", "localhost", "5050", "-c", "GET a.txt"};
    auto cfg = config::parse_client_args(5, argv);
    ASSERT_TRUE(cfg.has_value());
    EXPECT_EQ(cfg->host, "localhost");
    EXPECT_EQ(cfg->port, 5050);
    ASSERT_TRUE(cfg->command.has_value());
    EXPECT_EQ(*cfg->command, "GET a.txt");
}

TEST(ConfigTest, BadArgumentsThrow) {
    const char* bad_port[] = {"lanftp-server", "--port", "70000"};
    EXPECT_THROW(config::parse_server_args(3, bad_port), config::ConfigError);

    const char* missing[] = {"lanftp-client", "localhost"};
    EXPECT_THROW(config::parse_client_args(2, missing), config::ConfigError);

    const char* zero_chunk[] = {"lanftp-server", "--chunk-size", "0"};
    EXPECT_THROW(config::parse_server_args(3, zero_chunk), config::ConfigError);
}
