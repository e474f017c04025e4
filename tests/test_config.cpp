#include <gtest/gtest.h>
#include "config.h"
#include "fs.h"
#include <nlohmann/json.hpp>
#include <cctype>

using namespace rtcdrop;

class ConfigTest : public ::testing::Test {
protected:
    void clean_test_files() {
        delete_file("test_config.json");
    }

    void SetUp() override {
        clean_test_files();
    }

    void TearDown() override {
        clean_test_files();
    }
};

TEST_F(ConfigTest, DefaultsTest) {
    NodeConfig config;
    EXPECT_EQ(config.listen_port, 0);
    EXPECT_EQ(config.connection_timeout_seconds, 30);
    EXPECT_EQ(config.chunk_size, MAX_CHUNK_SIZE);
    EXPECT_EQ(config.download_prefix, "downloaded_");
    EXPECT_TRUE(config.peers.empty());

    FileTransferConfig transfer = config.to_file_transfer_config();
    EXPECT_EQ(transfer.chunk_size, 16384u);
    EXPECT_EQ(transfer.download_prefix, "downloaded_");
}

TEST_F(ConfigTest, GeneratePeerIdTest) {
    std::string id = generate_peer_id();
    ASSERT_EQ(id.size(), 32u);
    for (char c : id) {
        EXPECT_TRUE(std::isxdigit(static_cast<unsigned char>(c)));
    }
    EXPECT_NE(generate_peer_id(), id);
}

TEST_F(ConfigTest, MissingFileCreatesDefaultsTest) {
    NodeConfig config;
    ASSERT_TRUE(load_config("test_config.json", config));
    EXPECT_EQ(config.peer_id.size(), 32u);
    EXPECT_GT(config.created_at, 0);
    ASSERT_TRUE(file_exists("test_config.json"));

    // Peer id survives a reload
    NodeConfig reloaded;
    ASSERT_TRUE(load_config("test_config.json", reloaded));
    EXPECT_EQ(reloaded.peer_id, config.peer_id);
    EXPECT_EQ(reloaded.created_at, config.created_at);
}

TEST_F(ConfigTest, MalformedFileTest) {
    ASSERT_TRUE(create_file("test_config.json", "{ \"peer_id\": "));

    NodeConfig config;
    EXPECT_FALSE(load_config("test_config.json", config));
    EXPECT_EQ(config.peer_id.size(), 32u);
    EXPECT_EQ(config.connection_timeout_seconds, 30);
}

TEST_F(ConfigTest, MissingPeerIdIsGeneratedTest) {
    ASSERT_TRUE(create_file("test_config.json", "{ \"listen_port\": 4100, \"share_directory\": \"files\" }"));

    NodeConfig config;
    ASSERT_TRUE(load_config("test_config.json", config));
    EXPECT_EQ(config.peer_id.size(), 32u);
    EXPECT_EQ(config.listen_port, 4100);
    EXPECT_EQ(config.share_directory, "files");

    // The generated id is written back
    nlohmann::json saved = nlohmann::json::parse(read_file_text_cpp("test_config.json"));
    EXPECT_EQ(saved["peer_id"], config.peer_id);
}

TEST_F(ConfigTest, OutOfRangeValuesTest) {
    nlohmann::json json;
    json["listen_port"] = 70000;
    json["connection_timeout_seconds"] = 0;
    json["chunk_size"] = 1000000;

    NodeConfig config = config_from_json(json);
    EXPECT_EQ(config.listen_port, 0);
    EXPECT_EQ(config.connection_timeout_seconds, 30);
    EXPECT_EQ(config.chunk_size, MAX_CHUNK_SIZE);

    json["chunk_size"] = -4;
    EXPECT_EQ(config_from_json(json).chunk_size, 1u);

    json["chunk_size"] = 4096;
    EXPECT_EQ(config_from_json(json).chunk_size, 4096u);
}

TEST_F(ConfigTest, NonObjectJsonTest) {
    NodeConfig config = config_from_json(nlohmann::json::array({1, 2, 3}));
    EXPECT_TRUE(config.peer_id.empty());
    EXPECT_EQ(config.chunk_size, MAX_CHUNK_SIZE);
}

TEST_F(ConfigTest, SaveAndLoadTest) {
    NodeConfig config;
    config.peer_id = "0123456789abcdef0123456789abcdef";
    config.listen_port = 5000;
    config.connection_timeout_seconds = 12;
    config.chunk_size = 2048;
    config.download_directory = "incoming";
    config.advertised_addresses.push_back("198.51.100.4");
    config.log_level = "DEBUG";
    config.peers["peer-b"] = "127.0.0.1:5001";
    config.peers["peer-c"] = "10.0.0.2:5002";

    ASSERT_TRUE(save_config("test_config.json", config));

    nlohmann::json saved = nlohmann::json::parse(read_file_text_cpp("test_config.json"));
    EXPECT_TRUE(saved.contains("last_updated"));

    NodeConfig loaded;
    ASSERT_TRUE(load_config("test_config.json", loaded));
    EXPECT_EQ(loaded.peer_id, config.peer_id);
    EXPECT_EQ(loaded.listen_port, 5000);
    EXPECT_EQ(loaded.connection_timeout_seconds, 12);
    EXPECT_EQ(loaded.chunk_size, 2048u);
    EXPECT_EQ(loaded.download_directory, "incoming");
    ASSERT_EQ(loaded.advertised_addresses.size(), 1u);
    EXPECT_EQ(loaded.advertised_addresses[0], "198.51.100.4");
    EXPECT_EQ(loaded.log_level, "DEBUG");
    EXPECT_EQ(loaded.peers, config.peers);
}

TEST_F(ConfigTest, NonStringPeerIgnoredTest) {
    nlohmann::json json;
    json["peers"]["peer-b"] = "127.0.0.1:5001";
    json["peers"]["peer-c"] = 42;

    NodeConfig config = config_from_json(json);
    ASSERT_EQ(config.peers.size(), 1u);
    EXPECT_EQ(config.peers["peer-b"], "127.0.0.1:5001");
}
