#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <memory>
#include <sstream>
#include <string>
#include "cli/cli.hpp"
#include "test_utils.hpp"

using namespace xornet;

class CliTest : public ::testing::Test {
protected:
  std::filesystem::path test_dir;
  std::unique_ptr<node::LocalNetwork> network;
  std::stringstream input;
  std::stringstream output;

  void SetUp() override {
    test::quiet_logging();
    test_dir = test::unique_temp_dir("cli_test");

    node::NodeConfig config;
    config.chunker.min_chunk_size = 900;
    config.chunker.max_chunk_size = 1100;
    config.replication = 3;
    network = std::make_unique<node::LocalNetwork>(5, config);
  }

  void TearDown() override {
    network.reset();
    std::filesystem::remove_all(test_dir);
  }

  std::filesystem::path write_payload(const std::string& name, const crypto::Bytes& bytes) {
    auto path = test_dir / name;
    std::ofstream file(path, std::ios::binary);
    file.write(reinterpret_cast<const char*>(bytes.data()), bytes.size());
    return path;
  }

  static crypto::Bytes read_payload(const std::filesystem::path& path) {
    std::ifstream file(path, std::ios::binary);
    return crypto::Bytes(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
  }
};

TEST_F(CliTest, UploadThenDownload) {
  crypto::Bytes payload = test::random_bytes(3000);
  auto source = write_payload("payload.bin", payload);
  auto restored = test_dir / "restored.bin";

  cli::CLI shell(*network, input, output);
  EXPECT_TRUE(shell.execute("upload " + source.string()));
  EXPECT_NE(output.str().find("in 3 chunks"), std::string::npos) << output.str();
  ASSERT_TRUE(std::filesystem::exists(source.string() + ".datamap"));

  EXPECT_TRUE(shell.execute("download " + source.string() + ".datamap " + restored.string()));
  EXPECT_EQ(read_payload(restored), payload);
}

TEST_F(CliTest, PublishThenFetch) {
  crypto::Bytes payload = test::random_bytes(4000, 3);
  auto source = write_payload("public.bin", payload);
  auto restored = test_dir / "public.out";

  cli::CLI shell(*network, input, output);
  shell.execute("publish " + source.string());

  std::string text = output.str();
  auto at = text.find(" at ");
  ASSERT_NE(at, std::string::npos) << text;
  std::string address = text.substr(at + 4, 64);

  shell.execute("fetch " + address + " " + restored.string());
  EXPECT_EQ(read_payload(restored), payload);
}

TEST_F(CliTest, RunLoopStopsOnQuit) {
  input.str("help\npeers\nquit\nhelp\n");
  cli::CLI shell(*network, input, output);
  shell.run();

  std::string text = output.str();
  EXPECT_NE(text.find("Available commands"), std::string::npos);
  EXPECT_NE(text.find("Routing table of node 0"), std::string::npos);
  EXPECT_EQ(text.find("Available commands"), text.rfind("Available commands"));
}

TEST_F(CliTest, ReportsErrorsWithoutStopping) {
  cli::CLI shell(*network, input, output);
  EXPECT_TRUE(shell.execute("upload " + (test_dir / "missing.bin").string()));
  EXPECT_NE(output.str().find("Error uploading file"), std::string::npos);

  EXPECT_TRUE(shell.execute("bogus"));
  EXPECT_NE(output.str().find("Unknown command"), std::string::npos);
  EXPECT_FALSE(shell.execute("quit"));
}

TEST_F(CliTest, OfflineCommandTogglesTransport) {
  cli::CLI shell(*network, input, output);
  shell.execute("offline 2");
  EXPECT_FALSE(network->transport().is_online(network->node(2).id()));
  shell.execute("online 2");
  EXPECT_TRUE(network->transport().is_online(network->node(2).id()));
}
