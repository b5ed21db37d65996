#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <sstream>

#include "config.hpp"
#include "error.hpp"
#include "log.hpp"

namespace cosign {
namespace {

using json = nlohmann::json;

void expect_validation_error(const json& j) {
    try {
        Config::from_json(j);
        ADD_FAILURE() << "accepted " << j.dump();
    } catch (const CosignError& e) {
        EXPECT_EQ(e.type(), CosignError::ErrorType::Validation) << e.what();
    }
}

TEST(ConfigTest, EmptyDocumentYieldsDefaults) {
    Config config = Config::from_json(json::object());
    EXPECT_EQ(config.network, Network::Regtest);
    EXPECT_EQ(config.bitcoin_cli, "bitcoin-cli");
    EXPECT_TRUE(config.bitcoin_cli_args.empty());
    EXPECT_EQ(config.rpc_timeout_seconds, 30u);
    EXPECT_EQ(config.domain_suffix, "#cosign_btc_multisig");
    EXPECT_EQ(config.max_participants, 10u);
    EXPECT_DOUBLE_EQ(config.min_fee_rate, 1);
    EXPECT_DOUBLE_EQ(config.max_fee_rate, 100000);
    EXPECT_DOUBLE_EQ(config.default_fee_rate, 1);
    EXPECT_EQ(config.min_amount, 300u);
    EXPECT_EQ(config.min_input_value, 0u);
    EXPECT_EQ(config.log_level, LogLevel::Info);
    EXPECT_TRUE(config.log_file.empty());
}

TEST(ConfigTest, OverridesAreApplied) {
    Config config = Config::from_json(json{
        {"network", "testnet"},
        {"bitcoin_cli", "/opt/bitcoin/bin/bitcoin-cli"},
        {"bitcoin_cli_args", {"-rpcwallet=vault", "-rpcport=18443"}},
        {"rpc_timeout_seconds", 5},
        {"domain_suffix", "#staging"},
        {"max_participants", 15},
        {"min_fee_rate", 2},
        {"max_fee_rate", 500.5},
        {"default_fee_rate", 4},
        {"min_amount", 546},
        {"min_input_value", 1000},
        {"log_level", "debug"}
    });

    EXPECT_EQ(config.network, Network::Testnet);
    EXPECT_EQ(config.bitcoin_cli, "/opt/bitcoin/bin/bitcoin-cli");
    ASSERT_EQ(config.bitcoin_cli_args.size(), 2u);
    EXPECT_EQ(config.bitcoin_cli_args[1], "-rpcport=18443");
    EXPECT_EQ(config.domain_suffix, "#staging");
    EXPECT_EQ(config.max_participants, 15u);
    EXPECT_DOUBLE_EQ(config.max_fee_rate, 500.5);
    EXPECT_EQ(config.min_amount, 546u);
    EXPECT_EQ(config.min_input_value, 1000u);
    EXPECT_EQ(config.log_level, LogLevel::Debug);

    auto cli = config.cli_options();
    EXPECT_EQ(cli.binary, config.bitcoin_cli);
    EXPECT_EQ(cli.extra_args, config.bitcoin_cli_args);
    EXPECT_EQ(cli.timeout_seconds, 5u);
    EXPECT_EQ(cli.network, Network::Testnet);
}

TEST(ConfigTest, RejectsUnknownNames) {
    expect_validation_error(json{{"network", "litecoin"}});
    expect_validation_error(json{{"log_level", "verbose"}});
}

TEST(ConfigTest, RejectsWrongTypes) {
    expect_validation_error(json::array());
    expect_validation_error(json{{"max_participants", "ten"}});
    expect_validation_error(json{{"bitcoin_cli_args", "-rpcwallet=vault"}});
}

TEST(ConfigTest, RejectsInconsistentLimits) {
    expect_validation_error(json{{"bitcoin_cli", ""}});
    expect_validation_error(json{{"rpc_timeout_seconds", 0}});
    expect_validation_error(json{{"max_participants", 0}});
    expect_validation_error(json{{"max_participants", 17}});
    expect_validation_error(json{{"min_fee_rate", 0}});
    expect_validation_error(json{{"min_fee_rate", 10}, {"max_fee_rate", 5}, {"default_fee_rate", 7}});
    expect_validation_error(json{{"default_fee_rate", 200000}});
    expect_validation_error(json{{"min_fee_rate", 5}});
}

class ConfigFileTest : public ::testing::Test {
protected:
    void SetUp() override {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        dir_ = std::filesystem::temp_directory_path() / (std::string("cosign_config_") + info->name());
        std::filesystem::remove_all(dir_);
        std::filesystem::create_directories(dir_);
    }

    void TearDown() override {
        Log::set_file("");
        Log::set_level(LogLevel::Info);
        Log::set_quiet(false);
        std::error_code ec;
        std::filesystem::remove_all(dir_, ec);
    }

    std::string write_file(const std::string& name, const std::string& content) {
        auto path = (dir_ / name).string();
        std::ofstream file(path);
        file << content;
        return path;
    }

    std::filesystem::path dir_;
};

TEST_F(ConfigFileTest, LoadsFromDisk) {
    auto path = write_file("cosign.json", R"({"network": "signet", "store_path": "/var/lib/cosign/store.json"})");
    Config config = Config::load(path);
    EXPECT_EQ(config.network, Network::Signet);
    EXPECT_EQ(config.store_path, "/var/lib/cosign/store.json");
}

TEST_F(ConfigFileTest, MissingFileIsStorageError) {
    try {
        Config::load((dir_ / "absent.json").string());
        FAIL() << "expected StorageError";
    } catch (const CosignError& e) {
        EXPECT_EQ(e.type(), CosignError::ErrorType::Storage);
    }
}

TEST_F(ConfigFileTest, MalformedFileIsValidationError) {
    auto path = write_file("broken.json", "{\"network\": ");
    try {
        Config::load(path);
        FAIL() << "expected ValidationError";
    } catch (const CosignError& e) {
        EXPECT_EQ(e.type(), CosignError::ErrorType::Validation);
    }
}

TEST_F(ConfigFileTest, AppliesLoggingSettings) {
    Config config;
    config.log_level = LogLevel::Warn;
    config.log_file = (dir_ / "cosign.log").string();
    config.apply_logging();
    Log::set_quiet(true);

    EXPECT_EQ(Log::level(), LogLevel::Warn);
    EXPECT_FALSE(Log::enabled(LogLevel::Info));
    LOG_INFO("filtered line");
    LOG_WARN("kept line " << 42);
    Log::set_file("");

    std::ifstream file(config.log_file);
    std::stringstream content;
    content << file.rdbuf();
    EXPECT_EQ(content.str().find("filtered line"), std::string::npos);
    EXPECT_NE(content.str().find("[WARN] kept line 42"), std::string::npos);
}

} // namespace
} // namespace cosign
