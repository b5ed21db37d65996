#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "bitcoin_cli.hpp"
#include "consts.hpp"
#include "log.hpp"
#include "network.hpp"

namespace cosign {

constexpr const char* DEFAULT_DOMAIN_SUFFIX = "#cosign_btc_multisig";

// Runtime settings. Every key of the JSON document is optional:
//
// {
//   "network": "regtest",
//   "bitcoin_cli": "bitcoin-cli",
//   "bitcoin_cli_args": ["-rpcwallet=cosign"],
//   "rpc_timeout_seconds": 30,
//   "store_path": "cosign_store.json",
//   "domain_suffix": "#cosign_btc_multisig",
//   "max_participants": 10,
//   "min_fee_rate": 1,
//   "max_fee_rate": 100000,
//   "default_fee_rate": 1,
//   "min_amount": 300,
//   "min_input_value": 0,
//   "log_level": "info",
//   "log_file": ""
// }
struct Config {
    Network network = Network::Regtest;
    std::string bitcoin_cli = "bitcoin-cli";
    std::vector<std::string> bitcoin_cli_args;
    unsigned rpc_timeout_seconds = 30;
    std::string store_path = "cosign_store.json";
    std::string domain_suffix = DEFAULT_DOMAIN_SUFFIX;
    size_t max_participants = DEFAULT_MAX_PARTICIPANTS;
    double min_fee_rate = 1;          // sat/vB
    double max_fee_rate = 100000;     // sat/vB
    double default_fee_rate = 1;      // sat/vB
    uint64_t min_amount = 300;        // dust limit for the recipient output, sat
    uint64_t min_input_value = 0;     // smaller outputs are not spent, sat
    LogLevel log_level = LogLevel::Info;
    std::string log_file;

    // Throws ValidationError for unknown values or inconsistent limits
    static Config from_json(const nlohmann::json& j);

    // Reads and parses a config file; throws StorageError if it cannot be read
    static Config load(const std::string& path);

    BitcoinCliOptions cli_options() const;

    // Applies log level and log file to the process logger
    void apply_logging() const;
};

} // namespace cosign
