#include "config.hpp"
#include "error.hpp"
#include <fstream>

namespace cosign {

using json = nlohmann::json;

namespace {

[[noreturn]] void invalid(const std::string& message) {
    throw CosignError(CosignError::ErrorType::Validation, "Invalid configuration: " + message);
}

} // namespace

Config Config::from_json(const json& j) {
    if (!j.is_object()) {
        invalid("expected a JSON object");
    }

    Config config;
    try {
        if (j.contains("network")) {
            config.network = parse_network(j.at("network").get<std::string>());
        }
        config.bitcoin_cli = j.value("bitcoin_cli", config.bitcoin_cli);
        config.bitcoin_cli_args = j.value("bitcoin_cli_args", config.bitcoin_cli_args);
        config.rpc_timeout_seconds = j.value("rpc_timeout_seconds", config.rpc_timeout_seconds);
        config.store_path = j.value("store_path", config.store_path);
        config.domain_suffix = j.value("domain_suffix", config.domain_suffix);
        config.max_participants = j.value("max_participants", config.max_participants);
        config.min_fee_rate = j.value("min_fee_rate", config.min_fee_rate);
        config.max_fee_rate = j.value("max_fee_rate", config.max_fee_rate);
        config.default_fee_rate = j.value("default_fee_rate", config.default_fee_rate);
        config.min_amount = j.value("min_amount", config.min_amount);
        config.min_input_value = j.value("min_input_value", config.min_input_value);
        if (j.contains("log_level")) {
            config.log_level = Log::parse_level(j.at("log_level").get<std::string>());
        }
        config.log_file = j.value("log_file", config.log_file);
    } catch (const json::exception& e) {
        invalid(e.what());
    }

    if (config.bitcoin_cli.empty()) {
        invalid("bitcoin_cli must not be empty");
    }
    if (config.rpc_timeout_seconds == 0) {
        invalid("rpc_timeout_seconds must be positive");
    }
    if (config.max_participants == 0 || config.max_participants > MAX_MULTISIG_KEYS) {
        invalid("max_participants must be between 1 and " + std::to_string(MAX_MULTISIG_KEYS));
    }
    if (!(config.min_fee_rate > 0) || config.min_fee_rate > config.max_fee_rate) {
        invalid("fee rate limits must satisfy 0 < min_fee_rate <= max_fee_rate");
    }
    if (config.default_fee_rate < config.min_fee_rate || config.default_fee_rate > config.max_fee_rate) {
        invalid("default_fee_rate must lie within the fee rate limits");
    }
    return config;
}

Config Config::load(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        throw CosignError(CosignError::ErrorType::Storage, "Failed to open config file " + path);
    }
    json j;
    try {
        file >> j;
    } catch (const json::exception& e) {
        invalid(path + " is not valid JSON: " + e.what());
    }
    return from_json(j);
}

BitcoinCliOptions Config::cli_options() const {
    return BitcoinCliOptions{bitcoin_cli, bitcoin_cli_args, rpc_timeout_seconds, network};
}

void Config::apply_logging() const {
    Log::set_level(log_level);
    Log::set_file(log_file);
}

} // namespace cosign
