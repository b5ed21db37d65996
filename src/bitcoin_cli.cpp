#include "bitcoin_cli.hpp"
#include "error.hpp"
#include "log.hpp"
#include <algorithm>
#include <array>
#include <cmath>
#include <cstdio>
#include <memory>
#include <sys/wait.h>
#include <nlohmann/json.hpp>

namespace cosign {

using json = nlohmann::json;

namespace {

// Exit status of coreutils timeout(1) when the command ran out of time
constexpr int TIMEOUT_EXIT_CODE = 124;

std::string shell_quote(const std::string& arg) {
    std::string quoted = "'";
    for (char c : arg) {
        if (c == '\'') {
            quoted += "'\\''";
        } else {
            quoted += c;
        }
    }
    quoted += "'";
    return quoted;
}

const char* network_flag(Network network) {
    switch (network) {
        case Network::Mainnet: return "";
        case Network::Testnet: return "-testnet";
        case Network::Signet:  return "-signet";
        case Network::Regtest: return "-regtest";
    }
    return "";
}

json parse_response(const std::string& method, const std::string& output) {
    try {
        return json::parse(output);
    } catch (const json::exception& e) {
        throw CosignError(CosignError::ErrorType::ExternalService,
            "Failed to parse " + method + " response: " + e.what());
    }
}

} // namespace

BitcoinCliBackend::BitcoinCliBackend(BitcoinCliOptions options)
    : options_(std::move(options))
{}

// Execute a bitcoin-cli command and return its output.
// The call is wrapped in timeout(1) so a hung node cannot block the caller
// indefinitely. Throws ExternalServiceError if the command cannot run, exits
// non-zero or times out.
std::string BitcoinCliBackend::execute(const std::vector<std::string>& args) const {
    std::string full_cmd = "timeout " + std::to_string(options_.timeout_seconds) + " " +
                           shell_quote(options_.binary);
    std::string flag = network_flag(options_.network);
    if (!flag.empty()) {
        full_cmd += " " + flag;
    }
    for (const auto& arg : options_.extra_args) {
        full_cmd += " " + shell_quote(arg);
    }
    for (const auto& arg : args) {
        full_cmd += " " + shell_quote(arg);
    }
    full_cmd += " 2>&1";  // Capture stderr too

    LOG_DEBUG("Running " << full_cmd);

    std::unique_ptr<FILE, decltype(&pclose)> pipe(popen(full_cmd.c_str(), "r"), pclose);
    if (!pipe) {
        throw CosignError(CosignError::ErrorType::ExternalService,
            "Failed to execute " + options_.binary + ". Make sure it is installed and in your PATH.");
    }

    std::string result;
    std::array<char, 256> buffer;
    while (fgets(buffer.data(), buffer.size(), pipe.get()) != nullptr) {
        result += buffer.data();
    }

    int status = pclose(pipe.release());
    int exit_code = (status != -1 && WIFEXITED(status)) ? WEXITSTATUS(status) : -1;

    while (!result.empty() && (result.back() == '\n' || result.back() == '\r')) {
        result.pop_back();
    }

    const std::string method = args.empty() ? "bitcoin-cli" : args.front();
    if (exit_code == TIMEOUT_EXIT_CODE) {
        throw CosignError(CosignError::ErrorType::ExternalService,
            method + " timed out after " + std::to_string(options_.timeout_seconds) + "s");
    }
    if (exit_code != 0) {
        throw CosignError(CosignError::ErrorType::ExternalService,
            method + " failed with exit code " + std::to_string(exit_code) + ". Output: " + result);
    }
    if (result.empty()) {
        throw CosignError(CosignError::ErrorType::ExternalService, "Empty response from " + method);
    }
    return result;
}

uint64_t BitcoinCliBackend::btc_to_satoshis(double btc) {
    if (!(btc >= 0.0) || !std::isfinite(btc)) {
        throw CosignError(CosignError::ErrorType::ExternalService, "Invalid amount in node response");
    }
    return static_cast<uint64_t>(std::llround(btc * 1e8));
}

// estimatesmartfee reports BTC per 1000 virtual bytes:
// sat/vB = BTC/kvB * 1e8 / 1000, rounded up
FeeRates BitcoinCliBackend::fee_tiers(double btc_per_kvb) {
    if (!(btc_per_kvb > 0.0) || !std::isfinite(btc_per_kvb)) {
        throw CosignError(CosignError::ErrorType::ExternalService, "Invalid fee rate in node response");
    }
    auto normal = static_cast<uint64_t>(std::ceil(btc_per_kvb * 1e8 / 1000.0));
    auto economical = static_cast<uint64_t>(std::floor(static_cast<double>(normal) * 0.8));
    return FeeRates{normal * 2, normal, std::max<uint64_t>(1, economical)};
}

std::vector<Utxo> BitcoinCliBackend::list_spendable_outputs(const std::string& address) {
    json descriptors = json::array({"addr(" + address + ")"});
    json response = parse_response("scantxoutset", execute({"scantxoutset", "start", descriptors.dump()}));

    if (!response.value("success", false)) {
        throw CosignError(CosignError::ErrorType::ExternalService, "scantxoutset did not complete");
    }

    std::vector<Utxo> utxos;
    try {
        for (const auto& entry : response.at("unspents")) {
            Utxo utxo{
                Outpoint::from_display_txid(entry.at("txid").get<std::string>(), entry.at("vout").get<uint32_t>()),
                btc_to_satoshis(entry.at("amount").get<double>()),
                {}
            };
            if (entry.contains("scriptPubKey")) {
                utxo.script_pubkey = HexUtils::decode(entry.at("scriptPubKey").get<std::string>());
            }
            utxos.push_back(std::move(utxo));
        }
    } catch (const json::exception& e) {
        throw CosignError(CosignError::ErrorType::ExternalService,
            std::string("Unexpected scantxoutset response: ") + e.what());
    } catch (const CosignError& e) {
        if (e.type() != CosignError::ErrorType::Encoding) {
            throw;
        }
        throw CosignError(CosignError::ErrorType::ExternalService,
            std::string("Unexpected scantxoutset response: ") + e.what());
    }

    LOG_DEBUG("Found " << utxos.size() << " unspent outputs for " << address);
    return utxos;
}

FeeRates BitcoinCliBackend::estimate_fee_rates() {
    json response = parse_response("estimatesmartfee", execute({"estimatesmartfee", "6"}));
    if (!response.contains("feerate") || !response["feerate"].is_number()) {
        std::string reason = response.contains("errors") ? response["errors"].dump() : response.dump();
        throw CosignError(CosignError::ErrorType::ExternalService, "estimatesmartfee returned no fee rate: " + reason);
    }
    return fee_tiers(response["feerate"].get<double>());
}

std::string BitcoinCliBackend::broadcast(const std::string& raw_tx_hex) {
    std::string txid = execute({"sendrawtransaction", raw_tx_hex});
    if (txid.size() != 64 || !HexUtils::is_hex(txid)) {
        throw CosignError(CosignError::ErrorType::ExternalService, "sendrawtransaction returned no txid: " + txid);
    }
    LOG_INFO("Broadcast transaction " << txid);
    return txid;
}

uint64_t BitcoinCliBackend::get_confirmations(const std::string& txid) {
    json response = parse_response("getrawtransaction", execute({"getrawtransaction", txid, "true"}));
    // Mempool transactions carry no confirmations field
    return response.value("confirmations", uint64_t{0});
}

} // namespace cosign
