// cosign command-line tool
//
// Runs the multisig wallet engine against a Bitcoin Core node reached through
// bitcoin-cli, with records kept in a JSON file store.
//
//   cosign [--config=<file>] <command> [--option=value ...]
//
// Every command prints its result as JSON on stdout. Failures print
// "Error[<type>]: <message>" on stderr and exit with status 1.

#include "bitcoin_cli.hpp"
#include "config.hpp"
#include "error.hpp"
#include "json_file_store.hpp"
#include "local_signer.hpp"
#include "log.hpp"
#include "p2wsh_engine.hpp"
#include "tx_engine.hpp"
#include "wallet_registry.hpp"
#include <algorithm>
#include <fstream>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include <nlohmann/json.hpp>

namespace {

using cosign::CosignError;
using json = nlohmann::json;

constexpr const char* USAGE = R"(usage: cosign [--config=<file>] <command> [options]

commands:
  create-wallet    --m=<m> --key=<pubkey>[:<userId>] ... [--name=<name>]
  wallet           --id=<walletId>
  balance          --id=<walletId>
  initiate         --id=<walletId> --to=<address> --amount=<sat> [--fee-rate=<sat/vB>] [--note=<text>]
  digests          --tx=<transactionId>
  submit-signature --tx=<transactionId> --pubkey=<hex> --sig=<hex> ...   (one --sig per input)
  approve          --tx=<transactionId> --privkey-file=<path>            (development signer)
  cancel           --tx=<transactionId>
  broadcast        --tx=<transactionId>
  status           --tx=<transactionId>
  pending          --id=<walletId>
  history          --id=<walletId> [--page=<n>]
  fees
)";

bool HasFlag(const std::vector<std::string>& args, std::string_view flag) {
    for (const auto& arg : args) {
        if (arg == flag) {
            return true;
        }
    }
    return false;
}

std::optional<std::string> FindPrefixedOptionValue(const std::vector<std::string>& args,
                                                   std::string_view prefix) {
    for (const auto& arg : args) {
        if (arg.starts_with(prefix)) {
            return arg.substr(prefix.size());
        }
    }
    return std::nullopt;
}

std::vector<std::string> FindAllPrefixedOptionValues(const std::vector<std::string>& args,
                                                     std::string_view prefix) {
    std::vector<std::string> values;
    for (const auto& arg : args) {
        if (arg.starts_with(prefix)) {
            values.push_back(arg.substr(prefix.size()));
        }
    }
    return values;
}

std::string RequireOption(const std::vector<std::string>& args, std::string_view prefix) {
    auto value = FindPrefixedOptionValue(args, prefix);
    if (!value || value->empty()) {
        throw CosignError(CosignError::ErrorType::Validation,
            "missing required option " + std::string(prefix) + "<value>");
    }
    return *value;
}

uint64_t ParseUnsigned(const std::string& text, std::string_view what) {
    try {
        size_t used = 0;
        if (!text.empty() && text[0] != '-') {
            uint64_t value = std::stoull(text, &used);
            if (used == text.size()) {
                return value;
            }
        }
    } catch (const std::logic_error&) {
        // reported below
    }
    throw CosignError(CosignError::ErrorType::Validation,
        std::string(what) + " must be a non-negative integer, got '" + text + "'");
}

double ParseDouble(const std::string& text, std::string_view what) {
    try {
        size_t used = 0;
        double value = std::stod(text, &used);
        if (used == text.size()) {
            return value;
        }
    } catch (const std::logic_error&) {
        // reported below
    }
    throw CosignError(CosignError::ErrorType::Validation,
        std::string(what) + " must be a number, got '" + text + "'");
}

std::string ReadFirstLineFromFile(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        throw CosignError(CosignError::ErrorType::Storage, "failed to open " + path);
    }
    std::string line;
    std::getline(file, line);
    while (!line.empty() && (line.back() == '\r' || line.back() == ' ')) {
        line.pop_back();
    }
    return line;
}

void Print(const json& j) {
    std::cout << j.dump(4) << std::endl;
}

int Run(const std::vector<std::string>& args) {
    if (args.empty() || HasFlag(args, "--help") || HasFlag(args, "-h")) {
        std::cout << USAGE;
        return args.empty() ? 1 : 0;
    }

    cosign::Config config;
    if (auto path = FindPrefixedOptionValue(args, "--config=")) {
        config = cosign::Config::load(*path);
    }
    config.apply_logging();

    std::string command;
    for (const auto& arg : args) {
        if (!arg.starts_with("-")) {
            command = arg;
            break;
        }
    }
    if (command.empty()) {
        throw CosignError(CosignError::ErrorType::Validation, "no command given");
    }

    cosign::JsonFileStore store(config.store_path);
    // Signers run as separate processes; one command at a time per store
    cosign::JsonFileStore::Session session(store);
    cosign::P2wshEngine engine(cosign::network_params(config.network));
    cosign::BitcoinCliBackend chain(config.cli_options());
    cosign::WalletRegistry registry(store, engine, chain, config);
    cosign::TransactionEngine transactions(store, registry, engine, chain, config);

    if (command == "create-wallet") {
        std::vector<cosign::Participant> participants;
        for (const auto& entry : FindAllPrefixedOptionValues(args, "--key=")) {
            auto colon = entry.find(':');
            if (colon == std::string::npos) {
                participants.push_back({entry, ""});
            } else {
                participants.push_back({entry.substr(0, colon), entry.substr(colon + 1)});
            }
        }
        size_t m = ParseUnsigned(RequireOption(args, "--m="), "--m");
        size_t n = participants.size();
        if (auto n_opt = FindPrefixedOptionValue(args, "--n=")) {
            n = ParseUnsigned(*n_opt, "--n");
        }
        Print(registry.create(m, n, participants, FindPrefixedOptionValue(args, "--name=").value_or("")));
    } else if (command == "wallet") {
        Print(registry.require(RequireOption(args, "--id=")));
    } else if (command == "balance") {
        Print(registry.balance(RequireOption(args, "--id=")));
    } else if (command == "initiate") {
        double fee_rate = config.default_fee_rate;
        if (auto rate = FindPrefixedOptionValue(args, "--fee-rate=")) {
            fee_rate = ParseDouble(*rate, "--fee-rate");
        }
        Print(transactions.initiate(RequireOption(args, "--id="),
                                    RequireOption(args, "--to="),
                                    ParseUnsigned(RequireOption(args, "--amount="), "--amount"),
                                    fee_rate,
                                    FindPrefixedOptionValue(args, "--note=").value_or("")));
    } else if (command == "digests") {
        Print(transactions.unsigned_digests(RequireOption(args, "--tx=")));
    } else if (command == "submit-signature") {
        Print(transactions.submit_signature(RequireOption(args, "--tx="),
                                            RequireOption(args, "--pubkey="),
                                            FindAllPrefixedOptionValues(args, "--sig=")));
    } else if (command == "approve") {
        cosign::LocalKeySigner signer;
        std::string secret = ReadFirstLineFromFile(RequireOption(args, "--privkey-file="));
        std::string public_key = signer.add_key_hex(secret);
        std::fill(secret.begin(), secret.end(), '\0');
        Print(transactions.approve(RequireOption(args, "--tx="), public_key, signer, public_key));
    } else if (command == "cancel") {
        Print(transactions.cancel(RequireOption(args, "--tx=")));
    } else if (command == "broadcast") {
        Print(transactions.broadcast(RequireOption(args, "--tx=")));
    } else if (command == "status") {
        Print(transactions.get_status(RequireOption(args, "--tx=")));
    } else if (command == "pending") {
        Print(transactions.list_pending(RequireOption(args, "--id=")));
    } else if (command == "history") {
        size_t page = 1;
        if (auto page_opt = FindPrefixedOptionValue(args, "--page=")) {
            page = ParseUnsigned(*page_opt, "--page");
        }
        Print(transactions.history(RequireOption(args, "--id="), page));
    } else if (command == "fees") {
        auto rates = transactions.fee_rates();
        Print(json{{"fastest", rates.fastest}, {"normal", rates.normal},
                   {"economical", rates.economical}, {"unit", "sat/vbyte"}});
    } else {
        throw CosignError(CosignError::ErrorType::Validation, "unknown command: " + command);
    }
    return 0;
}

} // namespace

int main(int argc, char** argv) {
    std::vector<std::string> args(argv + 1, argv + argc);
    try {
        return Run(args);
    } catch (const CosignError& e) {
        std::cerr << "Error[" << CosignError::type_name(e.type()) << "]: " << e.what() << std::endl;
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
