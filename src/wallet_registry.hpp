#pragma once

#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "chain_backend.hpp"
#include "config.hpp"
#include "kv_store.hpp"
#include "records.hpp"
#include "script_engine.hpp"

namespace cosign {

// Creates and looks up multisig wallets.
//
// A wallet's id depends only on its participants' public keys, in the order
// given: reordering the same keys yields a different wallet, with a
// different script and address.
class WalletRegistry {
public:
    WalletRegistry(KeyValueStore& store, const ScriptEngine& engine, ChainBackend& chain, Config config);

    WalletSummary create(size_t m, size_t n, const std::vector<Participant>& participants,
                         const std::string& name = "");

    std::optional<Wallet> get(const std::string& wallet_id) const;

    // Like get, but throws NotFound
    Wallet require(const std::string& wallet_id) const;

    std::string derive_wallet_id(const std::vector<Participant>& participants) const;

    BalanceSummary balance(const std::string& wallet_id);

private:
    std::vector<Participant> validate(size_t m, size_t n, const std::vector<Participant>& participants) const;

    KeyValueStore& store_;
    const ScriptEngine& engine_;
    ChainBackend& chain_;
    Config config_;
    std::mutex create_mutex_;
};

} // namespace cosign
