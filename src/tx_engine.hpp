#pragma once

#include <functional>
#include <optional>
#include <string>
#include <vector>
#include "chain_backend.hpp"
#include "config.hpp"
#include "keyed_mutex.hpp"
#include "kv_store.hpp"
#include "records.hpp"
#include "script_engine.hpp"
#include "signer.hpp"
#include "wallet_registry.hpp"

namespace cosign {

constexpr size_t HISTORY_PAGE_SIZE = 10;

// Drives a transaction from initiation through signature collection to
// broadcast and confirmation.
//
// Every operation validates and computes in full before its single write to
// the store, so a failed call leaves the stored record as it was. Operations
// that modify an existing record serialize on the transaction id.
class TransactionEngine {
public:
    using Clock = std::function<std::string()>;

    TransactionEngine(KeyValueStore& store, const WalletRegistry& registry, const ScriptEngine& engine,
                      ChainBackend& chain, Config config, Clock clock = utc_now_iso8601);

    Transaction initiate(const std::string& wallet_id, const std::string& recipient_address,
                         uint64_t amount, double fee_rate, const std::string& note = "");

    // BIP143 digest of every input, hex
    DigestList unsigned_digests(const std::string& transaction_id) const;

    // `signatures` holds one hex signature per input, in input order
    SubmitResult submit_signature(const std::string& transaction_id, const std::string& public_key,
                                  const std::vector<std::string>& signatures);

    // Has `signer` sign every input digest with `credential`, then submits
    // the result as `public_key`'s signatures
    SubmitResult approve(const std::string& transaction_id, const std::string& public_key,
                         Signer& signer, const std::string& credential);

    CancelResult cancel(const std::string& transaction_id);
    BroadcastReceipt broadcast(const std::string& transaction_id);

    // Polls the network for broadcasted transactions; a failed lookup is
    // logged and the stored state returned
    StatusSummary get_status(const std::string& transaction_id);

    std::optional<Transaction> get(const std::string& transaction_id) const;

    TransactionList list_pending(const std::string& wallet_id) const;

    // Non-pending transactions, newest first, HISTORY_PAGE_SIZE per page.
    // Pages start at 1.
    TransactionList history(const std::string& wallet_id, size_t page) const;

    FeeRates fee_rates();

private:
    Transaction load(const std::string& transaction_id) const;
    void save(const Transaction& tx);
    std::vector<Transaction> wallet_transactions(const std::string& wallet_id) const;
    TxTemplate load_template(const Transaction& tx) const;

    SubmitResult submit_locked(Transaction tx, const std::string& public_key,
                               const std::vector<std::string>& signatures);

    KeyValueStore& store_;
    const WalletRegistry& registry_;
    const ScriptEngine& engine_;
    ChainBackend& chain_;
    Config config_;
    Clock clock_;
    KeyedMutex tx_locks_;
};

} // namespace cosign
