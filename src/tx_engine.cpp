#include "tx_engine.hpp"
#include "consts.hpp"
#include "error.hpp"
#include "fee_estimator.hpp"
#include "fingerprint.hpp"
#include "hex_utils.hpp"
#include "log.hpp"
#include "tx_state.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <limits>

namespace cosign {

using json = nlohmann::json;

namespace {

std::string to_lower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

void require_pending(const Transaction& tx, const std::string& action) {
    if (tx.status != TxStatus::Pending) {
        throw CosignError(CosignError::ErrorType::State,
            "Cannot " + action + " transaction " + tx.transaction_id + " in state " + to_string(tx.status));
    }
}

StatusSummary summarize(const Transaction& tx) {
    return StatusSummary{tx.transaction_id, tx.wallet_id, tx.status, tx.initiated_time,
                         tx.tx_hash, tx.broadcast_time, tx.required_signatures, tx.signatures_received()};
}

} // namespace

TransactionEngine::TransactionEngine(KeyValueStore& store, const WalletRegistry& registry,
                                     const ScriptEngine& engine, ChainBackend& chain,
                                     Config config, Clock clock)
    : store_(store)
    , registry_(registry)
    , engine_(engine)
    , chain_(chain)
    , config_(std::move(config))
    , clock_(std::move(clock))
{}

Transaction TransactionEngine::load(const std::string& transaction_id) const {
    auto tx = get(transaction_id);
    if (!tx) {
        throw CosignError(CosignError::ErrorType::NotFound, "Transaction " + transaction_id + " not found");
    }
    return *tx;
}

std::optional<Transaction> TransactionEngine::get(const std::string& transaction_id) const {
    auto record = store_.get(TX_KEY_PREFIX + transaction_id);
    if (!record) {
        return std::nullopt;
    }
    try {
        return record->get<Transaction>();
    } catch (const json::exception& e) {
        throw CosignError(CosignError::ErrorType::Storage,
            "Corrupt transaction record " + transaction_id + ": " + e.what());
    }
}

void TransactionEngine::save(const Transaction& tx) {
    store_.put(TX_KEY_PREFIX + tx.transaction_id, json(tx));
}

TxTemplate TransactionEngine::load_template(const Transaction& tx) const {
    return engine_.deserialize(HexUtils::decode(tx.template_hex));
}

// Builds an unsigned transaction spending every usable output of the wallet.
//
// Steps:
// 1. Validate recipient, amount and fee rate
// 2. Collect spendable outputs of the wallet address
// 3. Estimate the fee from the m-of-n input cost and the recipient kind
// 4. Pay the recipient and return the remainder to the wallet address
// 5. The transaction id is the hash of the serialized template
Transaction TransactionEngine::initiate(const std::string& wallet_id, const std::string& recipient_address,
                                        uint64_t amount, double fee_rate, const std::string& note) {
    if (recipient_address.empty()) {
        throw CosignError(CosignError::ErrorType::Validation, "Recipient address must not be empty");
    }
    const ScriptKind recipient_kind = engine_.classify_address(recipient_address);

    if (amount == 0) {
        throw CosignError(CosignError::ErrorType::Validation, "Amount must be positive");
    }
    if (amount < config_.min_amount) {
        throw CosignError(CosignError::ErrorType::Validation,
            "Amount " + std::to_string(amount) + " is below the dust limit of " +
            std::to_string(config_.min_amount) + " sat");
    }
    if (!std::isfinite(fee_rate) || fee_rate < config_.min_fee_rate || fee_rate > config_.max_fee_rate) {
        throw CosignError(CosignError::ErrorType::Validation,
            "Fee rate must be between " + std::to_string(config_.min_fee_rate) + " and " +
            std::to_string(config_.max_fee_rate) + " sat/vB");
    }

    const Wallet wallet = registry_.require(wallet_id);

    std::vector<Utxo> spendable;
    for (auto& utxo : chain_.list_spendable_outputs(wallet.address)) {
        if (utxo.amount > 0 && utxo.amount >= config_.min_input_value) {
            spendable.push_back(std::move(utxo));
        }
    }
    if (spendable.empty()) {
        throw CosignError(CosignError::ErrorType::NoFunds, "Wallet " + wallet_id + " has no spendable outputs");
    }

    std::vector<Bytes> keys;
    for (const auto& key : wallet.public_keys()) {
        keys.push_back(HexUtils::decode(key));
    }
    TxTemplate tmpl = engine_.new_template(wallet.m, keys);
    for (const auto& utxo : spendable) {
        engine_.add_input(tmpl, utxo);
    }

    const uint64_t vsize = FeeEstimator::estimate_vsize(wallet.m, wallet.n, tmpl.inputs.size(), {recipient_kind});
    const uint64_t fee = FeeEstimator::fee_for(vsize, fee_rate);
    const uint64_t total = tmpl.total_input_amount();
    if (total < amount || total - amount < fee) {
        throw CosignError(CosignError::ErrorType::InsufficientFunds,
            "Need " + std::to_string(amount) + " + " + std::to_string(fee) + " fee, wallet holds " +
            std::to_string(total));
    }

    const uint64_t change = total - amount - fee;
    engine_.add_output(tmpl, recipient_address, amount);
    if (change > 0) {
        engine_.add_output(tmpl, wallet.address, change);
    }

    const Bytes serialized = engine_.serialize(tmpl);

    Transaction tx;
    tx.transaction_id = Fingerprint::transaction_id(serialized);
    tx.wallet_id = wallet.wallet_id;
    tx.recipient_address = recipient_address;
    tx.amount = amount;
    tx.fee = fee;
    tx.change_amount = change;
    tx.status = TxStatus::Pending;
    tx.template_hex = HexUtils::encode(serialized);
    tx.input_count = tmpl.inputs.size();
    tx.required_signatures = wallet.m;
    tx.note = note;

    {
        auto guard = tx_locks_.acquire(tx.transaction_id);
        // The id is the template hash, so a cancelled record keeps blocking
        // the same transfer until the wallet's outputs change
        if (auto existing = get(tx.transaction_id)) {
            std::string message = "An identical transaction " + tx.transaction_id + " already exists";
            if (existing->status == TxStatus::Cancelled) {
                message += " and was cancelled; change the amount or fee rate to build a new one";
            }
            throw CosignError(CosignError::ErrorType::Conflict, message);
        }
        tx.initiated_time = clock_();
        save(tx);
    }

    LOG_INFO("Initiated transaction " << tx.transaction_id << " from wallet " << wallet.wallet_id
             << ": " << amount << " sat to " << recipient_address << ", fee " << fee
             << " sat (" << vsize << " vB), " << tx.input_count << " inputs");
    return tx;
}

DigestList TransactionEngine::unsigned_digests(const std::string& transaction_id) const {
    const Transaction tx = load(transaction_id);
    require_pending(tx, "sign");

    const TxTemplate tmpl = load_template(tx);
    DigestList result{tx.transaction_id, {}};
    for (size_t i = 0; i < tmpl.inputs.size(); ++i) {
        result.digests.push_back(HexUtils::encode(engine_.unsigned_digest(tmpl, i)));
    }
    return result;
}

SubmitResult TransactionEngine::submit_signature(const std::string& transaction_id, const std::string& public_key,
                                                 const std::vector<std::string>& signatures) {
    auto guard = tx_locks_.acquire(transaction_id);
    return submit_locked(load(transaction_id), public_key, signatures);
}

// Caller holds the lock of tx.transaction_id
SubmitResult TransactionEngine::submit_locked(Transaction tx, const std::string& public_key,
                                              const std::vector<std::string>& signatures) {
    require_pending(tx, "submit a signature for");

    const std::string signer = to_lower(public_key);
    if (tx.signatures.count(signer) != 0) {
        throw CosignError(CosignError::ErrorType::DuplicateSigner,
            "Public key " + signer + " has already signed transaction " + tx.transaction_id);
    }
    if (signatures.size() != tx.input_count) {
        throw CosignError(CosignError::ErrorType::InvalidSignature,
            "Expected " + std::to_string(tx.input_count) + " signatures, got " + std::to_string(signatures.size()));
    }

    Bytes key_bytes;
    std::vector<Bytes> signature_bytes;
    try {
        key_bytes = HexUtils::decode(signer);
        for (const auto& signature : signatures) {
            signature_bytes.push_back(HexUtils::decode(signature));
        }
    } catch (const CosignError& e) {
        throw CosignError(CosignError::ErrorType::InvalidSignature, std::string("Malformed signature data: ") + e.what());
    }

    // Apply to a working copy; nothing is stored unless every signature verifies
    TxTemplate tmpl = load_template(tx);
    for (size_t i = 0; i < signature_bytes.size(); ++i) {
        engine_.apply_signature(tmpl, i, key_bytes, signature_bytes[i]);
    }

    std::vector<std::string> normalized;
    for (size_t i = 0; i < tmpl.inputs.size(); ++i) {
        normalized.push_back(HexUtils::encode(tmpl.inputs[i].partial_sigs.at(key_bytes)));
    }
    tx.signatures.emplace(signer, std::move(normalized));
    tx.template_hex = HexUtils::encode(engine_.serialize(tmpl));

    if (tx.signatures_received() >= tx.required_signatures) {
        tx.signed_transaction = HexUtils::encode(engine_.finalize(tmpl));
        tx.status = transition(tx.status, TxEvent::ThresholdReached);
    }

    save(tx);

    LOG_INFO("Transaction " << tx.transaction_id << " signed by " << signer << " ("
             << tx.signatures_received() << "/" << tx.required_signatures << ")");
    if (tx.status == TxStatus::AllSigned) {
        LOG_INFO("Transaction " << tx.transaction_id << " -> " << to_string(tx.status));
    }

    return SubmitResult{tx.transaction_id, tx.status, tx.signatures_received(),
                        tx.required_signatures - std::min(tx.required_signatures, tx.signatures_received())};
}

SubmitResult TransactionEngine::approve(const std::string& transaction_id, const std::string& public_key,
                                        Signer& signer, const std::string& credential) {
    auto guard = tx_locks_.acquire(transaction_id);
    Transaction tx = load(transaction_id);
    require_pending(tx, "approve");

    const TxTemplate tmpl = load_template(tx);
    std::vector<std::string> signatures;
    for (size_t i = 0; i < tmpl.inputs.size(); ++i) {
        const Bytes digest = engine_.unsigned_digest(tmpl, i);
        try {
            signatures.push_back(HexUtils::encode(signer.sign(digest, credential)));
        } catch (const CosignError& e) {
            LOG_WARN("Signer failed on transaction " << transaction_id << " input " << i << ": " << e.what());
            if (e.type() == CosignError::ErrorType::ExternalService) {
                throw;
            }
            throw CosignError(CosignError::ErrorType::ExternalService, std::string("Signer failed: ") + e.what());
        }
    }

    return submit_locked(std::move(tx), public_key, signatures);
}

CancelResult TransactionEngine::cancel(const std::string& transaction_id) {
    auto guard = tx_locks_.acquire(transaction_id);
    Transaction tx = load(transaction_id);
    tx.status = transition(tx.status, TxEvent::Cancel);
    save(tx);

    LOG_INFO("Transaction " << tx.transaction_id << " -> " << to_string(tx.status));
    return CancelResult{tx.transaction_id, tx.status};
}

BroadcastReceipt TransactionEngine::broadcast(const std::string& transaction_id) {
    auto guard = tx_locks_.acquire(transaction_id);
    Transaction tx = load(transaction_id);
    const TxStatus next = transition(tx.status, TxEvent::Broadcast);
    if (!tx.signed_transaction) {
        throw CosignError(CosignError::ErrorType::State,
            "Transaction " + transaction_id + " has no signed transaction to broadcast");
    }

    std::string txid;
    try {
        txid = chain_.broadcast(*tx.signed_transaction);
    } catch (const CosignError& e) {
        LOG_ERROR("Broadcast of transaction " << transaction_id << " failed: " << e.what());
        throw;
    }

    tx.tx_hash = txid;
    tx.broadcast_time = clock_();
    tx.status = next;
    save(tx);

    LOG_INFO("Transaction " << tx.transaction_id << " -> " << to_string(tx.status) << " as " << txid);
    return BroadcastReceipt{tx.transaction_id, tx.status, *tx.tx_hash, *tx.broadcast_time};
}

StatusSummary TransactionEngine::get_status(const std::string& transaction_id) {
    Transaction tx = load(transaction_id);
    if (tx.status != TxStatus::Broadcasted) {
        return summarize(tx);
    }

    auto guard = tx_locks_.acquire(transaction_id);
    tx = load(transaction_id);
    if (tx.status != TxStatus::Broadcasted || !tx.tx_hash) {
        return summarize(tx);
    }

    uint64_t confirmations = 0;
    try {
        confirmations = chain_.get_confirmations(*tx.tx_hash);
    } catch (const CosignError& e) {
        LOG_WARN("Confirmation lookup for " << *tx.tx_hash << " failed: " << e.what());
        return summarize(tx);
    }

    if (confirmations > 0) {
        tx.status = transition(tx.status, TxEvent::Confirm);
        save(tx);
        LOG_INFO("Transaction " << tx.transaction_id << " -> " << to_string(tx.status)
                 << " with " << confirmations << " confirmations");
    }
    return summarize(tx);
}

std::vector<Transaction> TransactionEngine::wallet_transactions(const std::string& wallet_id) const {
    std::vector<Transaction> result;
    for (const auto& entry : store_.keys_with_prefix(TX_KEY_PREFIX)) {
        Transaction tx;
        try {
            tx = entry.value.get<Transaction>();
        } catch (const json::exception& e) {
            throw CosignError(CosignError::ErrorType::Storage, "Corrupt record " + entry.key + ": " + e.what());
        }
        if (tx.wallet_id == wallet_id) {
            result.push_back(std::move(tx));
        }
    }
    return result;
}

TransactionList TransactionEngine::list_pending(const std::string& wallet_id) const {
    const Wallet wallet = registry_.require(wallet_id);

    TransactionList list{wallet.wallet_id, wallet.address, {}, std::nullopt};
    for (auto& tx : wallet_transactions(wallet_id)) {
        if (tx.status == TxStatus::Pending) {
            list.transactions.push_back(std::move(tx));
        }
    }
    return list;
}

TransactionList TransactionEngine::history(const std::string& wallet_id, size_t page) const {
    if (page == 0) {
        throw CosignError(CosignError::ErrorType::Validation, "Page numbers start at 1");
    }
    if (page - 1 > std::numeric_limits<size_t>::max() / HISTORY_PAGE_SIZE - HISTORY_PAGE_SIZE) {
        throw CosignError(CosignError::ErrorType::Validation, "Page " + std::to_string(page) + " is out of range");
    }
    const Wallet wallet = registry_.require(wallet_id);

    std::vector<Transaction> done;
    for (auto& tx : wallet_transactions(wallet_id)) {
        if (tx.status != TxStatus::Pending) {
            done.push_back(std::move(tx));
        }
    }
    // ISO-8601 UTC strings order chronologically
    std::stable_sort(done.begin(), done.end(), [](const Transaction& a, const Transaction& b) {
        return a.initiated_time > b.initiated_time;
    });

    TransactionList list{wallet.wallet_id, wallet.address, {},
                         Pagination{page, HISTORY_PAGE_SIZE, done.size()}};
    const size_t begin = (page - 1) * HISTORY_PAGE_SIZE;
    for (size_t i = begin; i < done.size() && i < begin + HISTORY_PAGE_SIZE; ++i) {
        list.transactions.push_back(std::move(done[i]));
    }
    return list;
}

FeeRates TransactionEngine::fee_rates() {
    return chain_.estimate_fee_rates();
}

} // namespace cosign
