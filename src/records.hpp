#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include <nlohmann/json.hpp>

namespace cosign {

enum class TxStatus {
    Pending,
    AllSigned,
    Broadcasted,
    Confirmed,
    Cancelled
};

// Persisted names: pending_signatures, finished_signatures, broadcasted,
// confirmed, cancelled
std::string to_string(TxStatus status);
TxStatus parse_tx_status(std::string_view name);

struct Participant {
    std::string public_key;   // 33-byte compressed key, hex
    std::string user_id;
};

// Immutable once created
struct Wallet {
    std::string wallet_id;
    std::string address;
    std::string redeem_script;  // hex
    size_t m = 0;
    size_t n = 0;
    std::vector<Participant> participants;
    std::string name;
    std::string creation_time;

    std::vector<std::string> public_keys() const;
};

struct WalletSummary {
    std::string wallet_id;
    std::string address;
    std::string redeem_script;
    size_t m = 0;
    size_t n = 0;
    std::string name;
    std::string creation_time;
};

struct Transaction {
    std::string transaction_id;
    std::string wallet_id;
    std::string recipient_address;
    uint64_t amount = 0;
    uint64_t fee = 0;
    uint64_t change_amount = 0;
    TxStatus status = TxStatus::Pending;
    std::string template_hex;           // serialized PSBT
    size_t input_count = 0;
    size_t required_signatures = 0;
    std::map<std::string, std::vector<std::string>> signatures;  // public key -> one signature per input
    std::optional<std::string> signed_transaction;
    std::string initiated_time;
    std::optional<std::string> broadcast_time;
    std::optional<std::string> tx_hash;
    std::string note;

    size_t signatures_received() const { return signatures.size(); }
};

struct SubmitResult {
    std::string transaction_id;
    TxStatus status;
    size_t signatures_received;
    size_t signatures_remaining;
};

struct CancelResult {
    std::string transaction_id;
    TxStatus status;
};

struct BroadcastReceipt {
    std::string transaction_id;
    TxStatus status;
    std::string tx_hash;
    std::string broadcast_time;
};

struct StatusSummary {
    std::string transaction_id;
    std::string wallet_id;
    TxStatus status;
    std::string initiated_time;
    std::optional<std::string> tx_hash;
    std::optional<std::string> broadcast_time;
    size_t required_signatures;
    size_t signatures_received;
};

struct DigestList {
    std::string transaction_id;
    std::vector<std::string> digests;   // hex, one per input
};

struct BalanceSummary {
    std::string wallet_id;
    std::string address;
    uint64_t confirmed_balance;
};

struct Pagination {
    size_t page;
    size_t page_size;
    size_t total_count;
};

struct TransactionList {
    std::string wallet_id;
    std::string address;
    std::vector<Transaction> transactions;
    std::optional<Pagination> pagination;
};

// ISO-8601 UTC with millisecond precision, e.g. 2026-01-01T12:00:00.000Z
std::string utc_now_iso8601();

void to_json(nlohmann::json& j, const Participant& p);
void from_json(const nlohmann::json& j, Participant& p);
void to_json(nlohmann::json& j, const Wallet& w);
void from_json(const nlohmann::json& j, Wallet& w);
void to_json(nlohmann::json& j, const Transaction& t);
void from_json(const nlohmann::json& j, Transaction& t);

void to_json(nlohmann::json& j, const WalletSummary& s);
void to_json(nlohmann::json& j, const SubmitResult& r);
void to_json(nlohmann::json& j, const CancelResult& r);
void to_json(nlohmann::json& j, const BroadcastReceipt& r);
void to_json(nlohmann::json& j, const StatusSummary& s);
void to_json(nlohmann::json& j, const DigestList& d);
void to_json(nlohmann::json& j, const BalanceSummary& b);
void to_json(nlohmann::json& j, const TransactionList& l);

} // namespace cosign
