#include "records.hpp"
#include "error.hpp"
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace cosign {

using json = nlohmann::json;

std::string to_string(TxStatus status) {
    switch (status) {
        case TxStatus::Pending:     return "pending_signatures";
        case TxStatus::AllSigned:   return "finished_signatures";
        case TxStatus::Broadcasted: return "broadcasted";
        case TxStatus::Confirmed:   return "confirmed";
        case TxStatus::Cancelled:   return "cancelled";
    }
    return "pending_signatures";
}

TxStatus parse_tx_status(std::string_view name) {
    if (name == "pending_signatures")  return TxStatus::Pending;
    if (name == "finished_signatures") return TxStatus::AllSigned;
    if (name == "broadcasted")         return TxStatus::Broadcasted;
    if (name == "confirmed")           return TxStatus::Confirmed;
    if (name == "cancelled")           return TxStatus::Cancelled;
    throw CosignError(CosignError::ErrorType::Storage, "Unknown transaction status: " + std::string(name));
}

std::vector<std::string> Wallet::public_keys() const {
    std::vector<std::string> keys;
    keys.reserve(participants.size());
    for (const auto& participant : participants) {
        keys.push_back(participant.public_key);
    }
    return keys;
}

std::string utc_now_iso8601() {
    using namespace std::chrono;
    auto now = system_clock::now();
    auto seconds = system_clock::to_time_t(now);
    auto millis = duration_cast<milliseconds>(now.time_since_epoch()).count() % 1000;

    std::tm tm{};
    gmtime_r(&seconds, &tm);
    std::ostringstream ss;
    ss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S") << '.'
       << std::setw(3) << std::setfill('0') << millis << 'Z';
    return ss.str();
}

namespace {

template <typename T>
void put_optional(json& j, const char* key, const std::optional<T>& value) {
    if (value) {
        j[key] = *value;
    }
}

template <typename T>
void get_optional(const json& j, const char* key, std::optional<T>& value) {
    auto it = j.find(key);
    if (it != j.end() && !it->is_null()) {
        value = it->get<T>();
    } else {
        value.reset();
    }
}

} // namespace

void to_json(json& j, const Participant& p) {
    j = json{{"publicKey", p.public_key}, {"userId", p.user_id}};
}

void from_json(const json& j, Participant& p) {
    j.at("publicKey").get_to(p.public_key);
    p.user_id = j.value("userId", "");
}

void to_json(json& j, const Wallet& w) {
    j = json{
        {"walletId", w.wallet_id},
        {"address", w.address},
        {"redeemScript", w.redeem_script},
        {"m", w.m},
        {"n", w.n},
        {"participants", w.participants},
        {"name", w.name},
        {"creationTime", w.creation_time}
    };
}

void from_json(const json& j, Wallet& w) {
    j.at("walletId").get_to(w.wallet_id);
    j.at("address").get_to(w.address);
    j.at("redeemScript").get_to(w.redeem_script);
    j.at("m").get_to(w.m);
    j.at("n").get_to(w.n);
    j.at("participants").get_to(w.participants);
    w.name = j.value("name", "");
    w.creation_time = j.value("creationTime", "");
}

void to_json(json& j, const Transaction& t) {
    j = json{
        {"transactionId", t.transaction_id},
        {"walletId", t.wallet_id},
        {"recipientAddress", t.recipient_address},
        {"amount", t.amount},
        {"fee", t.fee},
        {"changeAmount", t.change_amount},
        {"status", to_string(t.status)},
        {"template", t.template_hex},
        {"inputCount", t.input_count},
        {"requiredSignatures", t.required_signatures},
        {"signatures", t.signatures},
        {"signaturesReceived", t.signatures_received()},
        {"initiatedTime", t.initiated_time},
        {"note", t.note}
    };
    put_optional(j, "signedTransaction", t.signed_transaction);
    put_optional(j, "broadcastTime", t.broadcast_time);
    put_optional(j, "txHash", t.tx_hash);
}

void from_json(const json& j, Transaction& t) {
    j.at("transactionId").get_to(t.transaction_id);
    j.at("walletId").get_to(t.wallet_id);
    j.at("recipientAddress").get_to(t.recipient_address);
    j.at("amount").get_to(t.amount);
    t.fee = j.value("fee", uint64_t{0});
    t.change_amount = j.value("changeAmount", uint64_t{0});
    t.status = parse_tx_status(j.at("status").get<std::string>());
    j.at("template").get_to(t.template_hex);
    j.at("inputCount").get_to(t.input_count);
    j.at("requiredSignatures").get_to(t.required_signatures);
    j.at("signatures").get_to(t.signatures);
    get_optional(j, "signedTransaction", t.signed_transaction);
    j.at("initiatedTime").get_to(t.initiated_time);
    get_optional(j, "broadcastTime", t.broadcast_time);
    get_optional(j, "txHash", t.tx_hash);
    t.note = j.value("note", "");
}

void to_json(json& j, const WalletSummary& s) {
    j = json{
        {"walletId", s.wallet_id},
        {"address", s.address},
        {"redeemScript", s.redeem_script},
        {"m", s.m},
        {"n", s.n},
        {"name", s.name},
        {"creationTime", s.creation_time}
    };
}

void to_json(json& j, const SubmitResult& r) {
    j = json{
        {"transactionId", r.transaction_id},
        {"status", to_string(r.status)},
        {"signaturesReceived", r.signatures_received},
        {"signaturesRemaining", r.signatures_remaining}
    };
}

void to_json(json& j, const CancelResult& r) {
    j = json{{"transactionId", r.transaction_id}, {"status", to_string(r.status)}};
}

void to_json(json& j, const BroadcastReceipt& r) {
    j = json{
        {"transactionId", r.transaction_id},
        {"status", to_string(r.status)},
        {"txHash", r.tx_hash},
        {"broadcastTime", r.broadcast_time}
    };
}

void to_json(json& j, const StatusSummary& s) {
    j = json{
        {"transactionId", s.transaction_id},
        {"walletId", s.wallet_id},
        {"status", to_string(s.status)},
        {"initiatedTime", s.initiated_time},
        {"requiredSignatures", s.required_signatures},
        {"signaturesReceived", s.signatures_received}
    };
    put_optional(j, "txHash", s.tx_hash);
    put_optional(j, "broadcastTime", s.broadcast_time);
}

void to_json(json& j, const DigestList& d) {
    j = json{{"transactionId", d.transaction_id}, {"digests", d.digests}};
}

void to_json(json& j, const BalanceSummary& b) {
    j = json{
        {"walletId", b.wallet_id},
        {"address", b.address},
        {"confirmedBalance", b.confirmed_balance}
    };
}

void to_json(json& j, const TransactionList& l) {
    j = json{
        {"walletId", l.wallet_id},
        {"address", l.address},
        {"transactions", l.transactions}
    };
    if (l.pagination) {
        j["pagination"] = json{
            {"page", l.pagination->page},
            {"pageSize", l.pagination->page_size},
            {"totalCount", l.pagination->total_count}
        };
    }
}

} // namespace cosign
