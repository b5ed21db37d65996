#include "wallet_registry.hpp"
#include "consts.hpp"
#include "ecdsa.hpp"
#include "error.hpp"
#include "fingerprint.hpp"
#include "hex_utils.hpp"
#include "log.hpp"
#include <algorithm>
#include <cctype>
#include <set>

namespace cosign {

using json = nlohmann::json;

namespace {

std::string to_lower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

std::vector<std::string> lowercase_keys(const std::vector<Participant>& participants) {
    std::vector<std::string> keys;
    keys.reserve(participants.size());
    for (const auto& participant : participants) {
        keys.push_back(to_lower(participant.public_key));
    }
    return keys;
}

} // namespace

WalletRegistry::WalletRegistry(KeyValueStore& store, const ScriptEngine& engine, ChainBackend& chain, Config config)
    : store_(store)
    , engine_(engine)
    , chain_(chain)
    , config_(std::move(config))
{}

// Checks the m-of-n shape and every public key; returns the participants with
// keys in canonical lowercase hex
std::vector<Participant> WalletRegistry::validate(size_t m, size_t n,
                                                  const std::vector<Participant>& participants) const {
    if (m == 0 || n == 0) {
        throw CosignError(CosignError::ErrorType::Validation, "m and n must be positive");
    }
    if (m > n) {
        throw CosignError(CosignError::ErrorType::Validation,
            "Required signatures (" + std::to_string(m) + ") exceed participants (" + std::to_string(n) + ")");
    }
    if (n > config_.max_participants) {
        throw CosignError(CosignError::ErrorType::Validation,
            "At most " + std::to_string(config_.max_participants) + " participants are supported");
    }
    if (participants.size() != n) {
        throw CosignError(CosignError::ErrorType::Validation,
            "Expected " + std::to_string(n) + " participants, got " + std::to_string(participants.size()));
    }

    std::vector<Participant> canonical;
    std::set<std::string> seen;
    for (const auto& participant : participants) {
        std::string key = to_lower(participant.public_key);
        if (key.size() != COMPRESSED_PUBKEY_SIZE * 2 || !HexUtils::is_hex(key) ||
            !Ecdsa::is_valid_public_key(HexUtils::decode(key))) {
            throw CosignError(CosignError::ErrorType::Validation,
                "Invalid compressed public key: " + participant.public_key);
        }
        if (!seen.insert(key).second) {
            throw CosignError(CosignError::ErrorType::Validation, "Duplicate public key: " + participant.public_key);
        }
        canonical.push_back(Participant{std::move(key), participant.user_id});
    }
    return canonical;
}

std::string WalletRegistry::derive_wallet_id(const std::vector<Participant>& participants) const {
    return Fingerprint::wallet_id(lowercase_keys(participants), config_.domain_suffix);
}

WalletSummary WalletRegistry::create(size_t m, size_t n, const std::vector<Participant>& participants,
                                     const std::string& name) {
    auto canonical = validate(m, n, participants);

    Wallet wallet;
    wallet.wallet_id = derive_wallet_id(canonical);
    wallet.m = m;
    wallet.n = n;
    wallet.participants = canonical;
    wallet.name = name;

    std::vector<Bytes> keys;
    keys.reserve(canonical.size());
    for (const auto& participant : canonical) {
        keys.push_back(HexUtils::decode(participant.public_key));
    }
    auto derived = engine_.derive_address(m, keys);
    wallet.address = derived.address;
    wallet.redeem_script = HexUtils::encode(derived.redeem_script);

    const std::string key = WALLET_KEY_PREFIX + wallet.wallet_id;
    {
        std::lock_guard<std::mutex> lock(create_mutex_);
        if (store_.get(key)) {
            throw CosignError(CosignError::ErrorType::Conflict,
                "Wallet " + wallet.wallet_id + " already exists");
        }
        wallet.creation_time = utc_now_iso8601();
        store_.put(key, json(wallet));
    }

    LOG_INFO("Created " << m << "-of-" << n << " wallet " << wallet.wallet_id << " at " << wallet.address);

    return WalletSummary{wallet.wallet_id, wallet.address, wallet.redeem_script,
                         wallet.m, wallet.n, wallet.name, wallet.creation_time};
}

std::optional<Wallet> WalletRegistry::get(const std::string& wallet_id) const {
    auto record = store_.get(WALLET_KEY_PREFIX + wallet_id);
    if (!record) {
        return std::nullopt;
    }
    try {
        return record->get<Wallet>();
    } catch (const json::exception& e) {
        throw CosignError(CosignError::ErrorType::Storage,
            "Corrupt wallet record " + wallet_id + ": " + e.what());
    }
}

Wallet WalletRegistry::require(const std::string& wallet_id) const {
    auto wallet = get(wallet_id);
    if (!wallet) {
        throw CosignError(CosignError::ErrorType::NotFound, "Wallet " + wallet_id + " not found");
    }
    return *wallet;
}

BalanceSummary WalletRegistry::balance(const std::string& wallet_id) {
    auto wallet = require(wallet_id);
    uint64_t total = 0;
    for (const auto& utxo : chain_.list_spendable_outputs(wallet.address)) {
        total += utxo.amount;
    }
    return BalanceSummary{wallet.wallet_id, wallet.address, total};
}

} // namespace cosign
