#include <gtest/gtest.h>

#include <atomic>
#include <cstdio>
#include <functional>
#include <limits>
#include <thread>

#include "address.hpp"
#include "consts.hpp"
#include "fee_estimator.hpp"
#include "fingerprint.hpp"
#include "memory_store.hpp"
#include "p2wsh_engine.hpp"
#include "test_utils.hpp"
#include "tx_engine.hpp"
#include "wallet_registry.hpp"

namespace cosign {
namespace {

using ErrorType = CosignError::ErrorType;

void expect_error(ErrorType type, const std::function<void()>& call) {
    try {
        call();
        ADD_FAILURE() << "expected " << CosignError::type_name(type);
    } catch (const CosignError& e) {
        EXPECT_EQ(e.type(), type) << e.what();
    }
}

class TransactionEngineTest : public ::testing::Test {
protected:
    void SetUp() override {
        wallet_ = registry_.create(2, 3, test::participants({1, 2, 3}), "ops");
        chain_.utxos = {test::make_utxo(0x42, 0, 100000)};
    }

    // Strictly increasing timestamps so history ordering is deterministic
    std::string tick() {
        char buffer[32];
        std::snprintf(buffer, sizeof(buffer), "2026-01-01T00:00:%02d.000Z", ++ticks_);
        return buffer;
    }

    Transaction initiate(uint64_t amount = 50000, double fee_rate = 10) {
        return engine_.initiate(wallet_.wallet_id, recipient_, amount, fee_rate);
    }

    std::vector<std::string> signatures_of(const std::string& tx_id, uint8_t k) {
        return test::sign_digests(engine_.unsigned_digests(tx_id).digests, k);
    }

    SubmitResult sign(const std::string& tx_id, uint8_t k) {
        return engine_.submit_signature(tx_id, test::public_key_hex(k), signatures_of(tx_id, k));
    }

    nlohmann::json snapshot(const std::string& tx_id) {
        auto record = store_.get(TX_KEY_PREFIX + tx_id);
        EXPECT_TRUE(record.has_value());
        return record.value_or(nlohmann::json());
    }

    size_t stored_transactions() { return store_.keys_with_prefix(TX_KEY_PREFIX).size(); }

    Config config_;
    P2wshEngine script_engine_{network_params(Network::Regtest)};
    test::FakeChainBackend chain_;
    MemoryStore store_;
    WalletRegistry registry_{store_, script_engine_, chain_, config_};
    int ticks_ = 0;
    TransactionEngine engine_{store_, registry_, script_engine_, chain_, config_, [this] { return tick(); }};

    WalletSummary wallet_;
    const std::string recipient_ = test::p2wpkh_address(7);
};

TEST_F(TransactionEngineTest, TwoOfThreeEndToEnd) {
    auto tx = initiate(50000, 10);
    EXPECT_EQ(tx.status, TxStatus::Pending);
    EXPECT_EQ(tx.fee, 1890u);
    EXPECT_EQ(tx.change_amount, 100000u - 50000 - 1890);
    EXPECT_EQ(tx.input_count, 1u);
    EXPECT_EQ(tx.required_signatures, 2u);
    EXPECT_EQ(tx.signatures_received(), 0u);
    EXPECT_FALSE(tx.signed_transaction.has_value());
    EXPECT_EQ(chain_.last_address, wallet_.address);

    auto first = sign(tx.transaction_id, 2);
    EXPECT_EQ(first.status, TxStatus::Pending);
    EXPECT_EQ(first.signatures_received, 1u);
    EXPECT_EQ(first.signatures_remaining, 1u);
    EXPECT_FALSE(engine_.get(tx.transaction_id)->signed_transaction.has_value());

    auto second = sign(tx.transaction_id, 1);
    EXPECT_EQ(second.status, TxStatus::AllSigned);
    EXPECT_EQ(second.signatures_received, 2u);
    EXPECT_EQ(second.signatures_remaining, 0u);

    auto signed_tx = engine_.get(tx.transaction_id);
    ASSERT_TRUE(signed_tx->signed_transaction.has_value());
    EXPECT_FALSE(signed_tx->tx_hash.has_value());

    auto receipt = engine_.broadcast(tx.transaction_id);
    EXPECT_EQ(receipt.status, TxStatus::Broadcasted);
    EXPECT_EQ(receipt.tx_hash, chain_.broadcast_txid);
    EXPECT_FALSE(receipt.broadcast_time.empty());
    ASSERT_EQ(chain_.broadcasted.size(), 1u);
    EXPECT_EQ(chain_.broadcasted[0], *signed_tx->signed_transaction);

    auto unconfirmed = engine_.get_status(tx.transaction_id);
    EXPECT_EQ(unconfirmed.status, TxStatus::Broadcasted);
    EXPECT_EQ(chain_.last_confirmation_txid, chain_.broadcast_txid);

    chain_.confirmations = 1;
    auto confirmed = engine_.get_status(tx.transaction_id);
    EXPECT_EQ(confirmed.status, TxStatus::Confirmed);
    EXPECT_EQ(confirmed.tx_hash, chain_.broadcast_txid);
    EXPECT_EQ(confirmed.signatures_received, 2u);
    EXPECT_EQ(engine_.get(tx.transaction_id)->status, TxStatus::Confirmed);

    const int calls = chain_.confirmation_calls;
    EXPECT_EQ(engine_.get_status(tx.transaction_id).status, TxStatus::Confirmed);
    EXPECT_EQ(chain_.confirmation_calls, calls);
}

TEST_F(TransactionEngineTest, TemplatePaysRecipientAndChange) {
    auto tx = initiate(50000, 10);
    auto tmpl = script_engine_.deserialize(HexUtils::decode(tx.template_hex));

    ASSERT_EQ(tmpl.outputs.size(), 2u);
    EXPECT_EQ(tmpl.outputs[0].amount, 50000u);
    EXPECT_EQ(tmpl.outputs[0].script_pubkey, Address::decode(recipient_, script_engine_.params()).script_pubkey);
    EXPECT_EQ(tmpl.outputs[1].amount, 48110u);
    EXPECT_EQ(tmpl.outputs[1].script_pubkey, tmpl.script_pubkey);
    EXPECT_EQ(tmpl.total_input_amount(), 100000u);
}

TEST_F(TransactionEngineTest, TransactionIdIsHashOfTemplate) {
    auto tx = initiate();
    EXPECT_EQ(tx.transaction_id, Fingerprint::transaction_id(HexUtils::decode(tx.template_hex)));
    EXPECT_EQ(engine_.get(tx.transaction_id)->transaction_id, tx.transaction_id);
}

TEST_F(TransactionEngineTest, IdenticalInitiationConflicts) {
    initiate(50000, 10);
    expect_error(ErrorType::Conflict, [&] { initiate(50000, 10); });
    EXPECT_EQ(stored_transactions(), 1u);
}

TEST_F(TransactionEngineTest, CancelledTransferStillBlocksIdenticalOne) {
    auto tx = initiate(50000, 10);
    engine_.cancel(tx.transaction_id);

    try {
        initiate(50000, 10);
        FAIL() << "expected ConflictError";
    } catch (const CosignError& e) {
        EXPECT_EQ(e.type(), ErrorType::Conflict);
        EXPECT_NE(std::string(e.what()).find("cancelled"), std::string::npos);
    }
    EXPECT_EQ(engine_.get(tx.transaction_id)->status, TxStatus::Cancelled);

    auto retry = initiate(50000, 11);
    EXPECT_NE(retry.transaction_id, tx.transaction_id);
    EXPECT_EQ(retry.status, TxStatus::Pending);
}

TEST_F(TransactionEngineTest, SpendsEveryInput) {
    chain_.utxos = {test::make_utxo(0x01, 0, 30000), test::make_utxo(0x02, 1, 30000)};
    auto tx = initiate(50000, 10);

    const uint64_t vsize = FeeEstimator::estimate_vsize(2, 3, 2, {ScriptKind::P2WPKH});
    EXPECT_EQ(vsize, 294u);
    EXPECT_EQ(tx.input_count, 2u);
    EXPECT_EQ(tx.fee, 2940u);
    EXPECT_EQ(tx.change_amount, 60000u - 50000 - 2940);
    EXPECT_EQ(engine_.unsigned_digests(tx.transaction_id).digests.size(), 2u);

    sign(tx.transaction_id, 3);
    EXPECT_EQ(sign(tx.transaction_id, 1).status, TxStatus::AllSigned);
}

TEST_F(TransactionEngineTest, ExactAmountLeavesNoChange) {
    auto tx = initiate(100000 - 1890, 10);
    EXPECT_EQ(tx.change_amount, 0u);
    auto tmpl = script_engine_.deserialize(HexUtils::decode(tx.template_hex));
    EXPECT_EQ(tmpl.outputs.size(), 1u);
}

TEST_F(TransactionEngineTest, InsufficientFunds) {
    expect_error(ErrorType::InsufficientFunds, [&] { initiate(100000 - 1889, 10); });
    expect_error(ErrorType::InsufficientFunds, [&] { initiate(200000, 10); });
    EXPECT_EQ(stored_transactions(), 0u);
}

TEST_F(TransactionEngineTest, NoFunds) {
    chain_.utxos.clear();
    expect_error(ErrorType::NoFunds, [&] { initiate(); });
    EXPECT_EQ(stored_transactions(), 0u);
}

TEST_F(TransactionEngineTest, SmallOutputsAreIgnored) {
    Config config = config_;
    config.min_input_value = 1000;
    TransactionEngine engine(store_, registry_, script_engine_, chain_, config);

    chain_.utxos = {test::make_utxo(0x01, 0, 999)};
    expect_error(ErrorType::NoFunds, [&] { engine.initiate(wallet_.wallet_id, recipient_, 500, 1); });

    chain_.utxos = {test::make_utxo(0x01, 0, 999), test::make_utxo(0x02, 0, 5000)};
    auto tx = engine.initiate(wallet_.wallet_id, recipient_, 500, 1);
    EXPECT_EQ(tx.input_count, 1u);
}

TEST_F(TransactionEngineTest, ValidatesRequest) {
    expect_error(ErrorType::Validation, [&] { engine_.initiate(wallet_.wallet_id, "", 50000, 10); });
    expect_error(ErrorType::Validation, [&] {
        engine_.initiate(wallet_.wallet_id, "1BgGZ9tcN4rm9KBzDn7KprQz87SZ26SAMH", 50000, 10);
    });
    expect_error(ErrorType::Validation, [&] { initiate(0, 10); });
    expect_error(ErrorType::Validation, [&] { initiate(299, 10); });
    expect_error(ErrorType::Validation, [&] { initiate(50000, 0.5); });
    expect_error(ErrorType::Validation, [&] { initiate(50000, 100001); });
    expect_error(ErrorType::NotFound, [&] { engine_.initiate("missing", recipient_, 50000, 10); });

    EXPECT_EQ(chain_.list_calls, 0);
    EXPECT_EQ(stored_transactions(), 0u);
}

TEST_F(TransactionEngineTest, NetworkFailureDuringInitiation) {
    chain_.fail_lookup = true;
    expect_error(ErrorType::ExternalService, [&] { initiate(); });
    EXPECT_EQ(stored_transactions(), 0u);
}

TEST_F(TransactionEngineTest, SignerCannotSignTwice) {
    auto tx = initiate();
    sign(tx.transaction_id, 2);
    auto before = snapshot(tx.transaction_id);

    expect_error(ErrorType::DuplicateSigner, [&] { sign(tx.transaction_id, 2); });
    EXPECT_EQ(snapshot(tx.transaction_id), before);
    EXPECT_EQ(engine_.get_status(tx.transaction_id).signatures_received, 1u);
}

TEST_F(TransactionEngineTest, InvalidSignaturesLeaveRecordUnchanged) {
    auto tx = initiate();
    const auto id = tx.transaction_id;
    const auto before = snapshot(id);

    // signed by an outsider, claimed by participant 1
    expect_error(ErrorType::InvalidSignature, [&] {
        engine_.submit_signature(id, test::PUBKEY_1, signatures_of(id, 9));
    });
    // key not in the wallet
    expect_error(ErrorType::InvalidSignature, [&] {
        engine_.submit_signature(id, test::public_key_hex(9), signatures_of(id, 9));
    });
    // wrong number of signatures
    expect_error(ErrorType::InvalidSignature, [&] { engine_.submit_signature(id, test::PUBKEY_1, {}); });
    expect_error(ErrorType::InvalidSignature, [&] {
        auto sigs = signatures_of(id, 1);
        sigs.push_back(sigs.front());
        engine_.submit_signature(id, test::PUBKEY_1, sigs);
    });
    // not hex
    expect_error(ErrorType::InvalidSignature, [&] { engine_.submit_signature(id, test::PUBKEY_1, {"zz"}); });

    EXPECT_EQ(snapshot(id), before);
}

TEST_F(TransactionEngineTest, SubmissionAfterThresholdIsRejected) {
    auto tx = initiate();
    sign(tx.transaction_id, 1);
    sign(tx.transaction_id, 3);
    auto before = snapshot(tx.transaction_id);

    expect_error(ErrorType::State, [&] {
        engine_.submit_signature(tx.transaction_id, test::PUBKEY_2,
                                 std::vector<std::string>(1, std::string(142, '0')));
    });
    EXPECT_EQ(snapshot(tx.transaction_id), before);
    EXPECT_EQ(engine_.get(tx.transaction_id)->signatures_received(), 2u);
}

TEST_F(TransactionEngineTest, StoredRecordShape) {
    auto tx = initiate();
    auto record = snapshot(tx.transaction_id);

    EXPECT_EQ(record["status"], "pending_signatures");
    EXPECT_EQ(record["walletId"], wallet_.wallet_id);
    EXPECT_EQ(record["requiredSignatures"], 2);
    EXPECT_EQ(record["signaturesReceived"], 0);
    EXPECT_TRUE(record["signatures"].empty());
    EXPECT_FALSE(record.contains("signedTransaction"));
    EXPECT_FALSE(record.contains("txHash"));

    sign(tx.transaction_id, 1);
    record = snapshot(tx.transaction_id);
    EXPECT_EQ(record["signaturesReceived"], 1);
    ASSERT_TRUE(record["signatures"].contains(test::PUBKEY_1));
    EXPECT_EQ(record["signatures"][test::PUBKEY_1].size(), 1u);
}

TEST_F(TransactionEngineTest, CancelOnlyWhilePending) {
    auto tx = initiate();
    auto result = engine_.cancel(tx.transaction_id);
    EXPECT_EQ(result.status, TxStatus::Cancelled);

    expect_error(ErrorType::State, [&] { engine_.cancel(tx.transaction_id); });
    expect_error(ErrorType::State, [&] { engine_.unsigned_digests(tx.transaction_id); });
    expect_error(ErrorType::State, [&] {
        engine_.submit_signature(tx.transaction_id, test::PUBKEY_1, {"00"});
    });
    expect_error(ErrorType::State, [&] { engine_.broadcast(tx.transaction_id); });
    EXPECT_EQ(engine_.get_status(tx.transaction_id).status, TxStatus::Cancelled);
}

TEST_F(TransactionEngineTest, CancelRejectedOnceThresholdReached) {
    auto tx = initiate();
    const auto id = tx.transaction_id;
    sign(id, 1);
    sign(id, 2);

    auto before = snapshot(id);
    expect_error(ErrorType::State, [&] { engine_.cancel(id); });
    EXPECT_EQ(snapshot(id), before);

    engine_.broadcast(id);
    before = snapshot(id);
    expect_error(ErrorType::State, [&] { engine_.cancel(id); });
    EXPECT_EQ(snapshot(id), before);

    // unconfirmed polls leave the record alone
    EXPECT_EQ(engine_.get_status(id).status, TxStatus::Broadcasted);
    EXPECT_EQ(engine_.get_status(id).status, TxStatus::Broadcasted);
    EXPECT_EQ(snapshot(id), before);

    chain_.confirmations = 2;
    EXPECT_EQ(engine_.get_status(id).status, TxStatus::Confirmed);
    before = snapshot(id);
    expect_error(ErrorType::State, [&] { engine_.cancel(id); });
    expect_error(ErrorType::State, [&] { engine_.broadcast(id); });
    EXPECT_EQ(snapshot(id), before);
    EXPECT_EQ(engine_.get_status(id).status, TxStatus::Confirmed);
}

TEST_F(TransactionEngineTest, BroadcastRequiresAllSignatures) {
    auto tx = initiate();
    expect_error(ErrorType::State, [&] { engine_.broadcast(tx.transaction_id); });
    sign(tx.transaction_id, 1);
    expect_error(ErrorType::State, [&] { engine_.broadcast(tx.transaction_id); });
    EXPECT_EQ(chain_.broadcast_calls, 0);
}

TEST_F(TransactionEngineTest, BroadcastFailureLeavesRecordUnchanged) {
    auto tx = initiate();
    sign(tx.transaction_id, 1);
    sign(tx.transaction_id, 2);
    auto before = snapshot(tx.transaction_id);

    chain_.fail_broadcast = true;
    expect_error(ErrorType::ExternalService, [&] { engine_.broadcast(tx.transaction_id); });
    EXPECT_EQ(snapshot(tx.transaction_id), before);
    EXPECT_EQ(chain_.broadcast_calls, 1);

    chain_.fail_broadcast = false;
    EXPECT_EQ(engine_.broadcast(tx.transaction_id).status, TxStatus::Broadcasted);
    expect_error(ErrorType::State, [&] { engine_.broadcast(tx.transaction_id); });
    EXPECT_EQ(chain_.broadcast_calls, 2);
}

TEST_F(TransactionEngineTest, ConfirmationLookupFailureKeepsState) {
    auto tx = initiate();
    sign(tx.transaction_id, 1);
    sign(tx.transaction_id, 2);
    engine_.broadcast(tx.transaction_id);
    auto before = snapshot(tx.transaction_id);

    chain_.fail_confirmations = true;
    chain_.confirmations = 3;
    auto status = engine_.get_status(tx.transaction_id);
    EXPECT_EQ(status.status, TxStatus::Broadcasted);
    EXPECT_EQ(snapshot(tx.transaction_id), before);

    chain_.fail_confirmations = false;
    EXPECT_EQ(engine_.get_status(tx.transaction_id).status, TxStatus::Confirmed);
}

TEST_F(TransactionEngineTest, StatusOfPendingTransactionDoesNotQueryNetwork) {
    auto tx = initiate();
    auto status = engine_.get_status(tx.transaction_id);
    EXPECT_EQ(status.status, TxStatus::Pending);
    EXPECT_EQ(status.wallet_id, wallet_.wallet_id);
    EXPECT_EQ(status.required_signatures, 2u);
    EXPECT_FALSE(status.tx_hash.has_value());
    EXPECT_EQ(chain_.confirmation_calls, 0);

    expect_error(ErrorType::NotFound, [&] { engine_.get_status("missing"); });
    expect_error(ErrorType::NotFound, [&] { engine_.cancel("missing"); });
    expect_error(ErrorType::NotFound, [&] { engine_.submit_signature("missing", test::PUBKEY_1, {}); });
}

TEST_F(TransactionEngineTest, ConcurrentSignersFinalizeOnce) {
    auto tx = initiate();
    std::vector<std::vector<std::string>> signatures;
    for (uint8_t k = 1; k <= 3; ++k) {
        signatures.push_back(signatures_of(tx.transaction_id, k));
    }

    std::atomic<int> accepted{0};
    std::atomic<int> finalized{0};
    std::atomic<int> rejected{0};
    std::vector<std::thread> threads;
    for (uint8_t k = 1; k <= 3; ++k) {
        threads.emplace_back([&, k] {
            try {
                auto result = engine_.submit_signature(tx.transaction_id, test::public_key_hex(k), signatures[k - 1]);
                ++accepted;
                if (result.status == TxStatus::AllSigned) {
                    ++finalized;
                }
            } catch (const CosignError& e) {
                EXPECT_EQ(e.type(), ErrorType::State);
                ++rejected;
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(accepted.load(), 2);
    EXPECT_EQ(finalized.load(), 1);
    EXPECT_EQ(rejected.load(), 1);

    auto stored = engine_.get(tx.transaction_id);
    EXPECT_EQ(stored->status, TxStatus::AllSigned);
    EXPECT_EQ(stored->signatures_received(), 2u);
    EXPECT_TRUE(stored->signed_transaction.has_value());
}

TEST_F(TransactionEngineTest, ApproveSignsWithSigner) {
    test::FakeSigner signer;
    signer.add("device-1", 1);
    signer.add("device-3", 3);

    auto tx = initiate();
    auto result = engine_.approve(tx.transaction_id, test::PUBKEY_1, signer, "device-1");
    EXPECT_EQ(result.status, TxStatus::Pending);
    EXPECT_EQ(result.signatures_received, 1u);

    result = engine_.approve(tx.transaction_id, test::PUBKEY_3, signer, "device-3");
    EXPECT_EQ(result.status, TxStatus::AllSigned);
    EXPECT_EQ(signer.calls, 2);
}

TEST_F(TransactionEngineTest, ApproveFailuresLeaveRecordUnchanged) {
    test::FakeSigner signer;
    signer.add("device-3", 3);

    auto tx = initiate();
    auto before = snapshot(tx.transaction_id);

    signer.fail = true;
    expect_error(ErrorType::ExternalService, [&] {
        engine_.approve(tx.transaction_id, test::PUBKEY_3, signer, "device-3");
    });
    signer.fail = false;
    expect_error(ErrorType::ExternalService, [&] {
        engine_.approve(tx.transaction_id, test::PUBKEY_3, signer, "unknown-device");
    });
    // the device holds key 3 but claims to be participant 2
    expect_error(ErrorType::InvalidSignature, [&] {
        engine_.approve(tx.transaction_id, test::PUBKEY_2, signer, "device-3");
    });

    EXPECT_EQ(snapshot(tx.transaction_id), before);
}

TEST_F(TransactionEngineTest, ListsPendingTransactionsOfWallet) {
    auto first = initiate(50000);
    auto second = initiate(40000);
    engine_.cancel(second.transaction_id);

    auto other_wallet = registry_.create(1, 2, test::participants({4, 5}));
    engine_.initiate(other_wallet.wallet_id, recipient_, 30000, 10);

    auto pending = engine_.list_pending(wallet_.wallet_id);
    EXPECT_EQ(pending.wallet_id, wallet_.wallet_id);
    EXPECT_EQ(pending.address, wallet_.address);
    EXPECT_FALSE(pending.pagination.has_value());
    ASSERT_EQ(pending.transactions.size(), 1u);
    EXPECT_EQ(pending.transactions[0].transaction_id, first.transaction_id);

    expect_error(ErrorType::NotFound, [&] { engine_.list_pending("missing"); });
}

TEST_F(TransactionEngineTest, HistoryIsPagedNewestFirst) {
    initiate(1000);  // stays pending, never in history
    std::vector<std::string> ids;
    for (uint64_t i = 0; i < 12; ++i) {
        auto tx = initiate(2000 + i);
        engine_.cancel(tx.transaction_id);
        ids.push_back(tx.transaction_id);
    }

    auto page1 = engine_.history(wallet_.wallet_id, 1);
    ASSERT_TRUE(page1.pagination.has_value());
    EXPECT_EQ(page1.pagination->page, 1u);
    EXPECT_EQ(page1.pagination->page_size, HISTORY_PAGE_SIZE);
    EXPECT_EQ(page1.pagination->total_count, 12u);
    ASSERT_EQ(page1.transactions.size(), 10u);
    EXPECT_EQ(page1.transactions[0].transaction_id, ids[11]);
    EXPECT_EQ(page1.transactions[9].transaction_id, ids[2]);

    auto page2 = engine_.history(wallet_.wallet_id, 2);
    ASSERT_EQ(page2.transactions.size(), 2u);
    EXPECT_EQ(page2.transactions[1].transaction_id, ids[0]);

    EXPECT_TRUE(engine_.history(wallet_.wallet_id, 3).transactions.empty());
    expect_error(ErrorType::Validation, [&] { engine_.history(wallet_.wallet_id, 0); });
    expect_error(ErrorType::Validation, [&] {
        engine_.history(wallet_.wallet_id, std::numeric_limits<size_t>::max());
    });
    expect_error(ErrorType::Validation, [&] {
        engine_.history(wallet_.wallet_id, std::numeric_limits<size_t>::max() / HISTORY_PAGE_SIZE + 2);
    });
}

TEST_F(TransactionEngineTest, FeeRatesPassThrough) {
    chain_.rates = FeeRates{40, 20, 16};
    auto rates = engine_.fee_rates();
    EXPECT_EQ(rates.fastest, 40u);
    EXPECT_EQ(rates.normal, 20u);
    EXPECT_EQ(rates.economical, 16u);

    chain_.fail_fees = true;
    expect_error(ErrorType::ExternalService, [&] { engine_.fee_rates(); });
}

} // namespace
} // namespace cosign
