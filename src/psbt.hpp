#pragma once

#include <cstdint>
#include <span>
#include <vector>
#include "script_engine.hpp"

namespace cosign {

// BIP174 partially signed transaction codec for multisig templates
// https://github.com/bitcoin/bips/blob/master/bip-0174.mediawiki
//
// Written records:
// - global  0x00 : unsigned transaction (legacy serialization, empty scriptSigs)
// - global  0xFC : proprietary "cosign" record holding the witness script,
//                  so a template without inputs still round-trips
// - input   0x01 : witness UTXO (amount + scriptPubKey)
// - input   0x02 : partial signature, key data = public key
// - input   0x05 : witness script
// Unknown records are skipped on read.
class Psbt {
public:
    static std::vector<uint8_t> serialize(const TxTemplate& tmpl);
    static TxTemplate deserialize(std::span<const uint8_t> data);

    // Legacy serialization: version, inputs, outputs, locktime. Hashing it
    // gives the txid of the finalized transaction.
    static std::vector<uint8_t> unsigned_transaction(const TxTemplate& tmpl);

private:
    Psbt() = delete;
};

} // namespace cosign
