#include "segwit.hpp"
#include "consts.hpp"
#include "hash_utils.hpp"
#include "serialize.hpp"

namespace cosign {

// Create a Pay-to-Witness-Public-Key-Hash (P2WPKH) program from a public key
// https://github.com/bitcoin/bips/blob/master/bip-0141.mediawiki
//
// P2WPKH structure (22 bytes total):
// - 0x00     : Witness version 0
// - 0x14     : Push 20 bytes
// - [20 bytes]: HASH160 of public key
std::vector<uint8_t> Segwit::get_p2wpkh_program(std::span<const uint8_t> pubkey) {
    auto hash160_result = HashUtils::hash160(pubkey);
    return witness_script_pubkey(WITNESS_VERSION_0, hash160_result);
}

// Create a Pay-to-Witness-Script-Hash (P2WSH) program from a witness script
// https://github.com/bitcoin/bips/blob/master/bip-0141.mediawiki
//
// The process:
// 1. Compute SHA256 of the witness script (note: single SHA256, not double)
// 2. Create witness program: [version byte] [push byte] [32-byte hash]
//
// P2WSH structure (34 bytes total):
// - 0x00     : Witness version 0
// - 0x20     : Push 32 bytes
// - [32 bytes]: SHA256 hash of the witness script
std::vector<uint8_t> Segwit::get_p2wsh_program(std::span<const uint8_t> script) {
    auto hash = HashUtils::sha256(script);
    return witness_script_pubkey(WITNESS_VERSION_0, hash);
}

// Version 0 is pushed as OP_0, versions 1..16 as OP_1..OP_16
std::vector<uint8_t> Segwit::witness_script_pubkey(uint8_t version, std::span<const uint8_t> program) {
    std::vector<uint8_t> script;
    script.reserve(program.size() + 2);
    script.push_back(version == 0 ? OP_0 : static_cast<uint8_t>(OP_1 + version - 1));
    script.push_back(static_cast<uint8_t>(program.size()));
    script.insert(script.end(), program.begin(), program.end());
    return script;
}

// OP_DUP OP_HASH160 <20 bytes> OP_EQUALVERIFY OP_CHECKSIG
std::vector<uint8_t> Segwit::p2pkh_script_pubkey(std::span<const uint8_t> pubkey_hash) {
    std::vector<uint8_t> script{OP_DUP, OP_HASH160, PUBKEY_HASH_SIZE};
    script.insert(script.end(), pubkey_hash.begin(), pubkey_hash.end());
    script.push_back(OP_EQUALVERIFY);
    script.push_back(OP_CHECKSIG);
    return script;
}

// OP_HASH160 <20 bytes> OP_EQUAL
std::vector<uint8_t> Segwit::p2sh_script_pubkey(std::span<const uint8_t> script_hash) {
    std::vector<uint8_t> script{OP_HASH160, PUBKEY_HASH_SIZE};
    script.insert(script.end(), script_hash.begin(), script_hash.end());
    script.push_back(OP_EQUAL);
    return script;
}

// Create an m-of-n multisignature witness script for use in P2WSH outputs
// following the standard pattern:
// OP_m <pubkey1> <pubkey2> ... <pubkey_n> OP_n OP_CHECKMULTISIG
//
// Keys are written in the order given. That order is part of the script and
// therefore of the address; signatures must later be placed on the witness
// stack in the same relative order.
//
// Multisig script structure:
// - OP_m     : Number of required signatures
// - 0x21     : Push 33 bytes (compressed public key size)
// - [33 bytes]: Public key, repeated n times
// - OP_n     : Total number of keys
// - OP_CHECKMULTISIG
std::vector<uint8_t> Segwit::create_witness_script(size_t m, const std::vector<std::vector<uint8_t>>& keys) {
    if (m == 0 || m > keys.size() || keys.size() > MAX_MULTISIG_KEYS) {
        throw CosignError(CosignError::ErrorType::Validation, "Invalid multisig threshold");
    }

    std::vector<uint8_t> script;
    script.reserve(3 + keys.size() * (COMPRESSED_PUBKEY_SIZE + 1));
    script.push_back(static_cast<uint8_t>(OP_1 + m - 1));

    for (const auto& key : keys) {
        if (key.size() != COMPRESSED_PUBKEY_SIZE) {
            throw CosignError(CosignError::ErrorType::Validation, "Public keys must be 33-byte compressed keys");
        }
        script.push_back(COMPRESSED_PUBKEY_SIZE);
        script.insert(script.end(), key.begin(), key.end());
    }

    script.push_back(static_cast<uint8_t>(OP_1 + keys.size() - 1));
    script.push_back(OP_CHECKMULTISIG);

    return script;
}

std::optional<MultisigScript> Segwit::parse_witness_script(std::span<const uint8_t> script) {
    if (script.size() < 3 || script.back() != OP_CHECKMULTISIG) {
        return std::nullopt;
    }
    uint8_t op_m = script.front();
    uint8_t op_n = script[script.size() - 2];
    if (op_m < OP_1 || op_m > OP_16 || op_n < OP_1 || op_n > OP_16) {
        return std::nullopt;
    }

    MultisigScript parsed;
    parsed.m = static_cast<size_t>(op_m - OP_1 + 1);
    size_t n = static_cast<size_t>(op_n - OP_1 + 1);

    size_t pos = 1;
    const size_t end = script.size() - 2;
    while (pos < end) {
        if (script[pos] != COMPRESSED_PUBKEY_SIZE || pos + 1 + COMPRESSED_PUBKEY_SIZE > end) {
            return std::nullopt;
        }
        parsed.public_keys.emplace_back(script.begin() + pos + 1,
                                        script.begin() + pos + 1 + COMPRESSED_PUBKEY_SIZE);
        pos += 1 + COMPRESSED_PUBKEY_SIZE;
    }

    if (parsed.public_keys.size() != n || parsed.m > n) {
        return std::nullopt;
    }
    return parsed;
}

// Create a transaction input from an outpoint (previous transaction output)
// https://en.bitcoin.it/wiki/Transaction
//
// Transaction input structure:
// - [32 bytes]: Previous transaction ID (little-endian)
// - [4 bytes] : Previous output index (little-endian)
// - [1 byte]  : Script length - 0 for SegWit inputs
// - [4 bytes] : Sequence number
std::vector<uint8_t> Segwit::input_from_outpoint(const Outpoint& outpoint) {
    std::vector<uint8_t> input;
    input.reserve(41);
    write_bytes(input, outpoint.txid_vec);
    write_le32(input, outpoint.index);
    write_u8(input, 0x00);
    write_le32(input, SEQUENCE_NO_LOCKTIME);
    return input;
}

// Transaction output structure:
// - [8 bytes]: Value in satoshis (little-endian)
// - [1-9 bytes]: Script length (varint)
// - [variable]: Script (scriptPubKey)
std::vector<uint8_t> Segwit::create_output(std::span<const uint8_t> script, uint64_t value) {
    std::vector<uint8_t> output;
    output.reserve(9 + script.size());
    write_le64(output, value);
    write_var_bytes(output, script);
    return output;
}

std::vector<uint8_t> Segwit::serialize_witness(const std::vector<std::vector<uint8_t>>& items) {
    std::vector<uint8_t> witness;
    write_compact_size(witness, items.size());
    for (const auto& item : items) {
        write_var_bytes(witness, item);
    }
    return witness;
}

} // namespace cosign
