#pragma once

#include "utxo.hpp"
#include <vector>
#include <span>
#include <cstdint>
#include <optional>

namespace cosign {

// Parsed form of a bare multisig witness script
struct MultisigScript {
    size_t m;
    std::vector<std::vector<uint8_t>> public_keys;
};

class Segwit {
public:
    // Get the P2WPKH witness program from a public key
    static std::vector<uint8_t> get_p2wpkh_program(std::span<const uint8_t> pubkey);

    // Get the P2WSH witness program from a witness script
    static std::vector<uint8_t> get_p2wsh_program(std::span<const uint8_t> script);

    // Generic witness output script: OP_version <program>
    static std::vector<uint8_t> witness_script_pubkey(uint8_t version, std::span<const uint8_t> program);

    // Legacy output scripts for base58 recipients
    static std::vector<uint8_t> p2pkh_script_pubkey(std::span<const uint8_t> pubkey_hash);
    static std::vector<uint8_t> p2sh_script_pubkey(std::span<const uint8_t> script_hash);

    // Create an m-of-n witness script from an ordered list of public keys
    static std::vector<uint8_t> create_witness_script(size_t m, const std::vector<std::vector<uint8_t>>& keys);

    // Inverse of create_witness_script; nullopt if the script is not a bare multisig
    static std::optional<MultisigScript> parse_witness_script(std::span<const uint8_t> script);

    // Serialize an input from a transaction outpoint (empty scriptSig)
    static std::vector<uint8_t> input_from_outpoint(const Outpoint& outpoint);

    // Serialize a transaction output with script and value
    static std::vector<uint8_t> create_output(std::span<const uint8_t> script, uint64_t value);

    // Serialize a witness stack: item count followed by length-prefixed items
    static std::vector<uint8_t> serialize_witness(const std::vector<std::vector<uint8_t>>& items);
};

} // namespace cosign
