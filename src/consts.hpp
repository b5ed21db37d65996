#pragma once

#include <cstddef>
#include <cstdint>

namespace cosign {

    // Bitcoin Script Operation Codes
    constexpr uint8_t OP_0 = 0x00;
    constexpr uint8_t OP_PUSHDATA1 = 0x4c;
    constexpr uint8_t OP_1 = 0x51;
    constexpr uint8_t OP_16 = 0x60;
    constexpr uint8_t OP_DUP = 0x76;
    constexpr uint8_t OP_EQUAL = 0x87;
    constexpr uint8_t OP_EQUALVERIFY = 0x88;
    constexpr uint8_t OP_HASH160 = 0xA9;
    constexpr uint8_t OP_CHECKSIG = 0xAC;
    constexpr uint8_t OP_CHECKMULTISIG = 0xAE;

    // Common script-related constants
    constexpr uint8_t COMPRESSED_PUBKEY_SIZE = 0x21; // 33 bytes
    constexpr uint8_t PUBKEY_HASH_SIZE = 0x14; // 20 bytes
    constexpr uint8_t WITNESS_VERSION_0 = 0x00;
    constexpr uint8_t WITNESS_PROGRAM_SIZE = 0x20; // 32 bytes

    // Transaction-related constants
    constexpr uint32_t SEQUENCE_NO_LOCKTIME = 0xFFFFFFFF;
    constexpr uint32_t SIGHASH_ALL = 0x01;
    constexpr uint32_t TX_VERSION = 0x02;
    constexpr uint32_t TX_LOCKTIME = 0x00;
    constexpr uint8_t TX_MARKER = 0x00;
    constexpr uint8_t TX_FLAG = 0x01;

    // Multisig policy
    constexpr size_t MAX_MULTISIG_KEYS = 16;       // largest n expressible with OP_n
    constexpr size_t DEFAULT_MAX_PARTICIPANTS = 10;

    // Record key namespaces
    constexpr const char* WALLET_KEY_PREFIX = "wallet:";
    constexpr const char* TX_KEY_PREFIX = "tx:";

    constexpr uint64_t SATOSHIS_PER_BTC = 100'000'000;

} // namespace cosign
