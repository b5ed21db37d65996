#include "address.hpp"
#include "base58.hpp"
#include "bech32.hpp"
#include "error.hpp"
#include "segwit.hpp"

namespace cosign {

DecodedAddress Address::decode(std::string_view address, const NetworkParams& params) {
    if (address.empty()) {
        throw CosignError(CosignError::ErrorType::Validation, "Address must not be empty");
    }

    // Segwit addresses: <hrp>1<data>
    if (auto witness = Bech32::decode_segwit(address, params.bech32_hrp)) {
        const auto& program = witness->program;
        if (witness->version == 0 && program.size() == 20) {
            return {ScriptKind::P2WPKH, Segwit::witness_script_pubkey(0, program)};
        }
        if (witness->version == 0 && program.size() == 32) {
            return {ScriptKind::P2WSH, Segwit::witness_script_pubkey(0, program)};
        }
        if (witness->version == 1 && program.size() == 32) {
            return {ScriptKind::P2TR, Segwit::witness_script_pubkey(1, program)};
        }
        throw CosignError(CosignError::ErrorType::Validation,
            "Unsupported witness program in address " + std::string(address));
    }

    // Legacy Base58Check addresses: <version byte><20-byte hash>
    std::vector<uint8_t> payload;
    try {
        payload = Base58::decode_check(address);
    } catch (const CosignError&) {
        throw CosignError(CosignError::ErrorType::Validation,
            "Unsupported or malformed address " + std::string(address) + " for " + params.name);
    }

    if (payload.size() == 21) {
        std::span<const uint8_t> hash(payload.data() + 1, 20);
        if (payload[0] == params.p2pkh_version) {
            return {ScriptKind::P2PKH, Segwit::p2pkh_script_pubkey(hash)};
        }
        if (payload[0] == params.p2sh_version) {
            return {ScriptKind::P2SH, Segwit::p2sh_script_pubkey(hash)};
        }
    }
    throw CosignError(CosignError::ErrorType::Validation,
        "Address " + std::string(address) + " does not belong to " + params.name);
}

std::string Address::kind_name(ScriptKind kind) {
    switch (kind) {
        case ScriptKind::P2PKH:  return "P2PKH";
        case ScriptKind::P2SH:   return "P2SH";
        case ScriptKind::P2WPKH: return "P2WPKH";
        case ScriptKind::P2WSH:  return "P2WSH";
        case ScriptKind::P2TR:   return "P2TR";
    }
    return "UNKNOWN";
}

} // namespace cosign
