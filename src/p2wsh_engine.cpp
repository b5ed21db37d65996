#include "p2wsh_engine.hpp"
#include "bech32.hpp"
#include "consts.hpp"
#include "ecdsa.hpp"
#include "error.hpp"
#include "hash_utils.hpp"
#include "hex_utils.hpp"
#include "psbt.hpp"
#include "segwit.hpp"
#include "serialize.hpp"
#include <algorithm>

namespace cosign {

DerivedAddress P2wshEngine::derive_address(size_t m, const std::vector<Bytes>& public_keys) const {
    auto witness_script = Segwit::create_witness_script(m, public_keys);
    auto program = HashUtils::sha256(witness_script);
    return {Bech32::encode_segwit(params_.bech32_hrp, WITNESS_VERSION_0, program),
            std::move(witness_script)};
}

ScriptKind P2wshEngine::classify_address(std::string_view address) const {
    return Address::decode(address, params_).kind;
}

TxTemplate P2wshEngine::new_template(size_t m, const std::vector<Bytes>& public_keys) const {
    TxTemplate tmpl;
    tmpl.m = m;
    tmpl.public_keys = public_keys;
    tmpl.witness_script = Segwit::create_witness_script(m, public_keys);
    tmpl.script_pubkey = Segwit::get_p2wsh_program(tmpl.witness_script);
    return tmpl;
}

void P2wshEngine::add_input(TxTemplate& tmpl, const Utxo& utxo) const {
    if (!utxo.script_pubkey.empty() && utxo.script_pubkey != tmpl.script_pubkey) {
        throw CosignError(CosignError::ErrorType::Validation,
            "Output " + utxo.outpoint.display_txid() + ":" + std::to_string(utxo.outpoint.index) +
            " is not locked to the wallet script");
    }
    tmpl.inputs.push_back(TemplateInput{utxo.outpoint, utxo.amount, {}});
}

void P2wshEngine::add_output(TxTemplate& tmpl, std::string_view address, uint64_t amount) const {
    auto decoded = Address::decode(address, params_);
    tmpl.outputs.push_back(TemplateOutput{std::move(decoded.script_pubkey), amount});
}

// Signature digest of one input according to BIP143
// https://github.com/bitcoin/bips/blob/master/bip-0143.mediawiki
//
// Preimage:
// 1. Transaction version (4 bytes)
// 2. hashPrevouts: double SHA256 of every input outpoint
// 3. hashSequence: double SHA256 of every input sequence
// 4. Outpoint being spent (36 bytes)
// 5. scriptCode: for P2WSH the witness script, length-prefixed
// 6. Value of the output being spent (8 bytes)
// 7. Sequence of the input (4 bytes)
// 8. hashOutputs: double SHA256 of every serialized output
// 9. Locktime (4 bytes)
// 10. Sighash type (4 bytes)
//
// The value is committed to, so a signer cannot be tricked into paying a
// larger fee than the one it was shown.
Bytes P2wshEngine::unsigned_digest(const TxTemplate& tmpl, size_t input_index) const {
    if (input_index >= tmpl.inputs.size()) {
        throw CosignError(CosignError::ErrorType::Validation,
            "Input index " + std::to_string(input_index) + " out of range");
    }

    Bytes prevouts;
    Bytes sequences;
    for (const auto& input : tmpl.inputs) {
        write_bytes(prevouts, input.outpoint.txid_vec);
        write_le32(prevouts, input.outpoint.index);
        write_le32(sequences, SEQUENCE_NO_LOCKTIME);
    }

    Bytes outputs;
    for (const auto& output : tmpl.outputs) {
        write_bytes(outputs, Segwit::create_output(output.script_pubkey, output.amount));
    }

    const auto& input = tmpl.inputs[input_index];

    Bytes preimage;
    write_le32(preimage, TX_VERSION);
    write_bytes(preimage, HashUtils::double_sha256(prevouts));
    write_bytes(preimage, HashUtils::double_sha256(sequences));
    write_bytes(preimage, input.outpoint.txid_vec);
    write_le32(preimage, input.outpoint.index);
    write_var_bytes(preimage, tmpl.witness_script);
    write_le64(preimage, input.amount);
    write_le32(preimage, SEQUENCE_NO_LOCKTIME);
    write_bytes(preimage, HashUtils::double_sha256(outputs));
    write_le32(preimage, TX_LOCKTIME);
    write_le32(preimage, SIGHASH_ALL);

    auto digest = HashUtils::double_sha256(preimage);
    return Bytes(digest.begin(), digest.end());
}

void P2wshEngine::apply_signature(TxTemplate& tmpl, size_t input_index,
                                  std::span<const uint8_t> public_key,
                                  std::span<const uint8_t> signature) const {
    if (input_index >= tmpl.inputs.size()) {
        throw CosignError(CosignError::ErrorType::InvalidSignature,
            "Signature for input " + std::to_string(input_index) + " which does not exist");
    }

    Bytes key(public_key.begin(), public_key.end());
    if (std::find(tmpl.public_keys.begin(), tmpl.public_keys.end(), key) == tmpl.public_keys.end()) {
        throw CosignError(CosignError::ErrorType::InvalidSignature,
            "Public key " + HexUtils::encode(key) + " is not part of the wallet script");
    }

    auto normalized = Ecdsa::normalize_signature(signature);
    std::span<const uint8_t> der(normalized.data(), normalized.size() - 1);
    auto digest = unsigned_digest(tmpl, input_index);
    if (!Ecdsa::verify(key, digest, der)) {
        throw CosignError(CosignError::ErrorType::InvalidSignature,
            "Signature for input " + std::to_string(input_index) + " does not verify");
    }

    tmpl.inputs[input_index].partial_sigs[key] = std::move(normalized);
}

// Assemble the fully signed transaction (BIP141/BIP144 serialization)
//
// 1. Version (4 bytes)
// 2. Marker 0x00 and flag 0x01
// 3. Inputs and outputs as in the legacy serialization
// 4. One witness stack per input:
//    <empty> <sig_1> ... <sig_m> <witness script>
//    The empty item is consumed by the CHECKMULTISIG off-by-one bug.
//    Signatures must appear in the same relative order as their keys in
//    the script, otherwise CHECKMULTISIG fails.
// 5. Locktime (4 bytes)
Bytes P2wshEngine::finalize(const TxTemplate& tmpl) const {
    if (tmpl.inputs.empty()) {
        throw CosignError(CosignError::ErrorType::State, "Cannot finalize a transaction without inputs");
    }

    std::vector<Bytes> witnesses;
    witnesses.reserve(tmpl.inputs.size());
    for (size_t i = 0; i < tmpl.inputs.size(); ++i) {
        const auto& input = tmpl.inputs[i];
        std::vector<Bytes> stack{Bytes{}};
        for (const auto& key : tmpl.public_keys) {
            if (stack.size() == tmpl.m + 1) {
                break;
            }
            auto it = input.partial_sigs.find(key);
            if (it != input.partial_sigs.end()) {
                stack.push_back(it->second);
            }
        }
        if (stack.size() != tmpl.m + 1) {
            throw CosignError(CosignError::ErrorType::State,
                "Input " + std::to_string(i) + " has " + std::to_string(stack.size() - 1) +
                " of " + std::to_string(tmpl.m) + " required signatures");
        }
        stack.push_back(tmpl.witness_script);
        witnesses.push_back(Segwit::serialize_witness(stack));
    }

    Bytes tx;
    write_le32(tx, TX_VERSION);
    write_u8(tx, TX_MARKER);
    write_u8(tx, TX_FLAG);

    write_compact_size(tx, tmpl.inputs.size());
    for (const auto& input : tmpl.inputs) {
        write_bytes(tx, Segwit::input_from_outpoint(input.outpoint));
    }

    write_compact_size(tx, tmpl.outputs.size());
    for (const auto& output : tmpl.outputs) {
        write_bytes(tx, Segwit::create_output(output.script_pubkey, output.amount));
    }

    for (const auto& witness : witnesses) {
        write_bytes(tx, witness);
    }

    write_le32(tx, TX_LOCKTIME);
    return tx;
}

Bytes P2wshEngine::serialize(const TxTemplate& tmpl) const {
    return Psbt::serialize(tmpl);
}

TxTemplate P2wshEngine::deserialize(std::span<const uint8_t> data) const {
    return Psbt::deserialize(data);
}

} // namespace cosign
