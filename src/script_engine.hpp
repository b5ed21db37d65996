#pragma once

#include <cstdint>
#include <map>
#include <span>
#include <string>
#include <string_view>
#include <vector>
#include "address.hpp"
#include "utxo.hpp"

namespace cosign {

using Bytes = std::vector<uint8_t>;

struct TemplateInput {
    Outpoint outpoint;
    uint64_t amount;
    std::map<Bytes, Bytes> partial_sigs;   // public key -> DER signature + sighash byte
};

struct TemplateOutput {
    Bytes script_pubkey;
    uint64_t amount;
};

// A partially signed multisig transaction: inputs, outputs and the signatures
// collected so far. Every input spends the same witness script.
struct TxTemplate {
    size_t m = 0;
    std::vector<Bytes> public_keys;
    Bytes witness_script;
    Bytes script_pubkey;                   // P2WSH program of witness_script
    std::vector<TemplateInput> inputs;
    std::vector<TemplateOutput> outputs;

    uint64_t total_input_amount() const {
        uint64_t total = 0;
        for (const auto& input : inputs) {
            total += input.amount;
        }
        return total;
    }
};

struct DerivedAddress {
    std::string address;
    Bytes redeem_script;
};

// Script, address and transaction-template capability the lifecycle engine
// is written against. Implementations must be deterministic in derive_address
// and must reject signatures in apply_signature that do not verify.
class ScriptEngine {
public:
    virtual ~ScriptEngine() = default;

    virtual DerivedAddress derive_address(size_t m, const std::vector<Bytes>& public_keys) const = 0;

    // Kind of output script an address pays to; throws ValidationError if the
    // address is not valid on the engine's network
    virtual ScriptKind classify_address(std::string_view address) const = 0;

    virtual TxTemplate new_template(size_t m, const std::vector<Bytes>& public_keys) const = 0;
    virtual void add_input(TxTemplate& tmpl, const Utxo& utxo) const = 0;
    virtual void add_output(TxTemplate& tmpl, std::string_view address, uint64_t amount) const = 0;

    // The 32 bytes a signer must sign for the given input
    virtual Bytes unsigned_digest(const TxTemplate& tmpl, size_t input_index) const = 0;

    // Throws InvalidSignature for unknown keys, malformed or non-verifying signatures
    virtual void apply_signature(TxTemplate& tmpl, size_t input_index,
                                 std::span<const uint8_t> public_key,
                                 std::span<const uint8_t> signature) const = 0;

    // Fully signed raw transaction; requires m signatures on every input
    virtual Bytes finalize(const TxTemplate& tmpl) const = 0;

    virtual Bytes serialize(const TxTemplate& tmpl) const = 0;
    virtual TxTemplate deserialize(std::span<const uint8_t> data) const = 0;
};

} // namespace cosign
