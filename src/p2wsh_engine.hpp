#pragma once

#include "network.hpp"
#include "script_engine.hpp"

namespace cosign {

// Script engine for native segwit multisig: P2WSH outputs, BIP143 digests and
// BIP174 templates
class P2wshEngine : public ScriptEngine {
public:
    explicit P2wshEngine(const NetworkParams& params) : params_(params) {}

    DerivedAddress derive_address(size_t m, const std::vector<Bytes>& public_keys) const override;
    ScriptKind classify_address(std::string_view address) const override;

    TxTemplate new_template(size_t m, const std::vector<Bytes>& public_keys) const override;
    void add_input(TxTemplate& tmpl, const Utxo& utxo) const override;
    void add_output(TxTemplate& tmpl, std::string_view address, uint64_t amount) const override;

    Bytes unsigned_digest(const TxTemplate& tmpl, size_t input_index) const override;
    void apply_signature(TxTemplate& tmpl, size_t input_index,
                         std::span<const uint8_t> public_key,
                         std::span<const uint8_t> signature) const override;
    Bytes finalize(const TxTemplate& tmpl) const override;

    Bytes serialize(const TxTemplate& tmpl) const override;
    TxTemplate deserialize(std::span<const uint8_t> data) const override;

    const NetworkParams& params() const { return params_; }

private:
    NetworkParams params_;
};

} // namespace cosign
