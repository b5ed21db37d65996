#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>
#include "address.hpp"

namespace cosign {

// Conservative virtual-size estimate for transactions spending P2WSH multisig
// inputs. Signatures are costed at their 73-byte maximum so the fee never
// falls short of what the finalized transaction needs.
class FeeEstimator {
public:
    // Weight units per MULTISIG-P2WSH input, excluding signatures and keys:
    // 41 non-witness bytes (outpoint, empty scriptSig, sequence) and
    // 6 witness bytes of item counts, OP_0 dummy and script length
    static constexpr uint64_t P2WSH_MULTISIG_INPUT_WEIGHT = 6 + 41 * 4;
    static constexpr uint64_t SIGNATURE_WEIGHT = 73;
    static constexpr uint64_t PUBKEY_WEIGHT = 34;

    // Estimated vsize of a transaction with `input_count` m-of-n P2WSH inputs,
    // one output per entry of `output_kinds` and a P2WSH change output
    static uint64_t estimate_vsize(size_t m, size_t n, size_t input_count,
                                   const std::vector<ScriptKind>& output_kinds);

    // Output weight in weight units
    static uint64_t output_weight(ScriptKind kind);

    // ceil(vsize * fee_rate)
    static uint64_t fee_for(uint64_t vsize, double fee_rate);

private:
    FeeEstimator() = delete;
};

} // namespace cosign
