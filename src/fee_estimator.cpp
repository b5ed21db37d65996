#include "fee_estimator.hpp"
#include "error.hpp"
#include "serialize.hpp"
#include <cmath>

namespace cosign {

uint64_t FeeEstimator::output_weight(ScriptKind kind) {
    // 8-byte value + script length + scriptPubKey, all non-witness (x4)
    switch (kind) {
        case ScriptKind::P2PKH:  return 34 * 4;
        case ScriptKind::P2SH:   return 32 * 4;
        case ScriptKind::P2WPKH: return 31 * 4;
        case ScriptKind::P2WSH:  return 43 * 4;
        case ScriptKind::P2TR:   return 43 * 4;
    }
    return 43 * 4;
}

// Transaction weight = 3 * base size + total size (BIP141). Virtual size is
// weight / 4 rounded up.
//
// Components:
// - per input: fixed P2WSH multisig cost + m signatures + n public keys
//   (the witness script is the dominant part of the witness)
// - per output: value, script length and scriptPubKey
// - the change slot: always counted, whether or not change is produced
// - segwit marker and flag: 2 witness bytes
// - version and locktime: 8 bytes
// - input and output counts: CompactSize each
uint64_t FeeEstimator::estimate_vsize(size_t m, size_t n, size_t input_count,
                                      const std::vector<ScriptKind>& output_kinds) {
    if (m == 0 || m > n) {
        throw CosignError(CosignError::ErrorType::Validation, "Invalid m-of-n for fee estimate");
    }

    uint64_t weight = 0;

    weight += P2WSH_MULTISIG_INPUT_WEIGHT * input_count;
    weight += (SIGNATURE_WEIGHT * m + PUBKEY_WEIGHT * n) * input_count;

    for (ScriptKind kind : output_kinds) {
        weight += output_weight(kind);
    }
    weight += output_weight(ScriptKind::P2WSH);
    const size_t output_count = output_kinds.size() + 1;

    weight += 2;
    weight += 8 * 4;
    weight += compact_size_length(input_count) * 4;
    weight += compact_size_length(output_count) * 4;

    return (weight + 3) / 4;
}

uint64_t FeeEstimator::fee_for(uint64_t vsize, double fee_rate) {
    if (!(fee_rate > 0.0) || !std::isfinite(fee_rate)) {
        throw CosignError(CosignError::ErrorType::Validation, "Fee rate must be positive");
    }
    return static_cast<uint64_t>(std::ceil(static_cast<double>(vsize) * fee_rate));
}

} // namespace cosign
