#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace cosign {

struct WitnessProgram {
    uint8_t version;
    std::vector<uint8_t> program;
};

// Segwit address codec (BIP173 bech32 for witness v0, BIP350 bech32m for v1+)
class Bech32 {
public:
    static std::string encode_segwit(std::string_view hrp, uint8_t witness_version,
                                     std::span<const uint8_t> program);

    // Returns nullopt on any checksum, charset, HRP or program-length error
    static std::optional<WitnessProgram> decode_segwit(std::string_view address,
                                                       std::string_view expected_hrp);

private:
    Bech32() = delete;
};

} // namespace cosign
