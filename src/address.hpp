#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>
#include "network.hpp"

namespace cosign {

// Output script kinds recognised for recipients
enum class ScriptKind {
    P2PKH,
    P2SH,
    P2WPKH,
    P2WSH,
    P2TR
};

struct DecodedAddress {
    ScriptKind kind;
    std::vector<uint8_t> script_pubkey;
};

class Address {
public:
    // Classifies an address of the given network and builds its scriptPubKey.
    // Throws ValidationError for unknown formats or addresses of another network.
    static DecodedAddress decode(std::string_view address, const NetworkParams& params);

    static std::string kind_name(ScriptKind kind);

private:
    Address() = delete;
};

} // namespace cosign
