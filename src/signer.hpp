#pragma once

#include <cstdint>
#include <span>
#include <string>
#include <vector>

namespace cosign {

// Signing capability: given a 32-byte digest and the identity of a
// credential, returns a signature (DER + sighash byte, or compact r||s).
// Failures are reported as ExternalServiceError.
class Signer {
public:
    virtual ~Signer() = default;

    virtual std::vector<uint8_t> sign(std::span<const uint8_t> digest, const std::string& credential) = 0;
};

} // namespace cosign
