#pragma once

#include <stdexcept>
#include <string>

namespace cosign {

class CosignError : public std::runtime_error {
public:
    enum class ErrorType {
        Validation,         // bad shape or bounds of caller input
        NotFound,           // unknown wallet or transaction id
        State,              // operation illegal in the current lifecycle state
        DuplicateSigner,
        InvalidSignature,
        InsufficientFunds,
        NoFunds,
        ExternalService,    // network, signing or broadcast collaborator failure
        Conflict,           // wallet with the same identity already exists
        Storage,            // persistence adapter I/O failure
        Encoding            // malformed hex, base58, bech32 or PSBT data
    };

    CosignError(ErrorType type, const std::string& message = "")
        : std::runtime_error(message.empty() ? type_name(type) : message)
        , type_(type)
    {}

    ErrorType type() const { return type_; }

    // Stable machine-readable name of an error type
    static const char* type_name(ErrorType type) {
        switch (type) {
            case ErrorType::Validation:        return "ValidationError";
            case ErrorType::NotFound:          return "NotFound";
            case ErrorType::State:             return "StateError";
            case ErrorType::DuplicateSigner:   return "DuplicateSigner";
            case ErrorType::InvalidSignature:  return "InvalidSignature";
            case ErrorType::InsufficientFunds: return "InsufficientFunds";
            case ErrorType::NoFunds:           return "NoFunds";
            case ErrorType::ExternalService:   return "ExternalServiceError";
            case ErrorType::Conflict:          return "Conflict";
            case ErrorType::Storage:           return "StorageError";
            case ErrorType::Encoding:          return "EncodingError";
        }
        return "UnknownError";
    }

private:
    ErrorType type_;
};

} // namespace cosign
