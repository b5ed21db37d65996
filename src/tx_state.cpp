#include "tx_state.hpp"
#include "error.hpp"

namespace cosign {

const char* event_name(TxEvent event) {
    switch (event) {
        case TxEvent::ThresholdReached: return "finish signatures";
        case TxEvent::Cancel:           return "cancel";
        case TxEvent::Broadcast:        return "broadcast";
        case TxEvent::Confirm:          return "confirm";
    }
    return "unknown";
}

TxStatus transition(TxStatus current, TxEvent event) {
    switch (current) {
        case TxStatus::Pending:
            if (event == TxEvent::ThresholdReached) return TxStatus::AllSigned;
            if (event == TxEvent::Cancel) return TxStatus::Cancelled;
            break;
        case TxStatus::AllSigned:
            if (event == TxEvent::Broadcast) return TxStatus::Broadcasted;
            break;
        case TxStatus::Broadcasted:
            if (event == TxEvent::Confirm) return TxStatus::Confirmed;
            break;
        case TxStatus::Confirmed:
        case TxStatus::Cancelled:
            break;
    }
    throw CosignError(CosignError::ErrorType::State,
        std::string("Cannot ") + event_name(event) + " a transaction in state " + to_string(current));
}

} // namespace cosign
