#pragma once

#include "records.hpp"

namespace cosign {

enum class TxEvent {
    ThresholdReached,
    Cancel,
    Broadcast,
    Confirm
};

const char* event_name(TxEvent event);

// Transaction lifecycle:
//
//   pending --threshold reached--> all_signed --broadcast--> broadcasted --confirm--> confirmed
//      |
//      +--cancel--> cancelled
//
// Returns the next status or throws StateError naming the current status and
// the requested transition.
TxStatus transition(TxStatus current, TxEvent event);

} // namespace cosign
