#include "rangeget/progress.hpp"

namespace rangeget {

const char* toString(TransferPhase phase) {
    switch (phase) {
    case TransferPhase::Probing:
        return "probing";
    case TransferPhase::Planning:
        return "planning";
    case TransferPhase::Transferring:
        return "transferring";
    case TransferPhase::Reconciling:
        return "reconciling";
    case TransferPhase::Completed:
        return "completed";
    case TransferPhase::Failed:
        return "failed";
    case TransferPhase::Cancelled:
        return "cancelled";
    }
    return "unknown";
}

bool isTerminal(TransferPhase phase) {
    return phase == TransferPhase::Completed || phase == TransferPhase::Failed ||
           phase == TransferPhase::Cancelled;
}

double Progress::bytesPerSecond() const {
    if (elapsed.count() <= 0) {
        return 0.0;
    }
    return static_cast<double>(downloaded_bytes) * 1000.0 / static_cast<double>(elapsed.count());
}

} // namespace rangeget
