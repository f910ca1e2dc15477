#include "rangeget/transfer_result.hpp"

namespace rangeget {

const char* toString(TransferOutcome outcome) {
    switch (outcome) {
    case TransferOutcome::Completed:
        return "completed";
    case TransferOutcome::Failed:
        return "failed";
    case TransferOutcome::Cancelled:
        return "cancelled";
    }
    return "unknown";
}

} // namespace rangeget
