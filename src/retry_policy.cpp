#include "rangeget/retry_policy.hpp"

#include <algorithm>

namespace rangeget {

std::chrono::milliseconds RetryPolicy::delayBefore(int attempt) const {
    if (attempt <= 1) {
        return std::chrono::milliseconds{0};
    }
    // Cap the shift so a large attempt count cannot overflow.
    const int shift = std::min(attempt - 2, 30);
    return base_delay * (1LL << shift);
}

} // namespace rangeget
