#pragma once

#include <chrono>

namespace rangeget {

struct RetryPolicy {
    int max_attempts{5};
    std::chrono::milliseconds base_delay{1000};

    // Wait inserted before the given attempt (1-based). The first attempt
    // starts immediately, later ones double: 1s, 2s, 4s, 8s.
    [[nodiscard]] std::chrono::milliseconds delayBefore(int attempt) const;
};

} // namespace rangeget
