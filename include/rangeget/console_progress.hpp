#pragma once

#include "progress.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <iosfwd>
#include <mutex>
#include <string>

namespace rangeget {

// Terminal progress panel. Meant to be used as the ProgressObserver of a
// download; redraws itself in place.
class ConsoleProgress {
public:
    explicit ConsoleProgress(std::ostream& out,
                             std::chrono::milliseconds redraw_interval = std::chrono::milliseconds{200});

    void operator()(const Progress& progress);

    [[nodiscard]] static std::string buildPanel(const Progress& progress);
    [[nodiscard]] static std::string formatLine(const Progress& progress);
    [[nodiscard]] static std::string formatSize(std::uint64_t bytes);
    [[nodiscard]] static std::string formatDuration(std::chrono::milliseconds duration);

private:
    void redrawPanel(const std::string& panel);

    std::ostream& out_;
    const std::chrono::milliseconds redraw_interval_;

    std::mutex mutex_;
    std::size_t previous_lines_{0};
    std::chrono::steady_clock::time_point last_redraw_{};
};

} // namespace rangeget
