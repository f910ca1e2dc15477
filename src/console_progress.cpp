#include "rangeget/console_progress.hpp"

#include <algorithm>
#include <filesystem>
#include <ostream>

#include <fmt/format.h>

namespace rangeget {

ConsoleProgress::ConsoleProgress(std::ostream& out, std::chrono::milliseconds redraw_interval)
    : out_(out), redraw_interval_(redraw_interval) {}

void ConsoleProgress::operator()(const Progress& progress) {
    std::lock_guard<std::mutex> lock(mutex_);

    // Terminal phases are always drawn so the last frame is accurate.
    const auto now = std::chrono::steady_clock::now();
    if (!isTerminal(progress.phase) && previous_lines_ > 0 && now - last_redraw_ < redraw_interval_) {
        return;
    }
    last_redraw_ = now;
    redrawPanel(buildPanel(progress));
}

std::string ConsoleProgress::buildPanel(const Progress& progress) {
    std::string panel;
    panel.reserve(512);
    panel.append("==================================================\n");
    panel += formatLine(progress);
    panel.push_back('\n');
    panel.append("--------------------------------------------------\n");
    panel += fmt::format("{:<13} {:>10}/s  elapsed {}\n", toString(progress.phase),
                         formatSize(static_cast<std::uint64_t>(progress.bytesPerSecond())),
                         formatDuration(progress.elapsed));
    panel.append("==================================================\n");
    return panel;
}

std::string ConsoleProgress::formatLine(const Progress& progress) {
    std::string line;
    line.reserve(256);

    std::string display_name = progress.display_id;
    if (display_name.empty() && !progress.filename.empty()) {
        display_name = std::filesystem::path{progress.filename}.filename().string();
    }
    if (display_name.empty()) {
        display_name = progress.filename;
    }
    if (display_name.size() > 20) {
        display_name = display_name.substr(0, 20);
    }
    if (display_name.empty()) {
        display_name = "(unnamed)";
    }

    if (progress.total_bytes > 0) {
        const double ratio = std::min(1.0, static_cast<double>(progress.downloaded_bytes) /
                                               static_cast<double>(progress.total_bytes));
        const int percent = static_cast<int>(ratio * 100.0);
        constexpr int bar_width = 30;
        const int bar_pos = static_cast<int>(ratio * bar_width);

        std::string bar;
        bar.reserve(static_cast<std::size_t>(bar_width) * 3);
        for (int i = 0; i < bar_width; ++i) {
            bar += (i < bar_pos) ? u8"█" : u8"░";
        }

        line += fmt::format("{:<20} [{}] {:>3}% ({}/{})", display_name, bar, percent,
                            formatSize(progress.downloaded_bytes), formatSize(progress.total_bytes));
    } else {
        line += fmt::format("{:<20} [Initializing...]", display_name);
    }

    if (progress.phase == TransferPhase::Failed || progress.has_error) {
        line += fmt::format("  FAILED {}", progress.error_message);
    } else if (progress.phase == TransferPhase::Cancelled) {
        line.append("  Cancelled");
    } else if (progress.phase == TransferPhase::Completed) {
        line.append("  Done");
    }

    return line;
}

std::string ConsoleProgress::formatSize(std::uint64_t bytes) {
    constexpr double KB = 1024.0;
    constexpr double MB = KB * 1024.0;
    constexpr double GB = MB * 1024.0;

    const double value = static_cast<double>(bytes);
    if (bytes >= static_cast<std::uint64_t>(GB)) {
        return fmt::format("{:.1f} GB", value / GB);
    } else if (bytes >= static_cast<std::uint64_t>(MB)) {
        return fmt::format("{:.1f} MB", value / MB);
    } else if (bytes >= static_cast<std::uint64_t>(KB)) {
        return fmt::format("{:.1f} KB", value / KB);
    } else {
        return fmt::format("{} B", bytes);
    }
}

std::string ConsoleProgress::formatDuration(std::chrono::milliseconds duration) {
    const auto total_seconds = std::chrono::duration_cast<std::chrono::seconds>(duration).count();
    const auto hours = total_seconds / 3600;
    const auto minutes = (total_seconds / 60) % 60;
    const auto seconds = total_seconds % 60;
    if (hours > 0) {
        return fmt::format("{}:{:02}:{:02}", hours, minutes, seconds);
    }
    return fmt::format("{:02}:{:02}", minutes, seconds);
}

void ConsoleProgress::redrawPanel(const std::string& panel) {
    const auto current_lines = static_cast<std::size_t>(std::count(panel.begin(), panel.end(), '\n'));
    if (previous_lines_ > 0) {
        out_ << "\033[" << previous_lines_ << "F\033[J";
    }
    out_ << panel << std::flush;
    previous_lines_ = current_lines;
}

} // namespace rangeget
