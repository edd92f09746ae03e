// Copyright (c) 2026 changcheng967. All rights reserved.

#include <hubfetch/cli/progress_bar.hpp>
#include <fmt/format.h>
#include <algorithm>
#include <cmath>
#include <iostream>

namespace hubfetch::cli {

//=============================================================================
// ProgressBar
//=============================================================================

ProgressBar::ProgressBar(std::uint64_t total, std::string_view label, std::ostream* out)
    : out_(out ? *out : std::cout)
    , total_(total)
    , label_(label) {}

void ProgressBar::label(std::string_view l) noexcept {
    if (label_ != l) {
        label_ = l;
        last_percent_ = -1;   // Force a redraw
    }
}

void ProgressBar::update(std::uint64_t current) noexcept {
    if (!started_) {
        started_ = true;
        first_current_ = current;
        start_ = std::chrono::steady_clock::now();
    }
    last_current_ = current;

    int percent = total_ == 0 ? 100 : static_cast<int>(
        std::clamp(static_cast<double>(current) * 100.0 / static_cast<double>(total_), 0.0, 100.0));

    // Only redraw on visible change
    if (percent == last_percent_ && !finished_) return;
    last_percent_ = percent;

    out_ << '\r' << render(current) << std::flush;
}

std::string ProgressBar::render(std::uint64_t current) const {
    double percent = total_ == 0 ? 100.0 : static_cast<double>(current) * 100.0 / static_cast<double>(total_);
    percent = std::clamp(percent, 0.0, 100.0);

    std::string line;
    if (!label_.empty()) {
        line += label_;
        line += ": ";
    }
    line += render_bar(percent);
    line += fmt::format(" {:3d}% ({}/{})", static_cast<int>(percent),
                        format_bytes(current), format_bytes(total_));

    // Speed over this session only; resumed bytes do not count
    auto elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - start_).count();
    if (started_ && elapsed > 0.5 && current > first_current_) {
        auto bps = static_cast<std::uint64_t>(static_cast<double>(current - first_current_) / elapsed);
        if (bps > 0) {
            line += " @ ";
            line += format_speed(bps);
            if (current < total_) {
                line += " ETA: ";
                line += format_time((total_ - current) / bps);
            }
        }
    }

    // Clear rest of line
    line += std::string(10, ' ');
    return line;
}

void ProgressBar::finish() noexcept {
    if (finished_) return;
    finished_ = true;
    update(total_);
    out_ << std::endl;
}

void ProgressBar::clear() noexcept {
    out_ << '\r' << std::string(100, ' ') << '\r' << std::flush;
}

std::string ProgressBar::render_bar(double percent) {
    constexpr int bar_width = 30;
    const int filled = static_cast<int>(std::round(bar_width * percent / 100.0));

    std::string bar = "[";
    bar.append(static_cast<std::size_t>(filled), '=');
    if (filled < bar_width) {
        bar += '>';
        bar.append(static_cast<std::size_t>(bar_width - filled - 1), ' ');
    }
    bar += ']';
    return bar;
}

std::string ProgressBar::format_speed(std::uint64_t bps) {
    return format_bytes(bps) + "/s";
}

std::string ProgressBar::format_bytes(std::uint64_t bytes) {
    constexpr std::uint64_t KB = 1024;
    constexpr std::uint64_t MB = 1024 * KB;
    constexpr std::uint64_t GB = 1024 * MB;
    constexpr std::uint64_t TB = 1024 * GB;

    if (bytes >= TB) {
        return fmt::format("{:.2f} TB", static_cast<double>(bytes) / TB);
    } else if (bytes >= GB) {
        return fmt::format("{:.2f} GB", static_cast<double>(bytes) / GB);
    } else if (bytes >= MB) {
        return fmt::format("{:.1f} MB", static_cast<double>(bytes) / MB);
    } else if (bytes >= KB) {
        return fmt::format("{:.0f} KB", static_cast<double>(bytes) / KB);
    }
    return fmt::format("{} B", bytes);
}

std::string ProgressBar::format_time(std::uint64_t seconds) {
    std::uint64_t hours = seconds / 3600;
    std::uint64_t minutes = (seconds % 3600) / 60;
    std::uint64_t secs = seconds % 60;

    if (hours > 0) {
        return fmt::format("{}h {:02d}m {}s", hours, minutes, secs);
    } else if (minutes > 0) {
        return fmt::format("{}m {}s", minutes, secs);
    }
    return fmt::format("{}s", secs);
}

} // namespace hubfetch::cli
