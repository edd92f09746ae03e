// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <chrono>
#include <cstdint>
#include <ostream>
#include <string>
#include <string_view>

namespace hubfetch::cli {

// Minimal progress bar for CLI
class ProgressBar {
public:
    explicit ProgressBar(std::uint64_t total, std::string_view label = {}, std::ostream* out = nullptr);

    // Redraw when the integer percentage moved (or the label changed)
    void update(std::uint64_t current) noexcept;

    // Draw 100% and end the line
    void finish() noexcept;

    // Clear the progress bar line
    void clear() noexcept;

    [[nodiscard]] std::uint64_t total() const noexcept { return total_; }
    void total(std::uint64_t t) noexcept { total_ = t; }

    [[nodiscard]] const std::string& label() const noexcept { return label_; }
    void label(std::string_view l) noexcept;

    // The line update() would draw, without the leading carriage return
    [[nodiscard]] std::string render(std::uint64_t current) const;

    [[nodiscard]] static std::string format_speed(std::uint64_t bps);
    [[nodiscard]] static std::string format_bytes(std::uint64_t bytes);
    [[nodiscard]] static std::string format_time(std::uint64_t seconds);

private:
    [[nodiscard]] static std::string render_bar(double percent);

    std::ostream& out_;
    std::uint64_t total_{0};
    std::uint64_t last_current_{0};
    std::uint64_t first_current_{0};   // Bytes already present at the first update
    bool started_{false};
    int last_percent_{-1};
    std::string label_;
    bool finished_{false};
    std::chrono::steady_clock::time_point start_{std::chrono::steady_clock::now()};
};

} // namespace hubfetch::cli
