#include "border_sizing.hpp"
#include <array>
#include <algorithm>
#include <cmath>
#include <numeric>

namespace quiltblock {

namespace {

constexpr std::array<int, 8> FIBONACCI = {1, 1, 2, 3, 5, 8, 13, 21};

}  // namespace

double round_to_quarter_inch(double inches) {
    return std::floor(inches * 4.0 + 0.5) / 4.0;
}

double suggest_golden_ratio_width(double previous_width) {
    return round_to_quarter_inch(previous_width * GOLDEN_RATIO);
}

std::vector<double> suggest_fibonacci_widths(double total_width, int border_count) {
    if (border_count < 1 || border_count > static_cast<int>(FIBONACCI.size())) {
        return {};
    }

    const int sum = std::accumulate(FIBONACCI.begin(), FIBONACCI.begin() + border_count, 0);

    std::vector<double> widths;
    widths.reserve(static_cast<size_t>(border_count));
    for (int i = 0; i < border_count; ++i) {
        widths.push_back(round_to_quarter_inch(static_cast<double>(FIBONACCI[i]) / sum * total_width));
    }
    return widths;
}

WidthSuggestion suggest_width_from_block_size(double block_size_inches) {
    return {
        round_to_quarter_inch(block_size_inches / 4.0),
        round_to_quarter_inch(block_size_inches / 2.0),
        round_to_quarter_inch(block_size_inches / 3.0),
    };
}

PhysicalSize calculate_quilt_size_with_borders(const PhysicalSize& size, const BorderConfig& config) {
    if (!config.enabled || config.borders.empty()) {
        return size;
    }

    double total = 0.0;
    for (const auto& border : config.borders) {
        total += border.width_inches;
    }
    return {size.width_inches + total * 2.0, size.height_inches + total * 2.0};
}

std::optional<std::vector<double>> calculate_borders_for_target_size(
    const PhysicalSize& current_size, const PhysicalSize& target_size, int border_count) {
    const double width_needed = (target_size.width_inches - current_size.width_inches) / 2.0;
    const double height_needed = (target_size.height_inches - current_size.height_inches) / 2.0;
    const double needed = std::min(width_needed, height_needed);

    if (needed <= 0.0) {
        return std::nullopt;
    }

    if (border_count > 1) {
        return suggest_fibonacci_widths(needed, border_count);
    }
    return std::vector<double>{round_to_quarter_inch(needed)};
}

const std::vector<BedSize>& bed_sizes() {
    static const std::vector<BedSize> sizes = {
        {"baby", "Baby", {36, 52}},
        {"twin", "Twin", {68, 88}},
        {"full", "Full", {84, 90}},
        {"queen", "Queen", {90, 96}},
        {"king", "King", {106, 96}},
    };
    return sizes;
}

}  // namespace quiltblock
