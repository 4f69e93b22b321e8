#ifndef QUILTBLOCK_BORDERS_BORDER_SIZING_HPP
#define QUILTBLOCK_BORDERS_BORDER_SIZING_HPP

// Width suggestions for borders. All results are in inches, rounded to
// the nearest quarter inch.

#include <model/border.hpp>
#include <optional>
#include <string>
#include <vector>

namespace quiltblock {

struct WidthSuggestion {
    double min = 0.0;
    double max = 0.0;
    double suggested = 0.0;
};

struct BedSize {
    std::string id;
    std::string name;
    PhysicalSize size;
};

constexpr double GOLDEN_RATIO = 1.618;

// Round half up to a multiple of 0.25
double round_to_quarter_inch(double inches);

// Next border width after `previous_width`, scaled by the golden ratio
double suggest_golden_ratio_width(double previous_width);

// Split total_width across border_count borders in Fibonacci
// proportions (1, 1, 2, 3, ...). Empty outside 1..8 borders.
std::vector<double> suggest_fibonacci_widths(double total_width, int border_count);

// Quarter, half and third of the block size
WidthSuggestion suggest_width_from_block_size(double block_size_inches);

// Finished size once every enabled border is sewn on
PhysicalSize calculate_quilt_size_with_borders(const PhysicalSize& size, const BorderConfig& config);

// Widths that grow current_size to fit target. Uses the tighter axis;
// nullopt when the target is not larger.
std::optional<std::vector<double>> calculate_borders_for_target_size(
    const PhysicalSize& current_size, const PhysicalSize& target_size, int border_count = 1);

// Standard mattress-top sizes: baby, twin, full, queen, king
const std::vector<BedSize>& bed_sizes();

}  // namespace quiltblock

#endif // QUILTBLOCK_BORDERS_BORDER_SIZING_HPP
