#ifndef QUILTBLOCK_MODEL_BORDER_HPP
#define QUILTBLOCK_MODEL_BORDER_HPP

#include "unit.hpp"
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace quiltblock {

using BorderId = std::string;

// How the four strips of a border meet at the corners
enum class CornerStyle { Butted, Mitered, Cornerstone };

// One ring around the block grid
struct BorderSpec {
    BorderId id;
    double width_inches = 2.0;
    CornerStyle corner_style = CornerStyle::Butted;
    ColorRoleId color_role;
    std::optional<ColorRoleId> cornerstone_color_role;  // Only used by Cornerstone

    bool operator==(const BorderSpec&) const = default;
};

// Partial border fields for update operations. A cornerstone role holding
// an empty std::optional<ColorRoleId> clears it.
struct BorderUpdate {
    std::optional<double> width_inches;
    std::optional<CornerStyle> corner_style;
    std::optional<ColorRoleId> color_role;
    std::optional<std::optional<ColorRoleId>> cornerstone_color_role;

    bool empty() const {
        return !width_inches && !corner_style && !color_role && !cornerstone_color_role;
    }

    bool operator==(const BorderUpdate&) const = default;
};

// Finished dimensions of a quilt top
struct PhysicalSize {
    double width_inches = 0.0;
    double height_inches = 0.0;

    bool operator==(const PhysicalSize&) const = default;
};

// Ordered borders, innermost first
struct BorderConfig {
    bool enabled = false;
    std::vector<BorderSpec> borders;

    const BorderSpec* find(const BorderId& id) const;
    std::optional<size_t> index_of(const BorderId& id) const;

    bool operator==(const BorderConfig&) const = default;
};

std::string_view to_string(CornerStyle style);
std::optional<CornerStyle> corner_style_from_string(std::string_view value);

// Merge a partial update into a border
BorderSpec apply_border_update(const BorderSpec& border, const BorderUpdate& update);

}  // namespace quiltblock

#endif // QUILTBLOCK_MODEL_BORDER_HPP
