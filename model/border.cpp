#include "border.hpp"

namespace quiltblock {

const BorderSpec* BorderConfig::find(const BorderId& id) const {
    for (const auto& border : borders) {
        if (border.id == id) {
            return &border;
        }
    }
    return nullptr;
}

std::optional<size_t> BorderConfig::index_of(const BorderId& id) const {
    for (size_t i = 0; i < borders.size(); ++i) {
        if (borders[i].id == id) {
            return i;
        }
    }
    return std::nullopt;
}

std::string_view to_string(CornerStyle style) {
    switch (style) {
        case CornerStyle::Butted: return "butted";
        case CornerStyle::Mitered: return "mitered";
        case CornerStyle::Cornerstone: return "cornerstone";
    }
    return "butted";
}

std::optional<CornerStyle> corner_style_from_string(std::string_view value) {
    if (value == "butted") return CornerStyle::Butted;
    if (value == "mitered") return CornerStyle::Mitered;
    if (value == "cornerstone") return CornerStyle::Cornerstone;
    return std::nullopt;
}

BorderSpec apply_border_update(const BorderSpec& border, const BorderUpdate& update) {
    BorderSpec result = border;
    if (update.width_inches) result.width_inches = *update.width_inches;
    if (update.corner_style) result.corner_style = *update.corner_style;
    if (update.color_role) result.color_role = *update.color_role;
    if (update.cornerstone_color_role) result.cornerstone_color_role = *update.cornerstone_color_role;
    return result;
}

}  // namespace quiltblock
