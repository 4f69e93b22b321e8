#include "palette.hpp"

#include <algorithm>
#include <cctype>

namespace quiltblock {

const ColorRole* Palette::find(const ColorRoleId& id) const {
    auto it = std::find_if(roles.begin(), roles.end(),
                           [&](const ColorRole& r) { return r.id == id; });
    return it == roles.end() ? nullptr : &*it;
}

std::optional<size_t> Palette::index_of(const ColorRoleId& id) const {
    for (size_t i = 0; i < roles.size(); ++i) {
        if (roles[i].id == id) {
            return i;
        }
    }
    return std::nullopt;
}

bool is_valid_hex_color(std::string_view color) {
    if (color.size() != 7 || color[0] != '#') {
        return false;
    }
    return std::all_of(color.begin() + 1, color.end(),
                       [](char c) { return std::isxdigit(static_cast<unsigned char>(c)) != 0; });
}

bool same_color(std::string_view a, std::string_view b) {
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
               return std::tolower(static_cast<unsigned char>(x)) == std::tolower(static_cast<unsigned char>(y));
           });
}

Palette default_palette() {
    return Palette{{
        {"background", "Background", "#F5F5DC"},  // cream
        {"feature", "Feature", "#2C3E50"},        // navy
        {"accent1", "Accent 1", "#8B4513"},       // saddle brown
        {"accent2", "Accent 2", "#DAA520"},       // goldenrod
    }};
}

Palette storage_default_palette() {
    return Palette{{
        {"background", "Background", "#FFFFFF"},
        {"feature", "Feature", "#1E3A5F"},
        {"accent1", "Accent 1", "#8B4513"},
        {"accent2", "Accent 2", "#DAA520"},
    }};
}

}  // namespace quiltblock
