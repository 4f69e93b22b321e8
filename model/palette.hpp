#ifndef QUILTBLOCK_MODEL_PALETTE_HPP
#define QUILTBLOCK_MODEL_PALETTE_HPP

#include "unit.hpp"
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace quiltblock {

// Hex color string, e.g. "#FF5733"
using HexColor = std::string;

// A palette entry referenced by unit patches instead of raw colors
struct ColorRole {
    ColorRoleId id;
    std::string name;
    HexColor color;
    bool is_variant_color = false;  // Auto-created from a per-instance override

    bool operator==(const ColorRole&) const = default;
};

struct Palette {
    std::vector<ColorRole> roles;

    const ColorRole* find(const ColorRoleId& id) const;
    std::optional<size_t> index_of(const ColorRoleId& id) const;
    bool contains(const ColorRoleId& id) const { return find(id) != nullptr; }
    size_t size() const { return roles.size(); }

    bool operator==(const Palette&) const = default;
};

// Colors by role id that win over the palette, e.g. per-instance
// variant colors
using PaletteOverrides = std::map<ColorRoleId, HexColor>;

// "#RRGGBB" with hex digits of either case
bool is_valid_hex_color(std::string_view color);

// Case-insensitive color comparison ("#abcdef" matches "#ABCDEF")
bool same_color(std::string_view a, std::string_view b);

// Standard four roles used for new blocks
Palette default_palette();

// Fallback palette used when a stored record carries none
Palette storage_default_palette();

}  // namespace quiltblock

#endif // QUILTBLOCK_MODEL_PALETTE_HPP
