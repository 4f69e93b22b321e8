#include "unit_bridge.hpp"
#include <model/constants.hpp>
#include <geometry/primitives.hpp>
#include <algorithm>
#include <stdexcept>
#include <type_traits>

namespace quiltblock {

namespace {

// Copy a role out of a patch map if present
void take_role(const PatchRoles& roles, const char* patch_id, ColorRoleId& target) {
    auto it = roles.find(patch_id);
    if (it != roles.end()) {
        target = it->second;
    }
}

const UnitDefinition& definition_for(const Unit& unit, const UnitRegistry& registry) {
    return registry.get_or_throw(std::string(type_id(unit_type(unit))));
}

// Build an update from generic results. Span rides along with the
// variant for units whose span depends on it.
UnitUpdate make_update(const UnitDefinition& def,
                       const std::optional<std::string>& variant,
                       const std::optional<PatchRoles>& patch_roles) {
    UnitUpdate update;
    if (variant) {
        update.variant = variant;
        if (std::holds_alternative<span_behavior::VariantDependent>(def.span_behavior())) {
            update.span = def.span_for_variant(variant);
        }
    }
    if (patch_roles) {
        update.patch_roles = *patch_roles;
    }
    return update;
}

enum class FlipAxis { Horizontal, Vertical };

std::optional<UnitUpdate> apply_flip(const Unit& unit, FlipAxis axis, const UnitRegistry& registry) {
    const UnitDefinition& def = definition_for(unit, registry);
    UnitConfig config = to_unit_config(unit);

    std::optional<std::string> new_variant;
    std::optional<PatchRoles> new_roles;

    if (config.variant) {
        auto flipped = axis == FlipAxis::Horizontal
            ? def.flip_horizontal_variant(*config.variant)
            : def.flip_vertical_variant(*config.variant);
        if (flipped && *flipped != *config.variant) {
            new_variant = flipped;
        }
    }

    // A geometric flip already mirrors the patches
    if (!new_variant) {
        new_roles = axis == FlipAxis::Horizontal
            ? def.flip_horizontal_patch_roles(config.patch_roles)
            : def.flip_vertical_patch_roles(config.patch_roles);
    }

    if (!new_variant && !new_roles) {
        return std::nullopt;
    }
    return make_update(def, new_variant, new_roles);
}

}  // namespace

UnitConfig to_unit_config(const Unit& unit) {
    return std::visit([](const auto& shape) -> UnitConfig {
        using T = std::decay_t<decltype(shape)>;
        UnitConfig config;
        if constexpr (std::is_same_v<T, unit::Square>) {
            config.patch_roles[patch::FILL] = shape.color_role;
        } else if constexpr (std::is_same_v<T, unit::Hst>) {
            config.variant = std::string(to_string(shape.variant));
            config.patch_roles[patch::PRIMARY] = shape.color_role;
            config.patch_roles[patch::SECONDARY] = shape.secondary_color_role;
        } else if constexpr (std::is_same_v<T, unit::FlyingGeese>) {
            config.variant = std::string(to_string(shape.direction));
            config.patch_roles[patch::GOOSE] = shape.roles.goose;
            config.patch_roles[patch::SKY1] = shape.roles.sky1;
            config.patch_roles[patch::SKY2] = shape.roles.sky2;
        } else if constexpr (std::is_same_v<T, unit::Qst>) {
            config.patch_roles[patch::TOP] = shape.roles.top;
            config.patch_roles[patch::RIGHT] = shape.roles.right;
            config.patch_roles[patch::BOTTOM] = shape.roles.bottom;
            config.patch_roles[patch::LEFT] = shape.roles.left;
        }
        return config;
    }, unit.shape);
}

Unit apply_unit_update(const Unit& unit, const UnitUpdate& update, const UnitRegistry& registry) {
    Unit result = unit;
    if (update.position) {
        result.position = *update.position;
    }
    if (update.span) {
        result.span = *update.span;
    } else if (update.variant) {
        const UnitDefinition& def = definition_for(unit, registry);
        if (std::holds_alternative<span_behavior::VariantDependent>(def.span_behavior())) {
            result.span = def.span_for_variant(update.variant);
        }
    }

    const PatchRoles& roles = update.patch_roles;
    std::visit([&](auto& shape) {
        using T = std::decay_t<decltype(shape)>;
        if constexpr (std::is_same_v<T, unit::Square>) {
            take_role(roles, patch::FILL, shape.color_role);
        } else if constexpr (std::is_same_v<T, unit::Hst>) {
            if (update.variant) {
                if (auto v = hst_variant_from_string(*update.variant)) {
                    shape.variant = *v;
                }
            }
            take_role(roles, patch::PRIMARY, shape.color_role);
            take_role(roles, patch::SECONDARY, shape.secondary_color_role);
        } else if constexpr (std::is_same_v<T, unit::FlyingGeese>) {
            if (update.variant) {
                if (auto d = direction_from_string(*update.variant)) {
                    shape.direction = *d;
                }
            }
            take_role(roles, patch::GOOSE, shape.roles.goose);
            take_role(roles, patch::SKY1, shape.roles.sky1);
            take_role(roles, patch::SKY2, shape.roles.sky2);
        } else if constexpr (std::is_same_v<T, unit::Qst>) {
            take_role(roles, patch::TOP, shape.roles.top);
            take_role(roles, patch::RIGHT, shape.roles.right);
            take_role(roles, patch::BOTTOM, shape.roles.bottom);
            take_role(roles, patch::LEFT, shape.roles.left);
        }
    }, result.shape);

    return result;
}

Unit make_unit(const UnitId& id, const GridPosition& position, UnitType type,
               const UnitConfig& config, const UnitRegistry& registry) {
    const UnitDefinition& def = registry.get_or_throw(std::string(type_id(type)));

    UnitUpdate update;
    update.variant = config.variant ? config.variant : def.default_variant();
    if (update.variant) {
        const auto& variants = def.variants();
        const bool listed = std::any_of(variants.begin(), variants.end(),
                                        [&](const VariantDefinition& v) { return v.id == *update.variant; });
        if (!listed) {
            throw std::invalid_argument("Unknown variant '" + *update.variant + "' for unit type '" +
                                        def.type_id() + "'");
        }
    }
    update.span = def.span_for_variant(update.variant);
    update.patch_roles = def.default_config().patch_roles;
    for (const auto& [patch_id, role] : config.patch_roles) {
        if (def.find_patch(patch_id)) {
            update.patch_roles[patch_id] = role;
        }
    }

    // Blank shape of the right alternative; the update fills it in
    UnitShape shape;
    switch (type) {
        case UnitType::Square: shape = unit::Square{}; break;
        case UnitType::Hst: shape = unit::Hst{}; break;
        case UnitType::FlyingGeese: shape = unit::FlyingGeese{}; break;
        case UnitType::Qst: shape = unit::Qst{}; break;
    }
    return apply_unit_update(Unit{id, position, Span{}, std::move(shape)}, update, registry);
}

UnitUpdate capture_prev(const Unit& unit, const UnitUpdate& next) {
    UnitConfig config = to_unit_config(unit);
    UnitUpdate prev;
    if (next.position) prev.position = unit.position;
    if (next.span) prev.span = unit.span;
    if (next.variant) prev.variant = config.variant;
    for (const auto& [patch_id, role] : next.patch_roles) {
        auto it = config.patch_roles.find(patch_id);
        if (it != config.patch_roles.end()) {
            prev.patch_roles[patch_id] = it->second;
        }
    }
    return prev;
}

std::optional<UnitUpdate> apply_rotation(const Unit& unit, const UnitRegistry& registry) {
    const UnitDefinition& def = definition_for(unit, registry);
    UnitConfig config = to_unit_config(unit);

    std::optional<std::string> new_variant;
    if (config.variant) {
        new_variant = def.rotate_variant(*config.variant);
    }
    std::optional<PatchRoles> new_roles = def.rotate_patch_roles(config.patch_roles);

    if (!new_variant && !new_roles) {
        return std::nullopt;
    }
    return make_update(def, new_variant, new_roles);
}

std::optional<UnitUpdate> apply_flip_horizontal(const Unit& unit, const UnitRegistry& registry) {
    return apply_flip(unit, FlipAxis::Horizontal, registry);
}

std::optional<UnitUpdate> apply_flip_vertical(const Unit& unit, const UnitRegistry& registry) {
    return apply_flip(unit, FlipAxis::Vertical, registry);
}

RoleAssignment assign_patch_role(const Unit& unit, const ColorRoleId& role_id,
                                 const std::optional<std::string>& patch_id,
                                 const UnitRegistry& registry) {
    const UnitDefinition& def = definition_for(unit, registry);
    UnitConfig config = to_unit_config(unit);

    std::string target = def.patches().front().id;
    if (patch_id && def.find_patch(*patch_id)) {
        target = *patch_id;
    }

    RoleAssignment result;
    result.prev.patch_roles = config.patch_roles;
    result.next.patch_roles = config.patch_roles;
    result.next.patch_roles[target] = role_id;
    return result;
}

UnitUpdate replace_role(const Unit& unit, const ColorRoleId& old_role, const ColorRoleId& new_role) {
    UnitConfig config = to_unit_config(unit);
    bool changed = false;
    for (auto& [patch_id, role] : config.patch_roles) {
        if (role == old_role) {
            role = new_role;
            changed = true;
        }
    }

    UnitUpdate update;
    if (changed) {
        update.patch_roles = std::move(config.patch_roles);
    }
    return update;
}

std::vector<ColorRoleId> get_all_role_ids(const Unit& unit) {
    std::vector<ColorRoleId> ids;
    for (const auto& [patch_id, role] : to_unit_config(unit).patch_roles) {
        ids.push_back(role);
    }
    return ids;
}

bool unit_uses_role(const Unit& unit, const ColorRoleId& role_id) {
    auto ids = get_all_role_ids(unit);
    return std::find(ids.begin(), ids.end(), role_id) != ids.end();
}

Span get_span_for_unit(const std::string& type_id, const std::optional<std::string>& variant,
                       const UnitRegistry& registry) {
    const UnitDefinition& def = registry.get_or_throw(type_id);
    return def.span_for_variant(variant ? variant : def.default_variant());
}

HexColor resolve_color(const ColorRoleId& role_id, const Palette& palette, const PaletteOverrides& overrides) {
    auto it = overrides.find(role_id);
    if (it != overrides.end() && !it->second.empty()) {
        return it->second;
    }
    if (const ColorRole* role = palette.find(role_id)) {
        return role->color;
    }
    return HexColor(constants::NEUTRAL_COLOR);
}

std::vector<ColoredTriangle> get_unit_triangles_with_colors(
    const Unit& unit, double cell_size, const Palette& palette,
    const PaletteOverrides& overrides, const UnitRegistry& registry) {
    const UnitDefinition& def = definition_for(unit, registry);
    UnitConfig config = to_unit_config(unit);

    const double width = unit.span.cols * cell_size;
    const double height = unit.span.rows * cell_size;

    std::vector<ColoredTriangle> result;
    for (const auto& triangle : def.get_triangles(config, width, height)) {
        ColorRoleId role_id;
        auto it = config.patch_roles.find(triangle.patch_id);
        if (it != config.patch_roles.end()) {
            role_id = it->second;
        }
        result.push_back({triangle.flat_points(), resolve_color(role_id, palette, overrides)});
    }
    return result;
}

}  // namespace quiltblock
