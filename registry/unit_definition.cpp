#include "unit_definition.hpp"
#include <algorithm>
#include <type_traits>

namespace quiltblock {

std::string_view to_string(UnitCategory category) {
    switch (category) {
        case UnitCategory::Basic: return "basic";
        case UnitCategory::Compound: return "compound";
        case UnitCategory::Advanced: return "advanced";
    }
    return "basic";
}

std::string_view to_string(PlacementMode mode) {
    switch (mode) {
        case PlacementMode::SingleTap: return "single_tap";
        case PlacementMode::TwoTap: return "two_tap";
    }
    return "single_tap";
}

ValidationResult ConfigSchema::validate(const UnitConfig& config) const {
    ValidationResult result;

    if (variants.empty()) {
        if (config.variant) {
            result.add_error("Unexpected variant \"" + *config.variant + "\"");
        }
    } else if (!config.variant) {
        result.add_error("Missing variant");
    } else if (std::find(variants.begin(), variants.end(), *config.variant) == variants.end()) {
        result.add_error("Invalid variant \"" + *config.variant + "\"");
    }

    for (const auto& patch_id : required_patches) {
        if (config.patch_roles.find(patch_id) == config.patch_roles.end()) {
            result.add_error("Missing role for patch \"" + patch_id + "\"");
        }
    }

    for (const auto& [patch_id, role] : config.patch_roles) {
        if (std::find(required_patches.begin(), required_patches.end(), patch_id) ==
            required_patches.end()) {
            result.add_warning("Unknown patch \"" + patch_id + "\"");
        }
    }

    return result;
}

const std::vector<VariantDefinition>& UnitDefinition::variants() const {
    static const std::vector<VariantDefinition> none;
    return none;
}

std::optional<std::string> UnitDefinition::rotate_variant(const std::string&) const {
    return std::nullopt;
}

std::optional<std::string> UnitDefinition::flip_horizontal_variant(const std::string&) const {
    return std::nullopt;
}

std::optional<std::string> UnitDefinition::flip_vertical_variant(const std::string&) const {
    return std::nullopt;
}

std::optional<PatchRoles> UnitDefinition::rotate_patch_roles(const PatchRoles&) const {
    return std::nullopt;
}

std::optional<PatchRoles> UnitDefinition::flip_horizontal_patch_roles(const PatchRoles&) const {
    return std::nullopt;
}

std::optional<PatchRoles> UnitDefinition::flip_vertical_patch_roles(const PatchRoles&) const {
    return std::nullopt;
}

std::optional<PlacementValidation> UnitDefinition::validate_placement(
    const GridPosition&, int, const CellOccupancy&) const {
    return std::nullopt;
}

Span UnitDefinition::span_for_variant(const std::optional<std::string>& variant) const {
    SpanBehavior behavior = span_behavior();
    return std::visit([&](const auto& b) -> Span {
        using T = std::decay_t<decltype(b)>;
        if constexpr (std::is_same_v<T, span_behavior::Fixed>) {
            return b.span;
        } else {
            if (!variant) {
                return default_span();
            }
            return b.get_span(*variant);
        }
    }, behavior);
}

const PatchDefinition* UnitDefinition::find_patch(const std::string& patch_id) const {
    for (const auto& p : patches()) {
        if (p.id == patch_id) {
            return &p;
        }
    }
    return nullptr;
}

UnitConfig UnitDefinition::default_config() const {
    UnitConfig config;
    config.variant = default_variant();
    for (const auto& p : patches()) {
        config.patch_roles[p.id] = p.default_role;
    }
    return config;
}

}  // namespace quiltblock
