#include "hst_unit.hpp"
#include <geometry/primitives.hpp>

namespace quiltblock {

namespace {

HstVariant parse_variant(const std::string& value) {
    return hst_variant_from_string(value).value_or(HstVariant::NW);
}

// 90 degrees clockwise: nw -> ne -> se -> sw -> nw
HstVariant rotated(HstVariant v) {
    switch (v) {
        case HstVariant::NW: return HstVariant::NE;
        case HstVariant::NE: return HstVariant::SE;
        case HstVariant::SE: return HstVariant::SW;
        case HstVariant::SW: return HstVariant::NW;
    }
    return v;
}

HstVariant flipped_horizontal(HstVariant v) {
    switch (v) {
        case HstVariant::NW: return HstVariant::NE;
        case HstVariant::NE: return HstVariant::NW;
        case HstVariant::SW: return HstVariant::SE;
        case HstVariant::SE: return HstVariant::SW;
    }
    return v;
}

HstVariant flipped_vertical(HstVariant v) {
    switch (v) {
        case HstVariant::NW: return HstVariant::SW;
        case HstVariant::SW: return HstVariant::NW;
        case HstVariant::NE: return HstVariant::SE;
        case HstVariant::SE: return HstVariant::NE;
    }
    return v;
}

}  // namespace

const std::vector<PatchDefinition>& HstUnit::patches() const {
    static const std::vector<PatchDefinition> patches = {
        {patch::PRIMARY, "Primary", "background"},
        {patch::SECONDARY, "Secondary", "background"},
    };
    return patches;
}

const std::vector<VariantDefinition>& HstUnit::variants() const {
    static const std::vector<VariantDefinition> variants = {
        {"nw", "Top-Left", "◸"},
        {"ne", "Top-Right", "◹"},
        {"sw", "Bottom-Left", "◺"},
        {"se", "Bottom-Right", "◿"},
    };
    return variants;
}

TriangleGroup HstUnit::get_triangles(const UnitConfig& config, double width, double height) const {
    return geometry::hst_triangles(parse_variant(config.variant.value_or("nw")), width, height);
}

std::optional<std::string> HstUnit::rotate_variant(const std::string& current) const {
    return std::string(to_string(rotated(parse_variant(current))));
}

std::optional<std::string> HstUnit::flip_horizontal_variant(const std::string& current) const {
    return std::string(to_string(flipped_horizontal(parse_variant(current))));
}

std::optional<std::string> HstUnit::flip_vertical_variant(const std::string& current) const {
    return std::string(to_string(flipped_vertical(parse_variant(current))));
}

ConfigSchema HstUnit::config_schema() const {
    return {{"nw", "ne", "sw", "se"}, {patch::PRIMARY, patch::SECONDARY}};
}

Thumbnail HstUnit::thumbnail() const {
    return {"0 0 24 24", {
        {"3,3 21,3 3,21", "currentColor"},
        {"21,3 21,21 3,21", "#E5E7EB"},
    }};
}

}  // namespace quiltblock
