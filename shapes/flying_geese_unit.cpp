#include "flying_geese_unit.hpp"
#include <geometry/primitives.hpp>

namespace quiltblock {

namespace {

FlyingGeeseDirection parse_direction(const std::string& value) {
    return direction_from_string(value).value_or(FlyingGeeseDirection::Right);
}

std::string name(FlyingGeeseDirection d) {
    return std::string(to_string(d));
}

PatchRoles swap_sky(const PatchRoles& current) {
    PatchRoles next = current;
    auto sky1 = current.find(patch::SKY1);
    auto sky2 = current.find(patch::SKY2);
    next.erase(patch::SKY1);
    next.erase(patch::SKY2);
    if (sky2 != current.end()) next[patch::SKY1] = sky2->second;
    if (sky1 != current.end()) next[patch::SKY2] = sky1->second;
    return next;
}

}  // namespace

Span flying_geese_span(FlyingGeeseDirection direction) {
    if (direction == FlyingGeeseDirection::Left || direction == FlyingGeeseDirection::Right) {
        return {1, 2};
    }
    return {2, 1};
}

SpanBehavior FlyingGeeseUnit::span_behavior() const {
    return span_behavior::VariantDependent{[](const std::string& variant) {
        return flying_geese_span(parse_direction(variant));
    }};
}

const std::vector<PatchDefinition>& FlyingGeeseUnit::patches() const {
    static const std::vector<PatchDefinition> patches = {
        {patch::GOOSE, "Goose", "background"},
        {patch::SKY1, "Sky 1", "background"},
        {patch::SKY2, "Sky 2", "background"},
    };
    return patches;
}

const std::vector<VariantDefinition>& FlyingGeeseUnit::variants() const {
    static const std::vector<VariantDefinition> variants = {
        {"right", "Right", "▶"},
        {"left", "Left", "◀"},
        {"down", "Down", "▼"},
        {"up", "Up", "▲"},
    };
    return variants;
}

TriangleGroup FlyingGeeseUnit::get_triangles(const UnitConfig& config, double width, double height) const {
    return geometry::flying_geese_triangles(parse_direction(config.variant.value_or("right")), width, height);
}

std::optional<std::string> FlyingGeeseUnit::rotate_variant(const std::string& current) const {
    switch (parse_direction(current)) {
        case FlyingGeeseDirection::Up: return name(FlyingGeeseDirection::Right);
        case FlyingGeeseDirection::Right: return name(FlyingGeeseDirection::Down);
        case FlyingGeeseDirection::Down: return name(FlyingGeeseDirection::Left);
        case FlyingGeeseDirection::Left: return name(FlyingGeeseDirection::Up);
    }
    return current;
}

std::optional<std::string> FlyingGeeseUnit::flip_horizontal_variant(const std::string& current) const {
    switch (parse_direction(current)) {
        case FlyingGeeseDirection::Left: return name(FlyingGeeseDirection::Right);
        case FlyingGeeseDirection::Right: return name(FlyingGeeseDirection::Left);
        default: return name(parse_direction(current));
    }
}

std::optional<std::string> FlyingGeeseUnit::flip_vertical_variant(const std::string& current) const {
    switch (parse_direction(current)) {
        case FlyingGeeseDirection::Up: return name(FlyingGeeseDirection::Down);
        case FlyingGeeseDirection::Down: return name(FlyingGeeseDirection::Up);
        default: return name(parse_direction(current));
    }
}

std::optional<PatchRoles> FlyingGeeseUnit::flip_horizontal_patch_roles(const PatchRoles& current) const {
    return swap_sky(current);
}

std::optional<PatchRoles> FlyingGeeseUnit::flip_vertical_patch_roles(const PatchRoles& current) const {
    return swap_sky(current);
}

ConfigSchema FlyingGeeseUnit::config_schema() const {
    return {{"up", "down", "left", "right"}, {patch::GOOSE, patch::SKY1, patch::SKY2}};
}

std::optional<PlacementValidation> FlyingGeeseUnit::validate_placement(
    const GridPosition& position, int grid_size, const CellOccupancy& is_cell_occupied) const {
    const GridPosition adjacent[] = {
        {position.row - 1, position.col},  // up
        {position.row + 1, position.col},  // down
        {position.row, position.col - 1},  // left
        {position.row, position.col + 1},  // right
    };

    PlacementValidation result;
    for (const auto& cell : adjacent) {
        if (cell.row < 0 || cell.row >= grid_size || cell.col < 0 || cell.col >= grid_size) {
            continue;
        }
        if (!is_cell_occupied(cell)) {
            result.valid_adjacent_cells.push_back(cell);
        }
    }

    if (result.valid_adjacent_cells.empty()) {
        result.valid = false;
        result.reason = "No adjacent empty cells available for Flying Geese";
    }
    return result;
}

Thumbnail FlyingGeeseUnit::thumbnail() const {
    return {"0 0 48 24", {
        {"3,3 45,12 3,21", "currentColor"},
        {"3,3 45,3 45,12", "#E5E7EB"},
        {"3,21 45,12 45,21", "#E5E7EB"},
    }};
}

}  // namespace quiltblock
