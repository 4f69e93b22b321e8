#include "unit.hpp"

#include <algorithm>
#include <cstdint>
#include <limits>
#include <type_traits>

namespace quiltblock {

UnitType unit_type(const Unit& unit) {
    return std::visit([](auto&& arg) -> UnitType {
        using T = std::decay_t<decltype(arg)>;
        if constexpr (std::is_same_v<T, unit::Square>) return UnitType::Square;
        else if constexpr (std::is_same_v<T, unit::Hst>) return UnitType::Hst;
        else if constexpr (std::is_same_v<T, unit::FlyingGeese>) return UnitType::FlyingGeese;
        else return UnitType::Qst;
    }, unit.shape);
}

std::string_view type_id(UnitType type) {
    switch (type) {
        case UnitType::Square: return "square";
        case UnitType::Hst: return "hst";
        case UnitType::FlyingGeese: return "flying_geese";
        case UnitType::Qst: return "qst";
    }
    return "square";
}

std::optional<UnitType> unit_type_from_id(std::string_view id) {
    if (id == "square") return UnitType::Square;
    if (id == "hst") return UnitType::Hst;
    if (id == "flying_geese") return UnitType::FlyingGeese;
    if (id == "qst") return UnitType::Qst;
    return std::nullopt;
}

std::string_view to_string(HstVariant variant) {
    switch (variant) {
        case HstVariant::NW: return "nw";
        case HstVariant::NE: return "ne";
        case HstVariant::SW: return "sw";
        case HstVariant::SE: return "se";
    }
    return "nw";
}

std::optional<HstVariant> hst_variant_from_string(std::string_view value) {
    if (value == "nw") return HstVariant::NW;
    if (value == "ne") return HstVariant::NE;
    if (value == "sw") return HstVariant::SW;
    if (value == "se") return HstVariant::SE;
    return std::nullopt;
}

std::string_view to_string(FlyingGeeseDirection direction) {
    switch (direction) {
        case FlyingGeeseDirection::Up: return "up";
        case FlyingGeeseDirection::Down: return "down";
        case FlyingGeeseDirection::Left: return "left";
        case FlyingGeeseDirection::Right: return "right";
    }
    return "right";
}

std::optional<FlyingGeeseDirection> direction_from_string(std::string_view value) {
    if (value == "up") return FlyingGeeseDirection::Up;
    if (value == "down") return FlyingGeeseDirection::Down;
    if (value == "left") return FlyingGeeseDirection::Left;
    if (value == "right") return FlyingGeeseDirection::Right;
    return std::nullopt;
}

std::vector<GridPosition> covered_cells(const Unit& unit) {
    std::vector<GridPosition> cells;
    if (unit.span.rows <= 0 || unit.span.cols <= 0) {
        return cells;
    }
    // 64-bit bounds so positions near INT_MAX do not wrap; cells past
    // INT_MAX are not representable and are left out
    constexpr int64_t limit = static_cast<int64_t>(std::numeric_limits<int>::max()) + 1;
    const int64_t row_end = std::min(limit, static_cast<int64_t>(unit.position.row) + unit.span.rows);
    const int64_t col_end = std::min(limit, static_cast<int64_t>(unit.position.col) + unit.span.cols);
    cells.reserve(static_cast<size_t>((row_end - unit.position.row) * (col_end - unit.position.col)));
    for (int64_t r = unit.position.row; r < row_end; ++r) {
        for (int64_t c = unit.position.col; c < col_end; ++c) {
            cells.push_back({static_cast<int>(r), static_cast<int>(c)});
        }
    }
    return cells;
}

bool unit_covers(const Unit& unit, const GridPosition& cell) {
    return cell.row >= unit.position.row &&
           cell.row < static_cast<int64_t>(unit.position.row) + unit.span.rows &&
           cell.col >= unit.position.col &&
           cell.col < static_cast<int64_t>(unit.position.col) + unit.span.cols;
}

bool fits_grid(const Unit& unit, int grid_size) {
    if (unit.span.rows <= 0 || unit.span.cols <= 0) {
        return false;
    }
    return unit.position.row >= 0 && unit.position.col >= 0 &&
           static_cast<int64_t>(unit.position.row) + unit.span.rows <= grid_size &&
           static_cast<int64_t>(unit.position.col) + unit.span.cols <= grid_size;
}

const Unit* find_unit(const std::vector<Unit>& units, const UnitId& id) {
    auto it = std::find_if(units.begin(), units.end(),
                           [&](const Unit& u) { return u.id == id; });
    return it == units.end() ? nullptr : &*it;
}

}  // namespace quiltblock
