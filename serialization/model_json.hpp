#ifndef QUILTBLOCK_SERIALIZATION_MODEL_JSON_HPP
#define QUILTBLOCK_SERIALIZATION_MODEL_JSON_HPP

// JSON for the document model, in the storage field layout
// (camelCase keys, fabricRole / patchFabricRoles for unit colors).

#include <nlohmann/json.hpp>
#include <model/block.hpp>
#include <model/border.hpp>
#include <model/palette.hpp>
#include <model/unit.hpp>
#include <stdexcept>
#include <string>

namespace quiltblock {

NLOHMANN_JSON_SERIALIZE_ENUM(UnitType, {
    {UnitType::Square, "square"},
    {UnitType::Hst, "hst"},
    {UnitType::FlyingGeese, "flying_geese"},
    {UnitType::Qst, "qst"},
})

NLOHMANN_JSON_SERIALIZE_ENUM(HstVariant, {
    {HstVariant::NW, "nw"},
    {HstVariant::NE, "ne"},
    {HstVariant::SW, "sw"},
    {HstVariant::SE, "se"},
})

NLOHMANN_JSON_SERIALIZE_ENUM(FlyingGeeseDirection, {
    {FlyingGeeseDirection::Up, "up"},
    {FlyingGeeseDirection::Down, "down"},
    {FlyingGeeseDirection::Left, "left"},
    {FlyingGeeseDirection::Right, "right"},
})

NLOHMANN_JSON_SERIALIZE_ENUM(CornerStyle, {
    {CornerStyle::Butted, "butted"},
    {CornerStyle::Mitered, "mitered"},
    {CornerStyle::Cornerstone, "cornerstone"},
})

NLOHMANN_JSON_SERIALIZE_ENUM(BlockStatus, {
    {BlockStatus::Draft, "draft"},
    {BlockStatus::Published, "published"},
})

// GridPosition / Span

inline void to_json(nlohmann::json& j, const GridPosition& p) {
    j = {{"row", p.row}, {"col", p.col}};
}

inline void from_json(const nlohmann::json& j, GridPosition& p) {
    p.row = j.at("row").get<int>();
    p.col = j.at("col").get<int>();
}

inline void to_json(nlohmann::json& j, const Span& s) {
    j = {{"rows", s.rows}, {"cols", s.cols}};
}

inline void from_json(const nlohmann::json& j, Span& s) {
    s.rows = j.value("rows", 1);
    s.cols = j.value("cols", 1);
}

// Unit

inline void to_json(nlohmann::json& j, const Unit& u) {
    j = {
        {"id", u.id},
        {"type", unit_type(u)},
        {"position", u.position},
        {"span", u.span},
    };
    std::visit([&j](const auto& shape) {
        using T = std::decay_t<decltype(shape)>;
        if constexpr (std::is_same_v<T, unit::Square>) {
            j["fabricRole"] = shape.color_role;
        } else if constexpr (std::is_same_v<T, unit::Hst>) {
            j["variant"] = shape.variant;
            j["fabricRole"] = shape.color_role;
            j["secondaryFabricRole"] = shape.secondary_color_role;
        } else if constexpr (std::is_same_v<T, unit::FlyingGeese>) {
            j["direction"] = shape.direction;
            j["patchFabricRoles"] = {
                {"goose", shape.roles.goose},
                {"sky1", shape.roles.sky1},
                {"sky2", shape.roles.sky2},
            };
        } else if constexpr (std::is_same_v<T, unit::Qst>) {
            j["patchFabricRoles"] = {
                {"top", shape.roles.top},
                {"right", shape.roles.right},
                {"bottom", shape.roles.bottom},
                {"left", shape.roles.left},
            };
        }
    }, u.shape);
}

// Roles missing from a stored unit fall back to "background"
inline void from_json(const nlohmann::json& j, Unit& u) {
    const std::string type = j.at("type").get<std::string>();
    const std::string fallback = "background";

    u.id = j.at("id").get<std::string>();
    u.position = j.at("position").get<GridPosition>();
    u.span = j.contains("span") ? j.at("span").get<Span>() : Span{};

    const nlohmann::json roles = j.value("patchFabricRoles", nlohmann::json::object());

    if (type == "square") {
        u.shape = unit::Square{j.value("fabricRole", fallback)};
    } else if (type == "hst") {
        auto variant = hst_variant_from_string(j.value("variant", std::string("nw")));
        if (!variant) {
            throw std::runtime_error("Invalid hst variant in unit " + u.id);
        }
        u.shape = unit::Hst{*variant, j.value("fabricRole", fallback), j.value("secondaryFabricRole", fallback)};
    } else if (type == "flying_geese") {
        auto direction = direction_from_string(j.value("direction", std::string("right")));
        if (!direction) {
            throw std::runtime_error("Invalid flying geese direction in unit " + u.id);
        }
        u.shape = unit::FlyingGeese{*direction, {
            roles.value("goose", fallback),
            roles.value("sky1", fallback),
            roles.value("sky2", fallback),
        }};
    } else if (type == "qst") {
        u.shape = unit::Qst{{
            roles.value("top", fallback),
            roles.value("right", fallback),
            roles.value("bottom", fallback),
            roles.value("left", fallback),
        }};
    } else {
        throw std::runtime_error("Unknown unit type: " + type);
    }
}

// Palette

inline void to_json(nlohmann::json& j, const ColorRole& r) {
    j = {{"id", r.id}, {"name", r.name}, {"color", r.color}};
    if (r.is_variant_color) {
        j["isVariantColor"] = true;
    }
}

inline void from_json(const nlohmann::json& j, ColorRole& r) {
    r.id = j.at("id").get<std::string>();
    r.name = j.value("name", r.id);
    r.color = j.at("color").get<std::string>();
    r.is_variant_color = j.value("isVariantColor", false);
}

inline void to_json(nlohmann::json& j, const Palette& p) {
    j = {{"roles", p.roles}};
}

inline void from_json(const nlohmann::json& j, Palette& p) {
    p.roles = j.at("roles").get<std::vector<ColorRole>>();
}

// Borders

inline void to_json(nlohmann::json& j, const BorderSpec& b) {
    j = {
        {"id", b.id},
        {"widthInches", b.width_inches},
        {"cornerStyle", b.corner_style},
        {"fabricRole", b.color_role},
    };
    if (b.cornerstone_color_role) {
        j["cornerstoneFabricRole"] = *b.cornerstone_color_role;
    }
}

inline void from_json(const nlohmann::json& j, BorderSpec& b) {
    b.id = j.at("id").get<std::string>();
    b.width_inches = j.value("widthInches", 2.0);
    b.corner_style = j.value("cornerStyle", CornerStyle::Butted);
    b.color_role = j.at("fabricRole").get<std::string>();
    if (j.contains("cornerstoneFabricRole") && !j["cornerstoneFabricRole"].is_null()) {
        b.cornerstone_color_role = j["cornerstoneFabricRole"].get<std::string>();
    } else {
        b.cornerstone_color_role.reset();
    }
}

inline void to_json(nlohmann::json& j, const BorderUpdate& u) {
    j = nlohmann::json::object();
    if (u.width_inches) j["widthInches"] = *u.width_inches;
    if (u.corner_style) j["cornerStyle"] = *u.corner_style;
    if (u.color_role) j["fabricRole"] = *u.color_role;
    if (u.cornerstone_color_role) {
        if (*u.cornerstone_color_role) {
            j["cornerstoneFabricRole"] = **u.cornerstone_color_role;
        } else {
            j["cornerstoneFabricRole"] = nullptr;
        }
    }
}

inline void from_json(const nlohmann::json& j, BorderUpdate& u) {
    if (j.contains("widthInches")) u.width_inches = j["widthInches"].get<double>();
    if (j.contains("cornerStyle")) u.corner_style = j["cornerStyle"].get<CornerStyle>();
    if (j.contains("fabricRole")) u.color_role = j["fabricRole"].get<std::string>();
    if (j.contains("cornerstoneFabricRole")) {
        const auto& role = j["cornerstoneFabricRole"];
        u.cornerstone_color_role = role.is_null() ? std::optional<ColorRoleId>{}
                                                  : std::optional<ColorRoleId>(role.get<std::string>());
    }
}

inline void to_json(nlohmann::json& j, const BorderConfig& c) {
    j = {{"enabled", c.enabled}, {"borders", c.borders}};
}

inline void from_json(const nlohmann::json& j, BorderConfig& c) {
    c.enabled = j.value("enabled", false);
    c.borders = j.value("borders", std::vector<BorderSpec>{});
}

// UnitUpdate: only the fields that are set

inline void to_json(nlohmann::json& j, const UnitUpdate& u) {
    j = nlohmann::json::object();
    if (u.position) j["position"] = *u.position;
    if (u.span) j["span"] = *u.span;
    if (u.variant) j["variant"] = *u.variant;
    if (!u.patch_roles.empty()) j["patchRoles"] = u.patch_roles;
}

inline void from_json(const nlohmann::json& j, UnitUpdate& u) {
    if (j.contains("position")) u.position = j["position"].get<GridPosition>();
    if (j.contains("span")) u.span = j["span"].get<Span>();
    if (j.contains("variant")) u.variant = j["variant"].get<std::string>();
    if (j.contains("patchRoles")) u.patch_roles = j["patchRoles"].get<PatchRoles>();
}

}  // namespace quiltblock

#endif // QUILTBLOCK_SERIALIZATION_MODEL_JSON_HPP
