#ifndef QUILTBLOCK_SERIALIZATION_PATTERN_JSON_HPP
#define QUILTBLOCK_SERIALIZATION_PATTERN_JSON_HPP

// JSON for patterns and their placed blocks, in the storage field layout

#include "model_json.hpp"
#include <model/pattern.hpp>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>

namespace quiltblock {

NLOHMANN_JSON_SERIALIZE_ENUM(PatternDifficulty, {
    {PatternDifficulty::Beginner, "beginner"},
    {PatternDifficulty::Intermediate, "intermediate"},
    {PatternDifficulty::Advanced, "advanced"},
})

NLOHMANN_JSON_SERIALIZE_ENUM(PatternCategory, {
    {PatternCategory::Traditional, "traditional"},
    {PatternCategory::Modern, "modern"},
    {PatternCategory::Art, "art"},
    {PatternCategory::Seasonal, "seasonal"},
    {PatternCategory::Other, "other"},
})

// Rotation is stored as degrees; anything but a quarter turn is rejected

inline void to_json(nlohmann::json& j, const Rotation& r) {
    j = degrees(r);
}

inline void from_json(const nlohmann::json& j, Rotation& r) {
    const int value = j.get<int>();
    auto rotation = rotation_from_degrees(value);
    if (!rotation) {
        throw std::runtime_error("Invalid rotation: " + std::to_string(value) + " (expected 0, 90, 180 or 270)");
    }
    r = *rotation;
}

inline void to_json(nlohmann::json& j, const QuiltGridSize& s) {
    j = {{"rows", s.rows}, {"cols", s.cols}};
}

inline void from_json(const nlohmann::json& j, QuiltGridSize& s) {
    s.rows = j.at("rows").get<int>();
    s.cols = j.at("cols").get<int>();
}

inline void to_json(nlohmann::json& j, const PhysicalSize& s) {
    j = {{"widthInches", s.width_inches}, {"heightInches", s.height_inches}};
}

inline void from_json(const nlohmann::json& j, PhysicalSize& s) {
    s.width_inches = j.at("widthInches").get<double>();
    s.height_inches = j.at("heightInches").get<double>();
}

// BlockInstance

inline void to_json(nlohmann::json& j, const BlockInstance& i) {
    j = {
        {"id", i.id},
        {"blockId", i.block_id},
        {"position", i.position},
        {"rotation", i.rotation},
        {"flipHorizontal", i.flip_horizontal},
        {"flipVertical", i.flip_vertical},
    };
    if (!i.palette_overrides.empty()) {
        j["paletteOverrides"] = i.palette_overrides;
    }
}

inline void from_json(const nlohmann::json& j, BlockInstance& i) {
    i.id = j.at("id").get<std::string>();
    i.block_id = j.at("blockId").get<std::string>();
    i.position = j.at("position").get<GridPosition>();
    i.rotation = j.value("rotation", Rotation::Deg0);
    i.flip_horizontal = j.value("flipHorizontal", false);
    i.flip_vertical = j.value("flipVertical", false);
    if (j.contains("paletteOverrides") && !j["paletteOverrides"].is_null()) {
        i.palette_overrides = j["paletteOverrides"].get<PaletteOverrides>();
    } else {
        i.palette_overrides.clear();
    }
}

}  // namespace quiltblock

#endif // QUILTBLOCK_SERIALIZATION_PATTERN_JSON_HPP
