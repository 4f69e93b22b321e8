#include "qst_unit.hpp"
#include <geometry/primitives.hpp>

namespace quiltblock {

namespace {

std::string role_of(const PatchRoles& roles, const char* patch_id) {
    auto it = roles.find(patch_id);
    return it == roles.end() ? std::string() : it->second;
}

}  // namespace

const std::vector<PatchDefinition>& QstUnit::patches() const {
    static const std::vector<PatchDefinition> patches = {
        {patch::TOP, "Top", "background"},
        {patch::RIGHT, "Right", "background"},
        {patch::BOTTOM, "Bottom", "background"},
        {patch::LEFT, "Left", "background"},
    };
    return patches;
}

TriangleGroup QstUnit::get_triangles(const UnitConfig&, double width, double height) const {
    return geometry::qst_triangles(width, height);
}

std::optional<PatchRoles> QstUnit::rotate_patch_roles(const PatchRoles& current) const {
    return PatchRoles{
        {patch::TOP, role_of(current, patch::LEFT)},
        {patch::RIGHT, role_of(current, patch::TOP)},
        {patch::BOTTOM, role_of(current, patch::RIGHT)},
        {patch::LEFT, role_of(current, patch::BOTTOM)},
    };
}

std::optional<PatchRoles> QstUnit::flip_horizontal_patch_roles(const PatchRoles& current) const {
    return PatchRoles{
        {patch::TOP, role_of(current, patch::TOP)},
        {patch::RIGHT, role_of(current, patch::LEFT)},
        {patch::BOTTOM, role_of(current, patch::BOTTOM)},
        {patch::LEFT, role_of(current, patch::RIGHT)},
    };
}

std::optional<PatchRoles> QstUnit::flip_vertical_patch_roles(const PatchRoles& current) const {
    return PatchRoles{
        {patch::TOP, role_of(current, patch::BOTTOM)},
        {patch::RIGHT, role_of(current, patch::RIGHT)},
        {patch::BOTTOM, role_of(current, patch::TOP)},
        {patch::LEFT, role_of(current, patch::LEFT)},
    };
}

ConfigSchema QstUnit::config_schema() const {
    return {{}, {patch::TOP, patch::RIGHT, patch::BOTTOM, patch::LEFT}};
}

Thumbnail QstUnit::thumbnail() const {
    return {"0 0 24 24", {
        {"3,3 21,3 12,12", "currentColor"},
        {"21,3 21,21 12,12", "#E5E7EB"},
        {"21,21 3,21 12,12", "currentColor"},
        {"3,21 3,3 12,12", "#E5E7EB"},
    }};
}

}  // namespace quiltblock
