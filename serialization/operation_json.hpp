#ifndef QUILTBLOCK_SERIALIZATION_OPERATION_JSON_HPP
#define QUILTBLOCK_SERIALIZATION_OPERATION_JSON_HPP

#include "model_json.hpp"
#include <history/operation.hpp>
#include <history/undo_manager.hpp>
#include <nlohmann/json.hpp>

namespace quiltblock {

// Forward declarations for mutual recursion
nlohmann::json operation_to_json(const Operation& operation);
Operation operation_from_json(const nlohmann::json& j);

namespace op {

inline void to_json(nlohmann::json& j, const AffectedUnit& a) {
    j = {{"unitId", a.unit_id}, {"prevRoles", a.prev_roles}};
}

inline void from_json(const nlohmann::json& j, AffectedUnit& a) {
    a.unit_id = j.at("unitId").get<std::string>();
    a.prev_roles = j.at("prevRoles").get<PatchRoles>();
}

}  // namespace op

// Tagged object: {"type": "add_unit", ...}
inline nlohmann::json operation_to_json(const Operation& operation) {
    nlohmann::json j = std::visit([](const auto& o) -> nlohmann::json {
        using T = std::decay_t<decltype(o)>;

        nlohmann::json j;

        if constexpr (std::is_same_v<T, op::AddUnit> || std::is_same_v<T, op::RemoveUnit>) {
            j["unit"] = o.unit;
        } else if constexpr (std::is_same_v<T, op::UpdateUnit>) {
            j["unitId"] = o.unit_id;
            j["prev"] = o.prev;
            j["next"] = o.next;
        } else if constexpr (std::is_same_v<T, op::UpdatePalette>) {
            j["roleId"] = o.role_id;
            j["prevColor"] = o.prev_color;
            j["nextColor"] = o.next_color;
        } else if constexpr (std::is_same_v<T, op::ResizeGrid>) {
            j["prevSize"] = o.prev_size;
            j["nextSize"] = o.next_size;
            j["removedUnits"] = o.removed_units;
        } else if constexpr (std::is_same_v<T, op::AddRole>) {
            j["role"] = o.role;
            if (o.index) j["index"] = *o.index;
        } else if constexpr (std::is_same_v<T, op::RemoveRole>) {
            j["role"] = o.role;
            j["index"] = o.index;
            j["affectedUnits"] = o.affected_units;
            j["fallbackRoleId"] = o.fallback_role_id;
        } else if constexpr (std::is_same_v<T, op::RenameRole>) {
            j["roleId"] = o.role_id;
            j["prevName"] = o.prev_name;
            j["nextName"] = o.next_name;
        } else if constexpr (std::is_same_v<T, op::AddBorder>) {
            j["border"] = o.border;
            if (o.index) j["index"] = *o.index;
        } else if constexpr (std::is_same_v<T, op::RemoveBorder>) {
            j["border"] = o.border;
            j["index"] = o.index;
        } else if constexpr (std::is_same_v<T, op::UpdateBorder>) {
            j["borderId"] = o.border_id;
            j["prev"] = o.prev;
            j["next"] = o.next;
        } else if constexpr (std::is_same_v<T, op::SetBordersEnabled>) {
            j["prev"] = o.prev;
            j["next"] = o.next;
        } else if constexpr (std::is_same_v<T, op::ReorderBorders>) {
            j["fromIndex"] = o.from;
            j["toIndex"] = o.to;
        } else if constexpr (std::is_same_v<T, op::Batch>) {
            j["operations"] = nlohmann::json::array();
            for (const auto& member : o.operations) {
                j["operations"].push_back(operation_to_json(member));
            }
        }

        return j;
    }, operation);

    j["type"] = std::string(operation_type(operation));
    return j;
}

inline Operation operation_from_json(const nlohmann::json& j) {
    std::string type = j.at("type").get<std::string>();

    if (type == "add_unit") {
        return op::AddUnit{j.at("unit").get<Unit>()};
    } else if (type == "remove_unit") {
        return op::RemoveUnit{j.at("unit").get<Unit>()};
    } else if (type == "update_unit") {
        return op::UpdateUnit{
            j.at("unitId").get<std::string>(),
            j.at("prev").get<UnitUpdate>(),
            j.at("next").get<UnitUpdate>()
        };
    } else if (type == "update_palette") {
        return op::UpdatePalette{
            j.at("roleId").get<std::string>(),
            j.at("prevColor").get<std::string>(),
            j.at("nextColor").get<std::string>()
        };
    } else if (type == "resize_grid") {
        return op::ResizeGrid{
            j.at("prevSize").get<int>(),
            j.at("nextSize").get<int>(),
            j.value("removedUnits", std::vector<Unit>{})
        };
    } else if (type == "add_role") {
        op::AddRole add{j.at("role").get<ColorRole>(), std::nullopt};
        if (j.contains("index")) add.index = j["index"].get<size_t>();
        return add;
    } else if (type == "remove_role") {
        return op::RemoveRole{
            j.at("role").get<ColorRole>(),
            j.at("index").get<size_t>(),
            j.value("affectedUnits", std::vector<op::AffectedUnit>{}),
            j.at("fallbackRoleId").get<std::string>()
        };
    } else if (type == "rename_role") {
        return op::RenameRole{
            j.at("roleId").get<std::string>(),
            j.at("prevName").get<std::string>(),
            j.at("nextName").get<std::string>()
        };
    } else if (type == "add_border") {
        op::AddBorder add{j.at("border").get<BorderSpec>(), std::nullopt};
        if (j.contains("index")) add.index = j["index"].get<size_t>();
        return add;
    } else if (type == "remove_border") {
        return op::RemoveBorder{j.at("border").get<BorderSpec>(), j.at("index").get<size_t>()};
    } else if (type == "update_border") {
        return op::UpdateBorder{
            j.at("borderId").get<std::string>(),
            j.at("prev").get<BorderUpdate>(),
            j.at("next").get<BorderUpdate>()
        };
    } else if (type == "set_borders_enabled") {
        return op::SetBordersEnabled{j.at("prev").get<bool>(), j.at("next").get<bool>()};
    } else if (type == "reorder_borders") {
        return op::ReorderBorders{j.at("fromIndex").get<size_t>(), j.at("toIndex").get<size_t>()};
    } else if (type == "batch") {
        op::Batch batch;
        for (const auto& member : j.at("operations")) {
            batch.operations.push_back(operation_from_json(member));
        }
        return batch;
    } else {
        throw std::runtime_error("Unknown operation type: " + type);
    }
}

// Undo and redo stacks, oldest first, for debugging dumps
inline nlohmann::json history_to_json(const UndoManager& history) {
    nlohmann::json j;
    j["undo"] = nlohmann::json::array();
    for (const auto& operation : history.undo_stack()) {
        j["undo"].push_back(operation_to_json(operation));
    }
    j["redo"] = nlohmann::json::array();
    for (const auto& operation : history.redo_stack()) {
        j["redo"].push_back(operation_to_json(operation));
    }
    return j;
}

}  // namespace quiltblock

#endif // QUILTBLOCK_SERIALIZATION_OPERATION_JSON_HPP
