#include "persistence.hpp"
#include "model_json.hpp"
#include "pattern_json.hpp"
#include <bridge/unit_bridge.hpp>
#include <common/logging.hpp>
#include <algorithm>
#include <cctype>
#include <set>
#include <utility>

namespace quiltblock {

namespace {

// Typed read of an optional field; wrong types are reported by name
template<typename T>
std::optional<T> read_field(const nlohmann::json& j, const std::string& key) {
    if (!j.contains(key) || j[key].is_null()) {
        return std::nullopt;
    }
    try {
        return j[key].get<T>();
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error("Invalid field '" + key + "': " + e.what());
    }
}

template<typename T>
T require_field(const nlohmann::json& j, const std::string& key) {
    auto value = read_field<T>(j, key);
    if (!value) {
        throw std::runtime_error("Missing field '" + key + "'");
    }
    return std::move(*value);
}

// Span must match what the definition computes for the variant
Unit repair_span(Unit unit) {
    const UnitConfig config = to_unit_config(unit);
    const Span expected = get_span_for_unit(std::string(type_id(unit_type(unit))), config.variant);
    if (unit.span != expected) {
        logging::get_logger()->debug("Repaired span of unit {} to {}x{}",
                                     unit.id, expected.rows, expected.cols);
        unit.span = expected;
    }
    return unit;
}

bool valid_grid_size(int size) {
    return size >= constants::MIN_GRID_SIZE && size <= constants::MAX_GRID_SIZE;
}

void check_palette_colors(const Palette& palette, const std::string& field) {
    for (const auto& role : palette.roles) {
        if (!is_valid_hex_color(role.color)) {
            throw std::runtime_error("Invalid field '" + field + "': role '" + role.id +
                                     "' has color '" + role.color + "' (expected #RRGGBB)");
        }
    }
}

template<typename T>
nlohmann::json nullable(const std::optional<T>& value) {
    return value ? nlohmann::json(*value) : nlohmann::json(nullptr);
}

}  // namespace

void to_json(nlohmann::json& j, const BlockDesignData& data) {
    j = {
        {"version", data.version},
        {"units", data.units},
        {"previewPalette", data.preview_palette},
    };
    if (data.border_config) {
        j["borderConfig"] = *data.border_config;
    }
}

void to_json(nlohmann::json& j, const BlockPersistData& data) {
    j = {
        {"name", data.name},
        {"description", nullable(data.description)},
        {"grid_size", data.grid_size},
        {"design_data", data.design_data},
        {"piece_count", data.piece_count},
    };
}

BlockPersistData serialize_block_for_storage(const Block& block) {
    BlockPersistData data;
    data.name = block.title.empty() ? "Untitled Block" : block.title;
    data.description = block.description;
    data.grid_size = block.grid_size;
    data.design_data.units = block.units;
    data.design_data.preview_palette = block.preview_palette;
    if (!block.border_config.borders.empty()) {
        data.design_data.border_config = block.border_config;
    }
    data.piece_count = block.units.size();
    return data;
}

nlohmann::json block_to_record(const Block& block) {
    nlohmann::json record = serialize_block_for_storage(block);
    record["id"] = block.id;
    record["creator_id"] = block.creator_id;
    record["derived_from_block_id"] = nullable(block.derived_from_block_id);
    record["hashtags"] = block.hashtags;
    record["status"] = block.status;
    record["created_at"] = block.created_at;
    record["updated_at"] = block.updated_at;
    record["published_at"] = nullable(block.published_at);
    return record;
}

std::vector<Unit> migrate_units(const nlohmann::json& units) {
    if (!units.is_array()) {
        throw std::runtime_error("Invalid field 'units': expected an array");
    }

    std::vector<Unit> result;
    result.reserve(units.size());
    for (size_t i = 0; i < units.size(); ++i) {
        nlohmann::json raw = units[i];
        if (!raw.is_object()) {
            throw std::runtime_error("Invalid field 'units[" + std::to_string(i) + "]': expected an object");
        }
        if (raw.contains("partFabricRoles") && !raw.contains("patchFabricRoles")) {
            raw["patchFabricRoles"] = raw["partFabricRoles"];
            raw.erase("partFabricRoles");
            logging::get_logger()->debug("Migrated partFabricRoles on unit {}", raw.value("id", std::string("?")));
        }
        try {
            result.push_back(repair_span(raw.get<Unit>()));
        } catch (const nlohmann::json::exception& e) {
            throw std::runtime_error("Invalid field 'units[" + std::to_string(i) + "]': " + e.what());
        }
    }
    return result;
}

Block deserialize_block_from_storage(const nlohmann::json& record) {
    if (!record.is_object()) {
        throw std::runtime_error("Block record must be a JSON object");
    }

    Block block;
    block.id = require_field<std::string>(record, "id");
    block.creator_id = read_field<std::string>(record, "creator_id").value_or("");
    block.derived_from_block_id = read_field<std::string>(record, "derived_from_block_id");
    block.title = read_field<std::string>(record, "name").value_or("");
    block.description = read_field<std::string>(record, "description");
    block.hashtags = read_field<std::vector<std::string>>(record, "hashtags").value_or(std::vector<std::string>{});
    block.grid_size = read_field<int>(record, "grid_size").value_or(constants::DEFAULT_GRID_SIZE);
    if (!valid_grid_size(block.grid_size)) {
        throw std::runtime_error("Invalid field 'grid_size': " + std::to_string(block.grid_size) +
                                 " (expected " + std::to_string(constants::MIN_GRID_SIZE) + " to " +
                                 std::to_string(constants::MAX_GRID_SIZE) + ")");
    }

    const std::string status = read_field<std::string>(record, "status").value_or("draft");
    auto parsed_status = block_status_from_string(status);
    if (!parsed_status) {
        throw std::runtime_error("Invalid field 'status': " + status);
    }
    block.status = *parsed_status;
    block.published_at = read_field<std::string>(record, "published_at");
    block.created_at = read_field<std::string>(record, "created_at").value_or("");
    block.updated_at = read_field<std::string>(record, "updated_at").value_or("");

    const nlohmann::json design = record.value("design_data", nlohmann::json());
    if (!design.is_null() && !design.is_object()) {
        throw std::runtime_error("Invalid field 'design_data': expected an object");
    }

    if (design.is_object() && design.contains("units") && !design["units"].is_null()) {
        block.units = migrate_units(design["units"]);
    } else if (design.is_object() && design.contains("shapes") && !design["shapes"].is_null()) {
        logging::get_logger()->debug("Reading legacy 'shapes' list of block {}", block.id);
        block.units = migrate_units(design["shapes"]);
    }

    // Units hanging off the grid cannot be edited or published
    const auto outside = std::remove_if(block.units.begin(), block.units.end(), [&](const Unit& u) {
        if (fits_grid(u, block.grid_size)) {
            return false;
        }
        logging::get_logger()->warn("Dropped unit {} of block {}: ({}, {}) {}x{} is outside the {}x{} grid",
                                    u.id, block.id, u.position.row, u.position.col,
                                    u.span.rows, u.span.cols, block.grid_size, block.grid_size);
        return true;
    });
    block.units.erase(outside, block.units.end());

    if (design.is_object()) {
        block.preview_palette = read_field<Palette>(design, "previewPalette").value_or(storage_default_palette());
        check_palette_colors(block.preview_palette, "previewPalette");
        block.border_config = read_field<BorderConfig>(design, "borderConfig").value_or(BorderConfig{});
    } else {
        block.preview_palette = storage_default_palette();
    }

    logging::get_logger()->debug("Loaded block {} ({} units, grid {})",
                                 block.id, block.units.size(), block.grid_size);
    return block;
}

PublishValidation validate_for_publish(const Block& block) {
    if (!valid_grid_size(block.grid_size)) {
        return {false, "Grid size must be between " + std::to_string(constants::MIN_GRID_SIZE) +
                       " and " + std::to_string(constants::MAX_GRID_SIZE)};
    }
    if (block.units.empty()) {
        return {false, "Add at least one unit before publishing"};
    }

    std::set<GridPosition> covered;
    for (const auto& unit : block.units) {
        for (const auto& cell : covered_cells(unit)) {
            if (cell.row >= 0 && cell.row < block.grid_size &&
                cell.col >= 0 && cell.col < block.grid_size) {
                covered.insert(cell);
            }
        }
    }

    const size_t total = static_cast<size_t>(block.grid_size) * static_cast<size_t>(block.grid_size);
    const size_t empty = total - covered.size();
    if (empty > 0) {
        return {false, std::to_string(empty) + " empty cell" + (empty > 1 ? "s" : "") +
                       " remaining. Fill all cells to publish."};
    }
    return {};
}

nlohmann::json pattern_to_record(const Pattern& pattern) {
    nlohmann::json design = {
        {"version", constants::DESIGN_DATA_VERSION},
        {"gridSize", pattern.grid_size},
        {"blockSizeInches", pattern.block_size_inches},
        {"physicalSize", pattern.physical_size},
        {"palette", pattern.palette},
        {"blockInstances", pattern.block_instances},
    };
    if (!pattern.border_config.borders.empty()) {
        design["borderConfig"] = pattern.border_config;
    }

    return {
        {"id", pattern.id},
        {"creator_id", pattern.creator_id},
        {"title", pattern.title.empty() ? std::string("Untitled Pattern") : pattern.title},
        {"description", nullable(pattern.description)},
        {"hashtags", pattern.hashtags},
        {"difficulty", pattern.difficulty},
        {"category", nullable(pattern.category)},
        {"design_data", design},
        {"status", pattern.status},
        {"is_premium", pattern.is_premium},
        {"price_cents", nullable(pattern.price_cents)},
        {"published_at", nullable(pattern.published_at)},
        {"thumbnail_url", nullable(pattern.thumbnail_url)},
        {"created_at", pattern.created_at},
        {"updated_at", pattern.updated_at},
    };
}

Pattern deserialize_pattern_from_storage(const nlohmann::json& record) {
    if (!record.is_object()) {
        throw std::runtime_error("Pattern record must be a JSON object");
    }

    Pattern pattern;
    pattern.id = require_field<std::string>(record, "id");
    pattern.creator_id = read_field<std::string>(record, "creator_id").value_or("");
    pattern.title = read_field<std::string>(record, "title").value_or("");
    pattern.description = read_field<std::string>(record, "description");
    pattern.hashtags = read_field<std::vector<std::string>>(record, "hashtags").value_or(std::vector<std::string>{});
    if (auto difficulty = read_field<std::string>(record, "difficulty")) {
        auto parsed = pattern_difficulty_from_string(*difficulty);
        if (!parsed) {
            throw std::runtime_error("Invalid field 'difficulty': " + *difficulty);
        }
        pattern.difficulty = *parsed;
    }

    if (auto category = read_field<std::string>(record, "category")) {
        pattern.category = pattern_category_from_string(*category);
        if (!pattern.category) {
            throw std::runtime_error("Invalid field 'category': " + *category);
        }
    }

    const std::string status = read_field<std::string>(record, "status").value_or("draft");
    auto parsed_status = block_status_from_string(status);
    if (!parsed_status) {
        throw std::runtime_error("Invalid field 'status': " + status);
    }
    pattern.status = *parsed_status;
    pattern.is_premium = read_field<bool>(record, "is_premium").value_or(false);
    pattern.price_cents = read_field<int>(record, "price_cents");
    pattern.published_at = read_field<std::string>(record, "published_at");
    pattern.thumbnail_url = read_field<std::string>(record, "thumbnail_url");
    pattern.created_at = read_field<std::string>(record, "created_at").value_or("");
    pattern.updated_at = read_field<std::string>(record, "updated_at").value_or("");

    const nlohmann::json design = record.value("design_data", nlohmann::json::object());
    if (!design.is_object()) {
        throw std::runtime_error("Invalid field 'design_data': expected an object");
    }

    pattern.grid_size = read_field<QuiltGridSize>(design, "gridSize").value_or(QuiltGridSize{});
    if (!valid_pattern_grid_size(pattern.grid_size)) {
        throw std::runtime_error("Invalid field 'gridSize': " + std::to_string(pattern.grid_size.rows) + "x" +
                                 std::to_string(pattern.grid_size.cols) + " (expected " +
                                 std::to_string(constants::PATTERN_MIN_GRID_SIZE) + " to " +
                                 std::to_string(constants::PATTERN_MAX_GRID_SIZE) + " per side)");
    }
    pattern.block_size_inches = read_field<double>(design, "blockSizeInches")
                                    .value_or(constants::DEFAULT_BLOCK_SIZE_INCHES);
    if (pattern.block_size_inches <= 0.0) {
        throw std::runtime_error("Invalid field 'blockSizeInches': must be positive");
    }
    // Always derived from the grid, whatever the record says
    pattern.physical_size = calculate_physical_size(pattern.grid_size, pattern.block_size_inches);

    pattern.palette = read_field<Palette>(design, "palette").value_or(default_palette());
    if (pattern.palette.roles.empty()) {
        throw std::runtime_error("Invalid field 'palette': needs at least one role");
    }
    check_palette_colors(pattern.palette, "palette");

    pattern.block_instances = read_field<std::vector<BlockInstance>>(design, "blockInstances")
                                  .value_or(std::vector<BlockInstance>{});
    std::set<GridPosition> taken;
    const auto dropped = std::remove_if(pattern.block_instances.begin(), pattern.block_instances.end(),
                                        [&](const BlockInstance& i) {
        if (!in_pattern_grid(i.position, pattern.grid_size) || !taken.insert(i.position).second) {
            logging::get_logger()->warn("Dropped block instance {} of pattern {}: ({}, {}) is outside the {}x{} grid "
                                        "or already taken", i.id, pattern.id, i.position.row, i.position.col,
                                        pattern.grid_size.rows, pattern.grid_size.cols);
            return true;
        }
        for (const auto& [role_id, color] : i.palette_overrides) {
            if (!is_valid_hex_color(color)) {
                throw std::runtime_error("Invalid field 'blockInstances': instance '" + i.id + "' overrides '" +
                                         role_id + "' with '" + color + "' (expected #RRGGBB)");
            }
        }
        return false;
    });
    pattern.block_instances.erase(dropped, pattern.block_instances.end());

    pattern.border_config = read_field<BorderConfig>(design, "borderConfig").value_or(BorderConfig{});

    logging::get_logger()->debug("Loaded pattern {} ({} blocks, grid {}x{})", pattern.id,
                                 pattern.block_instances.size(), pattern.grid_size.rows, pattern.grid_size.cols);
    return pattern;
}

PublishValidation validate_pattern_for_publish(const Pattern& pattern) {
    auto is_blank = [](const std::string& text) {
        return std::all_of(text.begin(), text.end(), [](char c) { return std::isspace(static_cast<unsigned char>(c)); });
    };

    if (is_blank(pattern.title)) {
        return {false, "Add a title before publishing"};
    }
    if (utf8_length(pattern.title) > constants::PATTERN_TITLE_MAX_LENGTH) {
        return {false, "Title must be at most " + std::to_string(constants::PATTERN_TITLE_MAX_LENGTH) + " characters"};
    }
    if (!valid_pattern_grid_size(pattern.grid_size)) {
        return {false, "Grid must be between " + std::to_string(constants::PATTERN_MIN_GRID_SIZE) + " and " +
                       std::to_string(constants::PATTERN_MAX_GRID_SIZE) + " blocks per side"};
    }
    const bool has_block = std::any_of(pattern.block_instances.begin(), pattern.block_instances.end(),
                                       [&](const BlockInstance& i) { return in_pattern_grid(i.position, pattern.grid_size); });
    if (!has_block) {
        return {false, "Place at least one block before publishing"};
    }
    if (pattern.is_premium) {
        const int price = pattern.price_cents.value_or(0);
        if (price < constants::MIN_PREMIUM_PRICE_CENTS || price > constants::MAX_PREMIUM_PRICE_CENTS) {
            return {false, "Premium patterns need a price between " +
                           std::to_string(constants::MIN_PREMIUM_PRICE_CENTS) + " and " +
                           std::to_string(constants::MAX_PREMIUM_PRICE_CENTS) + " cents"};
        }
    }
    return {};
}

std::vector<std::string> extract_hashtags(std::string_view text) {
    auto is_tag_char = [](char c) {
        return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
    };

    std::vector<std::string> tags;
    size_t i = 0;
    while (i < text.size()) {
        if (text[i] != '#') {
            ++i;
            continue;
        }
        size_t end = i + 1;
        while (end < text.size() && is_tag_char(text[end])) {
            ++end;
        }
        if (end > i + 1) {
            std::string tag(text.substr(i + 1, end - i - 1));
            for (auto& c : tag) {
                c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
            }
            tags.push_back(std::move(tag));
            i = end;
        } else {
            ++i;
        }
    }
    return tags;
}

}  // namespace quiltblock
