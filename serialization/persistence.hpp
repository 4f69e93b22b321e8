#ifndef QUILTBLOCK_SERIALIZATION_PERSISTENCE_HPP
#define QUILTBLOCK_SERIALIZATION_PERSISTENCE_HPP

// Conversion between the in-memory Block and its storage record, plus the
// checks the publishing layer runs on a block.

#include <model/block.hpp>
#include <model/constants.hpp>
#include <model/pattern.hpp>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace quiltblock {

// Design content stored in the record's design_data column
struct BlockDesignData {
    int version = constants::DESIGN_DATA_VERSION;
    std::vector<Unit> units;
    Palette preview_palette;
    std::optional<BorderConfig> border_config;  // Only written when borders exist
};

// Fields written when a block is created or updated
struct BlockPersistData {
    std::string name;
    std::optional<std::string> description;
    int grid_size = constants::DEFAULT_GRID_SIZE;
    BlockDesignData design_data;
    size_t piece_count = 0;
};

void to_json(nlohmann::json& j, const BlockDesignData& data);
void to_json(nlohmann::json& j, const BlockPersistData& data);

BlockPersistData serialize_block_for_storage(const Block& block);

// Full block record: identity, lifecycle fields and design_data
nlohmann::json block_to_record(const Block& block);

// Read a block record, migrating legacy layouts. Throws std::runtime_error
// naming the field when the record has the wrong structure.
Block deserialize_block_from_storage(const nlohmann::json& record);

// Rename partFabricRoles to patchFabricRoles and parse each unit
std::vector<Unit> migrate_units(const nlohmann::json& units);

struct PublishValidation {
    bool valid = true;
    std::optional<std::string> error;
};

// The grid size must be in range and every grid cell covered by some unit
PublishValidation validate_for_publish(const Block& block);

// Full pattern record. Grid, palette, placed blocks and borders are
// stored in design_data.
nlohmann::json pattern_to_record(const Pattern& pattern);

// Read a pattern record. Throws std::runtime_error naming the field;
// placed blocks outside the grid are dropped with a warning.
Pattern deserialize_pattern_from_storage(const nlohmann::json& record);

// A titled pattern with at least one placed block and, when premium, a
// price in range
PublishValidation validate_pattern_for_publish(const Pattern& pattern);

// "#tag" tokens of letters, digits and underscores, lowercased, in order
// of appearance. Repeated tags are returned each time they occur.
std::vector<std::string> extract_hashtags(std::string_view text);

}  // namespace quiltblock

#endif // QUILTBLOCK_SERIALIZATION_PERSISTENCE_HPP
