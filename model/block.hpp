#ifndef QUILTBLOCK_MODEL_BLOCK_HPP
#define QUILTBLOCK_MODEL_BLOCK_HPP

#include "unit.hpp"
#include "palette.hpp"
#include "border.hpp"
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace quiltblock {

// ISO 8601 timestamp string
using Timestamp = std::string;

enum class BlockStatus { Draft, Published };

// The design document: a square grid of units plus its palette and borders
struct Block {
    std::string id;
    std::string creator_id;
    std::optional<std::string> derived_from_block_id;  // Fork source

    std::string title;
    std::optional<std::string> description;  // Null is kept distinct from ""
    std::vector<std::string> hashtags;

    int grid_size = 3;
    std::vector<Unit> units;
    Palette preview_palette;
    BorderConfig border_config;

    // Lifecycle fields are owned by the publishing layer, not by undo
    BlockStatus status = BlockStatus::Draft;
    std::optional<Timestamp> published_at;
    Timestamp created_at;
    Timestamp updated_at;
};

std::string_view to_string(BlockStatus status);
std::optional<BlockStatus> block_status_from_string(std::string_view value);

// Code points of UTF-8 text; metadata limits count these, not bytes
size_t utf8_length(std::string_view text);

}  // namespace quiltblock

#endif // QUILTBLOCK_MODEL_BLOCK_HPP
