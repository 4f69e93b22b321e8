#include "block.hpp"
#include <algorithm>

namespace quiltblock {

std::string_view to_string(BlockStatus status) {
    return status == BlockStatus::Published ? "published" : "draft";
}

std::optional<BlockStatus> block_status_from_string(std::string_view value) {
    if (value == "draft") return BlockStatus::Draft;
    if (value == "published") return BlockStatus::Published;
    return std::nullopt;
}

size_t utf8_length(std::string_view text) {
    return static_cast<size_t>(std::count_if(text.begin(), text.end(), [](char c) {
        return (static_cast<unsigned char>(c) & 0xC0) != 0x80;
    }));
}

}  // namespace quiltblock
