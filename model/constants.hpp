#ifndef QUILTBLOCK_MODEL_CONSTANTS_HPP
#define QUILTBLOCK_MODEL_CONSTANTS_HPP

#include <array>
#include <cstddef>
#include <string_view>

namespace quiltblock {
namespace constants {

// Grid
constexpr int MIN_GRID_SIZE = 2;
constexpr int MAX_GRID_SIZE = 9;
constexpr int DEFAULT_GRID_SIZE = 3;

// Palette
constexpr size_t MIN_PALETTE_ROLES = 1;
constexpr size_t MAX_PALETTE_ROLES = 12;

// Role given to every patch of a newly placed unit
constexpr std::string_view DEFAULT_ROLE = "background";

// Extra colors handed out, in order, to roles added beyond the standard four
constexpr std::array<std::string_view, 8> ADDITIONAL_ROLE_COLORS = {
    "#C0392B", "#27AE60", "#8E44AD", "#2980B9",
    "#D35400", "#16A085", "#7F8C8D", "#E84393",
};

// Color used when a role id cannot be resolved
constexpr std::string_view NEUTRAL_COLOR = "#CCCCCC";

// Borders
constexpr size_t MAX_BORDERS = 4;
constexpr double DEFAULT_BORDER_WIDTH_INCHES = 2.0;
constexpr std::string_view DEFAULT_BORDER_ROLE = "accent1";
constexpr std::string_view BORDER_SEAM_COLOR = "#9CA3AF";
constexpr double BORDER_SEAM_WIDTH = 1.0;
constexpr std::string_view BORDER_OUTLINE_COLOR = "#6B7280";
constexpr double BORDER_OUTLINE_WIDTH = 2.0;

// History
constexpr size_t MAX_UNDO_HISTORY = 100;

// Metadata limits
constexpr size_t BLOCK_TITLE_MAX_LENGTH = 100;
constexpr size_t BLOCK_DESCRIPTION_MAX_LENGTH = 500;
constexpr size_t HASHTAG_MAX_LENGTH = 50;

// Patterns: a rows x cols grid of block instances
constexpr int PATTERN_MIN_GRID_SIZE = 2;
constexpr int PATTERN_MAX_GRID_SIZE = 25;
constexpr int GRID_SIZE_WARNING_THRESHOLD = 15;
constexpr int DEFAULT_PATTERN_ROWS = 4;
constexpr int DEFAULT_PATTERN_COLS = 4;
constexpr double DEFAULT_BLOCK_SIZE_INCHES = 12.0;
constexpr size_t PATTERN_TITLE_MAX_LENGTH = 100;
constexpr size_t PATTERN_DESCRIPTION_MAX_LENGTH = 2000;
constexpr size_t PATTERN_MAX_HASHTAGS = 10;
constexpr int MIN_PREMIUM_PRICE_CENTS = 100;
constexpr int MAX_PREMIUM_PRICE_CENTS = 100000;

// Storage
constexpr int DESIGN_DATA_VERSION = 1;

}  // namespace constants
}  // namespace quiltblock

#endif // QUILTBLOCK_MODEL_CONSTANTS_HPP
