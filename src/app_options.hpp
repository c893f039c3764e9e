#pragma once

#include <cstdint>
#include <optional>

struct AppOptions {
    std::optional<uint32_t> seed; // random when absent
    int cell_size = 64;
};

constexpr int MIN_CELL_SIZE = 32;
constexpr int MAX_CELL_SIZE = 128;

// sudoku_game [seed] [cell_size]
// Throws std::invalid_argument naming the offending argument.
AppOptions parse_app_options(int argc, const char* const argv[]);
