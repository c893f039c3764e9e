#include "app_options.hpp"

#include <limits>
#include <stdexcept>
#include <string>

namespace {

// Whole string must be decimal digits; no sign, no whitespace, no suffix
unsigned long long parse_unsigned(const std::string& text, unsigned long long max, const std::string& name) {
    if (text.empty() || text[0] < '0' || text[0] > '9') {
        throw std::invalid_argument(name + " must be an unsigned integer, got '" + text + "'");
    }

    size_t pos = 0;
    unsigned long long value = 0;
    try {
        value = std::stoull(text, &pos);
    } catch (const std::out_of_range&) {
        throw std::invalid_argument(name + " is too large: '" + text + "'");
    }

    if (pos != text.size()) {
        throw std::invalid_argument(name + " has trailing characters: '" + text + "'");
    }
    if (value > max) {
        throw std::invalid_argument(name + " must be at most " + std::to_string(max) + ", got '" + text + "'");
    }
    return value;
}

} // namespace

AppOptions parse_app_options(int argc, const char* const argv[]) {
    if (argc > 3) {
        throw std::invalid_argument("too many arguments");
    }

    AppOptions options;
    if (argc >= 2) {
        options.seed = static_cast<uint32_t>(parse_unsigned(argv[1], std::numeric_limits<uint32_t>::max(), "seed"));
    }
    if (argc == 3) {
        unsigned long long size = parse_unsigned(argv[2], MAX_CELL_SIZE, "cell_size");
        if (size < MIN_CELL_SIZE) {
            throw std::invalid_argument("cell_size must be between 32 and 128, got '" + std::string(argv[2]) + "'");
        }
        options.cell_size = static_cast<int>(size);
    }
    return options;
}
