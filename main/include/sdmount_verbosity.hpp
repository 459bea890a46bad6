#pragma once

#include <cstdint>

namespace sdmount {

enum class Verbosity : uint8_t {
    Silent = 0,  // warnings and errors only
    Diags,       // step-by-step diagnostics
    Debug,       // everything, including raw block bytes and timings
};

// Tag for mount outcome lines. apply_verbosity never touches it, so the
// outcome stays visible at Silent.
constexpr const char *kOutcomeTag = "sdmount";

const char *verbosity_name(Verbosity level);
bool parse_verbosity(const char *name, Verbosity *out);

// Maps the level onto ESP-IDF log levels for every sdmount tag.
void apply_verbosity(Verbosity level);

}  // namespace sdmount
