#include "sdmount_verbosity.hpp"

#include <cstring>

#include "esp_log.h"

namespace sdmount {
namespace {

constexpr const char *kCoreTags[] = {
    "sdmount_session",
    "sdmount_fs",
    "sdmount_diag",
    "sdmount_rate",
    "sdmount_port",
};

esp_log_level_t to_log_level(Verbosity level)
{
    switch (level) {
    case Verbosity::Silent:
        return ESP_LOG_WARN;
    case Verbosity::Debug:
        return ESP_LOG_DEBUG;
    case Verbosity::Diags:
    default:
        return ESP_LOG_INFO;
    }
}

}  // namespace

const char *verbosity_name(Verbosity level)
{
    switch (level) {
    case Verbosity::Silent:
        return "silent";
    case Verbosity::Diags:
        return "diags";
    case Verbosity::Debug:
        return "debug";
    default:
        return "unknown";
    }
}

bool parse_verbosity(const char *name, Verbosity *out)
{
    if (name == nullptr || out == nullptr) {
        return false;
    }
    if (std::strcmp(name, "silent") == 0) {
        *out = Verbosity::Silent;
    } else if (std::strcmp(name, "diags") == 0) {
        *out = Verbosity::Diags;
    } else if (std::strcmp(name, "debug") == 0) {
        *out = Verbosity::Debug;
    } else {
        return false;
    }
    return true;
}

void apply_verbosity(Verbosity level)
{
    const esp_log_level_t log_level = to_log_level(level);
    for (const char *tag : kCoreTags) {
        esp_log_level_set(tag, log_level);
    }
}

}  // namespace sdmount
