#include <cinttypes>
#include <cstdio>
#include <string>
#include <vector>

#include "esp_check.h"
#include "esp_log.h"
#include "sdmount_err.hpp"
#include "sdmount_session.hpp"

namespace sdmount {
namespace {

constexpr const char *kTag = "sdmount_fs";
constexpr const char *kTestFileName = "/test.txt";
constexpr const char *kSmokePayload = "Hello";
constexpr uint64_t kBytesPerMb = 1024ULL * 1024ULL;

bool check_mounted(const SdSession &session)
{
    if (!session.mounted || session.volume == nullptr) {
        ESP_LOGE(kTag, "SD card not mounted");
        return false;
    }
    return true;
}

esp_err_t read_volume_stats(SdSession *session, VolumeStats *out)
{
    esp_err_t ret = session->volume->stats(out);
    if (ret != ESP_OK) {
        ESP_LOGE(kTag, "error getting stats: %s", sdmount_err_to_name(ret));
        *out = {};
        return SDMOUNT_ERR_IO;
    }
    return ESP_OK;
}

esp_err_t read_dir(SdSession *session, const char *path, std::vector<std::string> *names)
{
    esp_err_t ret = session->volume->list_dir(path, names);
    if (ret != ESP_OK) {
        ESP_LOGE(kTag, "error listing files in %s: %s", path, sdmount_err_to_name(ret));
        names->clear();
        return SDMOUNT_ERR_IO;
    }
    return ESP_OK;
}

std::string join_path(const char *dir, const std::string &name)
{
    std::string path(dir);
    if (path.empty() || path.back() != '/') {
        path.push_back('/');
    }
    path += name;
    return path;
}

esp_err_t report_write_failure(esp_err_t ret)
{
    if (ret == SDMOUNT_ERR_READ_ONLY) {
        ESP_LOGE(kTag, "test failed: SD card is mounted read-only");
        ESP_LOGI(kTag, "this is normal - SD card is read-only for stability");
        return SDMOUNT_ERR_READ_ONLY;
    }
    ESP_LOGE(kTag, "test failed: %s", sdmount_err_to_name(ret));
    return SDMOUNT_ERR_IO;
}

esp_err_t run_quick_test(SdSession *session, const std::string &path, std::string *readback)
{
    ESP_LOGI(kTag, "testing write...");
    esp_err_t ret = session->volume->write_file(path.c_str(), kSmokePayload, false);
    if (ret != ESP_OK) {
        return report_write_failure(ret);
    }
    ESP_LOGI(kTag, "write successful");

    ESP_LOGI(kTag, "testing read...");
    std::string content;
    ret = session->volume->read_file(path.c_str(), &content);
    if (ret != ESP_OK) {
        ESP_LOGE(kTag, "test failed: read returned %s", sdmount_err_to_name(ret));
        return SDMOUNT_ERR_IO;
    }
    if (readback != nullptr) {
        *readback = content;
    }
    if (content != kSmokePayload) {
        ESP_LOGE(kTag, "test failed: read back \"%s\", expected \"%s\"", content.c_str(), kSmokePayload);
        return SDMOUNT_ERR_IO;
    }
    ESP_LOGI(kTag, "read successful: %s", content.c_str());
    return ESP_OK;
}

esp_err_t run_slow_test(SdSession *session, const std::string &path, const SmokeTestOptions &options)
{
    ESP_LOGI(kTag, "starting slow SD test (%" PRIu32 " writes, %" PRIu32 " ms interval)", options.count,
             options.interval_ms);
    Clock &clock = session->platform->clock();
    for (uint32_t i = 1; i <= options.count; ++i) {
        char line[48];
        std::snprintf(line, sizeof(line), "Slow test %" PRIu32 "/%" PRIu32 "\n", i, options.count);
        esp_err_t ret = session->volume->write_file(path.c_str(), line, true);
        if (ret != ESP_OK) {
            return report_write_failure(ret);
        }
        ESP_LOGI(kTag, "write %" PRIu32 "/%" PRIu32, i, options.count);
        clock.sleep_ms(options.interval_ms);
    }
    ESP_LOGI(kTag, "slow SD test completed successfully");
    return ESP_OK;
}

}  // namespace

std::string sd_test_file_path(const SdSession &session)
{
    return std::string(session.config.mount_point) + kTestFileName;
}

esp_err_t sd_get_stats(SdSession *session, SdStats *stats)
{
    ESP_RETURN_ON_FALSE(session != nullptr && stats != nullptr, ESP_ERR_INVALID_ARG, kTag, "invalid argument");
    *stats = {};
    if (!session->mounted || session->volume == nullptr) {
        return SDMOUNT_ERR_NOT_MOUNTED;
    }

    rate_limiter_throttle(&session->limiter);

    VolumeStats vs;
    ESP_RETURN_ON_ERROR(read_volume_stats(session, &vs), kTag, "stats unavailable");

    const uint64_t total_bytes = static_cast<uint64_t>(vs.block_size) * vs.total_blocks;
    const uint64_t free_bytes = static_cast<uint64_t>(vs.block_size) * vs.free_blocks;
    stats->total_mb = total_bytes / kBytesPerMb;
    stats->free_mb = free_bytes / kBytesPerMb;
    stats->used_mb = (total_bytes - free_bytes) / kBytesPerMb;
    return ESP_OK;
}

esp_err_t sd_list_files(SdSession *session, const char *path, std::vector<std::string> *names)
{
    ESP_RETURN_ON_FALSE(session != nullptr && names != nullptr, ESP_ERR_INVALID_ARG, kTag, "invalid argument");
    names->clear();
    if (!check_mounted(*session)) {
        return SDMOUNT_ERR_NOT_MOUNTED;
    }

    rate_limiter_throttle(&session->limiter);

    const char *search_path = (path != nullptr && path[0] != '\0') ? path : session->config.mount_point;
    return read_dir(session, search_path, names);
}

esp_err_t sd_print_info(SdSession *session)
{
    ESP_RETURN_ON_FALSE(session != nullptr, ESP_ERR_INVALID_ARG, kTag, "session must not be null");
    if (!check_mounted(*session)) {
        return SDMOUNT_ERR_NOT_MOUNTED;
    }

    rate_limiter_throttle(&session->limiter);

    VolumeStats vs;
    ESP_RETURN_ON_ERROR(read_volume_stats(session, &vs), kTag, "stats unavailable");
    const double total_mb = static_cast<double>(vs.block_size) * vs.total_blocks / kBytesPerMb;
    const double free_mb = static_cast<double>(vs.block_size) * vs.free_blocks / kBytesPerMb;

    ESP_LOGI(kTag, "SD Card:");
    ESP_LOGI(kTag, "  Total: %.2f MB", total_mb);
    ESP_LOGI(kTag, "  Used:  %.2f MB", total_mb - free_mb);
    ESP_LOGI(kTag, "  Free:  %.2f MB", free_mb);

    std::vector<std::string> names;
    ESP_RETURN_ON_ERROR(read_dir(session, session->config.mount_point, &names), kTag, "listing unavailable");
    ESP_LOGI(kTag, "Files:");
    if (names.empty()) {
        ESP_LOGI(kTag, "  (empty)");
    }
    for (const std::string &name : names) {
        ESP_LOGI(kTag, "  - %s", name.c_str());
    }
    return ESP_OK;
}

esp_err_t sd_test(SdSession *session, const SmokeTestOptions &options, std::string *readback)
{
    ESP_RETURN_ON_FALSE(session != nullptr, ESP_ERR_INVALID_ARG, kTag, "session must not be null");
    if (!check_mounted(*session)) {
        return SDMOUNT_ERR_NOT_MOUNTED;
    }

    rate_limiter_throttle(&session->limiter);

    const std::string path = sd_test_file_path(*session);
    if (!options.slow) {
        return run_quick_test(session, path, readback);
    }
    return run_slow_test(session, path, options);
}

esp_err_t sd_verify_stability(SdSession *session, uint32_t iterations)
{
    ESP_RETURN_ON_FALSE(session != nullptr, ESP_ERR_INVALID_ARG, kTag, "session must not be null");
    if (!check_mounted(*session)) {
        return SDMOUNT_ERR_NOT_MOUNTED;
    }

    Clock &clock = session->platform->clock();
    const char *root = session->config.mount_point;
    for (uint32_t loop = 1; loop <= iterations; ++loop) {
        ESP_LOGI(kTag, "--- test loop %" PRIu32 " ---", loop);
        rate_limiter_throttle(&session->limiter);

        std::vector<std::string> names;
        esp_err_t ret = session->volume->list_dir(root, &names);
        if (ret != ESP_OK) {
            ESP_LOGE(kTag, "stability error on loop %" PRIu32 ": %s", loop, sdmount_err_to_name(ret));
            return SDMOUNT_ERR_IO;
        }
        ESP_LOGI(kTag, "found %u files:", static_cast<unsigned>(names.size()));

        for (const std::string &name : names) {
            // A size lookup per entry proves the directory entry is readable.
            uint64_t size = 0;
            ret = session->volume->file_size(join_path(root, name).c_str(), &size);
            if (ret != ESP_OK) {
                ESP_LOGE(kTag, "stability error on loop %" PRIu32 " (%s): %s", loop, name.c_str(),
                         sdmount_err_to_name(ret));
                return SDMOUNT_ERR_IO;
            }
            ESP_LOGI(kTag, " - %s (%" PRIu64 " bytes)", name.c_str(), size);
        }

        clock.sleep_ms(kStabilityLoopDelayMs);
    }

    ESP_LOGI(kTag, "SD card is stable over %" PRIu32 " read cycles", iterations);
    return ESP_OK;
}

}  // namespace sdmount
