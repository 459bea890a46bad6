/*
 * SD-over-SPI bring-up firmware
 *
 * Bring-up contract:
 * - Board wiring comes from sdmount_board_config.hpp, never from ad-hoc pins here.
 * - Probe the boot sector before the first mount so a dead card is told apart
 *   from a bad filesystem.
 * - Mount read-only first; the writable pass runs only after the stability loop.
 */

#include <cinttypes>
#include <string>
#include <vector>

#include "esp_err.h"
#include "esp_log.h"
#include "freertos/FreeRTOS.h"
#include "freertos/task.h"
#include "sdmount_board_config.hpp"
#include "sdmount_err.hpp"
#include "sdmount_esp_port.hpp"
#include "sdmount_session.hpp"

namespace {

constexpr const char *kTag = "sdmount_app";
constexpr uint32_t kStabilityIterations = 10;

constexpr TickType_t ticks_from_ms(uint32_t ms)
{
    const TickType_t ticks = pdMS_TO_TICKS(ms);
    return ticks == 0 ? 1 : ticks;
}

sdmount::EspPlatform g_platform;
sdmount::SdSession g_session;

void log_board(const sdmount::BoardConfig &cfg)
{
    ESP_LOGI(kTag, "Board: %s", cfg.name);
    ESP_LOGI(kTag, "SPI%d: SCK=%d MOSI=%d MISO=%d CS=%d @ %" PRIu32 "Hz", cfg.spi_host + 1, cfg.pin_sck,
             cfg.pin_mosi, cfg.pin_miso, cfg.pin_cs, cfg.clock_hz);
    if (cfg.pin_idle_cs >= 0) {
        ESP_LOGI(kTag, "Shared bus: holding CS=%d high", cfg.pin_idle_cs);
    }
    ESP_LOGI(kTag, "Mount point: %s", cfg.mount_point);
}

void diag_boot_sector()
{
    sdmount::BootSectorInfo info = {};
    esp_err_t ret = sdmount::sd_probe_boot_sector(&g_session, &info);
    if (ret == ESP_OK) {
        ESP_LOGI(kTag, "diag_boot_sector: signature=0x%04X partition=%s", info.signature,
                 sdmount::partition_type_name(info.partition_type));
    } else {
        ESP_LOGW(kTag, "diag_boot_sector: %s", sdmount::sdmount_err_to_name(ret));
    }
}

bool diag_mount(bool read_only)
{
    sdmount::MountOptions options;
    options.read_only = read_only;
    sdmount::MountReport report;
    esp_err_t ret = sdmount::sd_mount(&g_session, options, &report);
    if (ret != ESP_OK) {
        ESP_LOGE(kTag, "diag_mount: failed in %s (%s, cause %s)", sdmount::mount_state_name(report.failed_phase),
                 sdmount::sdmount_err_to_name(ret), esp_err_to_name(report.cause));
        return false;
    }
    ESP_LOGI(kTag, "diag_mount: %s in %" PRId64 " ms (card %" PRIu64 " blocks, reused=%d)",
             read_only ? "read-only" : "read-write", report.elapsed_us / 1000, report.card.block_count,
             report.reused_handles ? 1 : 0);
    return true;
}

void diag_queries()
{
    ESP_ERROR_CHECK_WITHOUT_ABORT(sdmount::sd_print_info(&g_session));

    sdmount::SdStats stats = {};
    if (sdmount::sd_get_stats(&g_session, &stats) == ESP_OK) {
        ESP_LOGI(kTag, "diag_queries: total=%" PRIu64 "MB used=%" PRIu64 "MB free=%" PRIu64 "MB", stats.total_mb,
                 stats.used_mb, stats.free_mb);
    }

    std::vector<std::string> names;
    if (sdmount::sd_list_files(&g_session, nullptr, &names) == ESP_OK) {
        ESP_LOGI(kTag, "diag_queries: %u root entries", static_cast<unsigned>(names.size()));
    }
}

void run_bringup()
{
    ESP_LOGI(kTag, "===== SD MOUNT BRING-UP =====");
    const sdmount::BoardConfig &cfg = sdmount::board_config();
    log_board(cfg);

    ESP_ERROR_CHECK(sdmount::sd_session_init(&g_session, &g_platform, cfg));
    sdmount::Verbosity level = sdmount::Verbosity::Diags;
    if (!sdmount::parse_verbosity(SDMOUNT_APP_VERBOSITY, &level)) {
        ESP_LOGW(kTag, "unknown verbosity \"%s\", keeping diags", SDMOUNT_APP_VERBOSITY);
    }
    ESP_ERROR_CHECK_WITHOUT_ABORT(sdmount::sd_set_verbosity(&g_session, level));

    diag_boot_sector();

    if (diag_mount(true)) {
        diag_queries();

        esp_err_t ret = sdmount::sd_test(&g_session);
        if (ret == SDMOUNT_ERR_READ_ONLY) {
            ESP_LOGI(kTag, "diag_test: write refused on read-only mount as expected");
        } else {
            ESP_LOGW(kTag, "diag_test: unexpected result on read-only mount: %s", sdmount::sdmount_err_to_name(ret));
        }

        ESP_ERROR_CHECK_WITHOUT_ABORT(sdmount::sd_verify_stability(&g_session, kStabilityIterations));
        ESP_ERROR_CHECK_WITHOUT_ABORT(sdmount::sd_unmount(&g_session));
    }

    if (diag_mount(false)) {
        std::string readback;
        esp_err_t ret = sdmount::sd_test(&g_session, {}, &readback);
        ESP_LOGI(kTag, "diag_test: read-write result=%s readback=\"%s\"", sdmount::sdmount_err_to_name(ret),
                 readback.c_str());
        ESP_ERROR_CHECK_WITHOUT_ABORT(sdmount::sd_unmount(&g_session));
    }

    ESP_LOGI(kTag, "===== SD MOUNT BRING-UP COMPLETE =====");
}

}  // namespace

extern "C" void app_main(void)
{
    // Per-tag levels are set by sd_set_verbosity; keep everything else at info.
    esp_log_level_set("*", ESP_LOG_INFO);

    auto run_bringup_task = [](void *) {
        run_bringup();
        vTaskDelete(nullptr);
    };
    xTaskCreate(run_bringup_task, "sdmount_task", 8192, nullptr, 5, nullptr);

    while (true) {
        vTaskDelay(ticks_from_ms(1000));
    }
}
