#pragma once

#include <cinttypes>
#include <memory>
#include <string>
#include <vector>

#include "esp_err.h"
#include "sdmount_config.hpp"
#include "sdmount_diag.hpp"
#include "sdmount_port.hpp"
#include "sdmount_rate_limiter.hpp"
#include "sdmount_verbosity.hpp"

namespace sdmount {

enum class MountState : uint8_t {
    Unmounted = 0,
    AcquiringBus,
    Validating,
    Mounting,
    Settling,
    Mounted,
    Failed,
};

const char *mount_state_name(MountState state);

struct MountOptions {
    uint32_t timeout_ms = kDefaultMountTimeoutMs;
    bool read_only = true;
    // When set, `verbosity` applies for the duration of this call only.
    bool override_verbosity = false;
    Verbosity verbosity = Verbosity::Diags;
};

struct MountReport {
    MountState state = MountState::Unmounted;
    // Phase that was running when the attempt failed.
    MountState failed_phase = MountState::Unmounted;
    // Driver error behind an SDMOUNT_ERR_* result, ESP_OK otherwise.
    esp_err_t cause = ESP_OK;
    int64_t elapsed_us = 0;
    bool already_mounted = false;
    bool reused_handles = false;
    bool read_only = true;
    CardInfo card = {};
    BootSectorInfo boot = {};
    BlockProbe block1 = {};
};

struct SdStats {
    uint64_t total_mb = 0;
    uint64_t used_mb = 0;
    uint64_t free_mb = 0;
};

struct SmokeTestOptions {
    bool slow = false;
    uint32_t count = 60;
    uint32_t interval_ms = 1000;
};

// Owns the bus, card and filesystem handles of one SD slot.
// Invariant: mounted implies bus, card and a mounted volume are all present.
struct SdSession {
    Platform *platform = nullptr;
    BoardConfig config = {};
    std::unique_ptr<SpiBus> bus;
    std::unique_ptr<BlockDevice> card;
    std::unique_ptr<Volume> volume;
    bool mounted = false;
    RateLimiter limiter = {};
    Verbosity verbosity = Verbosity::Diags;
};

esp_err_t sd_session_init(SdSession *session, Platform *platform, const BoardConfig &config,
                          uint32_t rate_floor_ms = kDiagRateFloorMs);

// Runs the mount sequence under options.timeout_ms. A second call while
// mounted returns ESP_OK without touching the hardware.
esp_err_t sd_mount(SdSession *session, const MountOptions &options = {}, MountReport *report = nullptr);
esp_err_t sd_unmount(SdSession *session);
bool sd_is_mounted(const SdSession &session);
esp_err_t sd_set_verbosity(SdSession *session, Verbosity level);

// Acquires (or reuses) bus and card without mounting and checks block 0.
// The handles stay in the session for a later sd_mount.
esp_err_t sd_probe_boot_sector(SdSession *session, BootSectorInfo *info);

// Query surface: all of these need a mounted session and are rate limited.
esp_err_t sd_print_info(SdSession *session);
esp_err_t sd_get_stats(SdSession *session, SdStats *stats);
esp_err_t sd_list_files(SdSession *session, const char *path, std::vector<std::string> *names);
esp_err_t sd_test(SdSession *session, const SmokeTestOptions &options = {}, std::string *readback = nullptr);
esp_err_t sd_verify_stability(SdSession *session, uint32_t iterations = 10);

std::string sd_test_file_path(const SdSession &session);

}  // namespace sdmount
