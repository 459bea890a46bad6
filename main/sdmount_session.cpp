#include "sdmount_session.hpp"

#include <cinttypes>
#include <utility>

#include "esp_check.h"
#include "esp_log.h"
#include "sdmount_err.hpp"

namespace sdmount {
namespace {

constexpr const char *kTag = "sdmount_session";

double to_seconds(int64_t us)
{
    return static_cast<double>(us) / 1e6;
}

// Drops every handle the session holds. Order matters: the volume goes before
// the card it sits on, and the card device before the bus it is attached to.
void release_handles(SdSession *session)
{
    if (session->volume != nullptr && session->volume->is_mounted()) {
        esp_err_t ret = session->volume->unmount();
        if (ret != ESP_OK && ret != ESP_ERR_INVALID_STATE) {
            ESP_LOGW(kTag, "volume unmount during cleanup returned %s", sdmount_err_to_name(ret));
        }
    }
    session->volume.reset();
    session->card.reset();
    if (session->bus != nullptr) {
        esp_err_t ret = session->bus->release();
        if (ret != ESP_OK && ret != ESP_ERR_INVALID_STATE) {
            ESP_LOGW(kTag, "spi bus release during cleanup returned %s", esp_err_to_name(ret));
        }
    }
    session->bus.reset();
    session->mounted = false;
}

esp_err_t acquire_handles(SdSession *session, bool *reused, esp_err_t *cause)
{
    *reused = false;
    if (session->bus != nullptr && session->card != nullptr) {
        ESP_LOGD(kTag, "reusing existing SPI/SD card handles");
        *reused = true;
        return ESP_OK;
    }

    // A bus left without a card is stale; start over from a clean slate.
    release_handles(session);

    const BoardConfig &cfg = session->config;
    ESP_LOGI(kTag, "initializing SPI (SCK=%d MOSI=%d MISO=%d)", cfg.pin_sck, cfg.pin_mosi, cfg.pin_miso);
    esp_err_t ret = session->platform->open_bus(cfg, &session->bus);
    if (ret == ESP_OK && session->bus == nullptr) {
        ret = ESP_FAIL;
    }
    if (ret != ESP_OK) {
        ESP_LOGE(kTag, "SPI bus initialization failed: %s", esp_err_to_name(ret));
        *cause = ret;
        release_handles(session);
        return SDMOUNT_ERR_BUS_INIT;
    }

    ESP_LOGI(kTag, "initializing SD card (CS=%d @ %" PRIu32 " Hz)", cfg.pin_cs, cfg.clock_hz);
    ret = session->platform->open_card(*session->bus, cfg, &session->card);
    if (ret == ESP_OK && session->card == nullptr) {
        ret = ESP_FAIL;
    }
    if (ret != ESP_OK) {
        ESP_LOGE(kTag, "SD card initialization failed: %s", esp_err_to_name(ret));
        *cause = ret;
        release_handles(session);
        return SDMOUNT_ERR_CARD_INIT;
    }
    return ESP_OK;
}

esp_err_t validate_card(SdSession *session, MountReport *report)
{
    BlockDevice &card = *session->card;

    ESP_LOGI(kTag, "testing SD card communication...");
    esp_err_t ret = diag_check_communication(card, &report->card);
    if (ret != ESP_OK) {
        report->cause = ret;
        return SDMOUNT_ERR_NO_RESPONSE;
    }

    // Advisory only: a bad boot sector or block 1 read lowers confidence but
    // the mount call is the real judge.
    if (diag_check_boot_sector(card, &report->boot) != ESP_OK) {
        ESP_LOGW(kTag, "boot sector validation failed, attempting mount anyway...");
    }
    if (diag_check_block_read(card, 1, &report->block1) != ESP_OK) {
        ESP_LOGW(kTag, "multi-block read failed, attempting mount anyway...");
    }
    return ESP_OK;
}

esp_err_t mount_volume(SdSession *session, bool read_only, MountReport *report)
{
    ESP_LOGI(kTag, "initializing directory cache...");
    ESP_LOGD(kTag, "creating FAT volume");
    std::unique_ptr<Volume> volume = session->platform->create_volume(*session->card);
    if (volume == nullptr) {
        report->cause = ESP_ERR_NO_MEM;
        return SDMOUNT_ERR_MOUNT_FAILED;
    }

    ESP_LOGD(kTag, "mounting to %s (readonly=%s)", session->config.mount_point, read_only ? "true" : "false");
    esp_err_t ret = volume->mount(session->config.mount_point, read_only);
    if (ret != ESP_OK) {
        ESP_LOGE(kTag, "filesystem mount at %s failed: %s", session->config.mount_point, sdmount_err_to_name(ret));
        report->cause = ret;
        return SDMOUNT_ERR_MOUNT_FAILED;
    }

    session->volume = std::move(volume);
    report->read_only = read_only;
    return ESP_OK;
}

bool deadline_exceeded(int64_t elapsed_us, uint32_t timeout_ms, MountState phase)
{
    if (elapsed_us > static_cast<int64_t>(timeout_ms) * 1000) {
        ESP_LOGE(kTag, "mount timeout: %s took too long (%.1fs)", mount_state_name(phase), to_seconds(elapsed_us));
        return true;
    }
    ESP_LOGD(kTag, "%s: %.3fs elapsed", mount_state_name(phase), to_seconds(elapsed_us));
    return false;
}

esp_err_t run_mount_sequence(SdSession *session, const MountOptions &options, MountReport *report)
{
    Clock &clock = session->platform->clock();
    const int64_t start_us = clock.now_us();

    ESP_LOGI(kTag, "initializing SD card...");
    esp_err_t result = ESP_OK;
    MountState state = MountState::AcquiringBus;
    while (state != MountState::Mounted && state != MountState::Failed) {
        const MountState phase = state;
        report->state = phase;

        switch (phase) {
        case MountState::AcquiringBus:
            result = acquire_handles(session, &report->reused_handles, &report->cause);
            break;
        case MountState::Validating:
            result = validate_card(session, report);
            break;
        case MountState::Mounting:
            result = mount_volume(session, options.read_only, report);
            break;
        case MountState::Settling:
            ESP_LOGD(kTag, "waiting %" PRIu32 " ms for electrical settling", kSettleDelayMs);
            clock.sleep_ms(kSettleDelayMs);
            result = ESP_OK;
            break;
        default:
            result = ESP_ERR_INVALID_STATE;
            break;
        }

        if (result == ESP_OK) {
            report->elapsed_us = clock.now_us() - start_us;
            if (deadline_exceeded(report->elapsed_us, options.timeout_ms, phase)) {
                result = SDMOUNT_ERR_DEADLINE;
            }
        }

        if (result != ESP_OK) {
            report->failed_phase = phase;
            state = MountState::Failed;
            break;
        }

        switch (phase) {
        case MountState::AcquiringBus:
            state = MountState::Validating;
            break;
        case MountState::Validating:
            state = MountState::Mounting;
            break;
        case MountState::Mounting:
            state = MountState::Settling;
            break;
        default:
            state = MountState::Mounted;
            break;
        }
    }

    report->elapsed_us = clock.now_us() - start_us;
    report->state = state;
    if (state == MountState::Failed) {
        // Also reverses a completed mount when the last deadline gate tripped.
        release_handles(session);
        ESP_LOGE(kTag, "mount failed in %s after %.1fs: %s", mount_state_name(report->failed_phase),
                 to_seconds(report->elapsed_us), sdmount_err_to_name(result));
        return result;
    }

    session->mounted = true;
    ESP_LOGI(kOutcomeTag, "SD card mounted successfully in %.1fs", to_seconds(report->elapsed_us));
    return ESP_OK;
}

}  // namespace

const char *mount_state_name(MountState state)
{
    switch (state) {
    case MountState::Unmounted:
        return "unmounted";
    case MountState::AcquiringBus:
        return "SD card init";
    case MountState::Validating:
        return "pre-validation";
    case MountState::Mounting:
        return "filesystem mount";
    case MountState::Settling:
        return "settling";
    case MountState::Mounted:
        return "mounted";
    case MountState::Failed:
        return "failed";
    default:
        return "unknown";
    }
}

esp_err_t sd_session_init(SdSession *session, Platform *platform, const BoardConfig &config, uint32_t rate_floor_ms)
{
    ESP_RETURN_ON_FALSE(session != nullptr, ESP_ERR_INVALID_ARG, kTag, "session must not be null");
    ESP_RETURN_ON_FALSE(platform != nullptr, ESP_ERR_INVALID_ARG, kTag, "platform must not be null");
    ESP_RETURN_ON_FALSE(!session->mounted, ESP_ERR_INVALID_STATE, kTag, "session is mounted; unmount first");

    release_handles(session);
    session->platform = platform;
    session->config = config;
    rate_limiter_init(&session->limiter, &platform->clock(), rate_floor_ms);
    session->verbosity = Verbosity::Diags;
    apply_verbosity(session->verbosity);
    return ESP_OK;
}

esp_err_t sd_mount(SdSession *session, const MountOptions &options, MountReport *report)
{
    ESP_RETURN_ON_FALSE(session != nullptr && session->platform != nullptr, ESP_ERR_INVALID_ARG, kTag,
                        "session not initialized");

    MountReport local_report;
    MountReport *rep = report != nullptr ? report : &local_report;
    *rep = {};

    const Verbosity previous = session->verbosity;
    if (options.override_verbosity) {
        session->verbosity = options.verbosity;
        apply_verbosity(options.verbosity);
    }

    esp_err_t ret = ESP_OK;
    if (session->mounted) {
        ESP_LOGD(kTag, "SD card already mounted");
        rep->already_mounted = true;
        rep->state = MountState::Mounted;
    } else {
        ret = run_mount_sequence(session, options, rep);
    }

    if (options.override_verbosity) {
        session->verbosity = previous;
        apply_verbosity(previous);
    }
    return ret;
}

esp_err_t sd_unmount(SdSession *session)
{
    ESP_RETURN_ON_FALSE(session != nullptr && session->platform != nullptr, ESP_ERR_INVALID_ARG, kTag,
                        "session not initialized");

    if (!session->mounted) {
        ESP_LOGI(kTag, "SD card not mounted, nothing to do");
        return ESP_OK;
    }

    esp_err_t result = ESP_OK;
    if (session->volume != nullptr) {
        esp_err_t ret = session->volume->unmount();
        if (ret == ESP_ERR_INVALID_STATE) {
            ESP_LOGD(kTag, "filesystem already unmounted");
        } else if (ret != ESP_OK) {
            ESP_LOGW(kTag, "filesystem unmount failed: %s", sdmount_err_to_name(ret));
            result = ret;
        }
    }
    session->volume.reset();
    session->card.reset();

    if (session->bus != nullptr) {
        esp_err_t ret = session->bus->release();
        if (ret == ESP_ERR_INVALID_STATE) {
            ESP_LOGD(kTag, "SPI bus already released");
        } else if (ret != ESP_OK) {
            ESP_LOGW(kTag, "SPI bus release failed: %s", esp_err_to_name(ret));
            if (result == ESP_OK) {
                result = ret;
            }
        }
    }
    session->bus.reset();
    session->mounted = false;
    rate_limiter_reset(&session->limiter);

    // Give the hardware time to let go of the pins before any re-mount.
    session->platform->clock().sleep_ms(kReleaseDelayMs);

    if (result == ESP_OK) {
        ESP_LOGI(kTag, "SD card unmounted");
    } else {
        ESP_LOGE(kTag, "SD card unmount finished with errors: %s", sdmount_err_to_name(result));
    }
    return result;
}

bool sd_is_mounted(const SdSession &session)
{
    return session.mounted;
}

esp_err_t sd_set_verbosity(SdSession *session, Verbosity level)
{
    ESP_RETURN_ON_FALSE(session != nullptr, ESP_ERR_INVALID_ARG, kTag, "session must not be null");
    session->verbosity = level;
    apply_verbosity(level);
    ESP_LOGI(kTag, "verbosity: %s", verbosity_name(level));
    return ESP_OK;
}

esp_err_t sd_probe_boot_sector(SdSession *session, BootSectorInfo *info)
{
    ESP_RETURN_ON_FALSE(session != nullptr && session->platform != nullptr, ESP_ERR_INVALID_ARG, kTag,
                        "session not initialized");
    ESP_RETURN_ON_FALSE(info != nullptr, ESP_ERR_INVALID_ARG, kTag, "info must not be null");
    *info = {};

    ESP_LOGI(kTag, "testing boot sector read (no mount required)...");
    bool reused = false;
    esp_err_t cause = ESP_OK;
    esp_err_t ret = acquire_handles(session, &reused, &cause);
    if (ret != ESP_OK) {
        return ret;
    }

    CardInfo card_info;
    if (diag_check_communication(*session->card, &card_info) != ESP_OK) {
        if (!session->mounted) {
            release_handles(session);
        }
        return SDMOUNT_ERR_NO_RESPONSE;
    }

    ret = diag_check_boot_sector(*session->card, info);
    if (ret == ESP_OK) {
        ESP_LOGI(kTag, "boot sector read successful");
    } else {
        ESP_LOGW(kTag, "boot sector read failed: %s", sdmount_err_to_name(ret));
    }
    return ret;
}

}  // namespace sdmount
