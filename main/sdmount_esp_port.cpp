#include "sdmount_esp_port.hpp"

#include <type_traits>
#include <utility>

#include "driver/gpio.h"
#include "esp_check.h"
#include "esp_log.h"
#include "esp_timer.h"
#include "freertos/FreeRTOS.h"
#include "freertos/task.h"
#include "sdmount_fat_volume.hpp"

namespace sdmount {
namespace {

constexpr const char *kTag = "sdmount_port";
constexpr int kMaxTransferSize = 4096;

constexpr TickType_t ticks_from_ms(uint32_t ms)
{
    const TickType_t ticks = pdMS_TO_TICKS(ms);
    return ticks == 0 ? 1 : ticks;
}

void deassert_cs(int pin)
{
    if (pin < 0) {
        return;
    }
    const auto gpio = static_cast<gpio_num_t>(pin);
    gpio_reset_pin(gpio);
    gpio_set_direction(gpio, GPIO_MODE_OUTPUT);
    gpio_set_level(gpio, 1);
}

// A bus handle owns its SPI host and is never copied.
static_assert(!std::is_copy_constructible_v<EspSpiBus>);
static_assert(!std::is_copy_assignable_v<EspSpiBus>);

}  // namespace

int64_t EspClock::now_us()
{
    return esp_timer_get_time();
}

void EspClock::sleep_us(int64_t us)
{
    if (us <= 0) {
        return;
    }
    const int64_t deadline_us = esp_timer_get_time() + us;
    const TickType_t ticks = pdMS_TO_TICKS(static_cast<uint32_t>(us / 1000));
    if (ticks > 0) {
        vTaskDelay(ticks);
    }
    // pdMS_TO_TICKS rounds down; finish on single ticks so the wait is never short.
    while (esp_timer_get_time() < deadline_us) {
        vTaskDelay(1);
    }
}

EspSpiBus::EspSpiBus(spi_host_device_t host, bool owned) : host_(host), owned_(owned) {}

EspSpiBus::~EspSpiBus()
{
    if (!released_) {
        ESP_ERROR_CHECK_WITHOUT_ABORT(release());
    }
}

esp_err_t EspSpiBus::release()
{
    if (released_) {
        return ESP_ERR_INVALID_STATE;
    }
    released_ = true;
    if (!owned_) {
        ESP_LOGD(kTag, "SPI host %d not owned, leaving it initialized", static_cast<int>(host_));
        return ESP_OK;
    }
    esp_err_t ret = spi_bus_free(host_);
    if (ret == ESP_OK) {
        ESP_LOGD(kTag, "SPI host %d freed", static_cast<int>(host_));
    }
    return ret;
}

EspSdCard::~EspSdCard()
{
    if (device_added_) {
        ESP_ERROR_CHECK_WITHOUT_ABORT(sdspi_host_remove_device(handle_));
    }
    if (host_initialized_) {
        ESP_ERROR_CHECK_WITHOUT_ABORT(sdspi_host_deinit());
    }
}

esp_err_t EspSdCard::init(const EspSpiBus &bus, const BoardConfig &config)
{
    // Shared SPI contract: keep every CS line deasserted before SDSPI probing.
    deassert_cs(config.pin_idle_cs);
    deassert_cs(config.pin_cs);
    vTaskDelay(ticks_from_ms(5));

    esp_err_t ret = sdspi_host_init();
    if (ret != ESP_OK && ret != ESP_ERR_INVALID_STATE) {
        ESP_LOGE(kTag, "sdspi_host_init failed: %s", esp_err_to_name(ret));
        return ret;
    }
    host_initialized_ = true;

    sdspi_device_config_t dev_cfg = SDSPI_DEVICE_CONFIG_DEFAULT();
    dev_cfg.host_id = bus.host();
    dev_cfg.gpio_cs = static_cast<gpio_num_t>(config.pin_cs);
    ESP_RETURN_ON_ERROR(sdspi_host_init_device(&dev_cfg, &handle_), kTag, "sdspi_host_init_device failed");
    device_added_ = true;

    sdmmc_host_t host = SDSPI_HOST_DEFAULT();
    host.slot = handle_;
    host.max_freq_khz = static_cast<int>(config.clock_hz / 1000);
    ESP_RETURN_ON_ERROR(sdmmc_card_init(&host, &card_), kTag, "sdmmc_card_init failed");
    card_ready_ = true;

    ESP_LOGD(kTag, "card ready: %s, %d sectors of %d bytes", card_.cid.name, card_.csd.capacity,
             card_.csd.sector_size);
    return ESP_OK;
}

esp_err_t EspSdCard::block_count(uint64_t *count)
{
    ESP_RETURN_ON_FALSE(count != nullptr, ESP_ERR_INVALID_ARG, kTag, "count must not be null");
    ESP_RETURN_ON_FALSE(card_ready_, ESP_ERR_INVALID_STATE, kTag, "card not initialized");

    // CSD capacity is cached at init; CMD13 proves the card still answers.
    ESP_RETURN_ON_ERROR(sdmmc_get_status(&card_), kTag, "card status query failed");
    *count = static_cast<uint64_t>(card_.csd.capacity);
    return ESP_OK;
}

esp_err_t EspSdCard::read_blocks(uint32_t first, uint8_t *buffer, size_t count)
{
    ESP_RETURN_ON_FALSE(buffer != nullptr, ESP_ERR_INVALID_ARG, kTag, "buffer must not be null");
    ESP_RETURN_ON_FALSE(card_ready_, ESP_ERR_INVALID_STATE, kTag, "card not initialized");
    return sdmmc_read_sectors(&card_, buffer, first, count);
}

esp_err_t EspSdCard::write_blocks(uint32_t first, const uint8_t *buffer, size_t count)
{
    ESP_RETURN_ON_FALSE(buffer != nullptr, ESP_ERR_INVALID_ARG, kTag, "buffer must not be null");
    ESP_RETURN_ON_FALSE(card_ready_, ESP_ERR_INVALID_STATE, kTag, "card not initialized");
    return sdmmc_write_sectors(&card_, buffer, first, count);
}

uint32_t EspSdCard::block_size() const
{
    return card_ready_ ? static_cast<uint32_t>(card_.csd.sector_size) : kBlockSize;
}

esp_err_t EspPlatform::open_bus(const BoardConfig &config, std::unique_ptr<SpiBus> *bus)
{
    ESP_RETURN_ON_FALSE(bus != nullptr, ESP_ERR_INVALID_ARG, kTag, "bus must not be null");

    const auto host = static_cast<spi_host_device_t>(config.spi_host);
    spi_bus_config_t bus_cfg = {};
    bus_cfg.mosi_io_num = config.pin_mosi;
    bus_cfg.miso_io_num = config.pin_miso;
    bus_cfg.sclk_io_num = config.pin_sck;
    bus_cfg.quadwp_io_num = GPIO_NUM_NC;
    bus_cfg.quadhd_io_num = GPIO_NUM_NC;
    bus_cfg.max_transfer_sz = kMaxTransferSize;

    bool owned = true;
    esp_err_t ret = spi_bus_initialize(host, &bus_cfg, SPI_DMA_CH_AUTO);
    if (ret == ESP_ERR_INVALID_STATE) {
        ESP_LOGI(kTag, "SPI bus already initialized");
        owned = false;
        ret = ESP_OK;
    }
    ESP_RETURN_ON_ERROR(ret, kTag, "spi_bus_initialize failed");

    *bus = std::make_unique<EspSpiBus>(host, owned);
    return ESP_OK;
}

esp_err_t EspPlatform::open_card(SpiBus &bus, const BoardConfig &config, std::unique_ptr<BlockDevice> *card)
{
    ESP_RETURN_ON_FALSE(card != nullptr, ESP_ERR_INVALID_ARG, kTag, "card must not be null");

    auto sd_card = std::make_unique<EspSdCard>();
    // open_bus is the only producer of buses on this platform.
    ESP_RETURN_ON_ERROR(sd_card->init(static_cast<const EspSpiBus &>(bus), config), kTag, "card init failed");
    *card = std::move(sd_card);
    return ESP_OK;
}

std::unique_ptr<Volume> EspPlatform::create_volume(BlockDevice &card)
{
    return std::make_unique<FatVolume>(card);
}

}  // namespace sdmount
