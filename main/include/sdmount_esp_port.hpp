#pragma once

#include <memory>

#include "driver/sdspi_host.h"
#include "driver/spi_master.h"
#include "sdmmc_cmd.h"
#include "sdmount_port.hpp"

namespace sdmount {

class EspClock : public Clock
{
public:
    int64_t now_us() override;
    void sleep_us(int64_t us) override;
};

class EspSpiBus : public SpiBus
{
public:
    // owned is false when another driver had already initialized the host;
    // release() then leaves the bus alone.
    EspSpiBus(spi_host_device_t host, bool owned);
    ~EspSpiBus() override;

    EspSpiBus(const EspSpiBus &) = delete;
    EspSpiBus &operator=(const EspSpiBus &) = delete;

    esp_err_t release() override;
    spi_host_device_t host() const { return host_; }

private:
    spi_host_device_t host_;
    bool owned_;
    bool released_ = false;
};

class EspSdCard : public BlockDevice
{
public:
    EspSdCard() = default;
    ~EspSdCard() override;

    EspSdCard(const EspSdCard &) = delete;
    EspSdCard &operator=(const EspSdCard &) = delete;

    esp_err_t init(const EspSpiBus &bus, const BoardConfig &config);

    esp_err_t block_count(uint64_t *count) override;
    esp_err_t read_blocks(uint32_t first, uint8_t *buffer, size_t count) override;
    esp_err_t write_blocks(uint32_t first, const uint8_t *buffer, size_t count) override;
    uint32_t block_size() const override;

private:
    sdspi_dev_handle_t handle_ = -1;
    bool host_initialized_ = false;
    bool device_added_ = false;
    bool card_ready_ = false;
    sdmmc_card_t card_ = {};
};

class EspPlatform : public Platform
{
public:
    Clock &clock() override { return clock_; }
    esp_err_t open_bus(const BoardConfig &config, std::unique_ptr<SpiBus> *bus) override;
    esp_err_t open_card(SpiBus &bus, const BoardConfig &config, std::unique_ptr<BlockDevice> *card) override;
    std::unique_ptr<Volume> create_volume(BlockDevice &card) override;

private:
    EspClock clock_;
};

}  // namespace sdmount
