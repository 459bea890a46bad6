#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "esp_err.h"
#include "sdmount_config.hpp"

namespace sdmount {

// Seams between the mount sequencer and the hardware. The ESP-IDF
// implementations live in sdmount_esp_port.hpp and sdmount_fat_volume.hpp.

class Clock
{
public:
    virtual ~Clock() = default;

    virtual int64_t now_us() = 0;
    virtual void sleep_us(int64_t us) = 0;

    void sleep_ms(uint32_t ms) { sleep_us(static_cast<int64_t>(ms) * 1000); }
};

class SpiBus
{
public:
    virtual ~SpiBus() = default;

    // Frees the bus lines. Returns ESP_ERR_INVALID_STATE if already released.
    virtual esp_err_t release() = 0;
};

class BlockDevice
{
public:
    virtual ~BlockDevice() = default;

    virtual esp_err_t block_count(uint64_t *count) = 0;
    virtual esp_err_t read_blocks(uint32_t first, uint8_t *buffer, size_t count) = 0;
    virtual esp_err_t write_blocks(uint32_t first, const uint8_t *buffer, size_t count) = 0;
    virtual uint32_t block_size() const { return kBlockSize; }
};

struct VolumeStats {
    uint32_t block_size = 0;
    uint64_t total_blocks = 0;
    uint64_t free_blocks = 0;
};

// A filesystem view over a BlockDevice. Paths are absolute VFS paths
// (mount point included). Write failures caused by a read-only mount are
// reported as SDMOUNT_ERR_READ_ONLY, other I/O failures as SDMOUNT_ERR_IO.
class Volume
{
public:
    virtual ~Volume() = default;

    virtual esp_err_t mount(const char *path, bool read_only) = 0;
    // Returns ESP_ERR_INVALID_STATE if nothing is mounted.
    virtual esp_err_t unmount() = 0;
    virtual bool is_mounted() const = 0;

    virtual esp_err_t stats(VolumeStats *out) = 0;
    virtual esp_err_t list_dir(const char *path, std::vector<std::string> *names) = 0;
    virtual esp_err_t file_size(const char *path, uint64_t *size) = 0;
    virtual esp_err_t write_file(const char *path, const std::string &data, bool append) = 0;
    virtual esp_err_t read_file(const char *path, std::string *data) = 0;
};

class Platform
{
public:
    virtual ~Platform() = default;

    virtual Clock &clock() = 0;
    virtual esp_err_t open_bus(const BoardConfig &config, std::unique_ptr<SpiBus> *bus) = 0;
    virtual esp_err_t open_card(SpiBus &bus, const BoardConfig &config, std::unique_ptr<BlockDevice> *card) = 0;
    virtual std::unique_ptr<Volume> create_volume(BlockDevice &card) = 0;
};

}  // namespace sdmount
