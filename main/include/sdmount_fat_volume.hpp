#pragma once

#include <string>
#include <vector>

#include "ff.h"
#include "sdmount_port.hpp"

namespace sdmount {

// FatFs volume registered in the ESP-IDF VFS. The FatFs drive is backed by a
// BlockDevice through a diskio driver; a read-only mount reports STA_PROTECT
// so FatFs itself rejects every write with FR_WRITE_PROTECTED (errno EROFS).
class FatVolume : public Volume
{
public:
    explicit FatVolume(BlockDevice &device);
    ~FatVolume() override;

    FatVolume(const FatVolume &) = delete;
    FatVolume &operator=(const FatVolume &) = delete;

    esp_err_t mount(const char *path, bool read_only) override;
    esp_err_t unmount() override;
    bool is_mounted() const override { return mounted_; }

    esp_err_t stats(VolumeStats *out) override;
    esp_err_t list_dir(const char *path, std::vector<std::string> *names) override;
    esp_err_t file_size(const char *path, uint64_t *size) override;
    esp_err_t write_file(const char *path, const std::string &data, bool append) override;
    esp_err_t read_file(const char *path, std::string *data) override;

private:
    BlockDevice &device_;
    std::string base_path_;
    char drive_[3] = {};
    BYTE pdrv_ = 0xFF;
    FATFS *fs_ = nullptr;
    bool mounted_ = false;
};

}  // namespace sdmount
