#include "sdmount_fat_volume.hpp"

#include <cerrno>
#include <cinttypes>
#include <cstdio>
#include <cstring>
#include <dirent.h>
#include <sys/stat.h>

#include "esp_check.h"
#include "esp_log.h"
#include "esp_vfs_fat.h"
#include "sdmount_err.hpp"
#include "sdmount_fat_diskio.hpp"

namespace sdmount {
namespace {

constexpr const char *kTag = "sdmount_fs";
constexpr size_t kMaxOpenFiles = 5;

}  // namespace

FatVolume::FatVolume(BlockDevice &device) : device_(device) {}

FatVolume::~FatVolume()
{
    if (mounted_) {
        ESP_ERROR_CHECK_WITHOUT_ABORT(unmount());
    }
}

esp_err_t FatVolume::mount(const char *path, bool read_only)
{
    ESP_RETURN_ON_FALSE(path != nullptr, ESP_ERR_INVALID_ARG, kTag, "path must not be null");
    ESP_RETURN_ON_FALSE(!mounted_, ESP_ERR_INVALID_STATE, kTag, "volume already mounted");

    BYTE pdrv = FF_DRV_NOT_USED;
    ESP_RETURN_ON_ERROR(ff_diskio_get_drive(&pdrv), kTag, "no free FatFs drive");

    ESP_RETURN_ON_ERROR(fat_diskio_attach(pdrv, &device_, read_only), kTag, "diskio attach failed");
    drive_[0] = static_cast<char>('0' + pdrv);
    drive_[1] = ':';
    drive_[2] = '\0';

    esp_err_t ret = esp_vfs_fat_register(path, drive_, kMaxOpenFiles, &fs_);
    if (ret != ESP_OK) {
        ESP_LOGE(kTag, "esp_vfs_fat_register(%s) failed: %s", path, esp_err_to_name(ret));
        fat_diskio_detach(pdrv);
        fs_ = nullptr;
        return ret;
    }

    FRESULT fr = f_mount(fs_, drive_, 1);
    if (fr != FR_OK) {
        ESP_LOGE(kTag, "f_mount failed (%d)", static_cast<int>(fr));
        ESP_ERROR_CHECK_WITHOUT_ABORT(esp_vfs_fat_unregister_path(path));
        fat_diskio_detach(pdrv);
        fs_ = nullptr;
        return fr == FR_NO_FILESYSTEM ? ESP_ERR_NOT_FOUND : ESP_FAIL;
    }

    pdrv_ = pdrv;
    base_path_ = path;
    mounted_ = true;
    ESP_LOGD(kTag, "FAT volume %s mounted at %s (%s)", drive_, path, read_only ? "read-only" : "read-write");
    return ESP_OK;
}

esp_err_t FatVolume::unmount()
{
    if (!mounted_) {
        return ESP_ERR_INVALID_STATE;
    }

    FRESULT fr = f_mount(nullptr, drive_, 0);
    if (fr != FR_OK) {
        ESP_LOGW(kTag, "f_unmount returned %d", static_cast<int>(fr));
    }
    fat_diskio_detach(pdrv_);
    esp_err_t ret = esp_vfs_fat_unregister_path(base_path_.c_str());

    mounted_ = false;
    fs_ = nullptr;
    pdrv_ = FF_DRV_NOT_USED;
    return ret;
}

esp_err_t FatVolume::stats(VolumeStats *out)
{
    ESP_RETURN_ON_FALSE(out != nullptr, ESP_ERR_INVALID_ARG, kTag, "out must not be null");
    ESP_RETURN_ON_FALSE(mounted_, ESP_ERR_INVALID_STATE, kTag, "volume not mounted");

    DWORD free_clusters = 0;
    FATFS *fs = nullptr;
    FRESULT fr = f_getfree(drive_, &free_clusters, &fs);
    if (fr != FR_OK) {
        ESP_LOGE(kTag, "f_getfree failed (%d)", static_cast<int>(fr));
        return SDMOUNT_ERR_IO;
    }

#if FF_MAX_SS != FF_MIN_SS
    const uint32_t sector_size = fs->ssize;
#else
    const uint32_t sector_size = FF_MAX_SS;
#endif
    out->block_size = static_cast<uint32_t>(fs->csize) * sector_size;
    out->total_blocks = fs->n_fatent - 2;
    out->free_blocks = free_clusters;
    return ESP_OK;
}

esp_err_t FatVolume::list_dir(const char *path, std::vector<std::string> *names)
{
    ESP_RETURN_ON_FALSE(path != nullptr && names != nullptr, ESP_ERR_INVALID_ARG, kTag, "invalid argument");
    names->clear();

    DIR *dir = opendir(path);
    if (dir == nullptr) {
        const int err = errno;
        ESP_LOGW(kTag, "unable to open %s (errno %d)", path, err);
        return err == ENOENT ? ESP_ERR_NOT_FOUND : SDMOUNT_ERR_IO;
    }

    struct dirent *entry = nullptr;
    while ((entry = readdir(dir)) != nullptr) {
        if (strcmp(entry->d_name, ".") == 0 || strcmp(entry->d_name, "..") == 0) {
            continue;
        }
        names->emplace_back(entry->d_name);
    }
    closedir(dir);
    return ESP_OK;
}

esp_err_t FatVolume::file_size(const char *path, uint64_t *size)
{
    ESP_RETURN_ON_FALSE(path != nullptr && size != nullptr, ESP_ERR_INVALID_ARG, kTag, "invalid argument");

    struct stat st = {};
    if (stat(path, &st) != 0) {
        return errno == ENOENT ? ESP_ERR_NOT_FOUND : SDMOUNT_ERR_IO;
    }
    *size = static_cast<uint64_t>(st.st_size);
    return ESP_OK;
}

esp_err_t FatVolume::write_file(const char *path, const std::string &data, bool append)
{
    ESP_RETURN_ON_FALSE(path != nullptr, ESP_ERR_INVALID_ARG, kTag, "path must not be null");

    FILE *f = fopen(path, append ? "a" : "w");
    if (f == nullptr) {
        const int err = errno;
        ESP_LOGD(kTag, "fopen(%s) for write failed: %s", path, strerror(err));
        return sdmount_errno_to_err(err);
    }

    const size_t written = fwrite(data.data(), 1, data.size(), f);
    int err = written == data.size() ? 0 : errno;
    if (fclose(f) != 0 && err == 0) {
        err = errno;
    }
    if (written != data.size() || err != 0) {
        ESP_LOGD(kTag, "write to %s failed: %s", path, strerror(err));
        return sdmount_errno_to_err(err);
    }
    return ESP_OK;
}

esp_err_t FatVolume::read_file(const char *path, std::string *data)
{
    ESP_RETURN_ON_FALSE(path != nullptr && data != nullptr, ESP_ERR_INVALID_ARG, kTag, "invalid argument");
    data->clear();

    FILE *f = fopen(path, "r");
    if (f == nullptr) {
        return errno == ENOENT ? ESP_ERR_NOT_FOUND : SDMOUNT_ERR_IO;
    }

    char chunk[128];
    size_t n = 0;
    while ((n = fread(chunk, 1, sizeof(chunk), f)) > 0) {
        data->append(chunk, n);
    }
    const bool failed = ferror(f) != 0;
    fclose(f);
    return failed ? SDMOUNT_ERR_IO : ESP_OK;
}

}  // namespace sdmount
