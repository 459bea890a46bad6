#include "sdmount_fat_diskio.hpp"

#include <cinttypes>

#include "esp_check.h"
#include "esp_log.h"

namespace sdmount {
namespace {

constexpr const char *kTag = "sdmount_fs";

struct DiskSlot {
    BlockDevice *device = nullptr;
    bool read_only = false;
};

DiskSlot g_slots[FF_VOLUMES];

const ff_diskio_impl_t kBlockDeviceDiskio = {
    .init = &blockdev_initialize,
    .status = &blockdev_status,
    .read = &blockdev_read,
    .write = &blockdev_write,
    .ioctl = &blockdev_ioctl,
};

}  // namespace

esp_err_t fat_diskio_attach(BYTE pdrv, BlockDevice *device, bool read_only)
{
    ESP_RETURN_ON_FALSE(pdrv < FF_VOLUMES, ESP_ERR_INVALID_ARG, kTag, "drive %u out of range", pdrv);
    ESP_RETURN_ON_FALSE(device != nullptr, ESP_ERR_INVALID_ARG, kTag, "device must not be null");

    g_slots[pdrv] = {device, read_only};
    ff_diskio_register(pdrv, &kBlockDeviceDiskio);
    return ESP_OK;
}

void fat_diskio_detach(BYTE pdrv)
{
    if (pdrv >= FF_VOLUMES) {
        return;
    }
    ff_diskio_register(pdrv, nullptr);
    g_slots[pdrv] = {};
}

DSTATUS blockdev_status(unsigned char pdrv)
{
    if (pdrv >= FF_VOLUMES || g_slots[pdrv].device == nullptr) {
        return STA_NOINIT;
    }
    return g_slots[pdrv].read_only ? STA_PROTECT : 0;
}

DSTATUS blockdev_initialize(unsigned char pdrv)
{
    // The card was brought up by the session before the volume exists.
    return blockdev_status(pdrv);
}

DRESULT blockdev_read(unsigned char pdrv, unsigned char *buff, uint32_t sector, unsigned count)
{
    if (blockdev_status(pdrv) & STA_NOINIT) {
        return RES_NOTRDY;
    }
    esp_err_t ret = g_slots[pdrv].device->read_blocks(sector, buff, count);
    if (ret != ESP_OK) {
        ESP_LOGE(kTag, "read of %u blocks at %" PRIu32 " failed: %s", count, sector, esp_err_to_name(ret));
        return RES_ERROR;
    }
    return RES_OK;
}

DRESULT blockdev_write(unsigned char pdrv, const unsigned char *buff, uint32_t sector, unsigned count)
{
    const DSTATUS status = blockdev_status(pdrv);
    if (status & STA_NOINIT) {
        return RES_NOTRDY;
    }
    if (status & STA_PROTECT) {
        return RES_WRPRT;
    }
    esp_err_t ret = g_slots[pdrv].device->write_blocks(sector, buff, count);
    if (ret != ESP_OK) {
        ESP_LOGE(kTag, "write of %u blocks at %" PRIu32 " failed: %s", count, sector, esp_err_to_name(ret));
        return RES_ERROR;
    }
    return RES_OK;
}

DRESULT blockdev_ioctl(unsigned char pdrv, unsigned char cmd, void *buff)
{
    if (blockdev_status(pdrv) & STA_NOINIT) {
        return RES_NOTRDY;
    }
    BlockDevice &device = *g_slots[pdrv].device;
    switch (cmd) {
    case CTRL_SYNC:
        return RES_OK;
    case GET_SECTOR_COUNT: {
        uint64_t blocks = 0;
        if (device.block_count(&blocks) != ESP_OK) {
            return RES_ERROR;
        }
        *static_cast<LBA_t *>(buff) = static_cast<LBA_t>(blocks);
        return RES_OK;
    }
    case GET_SECTOR_SIZE:
        *static_cast<WORD *>(buff) = static_cast<WORD>(device.block_size());
        return RES_OK;
    case GET_BLOCK_SIZE:
        *static_cast<DWORD *>(buff) = 1;
        return RES_OK;
    default:
        return RES_PARERR;
    }
}

}  // namespace sdmount
