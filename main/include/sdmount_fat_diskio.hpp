#pragma once

#include "diskio_impl.h"
#include "esp_err.h"
#include "sdmount_port.hpp"

namespace sdmount {

// FatFs diskio driver that routes a physical drive to a BlockDevice.
// Contract: a drive attached read-only reports STA_PROTECT and refuses every
// write with RES_WRPRT, so FatFs fails writes with FR_WRITE_PROTECTED.
esp_err_t fat_diskio_attach(BYTE pdrv, BlockDevice *device, bool read_only);
void fat_diskio_detach(BYTE pdrv);

// Callbacks behind the registered ff_diskio_impl_t.
DSTATUS blockdev_initialize(unsigned char pdrv);
DSTATUS blockdev_status(unsigned char pdrv);
DRESULT blockdev_read(unsigned char pdrv, unsigned char *buff, uint32_t sector, unsigned count);
DRESULT blockdev_write(unsigned char pdrv, const unsigned char *buff, uint32_t sector, unsigned count);
DRESULT blockdev_ioctl(unsigned char pdrv, unsigned char cmd, void *buff);

}  // namespace sdmount
