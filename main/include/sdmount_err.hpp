#pragma once

#include "esp_err.h"

// Component error range, clear of the bases ESP-IDF components reserve.
#define SDMOUNT_ERR_BASE 0x1A000

#define SDMOUNT_ERR_BUS_INIT (SDMOUNT_ERR_BASE + 1)       /*!< SPI bus could not be constructed */
#define SDMOUNT_ERR_CARD_INIT (SDMOUNT_ERR_BASE + 2)      /*!< SD card handle could not be constructed */
#define SDMOUNT_ERR_NO_RESPONSE (SDMOUNT_ERR_BASE + 3)    /*!< card did not answer the block count query */
#define SDMOUNT_ERR_BAD_SIGNATURE (SDMOUNT_ERR_BASE + 4)  /*!< boot sector signature mismatch (advisory) */
#define SDMOUNT_ERR_MOUNT_FAILED (SDMOUNT_ERR_BASE + 5)   /*!< filesystem mount call failed */
#define SDMOUNT_ERR_DEADLINE (SDMOUNT_ERR_BASE + 6)       /*!< mount deadline exceeded */
#define SDMOUNT_ERR_READ_ONLY (SDMOUNT_ERR_BASE + 7)      /*!< write rejected by a read-only mount */
#define SDMOUNT_ERR_IO (SDMOUNT_ERR_BASE + 8)             /*!< generic filesystem I/O failure */
#define SDMOUNT_ERR_NOT_MOUNTED (SDMOUNT_ERR_BASE + 9)    /*!< operation needs a mounted card */

namespace sdmount {

// Names SDMOUNT_ERR_* codes; anything else goes through esp_err_to_name().
const char *sdmount_err_to_name(esp_err_t err);

// Maps a failed VFS write errno: EROFS (a write-protected FAT drive) becomes
// SDMOUNT_ERR_READ_ONLY, anything else SDMOUNT_ERR_IO.
esp_err_t sdmount_errno_to_err(int err);

}  // namespace sdmount
