#include "sdmount_err.hpp"

#include <cerrno>

namespace sdmount {

const char *sdmount_err_to_name(esp_err_t err)
{
    switch (err) {
    case SDMOUNT_ERR_BUS_INIT:
        return "SDMOUNT_ERR_BUS_INIT";
    case SDMOUNT_ERR_CARD_INIT:
        return "SDMOUNT_ERR_CARD_INIT";
    case SDMOUNT_ERR_NO_RESPONSE:
        return "SDMOUNT_ERR_NO_RESPONSE";
    case SDMOUNT_ERR_BAD_SIGNATURE:
        return "SDMOUNT_ERR_BAD_SIGNATURE";
    case SDMOUNT_ERR_MOUNT_FAILED:
        return "SDMOUNT_ERR_MOUNT_FAILED";
    case SDMOUNT_ERR_DEADLINE:
        return "SDMOUNT_ERR_DEADLINE";
    case SDMOUNT_ERR_READ_ONLY:
        return "SDMOUNT_ERR_READ_ONLY";
    case SDMOUNT_ERR_IO:
        return "SDMOUNT_ERR_IO";
    case SDMOUNT_ERR_NOT_MOUNTED:
        return "SDMOUNT_ERR_NOT_MOUNTED";
    default:
        return esp_err_to_name(err);
    }
}

esp_err_t sdmount_errno_to_err(int err)
{
    return err == EROFS ? SDMOUNT_ERR_READ_ONLY : SDMOUNT_ERR_IO;
}

}  // namespace sdmount
