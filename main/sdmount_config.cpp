#include "sdmount_config.hpp"

#include "sdmount_board_config.hpp"

namespace sdmount {

const BoardConfig &board_config()
{
    static const BoardConfig kConfig = {
        .name = SDMOUNT_BOARD_NAME,
        .pin_sck = SDMOUNT_SD_SCK,
        .pin_mosi = SDMOUNT_SD_MOSI,
        .pin_miso = SDMOUNT_SD_MISO,
        .pin_cs = SDMOUNT_SD_CS,
        .pin_idle_cs = SDMOUNT_IDLE_CS,
        .spi_host = SDMOUNT_SPI_HOST,
        .clock_hz = SDMOUNT_SD_BAUDRATE,
        .mount_point = SDMOUNT_MOUNT_POINT,
    };
    return kConfig;
}

}  // namespace sdmount
