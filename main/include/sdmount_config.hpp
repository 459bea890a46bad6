#pragma once

#include <cstdint>

namespace sdmount {

struct BoardConfig {
    const char *name = "";
    int pin_sck = -1;
    int pin_mosi = -1;
    int pin_miso = -1;
    int pin_cs = -1;
    // Other chip select sharing the bus; held high while the card is probed. -1 if none.
    int pin_idle_cs = -1;
    int spi_host = 1;
    uint32_t clock_hz = 4000000;
    const char *mount_point = "/sd";
};

constexpr uint32_t kBlockSize = 512;

// Hardware timing minimums. Shorter values reproduce the lost-mount and
// pin-still-claimed failures on ESP32 boards; do not tune them down.
constexpr uint32_t kSettleDelayMs = 200;
constexpr uint32_t kReleaseDelayMs = 500;

constexpr uint32_t kDiagRateFloorMs = 500;
constexpr uint32_t kLeanRateFloorMs = 250;

constexpr uint32_t kDefaultMountTimeoutMs = 10000;
constexpr uint32_t kStabilityLoopDelayMs = 500;

// Board preset selected at build time through SDMOUNT_BOARD.
const BoardConfig &board_config();

}  // namespace sdmount
