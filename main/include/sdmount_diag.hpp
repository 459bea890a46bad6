#pragma once

#include <cstddef>
#include <cstdint>

#include "esp_err.h"
#include "sdmount_port.hpp"

namespace sdmount {

constexpr size_t kBootSignatureOffset = 510;
constexpr uint16_t kBootSignature = 0xAA55;  // bytes 55 AA, little endian
// Type byte of the first partition entry (0x1BE + 4).
constexpr size_t kPartitionTypeOffset = 450;
constexpr size_t kProbeHeadBytes = 16;

struct CardInfo {
    uint64_t block_count = 0;
    uint32_t block_size = kBlockSize;
    uint64_t capacity_bytes = 0;
};

struct BootSectorInfo {
    bool read_ok = false;
    bool signature_valid = false;
    uint16_t signature = 0;
    uint8_t partition_type = 0;
};

struct BlockProbe {
    bool read_ok = false;
    uint32_t block = 0;
    uint8_t head[kProbeHeadBytes] = {};
};

// Pure helpers, no I/O.
void parse_boot_sector(const uint8_t *sector, size_t len, BootSectorInfo *info);
const char *partition_type_name(uint8_t type);
void format_hex(const uint8_t *data, size_t len, char *out, size_t out_len);

// Queries the block count. Any driver error means the card is not talking.
esp_err_t diag_check_communication(BlockDevice &card, CardInfo *info);

// Reads block 0 and checks the boot signature. Returns ESP_OK when valid,
// SDMOUNT_ERR_BAD_SIGNATURE on mismatch, or the driver error if the read failed.
esp_err_t diag_check_boot_sector(BlockDevice &card, BootSectorInfo *info);

// Single-block read smoke test; keeps the first bytes for the debug dump.
esp_err_t diag_check_block_read(BlockDevice &card, uint32_t block, BlockProbe *probe);

}  // namespace sdmount
