#include "sdmount_diag.hpp"

#include <cinttypes>
#include <cstdio>
#include <cstring>
#include <vector>

#include "esp_check.h"
#include "esp_log.h"
#include "sdmount_err.hpp"

namespace sdmount {
namespace {

constexpr const char *kTag = "sdmount_diag";

struct PartitionLabel {
    uint8_t type;
    const char *name;
};

constexpr PartitionLabel kPartitionLabels[] = {
    {0x01, "FAT12"},
    {0x04, "FAT16 <32MB"},
    {0x06, "FAT16"},
    {0x07, "NTFS/exFAT"},
    {0x0B, "FAT32"},
    {0x0C, "FAT32 LBA"},
    {0x0E, "FAT16 LBA"},
    {0x83, "Linux"},
};

}  // namespace

void parse_boot_sector(const uint8_t *sector, size_t len, BootSectorInfo *info)
{
    if (info == nullptr) {
        return;
    }
    *info = {};
    if (sector == nullptr || len < kBootSignatureOffset + 2) {
        return;
    }

    info->read_ok = true;
    info->signature = static_cast<uint16_t>((sector[kBootSignatureOffset + 1] << 8) | sector[kBootSignatureOffset]);
    info->signature_valid = info->signature == kBootSignature;
    info->partition_type = sector[kPartitionTypeOffset];
}

const char *partition_type_name(uint8_t type)
{
    for (const PartitionLabel &label : kPartitionLabels) {
        if (label.type == type) {
            return label.name;
        }
    }
    return "Unknown";
}

void format_hex(const uint8_t *data, size_t len, char *out, size_t out_len)
{
    if (out == nullptr || out_len == 0) {
        return;
    }
    out[0] = '\0';
    if (data == nullptr) {
        return;
    }

    size_t pos = 0;
    for (size_t i = 0; i < len; ++i) {
        // "XX" plus a separator, and room for the terminator.
        if (pos + 3 + 1 > out_len) {
            break;
        }
        pos += static_cast<size_t>(std::snprintf(out + pos, out_len - pos, i == 0 ? "%02X" : " %02X", data[i]));
    }
}

esp_err_t diag_check_communication(BlockDevice &card, CardInfo *info)
{
    ESP_RETURN_ON_FALSE(info != nullptr, ESP_ERR_INVALID_ARG, kTag, "info must not be null");
    *info = {};

    ESP_LOGD(kTag, "getting block count...");
    uint64_t blocks = 0;
    esp_err_t ret = card.block_count(&blocks);
    if (ret != ESP_OK) {
        ESP_LOGE(kTag, "communication test failed: %s", esp_err_to_name(ret));
        return ret;
    }

    info->block_count = blocks;
    info->block_size = card.block_size();
    info->capacity_bytes = blocks * info->block_size;

    const double capacity_mb = static_cast<double>(info->capacity_bytes) / (1024.0 * 1024.0);
    ESP_LOGI(kTag, "block count: %" PRIu64, blocks);
    ESP_LOGI(kTag, "capacity: %.2f MB (%.2f GB)", capacity_mb, capacity_mb / 1024.0);
    return ESP_OK;
}

esp_err_t diag_check_boot_sector(BlockDevice &card, BootSectorInfo *info)
{
    ESP_RETURN_ON_FALSE(info != nullptr, ESP_ERR_INVALID_ARG, kTag, "info must not be null");
    *info = {};

    ESP_LOGI(kTag, "reading boot sector (block 0)...");
    std::vector<uint8_t> sector(card.block_size(), 0);
    esp_err_t ret = card.read_blocks(0, sector.data(), 1);
    if (ret != ESP_OK) {
        ESP_LOGW(kTag, "boot sector read failed: %s", esp_err_to_name(ret));
        return ret;
    }

    parse_boot_sector(sector.data(), sector.size(), info);
    if (!info->read_ok) {
        ESP_LOGW(kTag, "block size %u too small for a boot sector", static_cast<unsigned>(sector.size()));
        return SDMOUNT_ERR_BAD_SIGNATURE;
    }
    ESP_LOGD(kTag, "signature bytes: 0x%02X 0x%02X", sector[kBootSignatureOffset], sector[kBootSignatureOffset + 1]);

    if (!info->signature_valid) {
        ESP_LOGW(kTag, "invalid boot signature: 0x%04X (expected 0x%04X)", info->signature, kBootSignature);
        return SDMOUNT_ERR_BAD_SIGNATURE;
    }
    ESP_LOGI(kTag, "valid boot signature: 0x%04X", info->signature);

    ESP_LOGD(kTag, "partition type byte (%u): 0x%02X", static_cast<unsigned>(kPartitionTypeOffset),
             info->partition_type);
    if (std::strcmp(partition_type_name(info->partition_type), "Unknown") == 0) {
        ESP_LOGI(kTag, "partition type: Unknown (0x%02X)", info->partition_type);
    } else {
        ESP_LOGI(kTag, "partition type: %s", partition_type_name(info->partition_type));
    }
    return ESP_OK;
}

esp_err_t diag_check_block_read(BlockDevice &card, uint32_t block, BlockProbe *probe)
{
    ESP_RETURN_ON_FALSE(probe != nullptr, ESP_ERR_INVALID_ARG, kTag, "probe must not be null");
    *probe = {};
    probe->block = block;

    ESP_LOGI(kTag, "testing multi-block read...");
    std::vector<uint8_t> buffer(card.block_size(), 0);
    ESP_LOGD(kTag, "reading block %" PRIu32 "...", block);
    esp_err_t ret = card.read_blocks(block, buffer.data(), 1);
    if (ret != ESP_OK) {
        ESP_LOGW(kTag, "multi-block read failed: %s", esp_err_to_name(ret));
        return ret;
    }

    probe->read_ok = true;
    const size_t head_len = buffer.size() < kProbeHeadBytes ? buffer.size() : kProbeHeadBytes;
    std::memcpy(probe->head, buffer.data(), head_len);

    char hex[kProbeHeadBytes * 3 + 1];
    format_hex(probe->head, head_len, hex, sizeof(hex));
    ESP_LOGD(kTag, "first %u bytes: %s", static_cast<unsigned>(head_len), hex);
    ESP_LOGI(kTag, "multi-block read successful");
    return ESP_OK;
}

}  // namespace sdmount
