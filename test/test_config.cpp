#include <gtest/gtest.h>

#include <cerrno>
#include <cstring>

#include "esp_log.h"

#include "sdmount_board_config.hpp"
#include "sdmount_config.hpp"
#include "sdmount_err.hpp"
#include "sdmount_verbosity.hpp"

namespace sdmount {
namespace {

TEST(BoardConfig, PresetFieldsArePopulated)
{
    const BoardConfig &cfg = board_config();
    ASSERT_NE(cfg.name, nullptr);
    ASSERT_NE(cfg.mount_point, nullptr);
    EXPECT_GT(std::strlen(cfg.name), 0u);
    EXPECT_EQ(cfg.mount_point[0], '/');
    EXPECT_GT(cfg.pin_sck, 0);
    EXPECT_GT(cfg.pin_mosi, 0);
    EXPECT_GT(cfg.pin_miso, 0);
    EXPECT_GT(cfg.pin_cs, 0);
    EXPECT_GT(cfg.clock_hz, 0u);
}

TEST(BoardConfig, MatchesSelectedPreset)
{
    const BoardConfig &cfg = board_config();
    EXPECT_EQ(cfg.pin_sck, SDMOUNT_SD_SCK);
    EXPECT_EQ(cfg.pin_mosi, SDMOUNT_SD_MOSI);
    EXPECT_EQ(cfg.pin_miso, SDMOUNT_SD_MISO);
    EXPECT_EQ(cfg.pin_cs, SDMOUNT_SD_CS);
    EXPECT_EQ(cfg.pin_idle_cs, SDMOUNT_IDLE_CS);
    EXPECT_EQ(cfg.spi_host, SDMOUNT_SPI_HOST);
    EXPECT_EQ(cfg.clock_hz, static_cast<uint32_t>(SDMOUNT_SD_BAUDRATE));
    EXPECT_STREQ(cfg.mount_point, SDMOUNT_MOUNT_POINT);
}

#if SDMOUNT_BOARD == SDMOUNT_BOARD_ESP32S3_DEVKITC
TEST(BoardConfig, DevKitCWiring)
{
    const BoardConfig &cfg = board_config();
    EXPECT_EQ(cfg.pin_sck, 12);
    EXPECT_EQ(cfg.pin_mosi, 11);
    EXPECT_EQ(cfg.pin_miso, 13);
    EXPECT_EQ(cfg.pin_cs, 16);
    EXPECT_EQ(cfg.clock_hz, 4000000u);
    EXPECT_STREQ(cfg.mount_point, "/sd");
}
#endif

TEST(BoardConfig, TimingConstantsAreNotTunedDown)
{
    EXPECT_GE(kSettleDelayMs, 200u);
    EXPECT_GE(kReleaseDelayMs, 500u);
    EXPECT_EQ(kDiagRateFloorMs, 500u);
    EXPECT_EQ(kLeanRateFloorMs, 250u);
    EXPECT_EQ(kDefaultMountTimeoutMs, 10000u);
}

TEST(Verbosity, ParsesKnownNames)
{
    Verbosity level = Verbosity::Diags;
    EXPECT_TRUE(parse_verbosity("silent", &level));
    EXPECT_EQ(level, Verbosity::Silent);
    EXPECT_TRUE(parse_verbosity("debug", &level));
    EXPECT_EQ(level, Verbosity::Debug);
    EXPECT_TRUE(parse_verbosity("diags", &level));
    EXPECT_EQ(level, Verbosity::Diags);
}

TEST(Verbosity, RejectsUnknownNames)
{
    Verbosity level = Verbosity::Debug;
    EXPECT_FALSE(parse_verbosity("loud", &level));
    EXPECT_FALSE(parse_verbosity(nullptr, &level));
    EXPECT_EQ(level, Verbosity::Debug);
}

TEST(Verbosity, NamesRoundTrip)
{
    for (Verbosity v : {Verbosity::Silent, Verbosity::Diags, Verbosity::Debug}) {
        Verbosity parsed = Verbosity::Silent;
        ASSERT_TRUE(parse_verbosity(verbosity_name(v), &parsed));
        EXPECT_EQ(parsed, v);
    }
}

TEST(Verbosity, SilentLeavesOutcomeTagVisible)
{
    esp_log_level_set(kOutcomeTag, ESP_LOG_INFO);
    apply_verbosity(Verbosity::Silent);
    EXPECT_EQ(esp_log_level_get("sdmount_session"), ESP_LOG_WARN);
    EXPECT_EQ(esp_log_level_get("sdmount_fs"), ESP_LOG_WARN);
    EXPECT_EQ(esp_log_level_get(kOutcomeTag), ESP_LOG_INFO);

    apply_verbosity(Verbosity::Debug);
    EXPECT_EQ(esp_log_level_get("sdmount_session"), ESP_LOG_DEBUG);
    apply_verbosity(Verbosity::Diags);
}

TEST(ErrorNames, ComponentCodes)
{
    EXPECT_STREQ(sdmount_err_to_name(SDMOUNT_ERR_BUS_INIT), "SDMOUNT_ERR_BUS_INIT");
    EXPECT_STREQ(sdmount_err_to_name(SDMOUNT_ERR_DEADLINE), "SDMOUNT_ERR_DEADLINE");
    EXPECT_STREQ(sdmount_err_to_name(SDMOUNT_ERR_READ_ONLY), "SDMOUNT_ERR_READ_ONLY");
    EXPECT_STREQ(sdmount_err_to_name(SDMOUNT_ERR_NOT_MOUNTED), "SDMOUNT_ERR_NOT_MOUNTED");
}

TEST(ErrorNames, WriteProtectErrnoMeansReadOnly)
{
    EXPECT_EQ(sdmount_errno_to_err(EROFS), SDMOUNT_ERR_READ_ONLY);
    EXPECT_EQ(sdmount_errno_to_err(EIO), SDMOUNT_ERR_IO);
    EXPECT_EQ(sdmount_errno_to_err(ENOSPC), SDMOUNT_ERR_IO);
    EXPECT_EQ(sdmount_errno_to_err(EACCES), SDMOUNT_ERR_IO);
    EXPECT_EQ(sdmount_errno_to_err(0), SDMOUNT_ERR_IO);
}

TEST(ErrorNames, FallsBackToEspNames)
{
    EXPECT_STREQ(sdmount_err_to_name(ESP_OK), esp_err_to_name(ESP_OK));
    EXPECT_STREQ(sdmount_err_to_name(ESP_ERR_TIMEOUT), esp_err_to_name(ESP_ERR_TIMEOUT));
}

}  // namespace
}  // namespace sdmount
