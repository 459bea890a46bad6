#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "fake_platform.hpp"
#include "sdmount_err.hpp"
#include "sdmount_session.hpp"

namespace sdmount {
namespace {

class QueryTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        ASSERT_EQ(sd_session_init(&session_, &platform_, fakes::test_board()), ESP_OK);
        hw_.files["/sd/a.txt"] = "alpha";
        hw_.files["/sd/b.log"] = "bravo!";
        hw_.files["/sd/logs/c.txt"] = "nested";
    }

    void mount(bool read_only = true)
    {
        MountOptions options;
        options.read_only = read_only;
        ASSERT_EQ(sd_mount(&session_, options), ESP_OK);
    }

    fakes::FakePlatform platform_;
    fakes::FakeHardware &hw_ = platform_.hw;
    SdSession session_;
};

TEST_F(QueryTest, StatsBeforeMountFail)
{
    SdStats stats;
    stats.total_mb = 99;
    EXPECT_EQ(sd_get_stats(&session_, &stats), SDMOUNT_ERR_NOT_MOUNTED);
    EXPECT_EQ(stats.total_mb, 0u);
    EXPECT_EQ(stats.used_mb, 0u);
    EXPECT_EQ(stats.free_mb, 0u);
}

TEST_F(QueryTest, StatsInWholeMegabytes)
{
    mount();
    SdStats stats;
    ASSERT_EQ(sd_get_stats(&session_, &stats), ESP_OK);
    // 32 KiB clusters: 100000 total, 60000 free.
    EXPECT_EQ(stats.total_mb, 3125u);
    EXPECT_EQ(stats.free_mb, 1875u);
    EXPECT_EQ(stats.used_mb, 1250u);
}

TEST_F(QueryTest, StatsRoundDown)
{
    hw_.volume_stats = {512, 3000, 1000};
    mount();
    SdStats stats;
    ASSERT_EQ(sd_get_stats(&session_, &stats), ESP_OK);
    EXPECT_EQ(stats.total_mb, 1u);
    EXPECT_EQ(stats.free_mb, 0u);
    EXPECT_EQ(stats.used_mb, 0u);
}

TEST_F(QueryTest, StatsFailureYieldsZeroes)
{
    mount();
    hw_.stats_err = ESP_FAIL;
    SdStats stats;
    EXPECT_EQ(sd_get_stats(&session_, &stats), SDMOUNT_ERR_IO);
    EXPECT_EQ(stats.total_mb, 0u);
}

TEST_F(QueryTest, ConsecutiveOperationsAreThrottled)
{
    mount();
    SdStats stats;
    const int64_t first = hw_.clock.now_us();
    ASSERT_EQ(sd_get_stats(&session_, &stats), ESP_OK);
    EXPECT_EQ(hw_.clock.now_us(), first);

    std::vector<std::string> names;
    ASSERT_EQ(sd_list_files(&session_, nullptr, &names), ESP_OK);
    EXPECT_EQ(hw_.clock.now_us() - first, static_cast<int64_t>(kDiagRateFloorMs) * 1000);
}

TEST_F(QueryTest, LeanFloorIsShorter)
{
    ASSERT_EQ(sd_session_init(&session_, &platform_, fakes::test_board(), kLeanRateFloorMs), ESP_OK);
    mount();
    SdStats stats;
    ASSERT_EQ(sd_get_stats(&session_, &stats), ESP_OK);
    const int64_t before = hw_.clock.now_us();
    ASSERT_EQ(sd_get_stats(&session_, &stats), ESP_OK);
    EXPECT_EQ(hw_.clock.now_us() - before, static_cast<int64_t>(kLeanRateFloorMs) * 1000);
}

TEST_F(QueryTest, SpacedOperationsDoNotWait)
{
    mount();
    SdStats stats;
    ASSERT_EQ(sd_get_stats(&session_, &stats), ESP_OK);
    hw_.clock.advance_ms(600);
    const int64_t before = hw_.clock.now_us();
    ASSERT_EQ(sd_get_stats(&session_, &stats), ESP_OK);
    EXPECT_EQ(hw_.clock.now_us(), before);
}

TEST_F(QueryTest, ListsRootByDefault)
{
    mount();
    std::vector<std::string> names;
    ASSERT_EQ(sd_list_files(&session_, nullptr, &names), ESP_OK);
    EXPECT_EQ(names, (std::vector<std::string>{"a.txt", "b.log"}));

    ASSERT_EQ(sd_list_files(&session_, "", &names), ESP_OK);
    EXPECT_EQ(names.size(), 2u);
}

TEST_F(QueryTest, ListsSubdirectory)
{
    mount();
    std::vector<std::string> names;
    ASSERT_EQ(sd_list_files(&session_, "/sd/logs", &names), ESP_OK);
    EXPECT_EQ(names, (std::vector<std::string>{"c.txt"}));
}

TEST_F(QueryTest, ListFailureYieldsEmptyList)
{
    mount();
    hw_.list_err = ESP_ERR_NOT_FOUND;
    std::vector<std::string> names = {"stale"};
    EXPECT_EQ(sd_list_files(&session_, nullptr, &names), SDMOUNT_ERR_IO);
    EXPECT_TRUE(names.empty());
}

TEST_F(QueryTest, ListBeforeMountFails)
{
    std::vector<std::string> names = {"stale"};
    EXPECT_EQ(sd_list_files(&session_, nullptr, &names), SDMOUNT_ERR_NOT_MOUNTED);
    EXPECT_TRUE(names.empty());
    EXPECT_EQ(hw_.list_calls, 0);
}

TEST_F(QueryTest, PrintInfo)
{
    EXPECT_EQ(sd_print_info(&session_), SDMOUNT_ERR_NOT_MOUNTED);
    mount();
    EXPECT_EQ(sd_print_info(&session_), ESP_OK);
    EXPECT_EQ(hw_.list_calls, 1);
}

TEST_F(QueryTest, PrintInfoOnEmptyCard)
{
    hw_.files.clear();
    mount();
    EXPECT_EQ(sd_print_info(&session_), ESP_OK);
}

TEST_F(QueryTest, PrintInfoListFailure)
{
    mount();
    hw_.list_err = ESP_FAIL;
    EXPECT_EQ(sd_print_info(&session_), SDMOUNT_ERR_IO);
}

TEST_F(QueryTest, SmokeTestOnWritableMount)
{
    mount(false);
    std::string readback;
    EXPECT_EQ(sd_test(&session_, {}, &readback), ESP_OK);
    EXPECT_EQ(readback, "Hello");
    EXPECT_EQ(hw_.files[sd_test_file_path(session_)], "Hello");
}

TEST_F(QueryTest, SmokeTestOverwritesPreviousContent)
{
    hw_.files["/sd/test.txt"] = "Hello from an earlier run";
    mount(false);
    std::string readback;
    EXPECT_EQ(sd_test(&session_, {}, &readback), ESP_OK);
    EXPECT_EQ(readback, "Hello");
}

TEST_F(QueryTest, SmokeTestOnReadOnlyMount)
{
    mount();
    EXPECT_EQ(sd_test(&session_), SDMOUNT_ERR_READ_ONLY);
    EXPECT_EQ(hw_.files.count("/sd/test.txt"), 0u);
}

TEST_F(QueryTest, SmokeTestWriteError)
{
    mount(false);
    hw_.write_err = ESP_FAIL;
    EXPECT_EQ(sd_test(&session_), SDMOUNT_ERR_IO);
}

TEST_F(QueryTest, SmokeTestBeforeMount)
{
    EXPECT_EQ(sd_test(&session_), SDMOUNT_ERR_NOT_MOUNTED);
}

TEST_F(QueryTest, SlowSmokeTestAppendsLines)
{
    mount(false);
    SmokeTestOptions options;
    options.slow = true;
    options.count = 3;
    options.interval_ms = 1000;

    const int64_t before = hw_.clock.now_us();
    ASSERT_EQ(sd_test(&session_, options), ESP_OK);
    EXPECT_EQ(hw_.files["/sd/test.txt"], "Slow test 1/3\nSlow test 2/3\nSlow test 3/3\n");
    EXPECT_GE(hw_.clock.now_us() - before, 3000000);
}

TEST_F(QueryTest, SlowSmokeTestOnReadOnlyMount)
{
    mount();
    SmokeTestOptions options;
    options.slow = true;
    options.count = 2;
    EXPECT_EQ(sd_test(&session_, options), SDMOUNT_ERR_READ_ONLY);
}

TEST_F(QueryTest, StabilityLoop)
{
    mount();
    const int64_t before = hw_.clock.now_us();
    EXPECT_EQ(sd_verify_stability(&session_, 3), ESP_OK);
    EXPECT_EQ(hw_.list_calls, 3);
    EXPECT_GE(hw_.clock.now_us() - before, 3 * static_cast<int64_t>(kStabilityLoopDelayMs) * 1000);
}

TEST_F(QueryTest, StabilityStopsOnFirstError)
{
    mount();
    hw_.size_err = ESP_FAIL;
    EXPECT_EQ(sd_verify_stability(&session_, 5), SDMOUNT_ERR_IO);
    EXPECT_EQ(hw_.list_calls, 1);
}

TEST_F(QueryTest, StabilityBeforeMount)
{
    EXPECT_EQ(sd_verify_stability(&session_, 1), SDMOUNT_ERR_NOT_MOUNTED);
}

TEST_F(QueryTest, QueriesFailAfterUnmount)
{
    mount();
    ASSERT_EQ(sd_unmount(&session_), ESP_OK);
    SdStats stats;
    EXPECT_EQ(sd_get_stats(&session_, &stats), SDMOUNT_ERR_NOT_MOUNTED);
}

}  // namespace
}  // namespace sdmount
