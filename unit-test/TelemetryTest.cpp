#include <filesystem>
#include "gtest/gtest.h"
#include "common/io_utils.hpp"
#include "config.hpp"
#include "telemetry.hpp"
#include "test/environment.hpp"

using namespace std;
using namespace codebox;

static const char *TIME_REPORT = R"(	Command being timed: "./main"
	User time (seconds): 0.12
	System time (seconds): 0.03
	Percent of CPU this job got: 95%
	Elapsed (wall clock) time (h:mm:ss or m:ss): 0:01.50
	Average shared text size (kbytes): 0
	Maximum resident set size (kbytes): 34512
	Major (requiring I/O) page faults: 0
	Exit status: 0
)";

TEST(TelemetryTest, ReadMetadataTest) {
    auto metadata = read_metadata(TIME_REPORT);
    EXPECT_EQ(metadata["Command being timed"], "\"./main\"");
    EXPECT_EQ(metadata["Elapsed (wall clock) time (h:mm:ss or m:ss)"], "0:01.50");
    EXPECT_EQ(metadata["Maximum resident set size (kbytes)"], "34512");
}

TEST(TelemetryTest, ParseTimeReportTest) {
    auto usage = parse_resource_usage(TIME_REPORT);
    ASSERT_TRUE(usage.peak_memory_kb);
    EXPECT_EQ(*usage.peak_memory_kb, 34512);
    ASSERT_TRUE(usage.cpu_time_ms);
    EXPECT_EQ(*usage.cpu_time_ms, 150);
    ASSERT_TRUE(usage.wall_time);
    EXPECT_DOUBLE_EQ(*usage.wall_time, 1.5);
    ASSERT_TRUE(usage.exit_status);
    EXPECT_EQ(*usage.exit_status, 0);
}

TEST(TelemetryTest, HourClockTest) {
    auto usage = parse_resource_usage("Elapsed (wall clock) time (h:mm:ss or m:ss): 1:02:03\n");
    ASSERT_TRUE(usage.wall_time);
    EXPECT_DOUBLE_EQ(*usage.wall_time, 3723);
}

TEST(TelemetryTest, MalformedReportTest) {
    auto usage = parse_resource_usage("Maximum resident set size (kbytes): lots\nUser time (seconds): 0.1\n");
    EXPECT_FALSE(usage.peak_memory_kb);
    // 缺少 System time 时无法得到 CPU 时间
    EXPECT_FALSE(usage.cpu_time_ms);
    EXPECT_FALSE(usage.wall_time);
}

TEST(TelemetryTest, MissingReportTest) {
    test::setup_test_environment();
    auto usage = read_resource_usage(RUN_DIR / "no-such-time.txt");
    EXPECT_FALSE(usage.peak_memory_kb);
    EXPECT_FALSE(usage.cpu_time_ms);
}
