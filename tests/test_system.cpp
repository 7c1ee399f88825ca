#include <gtest/gtest.h>

#include <cmath>
#include <limits>
#include <string>

#include "projectm_pod/system.hpp"

using namespace projectm_pod;

TEST(FormatTime, HoursMinutesSeconds) {
  EXPECT_EQ(format_time(0), "00:00:00");
  EXPECT_EQ(format_time(3725.9), "01:02:05");
}

TEST(FormatTime, ClampsCorruptDurations) {
  EXPECT_EQ(format_time(1e300), "1000000:00:00");
  EXPECT_EQ(format_time(std::numeric_limits<double>::infinity()),
            "1000000:00:00");
  EXPECT_EQ(format_time(std::nan("")), "00:00:00");
  EXPECT_EQ(format_time(-5), "00:00:00");
}

TEST(TailText, MarksCutText) {
  EXPECT_EQ(tail_text("short", 10), "short");
  EXPECT_EQ(tail_text("0123456789", 4), "...6789");
}

TEST(TempDirectoryTest, RemovedOnDestruction) {
  std::filesystem::path path;
  {
    TempDirectory dir("system_test_");
    ASSERT_TRUE(dir.valid()) << dir.error();
    path = dir.path();
    std::string error;
    ASSERT_TRUE(write_file(path / "nested.txt", "x", error)) << error;
  }
  EXPECT_FALSE(std::filesystem::exists(path));
}
