/// @file test_procfs_parsing.cpp
/// @brief Tests for the /proc text parsers

#include "procfs_reader.hpp"
#include "system_info.hpp"

#include <gtest/gtest.h>

#include <sstream>

using systop::ProcfsReader;
using systop::SystemInfo;

TEST(ProcfsParsingTest, ParseStatReadsCommAndTimes)
{
    const std::string content =
        "1234 (bash) S 1000 1234 1234 34816 1240 4194304 2500 10000 3 12 150 45 20 10 20 0 1 0 5000 "
        "12345678 800 18446744073709551615\n";

    auto info = ProcfsReader::parse_stat(1234, content);

    ASSERT_TRUE(info.has_value());
    EXPECT_EQ(info->pid, 1234u);
    EXPECT_EQ(info->name, "bash");
    EXPECT_EQ(info->user_time, 150u);
    EXPECT_EQ(info->kernel_time, 45u);
}

TEST(ProcfsParsingTest, ParseStatHandlesParenthesesAndSpacesInComm)
{
    const std::string content =
        "77 (my (weird) proc) R 1 77 77 0 -1 4194560 10 0 0 0 7 3 0 0 20 0 1 0 100 0 0\n";

    auto info = ProcfsReader::parse_stat(77, content);

    ASSERT_TRUE(info.has_value());
    EXPECT_EQ(info->name, "my (weird) proc");
    EXPECT_EQ(info->user_time, 7u);
    EXPECT_EQ(info->kernel_time, 3u);
}

TEST(ProcfsParsingTest, ParseStatRejectsMalformedContent)
{
    EXPECT_FALSE(ProcfsReader::parse_stat(1, "").has_value());
    EXPECT_FALSE(ProcfsReader::parse_stat(1, "1 bash S 0 0").has_value());
    EXPECT_FALSE(ProcfsReader::parse_stat(1, "1 (bash)").has_value());
    EXPECT_FALSE(ProcfsReader::parse_stat(1, "1 (bash) S 0 1 1 0 -1").has_value());
}

TEST(ProcfsParsingTest, ParseStatmResident)
{
    auto resident = ProcfsReader::parse_statm_resident("5000 1200 300 10 0 900 0\n");
    ASSERT_TRUE(resident.has_value());
    EXPECT_EQ(*resident, 1200u);

    EXPECT_FALSE(ProcfsReader::parse_statm_resident("").has_value());
    EXPECT_FALSE(ProcfsReader::parse_statm_resident("5000").has_value());
}

TEST(ProcfsParsingTest, ParseCpuLine)
{
    auto parsed = SystemInfo::parse_cpu_line("cpu3 100 5 50 800 20 1 2 3 0 0");

    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(parsed->label, "cpu3");
    EXPECT_EQ(parsed->times.user, 100u);
    EXPECT_EQ(parsed->times.nice, 5u);
    EXPECT_EQ(parsed->times.system, 50u);
    EXPECT_EQ(parsed->times.idle, 800u);
    EXPECT_EQ(parsed->times.steal, 3u);
    EXPECT_EQ(parsed->times.total(), 981u);
    EXPECT_EQ(parsed->times.active(), 161u);
}

TEST(ProcfsParsingTest, ParseCpuLineRejectsOtherLines)
{
    EXPECT_FALSE(SystemInfo::parse_cpu_line("intr 12345 0 0").has_value());
    EXPECT_FALSE(SystemInfo::parse_cpu_line("").has_value());
    EXPECT_FALSE(SystemInfo::parse_cpu_line("cpu0 x y z").has_value());
}

TEST(ProcfsParsingTest, ParseMeminfo)
{
    std::istringstream in(
        "MemTotal:       16000000 kB\n"
        "MemFree:         2000000 kB\n"
        "MemAvailable:    6000000 kB\n"
        "Buffers:          300000 kB\n");

    auto info = SystemInfo::parse_meminfo(in);

    EXPECT_EQ(info.total, 16000000ull * 1024);
    EXPECT_EQ(info.available, 6000000ull * 1024);
    EXPECT_EQ(info.used, 10000000ull * 1024);
}

TEST(ProcfsParsingTest, ParseMeminfoWithoutTotal)
{
    std::istringstream in("MemAvailable: 100 kB\n");

    auto info = SystemInfo::parse_meminfo(in);

    EXPECT_EQ(info.total, 0u);
    EXPECT_EQ(info.used, 0u);
}

TEST(ProcfsParsingTest, ParseOsRelease)
{
    std::istringstream quoted("NAME=\"Debian GNU/Linux\"\nPRETTY_NAME=\"Debian GNU/Linux 12 (bookworm)\"\nID=debian\n");
    EXPECT_EQ(SystemInfo::parse_os_release(quoted), "Debian GNU/Linux 12 (bookworm)");

    std::istringstream bare("PRETTY_NAME=Alpine\n");
    EXPECT_EQ(SystemInfo::parse_os_release(bare), "Alpine");

    std::istringstream missing("ID=arch\n");
    EXPECT_TRUE(SystemInfo::parse_os_release(missing).empty());
}
