// ==============================================================================
// test_platform_gtest.cpp - Тесты платформенного модуля (GoogleTest)
// ==============================================================================

#include <raven/platform.hpp>

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <string>

namespace raven::platform::test {

// ==============================================================================
// Пути
// ==============================================================================

TEST(PlatformTest, PathUtf8_RoundTrip) {
    // Arrange
    const std::string original = "reports/отчёт-файл.json";

    // Act
    const std::filesystem::path p = path_from_utf8(original);
    const std::string back = path_to_utf8(p);

    // Assert
    EXPECT_EQ(back, original);
    EXPECT_EQ(path_to_utf8(p.filename()), "отчёт-файл.json");
}

TEST(PlatformTest, PathFromUtf8_Empty) {
    EXPECT_TRUE(path_from_utf8("").empty());
    EXPECT_EQ(path_to_utf8(std::filesystem::path()), "");
}

TEST(PlatformTest, LowerExtension) {
    EXPECT_EQ(lower_extension("setup.EXE"), "exe");
    EXPECT_EQ(lower_extension("/usr/lib/libc.so"), "so");
    EXPECT_EQ(lower_extension("archive.tar.GZ"), "gz");
    EXPECT_EQ(lower_extension("/usr/bin/ls"), "");
    EXPECT_EQ(lower_extension(".profile"), "");
}

// ==============================================================================
// Временные файлы
// ==============================================================================

TEST(PlatformTest, MakeTempFile_CreatesEmptyUniqueFiles) {
    // Arrange & Act
    const auto first = make_temp_file("raven-platform");
    const auto second = make_temp_file("raven-platform");

    // Assert
    EXPECT_NE(path_to_utf8(first), path_to_utf8(second));
    EXPECT_TRUE(std::filesystem::is_regular_file(first));
    EXPECT_EQ(std::filesystem::file_size(first), 0u);
    EXPECT_EQ(path_to_utf8(first.filename()).rfind("rav", 0), 0u);

    {
        std::ofstream out(first, std::ios::binary);
        out << "data";
    }
    EXPECT_EQ(std::filesystem::file_size(first), 4u);

    std::filesystem::remove(first);
    std::filesystem::remove(second);
}

// ==============================================================================
// Время
// ==============================================================================

TEST(PlatformTest, FormatUtcRfc3339) {
    EXPECT_EQ(format_utc_rfc3339(0), "1970-01-01T00:00:00Z");
    EXPECT_EQ(format_utc_rfc3339(1714564800), "2024-05-01T12:00:00Z");
    EXPECT_EQ(format_utc_rfc3339(951782400), "2000-02-29T00:00:00Z");
}

// ==============================================================================
// TTY
// ==============================================================================

TEST(PlatformTest, TtyDetection_IsStable) {
    // Под ctest stdout обычно не терминал; проверяем только согласованность
    EXPECT_EQ(is_tty_stdout(), is_tty_stdout());
    EXPECT_EQ(is_tty_stderr(), is_tty_stderr());
}

}  // namespace raven::platform::test
