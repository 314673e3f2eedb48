#include <gtest/gtest.h>

#include "lanmonitor/AtomicFile.h"

#include <fstream>

TEST(AtomicFileTest, ComputePathsAddsPartSuffix)
{
    const auto p = LanMonitor::computeAtomicFilePaths(
        std::filesystem::path("/var/lib/lanmonitor/devices.json"));

    EXPECT_EQ(p.finalPath, std::filesystem::path("/var/lib/lanmonitor/devices.json"));
    EXPECT_EQ(p.tempPath, std::filesystem::path("/var/lib/lanmonitor/devices.json.part"));
}

TEST(AtomicFileTest, WriteReplacesExistingFileAndRemovesTemp)
{
    const auto root = std::filesystem::temp_directory_path() / "lanmonitor_atomic_file_test";
    std::filesystem::create_directories(root);

    const auto finalPath = root / "final.json";
    const auto tempPath = root / "final.json.part";

    // Clean slate
    std::error_code ec;
    std::filesystem::remove(finalPath, ec);
    std::filesystem::remove(tempPath, ec);

    {
        std::ofstream out(finalPath, std::ios::binary);
        out << "old";
    }

    std::string err;
    ASSERT_TRUE(LanMonitor::writeFileAtomically(finalPath, "{\"v\":2}", err)) << err;

    EXPECT_TRUE(std::filesystem::exists(finalPath));
    EXPECT_FALSE(std::filesystem::exists(tempPath));

    std::string content;
    ASSERT_TRUE(LanMonitor::readWholeFile(finalPath, content, err)) << err;
    EXPECT_EQ(content, "{\"v\":2}");
}

TEST(AtomicFileTest, ReadMissingFileFails)
{
    const auto missing = std::filesystem::temp_directory_path() / "lanmonitor_no_such_file.json";
    std::error_code ec;
    std::filesystem::remove(missing, ec);

    std::string content;
    std::string err;
    EXPECT_FALSE(LanMonitor::readWholeFile(missing, content, err));
    EXPECT_FALSE(err.empty());
}

TEST(AtomicFileTest, RemovesLeftoverPartFileOnly)
{
    const auto root = std::filesystem::temp_directory_path() / "lanmonitor_atomic_leftover";
    std::error_code ec;
    std::filesystem::remove_all(root, ec);
    std::filesystem::create_directories(root);

    const auto finalPath = root / "devices.json";
    EXPECT_FALSE(LanMonitor::removeStaleTempFile(finalPath));

    {
        std::ofstream out(root / "devices.json.part", std::ios::binary);
        out << "{\"devi";
    }
    {
        std::ofstream out(finalPath, std::ios::binary);
        out << "{}";
    }

    EXPECT_TRUE(LanMonitor::removeStaleTempFile(finalPath));
    EXPECT_FALSE(std::filesystem::exists(root / "devices.json.part"));
    EXPECT_TRUE(std::filesystem::exists(finalPath));
}
