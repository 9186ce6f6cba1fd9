#include "gtest/gtest.h"
#include "core/FileSystemUtil.h"
#include <fstream>
#include <filesystem>

#ifndef _WIN32
#include <unistd.h>
#endif

namespace fs = std::filesystem;
using namespace ImageConverter;

class FileSystemTest : public ::testing::Test {
protected:
    fs::path testDir;

    void SetUp() override {
        // Create a unique temporary directory for each test
        testDir = fs::temp_directory_path() / "imgconv_tests" / ::testing::UnitTest::GetInstance()->current_test_info()->name();
        fs::create_directories(testDir);
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(testDir, ec);
    }

    void createFile(const fs::path& path) {
        std::ofstream f(path);
        f << "test data";
    }
};

TEST_F(FileSystemTest, CheckSource) {
    createFile(testDir / "a.png");
    fs::create_directory(testDir / "dir.png");

    ASSERT_EQ(FileSystemUtil::checkSource(testDir / "a.png"), FileSystemUtil::SourceState::Readable);
    ASSERT_EQ(FileSystemUtil::checkSource(testDir / "nope.png"), FileSystemUtil::SourceState::NotFound);
    ASSERT_EQ(FileSystemUtil::checkSource(testDir / "dir.png"), FileSystemUtil::SourceState::Unreadable);
}

TEST_F(FileSystemTest, UnreadableSource) {
#ifdef _WIN32
    GTEST_SKIP() << "POSIX permissions only";
#else
    if (::geteuid() == 0) {
        GTEST_SKIP() << "root can read any file";
    }
    fs::path locked = testDir / "locked.png";
    createFile(locked);
    fs::permissions(locked, fs::perms::none, fs::perm_options::replace);
    ASSERT_EQ(FileSystemUtil::checkSource(locked), FileSystemUtil::SourceState::Unreadable);
    fs::permissions(locked, fs::perms::owner_all, fs::perm_options::replace);
#endif
}

TEST_F(FileSystemTest, WritableDirectory) {
    ASSERT_TRUE(FileSystemUtil::isWritableDirectory(testDir));
    ASSERT_FALSE(FileSystemUtil::isWritableDirectory(testDir / "missing"));
    ASSERT_FALSE(FileSystemUtil::isWritableDirectory(""));

    createFile(testDir / "file.txt");
    ASSERT_FALSE(FileSystemUtil::isWritableDirectory(testDir / "file.txt"));
}

TEST_F(FileSystemTest, GetImageFiles) {
    createFile(testDir / "b.png");
    createFile(testDir / "a.JPG");
    createFile(testDir / "notes.txt");

    auto files = FileSystemUtil::getImageFiles(testDir, false);
    ASSERT_EQ(files.size(), 2u);
    ASSERT_EQ(files[0].filename(), "a.JPG");
    ASSERT_EQ(files[1].filename(), "b.png");
}

TEST_F(FileSystemTest, GetImageFilesRecursive) {
    fs::create_directory(testDir / "sub");
    createFile(testDir / "a.tif");
    createFile(testDir / "sub" / "b.bmp");

    auto files_non_rec = FileSystemUtil::getImageFiles(testDir, false);
    ASSERT_EQ(files_non_rec.size(), 1u);

    auto files_rec = FileSystemUtil::getImageFiles(testDir, true);
    ASSERT_EQ(files_rec.size(), 2u);
}

TEST_F(FileSystemTest, ExpandInputsKeepsFilesAndExpandsDirectories) {
    fs::create_directory(testDir / "album");
    createFile(testDir / "album" / "x.png");
    createFile(testDir / "album" / "y.webp");
    createFile(testDir / "single.bmp");

    auto files = FileSystemUtil::expandInputs({testDir / "single.bmp", testDir / "album", testDir / "missing.png"});

    ASSERT_EQ(files.size(), 4u);
    ASSERT_EQ(files[0], testDir / "single.bmp");
    ASSERT_EQ(files[1].filename(), "x.png");
    ASSERT_EQ(files[2].filename(), "y.webp");
    // Missing files are passed through so they are reported per file
    ASSERT_EQ(files[3], testDir / "missing.png");
}
