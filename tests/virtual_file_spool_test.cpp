/// @file virtual_file_spool_test.cpp
/// @brief Spool file naming and writing

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

#include "core/dnd/virtual_file_spool.hpp"
#include "core/util/string_utils.hpp"

namespace shelldrop::dnd {
namespace {

namespace fs = std::filesystem;

std::vector<std::byte> bytesOf(const std::string& text) {
    std::vector<std::byte> bytes;
    for (char c : text) {
        bytes.push_back(static_cast<std::byte>(c));
    }
    return bytes;
}

std::string contentsOf(const fs::path& path) {
    std::ifstream file(path, std::ios::binary);
    std::ostringstream content;
    content << file.rdbuf();
    return content.str();
}

class VirtualFileSpoolTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = fs::temp_directory_path() / "shelldrop_spool_test";
        fs::remove_all(dir_);
        fs::create_directories(dir_);
        settings_.directory = dir_;
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(dir_, ec);
    }

    fs::path dir_;
    config::SpoolSettings settings_;
};

TEST(SanitizeFileNameTest, KeepsOrdinaryName) {
    EXPECT_EQ(sanitizeFileName(u"photo 01.jpg", 0), u"photo 01.jpg");
}

TEST(SanitizeFileNameTest, StripsDirectories) {
    EXPECT_EQ(sanitizeFileName(u"folder\\sub/inner.png", 0), u"inner.png");
    EXPECT_EQ(sanitizeFileName(u"..\\..\\escape.txt", 0), u"escape.txt");
}

TEST(SanitizeFileNameTest, ReplacesInvalidCharacters) {
    EXPECT_EQ(sanitizeFileName(u"a<b>c:d\"e|f?g*h.txt", 0), u"a_b_c_d_e_f_g_h.txt");
    EXPECT_EQ(sanitizeFileName(u"tab\there", 0), u"tab_here");
}

TEST(SanitizeFileNameTest, TrimsDotsAndSpaces) {
    EXPECT_EQ(sanitizeFileName(u"  name.txt. . ", 0), u"name.txt");
}

TEST(SanitizeFileNameTest, FallsBackToIndexedName) {
    EXPECT_EQ(sanitizeFileName(u"", 3), u"virtual_3");
    EXPECT_EQ(sanitizeFileName(u"...", 7), u"virtual_7");
    EXPECT_EQ(sanitizeFileName(u"dir\\", 1), u"virtual_1");
}

TEST_F(VirtualFileSpoolTest, SpoolPathHasPrefixAndName) {
    auto path = makeSpoolPath(settings_, u"image.jpg", 0);

    EXPECT_EQ(path.parent_path(), dir_);
    const auto name = pathToUtf8(path.filename());
    EXPECT_EQ(name.rfind("shelldrop_", 0), 0u);
    EXPECT_TRUE(name.ends_with("_image.jpg"));
}

TEST_F(VirtualFileSpoolTest, EmptyDirectoryUsesTemp) {
    settings_.directory.clear();
    auto path = makeSpoolPath(settings_, u"a.txt", 0);
    EXPECT_TRUE(fs::equivalent(path.parent_path(), fs::temp_directory_path()));
}

TEST_F(VirtualFileSpoolTest, ForcedExtension) {
    settings_.forced_extension = ".jpg";

    EXPECT_TRUE(pathToUtf8(makeSpoolPath(settings_, u"picture", 0)).ends_with("_picture.jpg"));
    EXPECT_TRUE(pathToUtf8(makeSpoolPath(settings_, u"picture.JPG", 0)).ends_with("_picture.JPG"));
    EXPECT_TRUE(
        pathToUtf8(makeSpoolPath(settings_, u"picture.png", 0)).ends_with("_picture.png.jpg"));
}

TEST_F(VirtualFileSpoolTest, CustomPrefix) {
    settings_.prefix = "viewer";
    auto name = pathToUtf8(makeSpoolPath(settings_, u"x.bin", 0).filename());
    EXPECT_EQ(name.rfind("viewer_", 0), 0u);
}

TEST_F(VirtualFileSpoolTest, NameSetSeparatesSameBasenameFromDifferentFolders) {
    SpoolNameSet names(settings_);

    auto first = names.reserve(u"dir1\\x.txt", 0);
    auto second = names.reserve(u"dir2\\x.txt", 1);

    EXPECT_NE(first, second);
    EXPECT_EQ(first.parent_path(), dir_);
    EXPECT_EQ(second.parent_path(), dir_);
    EXPECT_TRUE(pathToUtf8(first.filename()).ends_with("_x.txt"));
    EXPECT_TRUE(pathToUtf8(second.filename()).ends_with("_1_x.txt"));
    EXPECT_EQ(names.size(), 2u);
}

TEST_F(VirtualFileSpoolTest, NameSetIgnoresCase) {
    SpoolNameSet names(settings_);

    auto upper = names.reserve(u"X.TXT", 0);
    auto lower = names.reserve(u"x.txt", 1);

    EXPECT_TRUE(names.contains(upper));
    EXPECT_NE(pathToUtf8(upper.filename()), pathToUtf8(lower.filename()));
    EXPECT_TRUE(pathToUtf8(lower.filename()).ends_with("_1_x.txt"));
}

TEST_F(VirtualFileSpoolTest, NameSetKeepsTryingUntilFree) {
    SpoolNameSet names(settings_);

    // The first fallback for the third name is already taken by the first
    auto a = names.reserve(u"1_a.txt", 0);
    auto b = names.reserve(u"a.txt", 1);
    auto c = names.reserve(u"a.txt", 1);

    EXPECT_TRUE(pathToUtf8(a.filename()).ends_with("_1_a.txt"));
    EXPECT_TRUE(pathToUtf8(b.filename()).ends_with("_a.txt"));
    EXPECT_TRUE(pathToUtf8(c.filename()).ends_with("_1_2_a.txt"));
    EXPECT_NE(a, c);
    EXPECT_NE(b, c);
    EXPECT_EQ(names.size(), 3u);
}

TEST_F(VirtualFileSpoolTest, SpoolsAcrossManyChunks) {
    std::string text;
    for (int i = 0; i < 1000; ++i) {
        text += std::to_string(i);
    }
    auto bytes = bytesOf(text);
    auto path = dir_ / "chunks.txt";

    auto written = spoolToFile(path, memoryReader(bytes), 7);

    ASSERT_TRUE(written.has_value());
    EXPECT_EQ(*written, text.size());
    EXPECT_EQ(contentsOf(path), text);
}

TEST_F(VirtualFileSpoolTest, EmptySourceGivesEmptyFile) {
    auto path = dir_ / "empty.txt";
    auto written = spoolToFile(path, memoryReader({}), 64);

    ASSERT_TRUE(written.has_value());
    EXPECT_EQ(*written, 0u);
    EXPECT_TRUE(fs::exists(path));
    EXPECT_EQ(fs::file_size(path), 0u);
}

TEST_F(VirtualFileSpoolTest, ReaderFailureRemovesPartialFile) {
    auto path = dir_ / "partial.bin";
    int calls = 0;
    ByteReader failing = [&calls](std::span<std::byte> buffer) -> Result<std::size_t, DropError> {
        if (++calls > 2) {
            return std::unexpected(DropError::StreamReadFailure);
        }
        buffer[0] = std::byte{0x55};
        return std::size_t{1};
    };

    auto written = spoolToFile(path, failing, 16);

    ASSERT_FALSE(written.has_value());
    EXPECT_EQ(written.error(), DropError::StreamReadFailure);
    EXPECT_FALSE(fs::exists(path));
}

TEST_F(VirtualFileSpoolTest, UnwritablePathReported) {
    auto path = dir_ / "missing_dir" / "file.bin";
    auto bytes = bytesOf("data");

    auto written = spoolToFile(path, memoryReader(bytes), 16);

    ASSERT_FALSE(written.has_value());
    EXPECT_EQ(written.error(), DropError::TempFileWriteFailure);
}

TEST(MemoryReaderTest, ReadsThenReportsEnd) {
    auto bytes = bytesOf("abcdef");
    auto reader = memoryReader(bytes);
    std::vector<std::byte> buffer(4);

    auto first = reader(buffer);
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(*first, 4u);

    auto second = reader(buffer);
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(*second, 2u);
    EXPECT_EQ(buffer[1], std::byte{'f'});

    auto third = reader(buffer);
    ASSERT_TRUE(third.has_value());
    EXPECT_EQ(*third, 0u);
}

}  // namespace
}  // namespace shelldrop::dnd
