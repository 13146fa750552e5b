/// @file version_test.cpp
/// @brief Version macros follow the build's project version

#include <gtest/gtest.h>

#include <string>

#include <shelldrop/shelldrop.hpp>

namespace shelldrop {
namespace {

TEST(VersionTest, StringMatchesComponents) {
    const std::string expected = std::to_string(SHELLDROP_VERSION_MAJOR) + "." +
                                 std::to_string(SHELLDROP_VERSION_MINOR) + "." +
                                 std::to_string(SHELLDROP_VERSION_PATCH);
    EXPECT_EQ(std::string(SHELLDROP_VERSION_STRING), expected);
}

TEST(VersionTest, PreReleaseSeries) {
    EXPECT_EQ(SHELLDROP_VERSION_MAJOR, 0);
    EXPECT_EQ(SHELLDROP_VERSION_MINOR, 1);
}

}  // namespace
}  // namespace shelldrop
