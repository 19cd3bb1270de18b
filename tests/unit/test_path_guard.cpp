#include <filesystem>
#include <string>
#include <gtest/gtest.h>
#include "policy/path_guard.hpp"

namespace {

using runvault::core::errors::ErrorCategory;
using runvault::core::errors::get_error;
using runvault::core::errors::get_value;
using runvault::core::errors::is_error;
using runvault::policy::PathGuard;

TEST(PathGuardTest, ResolvesNestedRelativePath) {
    const std::filesystem::path root = "/store/runs/r1/files";
    auto resolved = PathGuard::resolve_within(root, "src/main.cpp");
    ASSERT_FALSE(is_error(resolved));
    EXPECT_EQ(get_value(resolved).string(), "/store/runs/r1/files/src/main.cpp");
}

TEST(PathGuardTest, NormalizesInnerDotDot) {
    auto resolved = PathGuard::resolve_within("/root", "a/../b.txt");
    ASSERT_FALSE(is_error(resolved));
    EXPECT_EQ(get_value(resolved).string(), "/root/b.txt");
}

TEST(PathGuardTest, RejectsEscapes) {
    for (const std::string candidate : {"../escape.txt", "a/../../escape.txt", ".."}) {
        auto resolved = PathGuard::resolve_within("/root", candidate);
        ASSERT_TRUE(is_error(resolved)) << candidate;
        EXPECT_EQ(get_error(resolved).code, "path_outside_root") << candidate;
        EXPECT_EQ(get_error(resolved).category, ErrorCategory::Input);
    }
}

TEST(PathGuardTest, RejectsAbsoluteAndEmpty) {
    auto absolute = PathGuard::resolve_within("/root", "/etc/passwd");
    ASSERT_TRUE(is_error(absolute));
    EXPECT_EQ(get_error(absolute).code, "invalid_path");

    auto empty = PathGuard::resolve_within("/root", "");
    ASSERT_TRUE(is_error(empty));
    EXPECT_EQ(get_error(empty).code, "invalid_path");

    auto dot = PathGuard::resolve_within("/root", ".");
    ASSERT_TRUE(is_error(dot));
    EXPECT_EQ(get_error(dot).code, "invalid_path");
}

TEST(PathGuardTest, ValidatesSingleComponentNames) {
    EXPECT_FALSE(is_error(PathGuard::validate_name("2025-01-15-flow-abc12345")));
    for (const std::string bad : {"", ".", "..", "a/b", "a\\b"}) {
        auto checked = PathGuard::validate_name(bad);
        ASSERT_TRUE(is_error(checked)) << bad;
        EXPECT_EQ(get_error(checked).code, "invalid_name");
    }
}

TEST(PathGuardTest, WithinRootIsLexical) {
    EXPECT_TRUE(PathGuard::is_within_root("/a/b", "/a/b/c"));
    EXPECT_TRUE(PathGuard::is_within_root("/a/b/", "/a/b/c"));
    EXPECT_FALSE(PathGuard::is_within_root("/a/b", "/a/bc"));
    EXPECT_FALSE(PathGuard::is_within_root("/a/b", "/a/b/../c"));
}

}  // namespace
