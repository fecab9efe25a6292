#include <doctest/doctest.h>
#include <safepath/drive_root.hpp>

using namespace safepath;

TEST_CASE("is_drive_letter") {
    CHECK(is_drive_letter("C:"));
    CHECK(is_drive_letter("c:"));
    CHECK(is_drive_letter("Z:\\"));
    CHECK_FALSE(is_drive_letter("C"));
    CHECK_FALSE(is_drive_letter("C:/"));
    CHECK_FALSE(is_drive_letter("CC:"));
    CHECK_FALSE(is_drive_letter("1:"));
    CHECK_FALSE(is_drive_letter("C:x"));
}

TEST_CASE("detect_drive_root recognizes POSIX and Windows roots") {
    auto slash = detect_drive_root("/");
    REQUIRE(slash.has_value());
    CHECK(slash->role == NodeRole::Root);
    CHECK(slash->text == "/");

    auto backslash = detect_drive_root("\\");
    REQUIRE(backslash.has_value());
    CHECK(backslash->role == NodeRole::Root);
    CHECK(backslash->text == "\\");
}

TEST_CASE("detect_drive_root canonicalizes drive letters") {
    auto lower = detect_drive_root("c:");
    REQUIRE(lower.has_value());
    CHECK(lower->role == NodeRole::DriveLetter);
    CHECK(lower->text == "C:\\");

    auto full = detect_drive_root("D:\\");
    REQUIRE(full.has_value());
    CHECK(full->text == "D:\\");
}

TEST_CASE("detect_drive_root rejects other nodes") {
    CHECK_FALSE(detect_drive_root("notadrive").has_value());
    CHECK_FALSE(detect_drive_root("").has_value());
    CHECK_FALSE(detect_drive_root("C:/").has_value());
    CHECK_FALSE(detect_drive_root("//").has_value());
}
