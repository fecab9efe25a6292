#include <doctest/doctest.h>
#include <safepath/reserved_names.hpp>

#include <string>

using namespace safepath;

TEST_CASE("is_reserved_name matches device names case-insensitively") {
    CHECK(is_reserved_name("NUL"));
    CHECK(is_reserved_name("nul"));
    CHECK(is_reserved_name("Con"));
    CHECK(is_reserved_name("PRN"));
    CHECK(is_reserved_name("aux"));
    CHECK(is_reserved_name("COM1"));
    CHECK(is_reserved_name("com9"));
    CHECK(is_reserved_name("LPT1"));
    CHECK(is_reserved_name("lpt9"));

    CHECK_FALSE(is_reserved_name("COM0"));
    CHECK_FALSE(is_reserved_name("COM10"));
    CHECK_FALSE(is_reserved_name("NULL"));
    CHECK_FALSE(is_reserved_name(""));
}

TEST_CASE("FAT device names are reserved only with fat_compatible") {
    for (const char* name : {"$IDLE$", "CONFIG$", "KEYBD$", "SCREEN$", "CLOCK$", "LST"}) {
        CAPTURE(name);
        CHECK_FALSE(is_reserved_name(name, false));
        CHECK(is_reserved_name(name, true));
    }
    CHECK(is_reserved_name("lst", true));
}

TEST_CASE("split_extension splits at the last dot") {
    CHECK(split_extension("nul.txt") == std::make_pair(std::string("nul"), std::string(".txt")));
    CHECK(split_extension("a.tar.gz") == std::make_pair(std::string("a.tar"), std::string(".gz")));
    CHECK(split_extension("nul.") == std::make_pair(std::string("nul"), std::string(".")));
    CHECK(split_extension("noext") == std::make_pair(std::string("noext"), std::string()));
}

TEST_CASE("split_extension keeps leading dots in the stem") {
    CHECK(split_extension(".profile") == std::make_pair(std::string(".profile"), std::string()));
    CHECK(split_extension("..") == std::make_pair(std::string(".."), std::string()));
    CHECK(split_extension(".nul.txt") == std::make_pair(std::string(".nul"), std::string(".txt")));
}

TEST_CASE("guard_reserved_name wraps whole-node matches") {
    CHECK(guard_reserved_name("NUL") == "_NUL_");
    CHECK(guard_reserved_name("con") == "_con_");
    CHECK(guard_reserved_name("LST") == "LST");
    CHECK(guard_reserved_name("LST", true) == "_LST_");
}

TEST_CASE("guard_reserved_name wraps the stem and keeps the extension") {
    CHECK(guard_reserved_name("nul.txt") == "_nul_.txt");
    CHECK(guard_reserved_name("COM1.log") == "_COM1_.log");
    CHECK(guard_reserved_name("CLOCK$.sys", true) == "_CLOCK$_.sys");
    CHECK(guard_reserved_name("CLOCK$.sys", false) == "CLOCK$.sys");
}

TEST_CASE("guard_reserved_name leaves other nodes alone") {
    CHECK(guard_reserved_name("null.txt") == "null.txt");
    CHECK(guard_reserved_name("my_nul") == "my_nul");
    CHECK(guard_reserved_name(".nul") == ".nul");
    CHECK(guard_reserved_name("") == "");
}
