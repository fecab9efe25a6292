#include <doctest/doctest.h>
#include <safepath/char_filter.hpp>

#include <string>

using namespace safepath;

TEST_CASE("is_blacklisted covers reserved punctuation") {
    for (char c : std::string("<>:\"|?*\\/")) {
        CHECK(is_blacklisted(static_cast<unsigned char>(c)));
    }
    CHECK_FALSE(is_blacklisted('a'));
    CHECK_FALSE(is_blacklisted(';'));
    CHECK_FALSE(is_blacklisted('.'));
    CHECK_FALSE(is_blacklisted(' '));
}

TEST_CASE("is_blacklisted covers control, DEL, C1 and NBSP") {
    CHECK(is_blacklisted(0));
    CHECK(is_blacklisted(31));
    CHECK(is_blacklisted(127));
    CHECK(is_blacklisted(0x80));
    CHECK(is_blacklisted(0x9F));
    CHECK(is_blacklisted(0xA0));
    CHECK_FALSE(is_blacklisted(0xA1));
    CHECK_FALSE(is_blacklisted(0xE9));
}

TEST_CASE("filter_characters replaces each blacklisted character") {
    CHECK(filter_characters("plums;and/or|apples") == "plums;and_or_apples");
    CHECK(filter_characters("a<b>c") == "a_b_c");
    CHECK(filter_characters("what?*") == "what__");
    CHECK(filter_characters("tab\there") == "tab_here");
    CHECK(filter_characters("plain") == "plain");
    CHECK(filter_characters("") == "");
}

TEST_CASE("filter_characters keeps valid non-ASCII text") {
    CHECK(filter_characters("caf\xc3\xa9") == "caf\xc3\xa9");
    CHECK(filter_characters("\xe6\x97\xa5\xe6\x9c\xac") == "\xe6\x97\xa5\xe6\x9c\xac");
    CHECK(filter_characters("\xf0\x9f\x98\x80") == "\xf0\x9f\x98\x80");
}

TEST_CASE("filter_characters replaces C1 controls and NBSP") {
    CHECK(filter_characters("a\xc2\x85" "b") == "a_b");
    CHECK(filter_characters("a\xc2\xa0" "b") == "a_b");
    CHECK(filter_characters("a\x7f" "b") == "a_b");
}

TEST_CASE("filter_characters replaces malformed UTF-8 byte by byte") {
    CHECK(filter_characters("\xff") == "_");
    CHECK(filter_characters("a\xfe\xff" "b") == "a__b");
    // truncated two-byte sequence
    CHECK(filter_characters("x\xc3") == "x_");
    // overlong encoding of '/'
    CHECK(filter_characters("\xc0\xaf") == "__");
    // UTF-16 surrogate
    CHECK(filter_characters("\xed\xa0\x80") == "___");
}

TEST_CASE("code_point_length counts code points, not bytes") {
    CHECK(code_point_length("") == 0);
    CHECK(code_point_length("abc") == 3);
    CHECK(code_point_length("caf\xc3\xa9") == 4);
    CHECK(code_point_length("\xf0\x9f\x98\x80!") == 2);
}

TEST_CASE("truncate_code_points never splits a sequence") {
    CHECK(truncate_code_points("abcdef", 3) == "abc");
    CHECK(truncate_code_points("\xc3\xa9\xc3\xa9\xc3\xa9", 2) == "\xc3\xa9\xc3\xa9");
    CHECK(truncate_code_points("ab", 10) == "ab");
    CHECK(truncate_code_points("abc", 0) == "");
}

TEST_CASE("trim_whitespace strips both ends") {
    CHECK(trim_whitespace("  abc  ") == "abc");
    CHECK(trim_whitespace("\t\nabc\r\n") == "abc");
    CHECK(trim_whitespace("a b") == "a b");
    CHECK(trim_whitespace("   ") == "");
}

TEST_CASE("trim_whitespace only strips ASCII whitespace") {
    CHECK(trim_whitespace("\v\fabc\f\v") == "abc");
    // NBSP and NEL bytes are not whitespace in any locale
    CHECK(trim_whitespace("a\xc2\xa0") == "a\xc2\xa0");
    CHECK(trim_whitespace("\xa0x\x85") == "\xa0x\x85");
    CHECK(trim_whitespace(" \xc2\x85 ") == "\xc2\x85");
}
