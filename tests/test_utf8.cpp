#include <catch2/catch_test_macros.hpp>

#include "render/document_renderer.hpp"
#include "text_utils.hpp"
#include "utf8.hpp"

#include <string>

namespace {

std::string repeat(const std::string& unit, size_t n) {
    std::string s;
    for (size_t i = 0; i < n; ++i) s += unit;
    return s;
}

std::string join(const std::vector<std::string>& parts) {
    std::string s;
    for (auto& p : parts) s += p;
    return s;
}

} // namespace

TEST_CASE("utf8 length", "[utf8]") {
    REQUIRE(utf8::length("") == 0);
    REQUIRE(utf8::length("hello") == 5);
    REQUIRE(utf8::length("привет") == 6);
    REQUIRE(utf8::length("日本語") == 3);
    REQUIRE(utf8::length("a😀b") == 3);
    // Truncated sequence counts byte by byte
    REQUIRE(utf8::length(std::string("\xD0", 1)) == 1);
}

TEST_CASE("Message splitting", "[utf8]") {

    SECTION("EmptyTextHasNoPieces") {
        REQUIRE(split_for_messages("").empty());
    }

    SECTION("ShortTextIsOnePiece") {
        auto parts = split_for_messages("hello");
        REQUIRE(parts == std::vector<std::string>{"hello"});
    }

    SECTION("ExactlyAtLimit") {
        auto parts = split_for_messages(repeat("a", kMaxMessageChars));
        REQUIRE(parts.size() == 1);
    }

    SECTION("NineThousandCharsInThreePieces") {
        auto text = repeat("a", 9000);
        auto parts = split_for_messages(text);
        REQUIRE(parts.size() == 3);
        REQUIRE(utf8::length(parts[0]) == 4096);
        REQUIRE(utf8::length(parts[1]) == 4096);
        REQUIRE(utf8::length(parts[2]) == 808);
        REQUIRE(join(parts) == text);
    }

    SECTION("MultibyteNeverCutMidCharacter") {
        auto text = repeat("ж", 5000) + repeat("😀", 10);
        auto parts = split_for_messages(text);
        REQUIRE(parts.size() == 2);
        REQUIRE(utf8::length(parts[0]) == 4096);
        REQUIRE(utf8::length(parts[1]) == 5010 - 4096);
        REQUIRE(parts[0] == repeat("ж", 4096));
        REQUIRE(join(parts) == text);
    }

    SECTION("EveryPieceWithinLimit") {
        auto text = repeat("ab€", 3001);
        auto parts = utf8::split(text, 100);
        for (auto& p : parts) {
            REQUIRE(utf8::length(p) <= 100);
        }
        REQUIRE(join(parts) == text);
    }
}

TEST_CASE("UTF-16 offsets", "[utf8]") {
    // "a" (1 unit), "é" (1 unit, 2 bytes), "😀" (2 units, 4 bytes), "b"
    std::string s = "a\xC3\xA9\xF0\x9F\x98\x80" "b";
    auto offsets = utf8::utf16_to_byte_offsets(s);
    REQUIRE(offsets == std::vector<size_t>{0, 1, 3, 3, 7, 8});
}

TEST_CASE("Text helpers", "[utf8]") {
    REQUIRE(text::trim("  hi there \n") == "hi there");
    REQUIRE(text::trim("   ").empty());
    REQUIRE(text::is_blank(" \t\n"));
    REQUIRE(text::is_blank(""));
    REQUIRE_FALSE(text::is_blank(" x "));
    REQUIRE(text::to_upper("en") == "EN");
    REQUIRE(text::to_lower("English") == "english");
}
