#define CATCH_CONFIG_MAIN

#include <algorithm>
#include <optional>

#include <catch2/catch.hpp>

#include "textclean/glyph_map.hpp"

using namespace textclean;

TEST_CASE("Mapped glyphs") {
    auto [code_point, ascii] = GENERATE(table<char32_t, char>({
        {U'─', '-'}, {U'│', '|'}, {U'├', '+'}, {U'┤', '+'}, {U'┼', '+'},
        {U'╭', '+'}, {U'╰', '+'}, {U'═', '='}, {U'║', '|'}, {U'╒', '+'},
        {U'╬', '+'}, {U'╱', '/'}, {U'╲', '\\'}, {U'╳', 'X'}, {U'╴', '-'},
        {U'╾', '-'}, {U'╵', '|'}, {U'╿', '|'},
    }));
    REQUIRE(ascii_replacement(code_point) == std::optional<char>(ascii));
}

TEST_CASE("Unmapped code points") {
    REQUIRE(ascii_replacement(U'a') == std::nullopt);
    REQUIRE(ascii_replacement(U'━') == std::nullopt);
    REQUIRE(ascii_replacement(U'┃') == std::nullopt);
    REQUIRE(ascii_replacement(U'▀') == std::nullopt);
    REQUIRE(ascii_replacement(BOX_DRAWING_FIRST - 1) == std::nullopt);
    REQUIRE(ascii_replacement(BOX_DRAWING_LAST + 1) == std::nullopt);
}

TEST_CASE("Table contents") {
    auto const& table = glyph_table();
    REQUIRE(std::count_if(table.begin(), table.end(), [](char c) { return c != '\0'; }) == 59);
    REQUIRE(std::count(table.begin(), table.end(), '+') == 40);
    REQUIRE(std::count(table.begin(), table.end(), '-') == 7);
    REQUIRE(std::count(table.begin(), table.end(), '|') == 8);
    REQUIRE(std::count(table.begin(), table.end(), '=') == 1);
    // the whole double/mixed junction range maps to '+'
    for (char32_t code_point = U'╒'; code_point <= U'╬'; ++code_point) {
        REQUIRE(ascii_replacement(code_point) == std::optional<char>('+'));
    }
}
