#include "textclean/glyph_map.hpp"

namespace textclean {

namespace {

    struct Glyph {
        char32_t code_point;
        char ascii;
    };

    constexpr std::array<Glyph, 59> GLYPHS{{
        // light lines and corners
        {U'─', '-'}, {U'│', '|'}, {U'├', '+'}, {U'┤', '+'},
        {U'└', '+'}, {U'┌', '+'}, {U'┐', '+'}, {U'┘', '+'},
        {U'┬', '+'}, {U'┴', '+'}, {U'┼', '+'},
        // rounded corners
        {U'╭', '+'}, {U'╮', '+'}, {U'╯', '+'}, {U'╰', '+'},
        // double and mixed-weight lines, corners and junctions
        {U'═', '='}, {U'║', '|'},
        {U'╒', '+'}, {U'╓', '+'}, {U'╔', '+'}, {U'╕', '+'}, {U'╖', '+'}, {U'╗', '+'},
        {U'╘', '+'}, {U'╙', '+'}, {U'╚', '+'}, {U'╛', '+'}, {U'╜', '+'}, {U'╝', '+'},
        {U'╞', '+'}, {U'╟', '+'}, {U'╠', '+'}, {U'╡', '+'}, {U'╢', '+'}, {U'╣', '+'},
        {U'╤', '+'}, {U'╥', '+'}, {U'╦', '+'}, {U'╧', '+'}, {U'╨', '+'}, {U'╩', '+'},
        {U'╪', '+'}, {U'╫', '+'}, {U'╬', '+'},
        // diagonals
        {U'╱', '/'}, {U'╲', '\\'}, {U'╳', 'X'},
        // half lines
        {U'╴', '-'}, {U'╶', '-'}, {U'╸', '-'}, {U'╺', '-'}, {U'╼', '-'}, {U'╾', '-'},
        {U'╵', '|'}, {U'╷', '|'}, {U'╹', '|'}, {U'╻', '|'}, {U'╽', '|'}, {U'╿', '|'},
    }};

    constexpr auto build_table() {
        std::array<char, BOX_DRAWING_LAST - BOX_DRAWING_FIRST + 1> table{};
        for (auto const& glyph: GLYPHS) {
            table[glyph.code_point - BOX_DRAWING_FIRST] = glyph.ascii;
        }
        return table;
    }

    constexpr auto TABLE = build_table();

}  // namespace

auto glyph_table() -> std::array<char, BOX_DRAWING_LAST - BOX_DRAWING_FIRST + 1> const& {
    return TABLE;
}

auto ascii_replacement(char32_t code_point) -> std::optional<char> {
    if (code_point < BOX_DRAWING_FIRST || code_point > BOX_DRAWING_LAST) {
        return std::nullopt;
    }
    if (char ascii = TABLE[code_point - BOX_DRAWING_FIRST]; ascii != '\0') {
        return ascii;
    }
    return std::nullopt;
}

}  // namespace textclean
