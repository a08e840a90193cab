#pragma once

#include <array>
#include <optional>

namespace textclean {

/** First code point of the Unicode Box Drawing block. */
constexpr char32_t BOX_DRAWING_FIRST = 0x2500;

/** Last code point of the Unicode Box Drawing block. */
constexpr char32_t BOX_DRAWING_LAST = 0x257F;

/**
 * ASCII replacements indexed by `code_point - BOX_DRAWING_FIRST`; `'\0'` means the glyph is
 * not mapped.
 */
[[nodiscard]] auto glyph_table() -> std::array<char, BOX_DRAWING_LAST - BOX_DRAWING_FIRST + 1> const&;

/** Returns the ASCII replacement of a glyph, or `std::nullopt` if it has none. */
[[nodiscard]] auto ascii_replacement(char32_t code_point) -> std::optional<char>;

}  // namespace textclean
