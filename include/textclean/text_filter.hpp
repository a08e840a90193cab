#pragma once

#include <string>
#include <string_view>

namespace textclean {

/**
 * Text filter transforms a whole line of text into another line of text.
 */
class TextFilter {
  public:
    TextFilter();
    TextFilter(TextFilter const&);
    TextFilter(TextFilter&&);
    TextFilter& operator=(TextFilter const&);
    TextFilter& operator=(TextFilter&&);
    virtual ~TextFilter();

    [[nodiscard]] virtual auto filter(std::string_view input) const -> std::string = 0;
};

/**
 * Removes terminal control sequences of the form `ESC [ [0-9;]* [A-Za-z]`.
 *
 * Matches are leftmost and non-overlapping. A sequence that reaches the end of the input
 * without its final letter is not a match and is kept as is.
 */
class StripAnsiFilter final: public TextFilter {
  public:
    [[nodiscard]] auto filter(std::string_view input) const -> std::string override;
};

/**
 * Replaces box-drawing glyphs with their ASCII look-alikes (see `glyph_map.hpp`).
 *
 * Operates on UTF-8 bytes; anything that is not an encoded glyph from the map, including
 * malformed sequences, is copied verbatim.
 */
class AsciiGlyphFilter final: public TextFilter {
  public:
    [[nodiscard]] auto filter(std::string_view input) const -> std::string override;
};

}  // namespace textclean
