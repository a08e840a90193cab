#include "textclean/text_filter.hpp"

#include <optional>

#include "textclean/glyph_map.hpp"

namespace textclean {

TextFilter::TextFilter() = default;
TextFilter::TextFilter(TextFilter const&) = default;
TextFilter::TextFilter(TextFilter&&) = default;
TextFilter& TextFilter::operator=(TextFilter const&) = default;
TextFilter& TextFilter::operator=(TextFilter&&) = default;
TextFilter::~TextFilter() = default;

namespace {

    constexpr char ESC = '\x1B';

    [[nodiscard]] auto is_parameter(char c) -> bool { return (c >= '0' && c <= '9') || c == ';'; }

    [[nodiscard]] auto is_final(char c) -> bool {
        return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z');
    }

    /**
     * If an escape sequence starts at `pos`, returns the position right past its final letter.
     */
    [[nodiscard]] auto match_escape(std::string_view input, std::size_t pos)
        -> std::optional<std::size_t> {
        if (pos + 1 >= input.size() || input[pos] != ESC || input[pos + 1] != '[') {
            return std::nullopt;
        }
        pos += 2;
        while (pos < input.size() && is_parameter(input[pos])) {
            ++pos;
        }
        if (pos < input.size() && is_final(input[pos])) {
            return pos + 1;
        }
        return std::nullopt;
    }

    // Box Drawing is U+2500..U+257F, i.e., E2 94 80..E2 95 BF in UTF-8.
    [[nodiscard]] auto decode_box_drawing(std::string_view input, std::size_t pos)
        -> std::optional<char32_t> {
        if (pos + 2 >= input.size()) {
            return std::nullopt;
        }
        auto lead = static_cast<unsigned char>(input[pos]);
        auto second = static_cast<unsigned char>(input[pos + 1]);
        auto third = static_cast<unsigned char>(input[pos + 2]);
        if (lead != 0xE2 || (second != 0x94 && second != 0x95) || (third & 0xC0) != 0x80) {
            return std::nullopt;
        }
        return static_cast<char32_t>(((lead & 0x0F) << 12) | ((second & 0x3F) << 6) | (third & 0x3F));
    }

}  // namespace

auto StripAnsiFilter::filter(std::string_view input) const -> std::string {
    std::string output;
    output.reserve(input.size());
    std::size_t pos = 0;
    while (pos < input.size()) {
        auto esc = input.find(ESC, pos);
        if (esc == std::string_view::npos) {
            output.append(input.substr(pos));
            break;
        }
        output.append(input.substr(pos, esc - pos));
        if (auto end = match_escape(input, esc); end) {
            pos = *end;
        } else {
            output.push_back(ESC);
            pos = esc + 1;
        }
    }
    return output;
}

auto AsciiGlyphFilter::filter(std::string_view input) const -> std::string {
    std::string output;
    output.reserve(input.size());
    std::size_t pos = 0;
    while (pos < input.size()) {
        if (auto code_point = decode_box_drawing(input, pos); code_point) {
            if (auto ascii = ascii_replacement(*code_point); ascii) {
                output.push_back(*ascii);
                pos += 3;
                continue;
            }
        }
        output.push_back(input[pos]);
        ++pos;
    }
    return output;
}

}  // namespace textclean
