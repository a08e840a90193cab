#include "textclean/text_cleaner.hpp"

namespace textclean {

TextCleaner::TextCleaner() = default;

void TextCleaner::add_text_filter(std::unique_ptr<TextFilter> text_filter) {
    m_text_filters.emplace_back(std::move(text_filter));
}

auto TextCleaner::clean(std::string_view input) const -> std::string {
    std::string text(input);
    for (auto& text_filter: m_text_filters) {
        text = text_filter->filter(text);
    }
    return text;
}

auto make_text_cleaner() -> TextCleaner {
    TextCleaner cleaner;
    cleaner.emplace_text_filter<StripAnsiFilter>();
    cleaner.emplace_text_filter<AsciiGlyphFilter>();
    return cleaner;
}

}  // namespace textclean
