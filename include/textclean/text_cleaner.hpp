#pragma once

#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "text_filter.hpp"

namespace textclean {

/**
 * Runs a line of text through an ordered chain of text filters, each applied once.
 */
class TextCleaner {
    std::vector<std::unique_ptr<TextFilter>> m_text_filters;

  public:
    TextCleaner();

    void add_text_filter(std::unique_ptr<TextFilter> text_filter);

    template <typename T, typename... Args>
    void emplace_text_filter(Args... args) {
        m_text_filters.emplace_back(std::make_unique<T>(args...));
    }

    [[nodiscard]] auto clean(std::string_view input) const -> std::string;
};

/** Cleaner stripping escape sequences first, then replacing box-drawing glyphs. */
[[nodiscard]] auto make_text_cleaner() -> TextCleaner;

}  // namespace textclean
