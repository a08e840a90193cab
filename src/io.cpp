#include "textclean/io.hpp"

#include <utf8.h>

namespace textclean::io {

NoSuchFile::NoSuchFile(std::filesystem::path const& file)
    : IoError(fmt::format("No such file: {}", file.string())) {}

InvalidEncoding::InvalidEncoding(std::size_t line_number)
    : IoError(fmt::format("Line {} is not valid UTF-8", line_number)), m_line_number(line_number) {}

auto InvalidEncoding::line_number() const noexcept -> std::size_t {
    return m_line_number;
}

auto resolve_path(std::filesystem::path const& file) -> std::filesystem::path {
    if (not std::filesystem::exists(file)) {
        throw NoSuchFile(file);
    }
    return file;
}

auto is_valid_utf8(std::string_view text) -> bool {
    return utf8::is_valid(text.begin(), text.end());
}

}  // namespace textclean::io
