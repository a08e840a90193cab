#pragma once

#include <cstddef>
#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <string>
#include <string_view>

#include <fmt/format.h>

#include "ensure.hpp"

namespace textclean::io {

/// Failure to open, read, create, or write a file.
class IoError: public std::runtime_error {
  public:
    using std::runtime_error::runtime_error;
};

/// Indicates that a file was not found.
///
/// As opposed to the standard c++ IO error, this one preserves the file name in the message for
/// more informative logging.
class NoSuchFile: public IoError {
  public:
    explicit NoSuchFile(std::filesystem::path const& file);
};

/// A line of input is not valid UTF-8.
class InvalidEncoding: public IoError {
  public:
    explicit InvalidEncoding(std::size_t line_number);
    [[nodiscard]] auto line_number() const noexcept -> std::size_t;

  private:
    std::size_t m_line_number;
};

/// Resolves string as a path; throws NoSuchFile if the file does not exist.
[[nodiscard]] auto resolve_path(std::filesystem::path const& file) -> std::filesystem::path;

[[nodiscard]] auto is_valid_utf8(std::string_view text) -> bool;

/// Calls `fn` for every line of `is`, in order, without its `\n` or `\r\n` terminator.
/// A `\r` not followed by `\n` is kept, including at the end of the last line.
///
/// Throws InvalidEncoding for a line that is not valid UTF-8, and IoError if the stream fails
/// before reaching its end.
template <typename Function>
void for_each_line(std::istream& is, Function fn) {
    std::string line;
    std::size_t line_number = 0;
    while (std::getline(is, line)) {
        ++line_number;
        if (not is.eof() && not line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (not is_valid_utf8(line)) {
            throw InvalidEncoding(line_number);
        }
        fn(line);
    }
    ensure(not is.bad()).or_throw(IoError(fmt::format("Failed reading line {}", line_number + 1)));
}

}  // namespace textclean::io
