#pragma once

#include <cstddef>
#include <filesystem>
#include <iostream>

#include "text_cleaner.hpp"

namespace textclean {

struct CleanOptions {
    /// Lines are cleaned in parallel if greater than 1.
    std::size_t threads = 1;
    /// Number of lines read before cleaning and writing them.
    std::size_t batch_size = 100'000;
};

struct CleanStats {
    std::size_t lines = 0;
    /// Input bytes, excluding line terminators.
    std::size_t bytes_in = 0;
    /// Output bytes, excluding line terminators.
    std::size_t bytes_out = 0;
};

/**
 * Cleans every line of `is` and writes it to `os` followed by `\n`.
 *
 * Output lines are in the same order as input lines regardless of the number of threads.
 * If reading fails, the lines read before the failure are still cleaned and written before the
 * exception propagates.
 */
auto clean_stream(
    std::istream& is, std::ostream& os, TextCleaner const& cleaner, CleanOptions const& options = {}
) -> CleanStats;

/**
 * Cleans `input` into `output`, overwriting it.
 *
 * Throws `io::NoSuchFile` if `input` does not exist and `io::IoError` if either file cannot be
 * opened or written. A partially written output is left in place.
 */
auto clean_file(
    std::filesystem::path const& input,
    std::filesystem::path const& output,
    TextCleaner const& cleaner,
    CleanOptions const& options = {}
) -> CleanStats;

}  // namespace textclean
