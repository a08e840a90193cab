#pragma once

#include <filesystem>

namespace textclean {

/**
 * Returns the path the cleaned copy of `input` is written to.
 *
 * The file `dir/name.ext` maps to `dir/name_output.txt`. If `input` has no file name to take
 * the stem from (e.g., `dir/` or `dir/..`), the result is `output_output.txt` in that directory.
 */
[[nodiscard]] auto output_path_for(std::filesystem::path const& input) -> std::filesystem::path;

}  // namespace textclean
