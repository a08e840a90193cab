#pragma once

#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <vector>

namespace textclean {

/// No file was chosen.
class UserCancelled: public std::runtime_error {
  public:
    UserCancelled();
};

/**
 * Interactive choice of an input file.
 */
class FilePicker {
  public:
    FilePicker();
    FilePicker(FilePicker const&);
    FilePicker(FilePicker&&);
    FilePicker& operator=(FilePicker const&);
    FilePicker& operator=(FilePicker&&);
    virtual ~FilePicker();

    /** Returns the chosen file; throws `UserCancelled` if none was chosen. */
    [[nodiscard]] virtual auto pick() -> std::filesystem::path = 0;
};

/**
 * Picks a `.txt` file by prompting on a terminal.
 *
 * The `.txt` files of a directory are listed with numbers. The answer is either one of those
 * numbers or a path (relative paths are resolved against the directory). Answers that are not
 * existing `.txt` files are rejected and the prompt is repeated. An empty answer or the end of
 * the input stream cancels.
 */
class TerminalFilePicker final: public FilePicker {
    std::filesystem::path m_directory;
    std::istream& m_in;
    std::ostream& m_out;

  public:
    TerminalFilePicker(std::filesystem::path directory, std::istream& in, std::ostream& out);

    [[nodiscard]] auto pick() -> std::filesystem::path override;

    /** Regular `.txt` files in the directory, sorted by path. */
    [[nodiscard]] auto candidates() const -> std::vector<std::filesystem::path>;
};

/** Checks if the path has a `.txt` extension, ignoring case. */
[[nodiscard]] auto has_txt_extension(std::filesystem::path const& path) -> bool;

}  // namespace textclean
