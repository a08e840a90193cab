#include "textclean/file_picker.hpp"

#include <algorithm>
#include <charconv>
#include <optional>
#include <string>
#include <utility>

#include <boost/algorithm/string.hpp>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace textclean {

UserCancelled::UserCancelled() : std::runtime_error("No input file selected") {}

FilePicker::FilePicker() = default;
FilePicker::FilePicker(FilePicker const&) = default;
FilePicker::FilePicker(FilePicker&&) = default;
FilePicker& FilePicker::operator=(FilePicker const&) = default;
FilePicker& FilePicker::operator=(FilePicker&&) = default;
FilePicker::~FilePicker() = default;

auto has_txt_extension(std::filesystem::path const& path) -> bool {
    return boost::algorithm::iequals(path.extension().string(), ".txt");
}

namespace {

    [[nodiscard]] auto parse_number(std::string const& answer) -> std::optional<std::size_t> {
        std::size_t number = 0;
        auto [ptr, ec] = std::from_chars(answer.data(), answer.data() + answer.size(), number);
        if (ec != std::errc() || ptr != answer.data() + answer.size()) {
            return std::nullopt;
        }
        return number;
    }

}  // namespace

TerminalFilePicker::TerminalFilePicker(std::filesystem::path directory, std::istream& in, std::ostream& out)
    : m_directory(std::move(directory)), m_in(in), m_out(out) {}

auto TerminalFilePicker::candidates() const -> std::vector<std::filesystem::path> {
    std::vector<std::filesystem::path> files;
    for (auto const& entry: std::filesystem::directory_iterator(m_directory)) {
        if (entry.is_regular_file() && has_txt_extension(entry.path())) {
            files.push_back(entry.path());
        }
    }
    std::sort(files.begin(), files.end());
    return files;
}

auto TerminalFilePicker::pick() -> std::filesystem::path {
    auto files = candidates();
    m_out << "Select Input File\n";
    for (std::size_t idx = 0; idx < files.size(); ++idx) {
        m_out << fmt::format("  [{}] {}\n", idx + 1, files[idx].filename().string());
    }
    std::string answer;
    while (true) {
        m_out << "Number or path of a .txt file (empty to cancel): " << std::flush;
        if (not std::getline(m_in, answer)) {
            throw UserCancelled();
        }
        boost::algorithm::trim(answer);
        if (answer.empty()) {
            throw UserCancelled();
        }
        if (auto number = parse_number(answer); number) {
            if (*number >= 1 && *number <= files.size()) {
                return files[*number - 1];
            }
            spdlog::warn("No file listed under number {}", *number);
            continue;
        }
        std::filesystem::path path(answer);
        if (path.is_relative()) {
            path = m_directory / path;
        }
        if (not has_txt_extension(path)) {
            spdlog::warn("Not a .txt file: {}", path.string());
            continue;
        }
        if (not std::filesystem::is_regular_file(path)) {
            spdlog::warn("No such file: {}", path.string());
            continue;
        }
        return path;
    }
}

}  // namespace textclean
