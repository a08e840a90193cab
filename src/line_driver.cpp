#include "textclean/line_driver.hpp"

#include <algorithm>
#include <fstream>
#include <string>
#include <utility>
#include <vector>

#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <tbb/blocked_range.h>
#include <tbb/parallel_for.h>

#include "textclean/ensure.hpp"
#include "textclean/io.hpp"

namespace textclean {

namespace {

    void clean_batch(std::vector<std::string>& lines, TextCleaner const& cleaner, std::size_t threads) {
        if (threads <= 1 || lines.size() <= 1) {
            for (auto& line: lines) {
                line = cleaner.clean(line);
            }
            return;
        }
        tbb::parallel_for(
            tbb::blocked_range<std::size_t>(0, lines.size()),
            [&](tbb::blocked_range<std::size_t> const& range) {
                for (auto idx = range.begin(); idx != range.end(); ++idx) {
                    lines[idx] = cleaner.clean(lines[idx]);
                }
            }
        );
    }

}  // namespace

auto clean_stream(std::istream& is, std::ostream& os, TextCleaner const& cleaner, CleanOptions const& options)
    -> CleanStats {
    CleanStats stats;
    std::size_t batch_size = std::max<std::size_t>(options.batch_size, 1);
    std::size_t batch_number = 0;
    std::vector<std::string> batch;

    auto flush = [&] {
        if (batch.empty()) {
            return;
        }
        auto lines = std::exchange(batch, {});
        spdlog::debug("[Cleaning] Batch {} ({} lines)", batch_number, lines.size());
        clean_batch(lines, cleaner, options.threads);
        for (auto const& line: lines) {
            os << line << '\n';
            stats.bytes_out += line.size();
        }
        if (not os.good()) {
            throw io::IoError(
                fmt::format("Failed writing lines {}-{}", stats.lines + 1, stats.lines + lines.size())
            );
        }
        stats.lines += lines.size();
        ++batch_number;
    };

    try {
        io::for_each_line(is, [&](std::string const& line) {
            stats.bytes_in += line.size();
            batch.push_back(line);
            if (batch.size() >= batch_size) {
                flush();
            }
        });
    } catch (io::IoError const&) {
        flush();
        throw;
    }
    flush();
    return stats;
}

auto clean_file(
    std::filesystem::path const& input,
    std::filesystem::path const& output,
    TextCleaner const& cleaner,
    CleanOptions const& options
) -> CleanStats {
    std::ifstream is(io::resolve_path(input), std::ios::binary);
    ensure(is.is_open()).or_throw(
        io::IoError(fmt::format("Cannot open input file: {}", input.string()))
    );
    std::ofstream os(output, std::ios::binary | std::ios::trunc);
    ensure(os.is_open()).or_throw(
        io::IoError(fmt::format("Cannot create output file: {}", output.string()))
    );
    auto stats = clean_stream(is, os, cleaner, options);
    os.close();
    ensure(not os.fail()).or_throw(
        io::IoError(fmt::format("Failed writing output file: {}", output.string()))
    );
    return stats;
}

}  // namespace textclean
