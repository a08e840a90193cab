#pragma once

#include <algorithm>
#include <filesystem>
#include <optional>
#include <thread>
#include <variant>

#include <spdlog/spdlog.h>

namespace textclean {

/**
 * Parsed command line of `clean_text`.
 */
struct CleanTextSettings {
    std::optional<std::filesystem::path> input{};
    std::optional<std::filesystem::path> output{};
    std::size_t threads = std::max(std::thread::hardware_concurrency(), 1U);
    std::size_t batch_size = 100'000;
    spdlog::level::level_enum log_level = spdlog::level::info;

    /**
     * Returns the settings, or the exit code if parsing stopped: `0` for `--help`, a CLI11 error
     * code for invalid arguments.
     */
    [[nodiscard]] static auto parse(int argc, char const* const* argv)
        -> std::variant<CleanTextSettings, int>;
};

}  // namespace textclean
