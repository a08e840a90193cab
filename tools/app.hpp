#pragma once

#include <algorithm>
#include <filesystem>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <thread>

#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>

namespace textclean {

namespace arg {

    /**
     * Input and output files of a cleaning run.
     *
     * Both are optional: without an input, the file is picked interactively; without an output,
     * it is derived from the input.
     */
    struct CleanFile {
        explicit CleanFile(CLI::App* app);
        [[nodiscard]] auto input() const -> std::optional<std::filesystem::path>;
        [[nodiscard]] auto output() const -> std::optional<std::filesystem::path>;

      private:
        std::optional<std::string> m_input;
        std::optional<std::string> m_output;
    };

    struct Threads {
        explicit Threads(CLI::App* app);
        [[nodiscard]] auto threads() const -> std::size_t;

      private:
        std::size_t m_threads = std::max(std::thread::hardware_concurrency(), 1U);
    };

    template <std::size_t Default = 100'000>
    struct BatchSize {
        explicit BatchSize(CLI::App* app)
        {
            app->add_option("--batch-size", m_batch_size, "Number of lines to process at a time")
                ->capture_default_str()
                ->check(CLI::PositiveNumber);
        }

        [[nodiscard]] auto batch_size() const -> std::size_t { return m_batch_size; }

      private:
        std::size_t m_batch_size = Default;
    };

    /**
     * Log level configuration.
     *
     * This option takes one of the valid string values and translates it into spdlog log level
     * values.
     */
    struct LogLevel {
        static const std::set<std::string> VALID_LEVELS;
        static const std::map<std::string, spdlog::level::level_enum> ENUM_MAP;

        explicit LogLevel(CLI::App* app);
        [[nodiscard]] auto log_level() const -> spdlog::level::level_enum;

      private:
        std::string m_level = "info";
    };

}  // namespace arg

/**
 * A declarative way to define CLI interface. This class inherits from `CLI::App` and therefore it
 * can be used like a regular `CLI::App` object once it is defined. This way, we can have a
 * declarative base with the ability to customize it.
 */
template <typename... Args>
struct App: public CLI::App, public Args... {
    explicit App(std::string const& description) : CLI::App(description), Args(this)...
    {
        this->set_config("--config", "", "Configuration .ini file", false);
    }
};

}  // namespace textclean
