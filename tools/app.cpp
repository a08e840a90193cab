#include "app.hpp"

namespace textclean::arg {

CleanFile::CleanFile(CLI::App* app) {
    app->add_option("-i,--input", m_input, "Input text file (picked interactively if omitted)")
        ->check(CLI::ExistingFile);
    app->add_option("-o,--output", m_output, "Output file (defaults to <input stem>_output.txt)");
}

auto CleanFile::input() const -> std::optional<std::filesystem::path> {
    if (m_input) {
        return std::filesystem::path(*m_input);
    }
    return std::nullopt;
}

auto CleanFile::output() const -> std::optional<std::filesystem::path> {
    if (m_output) {
        return std::filesystem::path(*m_output);
    }
    return std::nullopt;
}

Threads::Threads(CLI::App* app) {
    app->add_option("-j,--threads", m_threads, "Number of threads")
        ->capture_default_str()
        ->check(CLI::PositiveNumber);
}

auto Threads::threads() const -> std::size_t {
    return m_threads;
}

LogLevel::LogLevel(CLI::App* app) {
    app->add_option("-L,--log-level", m_level, "Log level")
        ->capture_default_str()
        ->check(CLI::IsMember(VALID_LEVELS));
}

auto LogLevel::log_level() const -> spdlog::level::level_enum {
    return ENUM_MAP.at(m_level);
}

const std::set<std::string> LogLevel::VALID_LEVELS = {
    "trace", "debug", "info", "warn", "err", "critical", "off"
};
const std::map<std::string, spdlog::level::level_enum> LogLevel::ENUM_MAP = {
    {"trace", spdlog::level::level_enum::trace},
    {"debug", spdlog::level::level_enum::debug},
    {"info", spdlog::level::level_enum::info},
    {"warn", spdlog::level::level_enum::warn},
    {"err", spdlog::level::level_enum::err},
    {"critical", spdlog::level::level_enum::critical},
    {"off", spdlog::level::level_enum::off}
};

}  // namespace textclean::arg
