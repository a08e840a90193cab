#include "program/clean_text.hpp"

#include "app.hpp"

namespace textclean {

auto CleanTextSettings::parse(int argc, char const* const* argv)
    -> std::variant<CleanTextSettings, int> {
    App<arg::CleanFile, arg::Threads, arg::BatchSize<100'000>, arg::LogLevel> app{
        "clean_text - strip terminal escape sequences and replace box-drawing glyphs with ASCII."
    };
    try {
        app.parse(argc, argv);
    } catch (CLI::ParseError const& e) {
        return app.exit(e);
    }
    CleanTextSettings settings;
    settings.input = app.input();
    settings.output = app.output();
    settings.threads = app.threads();
    settings.batch_size = app.batch_size();
    settings.log_level = app.log_level();
    return settings;
}

}  // namespace textclean
