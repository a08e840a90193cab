#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <variant>

#include <spdlog/spdlog.h>
#include <tbb/global_control.h>

#include "program/clean_text.hpp"
#include "textclean/file_picker.hpp"
#include "textclean/line_driver.hpp"
#include "textclean/output_path.hpp"
#include "textclean/text_cleaner.hpp"

using namespace textclean;

int main(int argc, char const** argv) {
    auto result = CleanTextSettings::parse(argc, argv);
    if (auto* exit_code = std::get_if<int>(&result); exit_code != nullptr) {
        return *exit_code;
    }
    auto const& settings = std::get<CleanTextSettings>(result);

    spdlog::set_level(settings.log_level);

    tbb::global_control control(tbb::global_control::max_allowed_parallelism, settings.threads);
    spdlog::debug("Number of worker threads: {}", settings.threads);

    try {
        std::filesystem::path input;
        if (settings.input) {
            input = *settings.input;
        } else {
            TerminalFilePicker picker(std::filesystem::current_path(), std::cin, std::cerr);
            input = picker.pick();
        }
        auto output = settings.output.value_or(output_path_for(input));

        spdlog::info("Processing file: {}", input.string());
        spdlog::info("Output will be saved to: {}", output.string());

        auto stats = clean_file(
            input, output, make_text_cleaner(), CleanOptions{settings.threads, settings.batch_size}
        );
        spdlog::info(
            "Cleaning completed: {} lines, {} bytes in, {} bytes out. Output saved to {}",
            stats.lines,
            stats.bytes_in,
            stats.bytes_out,
            output.string()
        );
    } catch (std::exception const& err) {
        spdlog::error("{}", err.what());
        return EXIT_FAILURE;
    }
    return EXIT_SUCCESS;
}
