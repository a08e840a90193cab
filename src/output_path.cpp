#include "textclean/output_path.hpp"

#include <fmt/format.h>

namespace textclean {

auto output_path_for(std::filesystem::path const& input) -> std::filesystem::path {
    auto filename = input.filename();
    std::string output_name = "output_output.txt";
    if (not filename.empty() && filename != "." && filename != "..") {
        output_name = fmt::format("{}_output.txt", input.stem().string());
    }
    auto output = input;
    output.replace_filename(output_name);
    return output;
}

}  // namespace textclean
