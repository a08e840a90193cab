#define CATCH_CONFIG_MAIN

#include <filesystem>

#include <catch2/catch.hpp>

#include "textclean/output_path.hpp"

using namespace textclean;
using std::filesystem::path;

TEST_CASE("Output path is a sibling of the input") {
    REQUIRE(output_path_for(path("/data/log.txt")) == path("/data/log_output.txt"));
    REQUIRE(output_path_for(path("log.txt")) == path("log_output.txt"));
    REQUIRE(output_path_for(path("dir/sub/report.txt")) == path("dir/sub/report_output.txt"));
}

TEST_CASE("Only the last extension is replaced") {
    REQUIRE(output_path_for(path("/data/archive.tar.txt")) == path("/data/archive.tar_output.txt"));
    REQUIRE(output_path_for(path("/data/notes")) == path("/data/notes_output.txt"));
    REQUIRE(output_path_for(path("/data/.hidden")) == path("/data/.hidden_output.txt"));
}

TEST_CASE("Fallback name without a stem") {
    REQUIRE(output_path_for(path("/data/")) == path("/data/output_output.txt"));
    REQUIRE(output_path_for(path("/data/..")) == path("/data/output_output.txt"));
    REQUIRE(output_path_for(path("")) == path("output_output.txt"));
}
