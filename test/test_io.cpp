#define CATCH_CONFIG_MAIN

#include <fstream>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

#include <catch2/catch.hpp>

#include "textclean/io.hpp"
#include "textclean/temporary_directory.hpp"

using namespace textclean;

auto read_lines(std::string const& input) -> std::vector<std::string> {
    std::istringstream is(input);
    std::vector<std::string> lines;
    io::for_each_line(is, [&](std::string const& line) { lines.push_back(line); });
    return lines;
}

TEST_CASE("Line terminators are stripped") {
    REQUIRE(read_lines("").empty());
    REQUIRE(read_lines("a\nb\n") == std::vector<std::string>{"a", "b"});
    REQUIRE(read_lines("a\nb") == std::vector<std::string>{"a", "b"});
    REQUIRE(read_lines("a\r\nb\r\n") == std::vector<std::string>{"a", "b"});
    REQUIRE(read_lines("\n\n") == std::vector<std::string>{"", ""});
    REQUIRE(read_lines("a\rb\n") == std::vector<std::string>{"a\rb"});
}

TEST_CASE("Carriage return without newline is kept") {
    REQUIRE(read_lines("a\r") == std::vector<std::string>{"a\r"});
    REQUIRE(read_lines("a\r\nb\r") == std::vector<std::string>{"a", "b\r"});
    REQUIRE(read_lines("a\r\r\n") == std::vector<std::string>{"a\r"});
}

TEST_CASE("Unicode lines are accepted") {
    REQUIRE(read_lines("╔═╗\nGrüße\n") == std::vector<std::string>{"╔═╗", "Grüße"});
}

TEST_CASE("Invalid UTF-8 stops reading") {
    std::istringstream is("ok\nbad \xFF\xFE byte\nnever\n");
    std::vector<std::string> lines;
    std::optional<std::size_t> failed_line;
    try {
        io::for_each_line(is, [&](std::string const& line) { lines.push_back(line); });
    } catch (io::InvalidEncoding const& err) {
        failed_line = err.line_number();
    }
    REQUIRE(failed_line == std::optional<std::size_t>(2));
    REQUIRE(lines == std::vector<std::string>{"ok"});
}

TEST_CASE("Invalid encoding is an IO error") {
    std::istringstream is("\xC3\x28\n");
    REQUIRE_THROWS_AS(io::for_each_line(is, [](std::string const&) {}), io::IoError);
}

TEST_CASE("UTF-8 validation") {
    REQUIRE(io::is_valid_utf8(""));
    REQUIRE(io::is_valid_utf8("ascii"));
    REQUIRE(io::is_valid_utf8("├──┤ 世界"));
    REQUIRE_FALSE(io::is_valid_utf8("\xE2\x94"));
    REQUIRE_FALSE(io::is_valid_utf8("\xC0\xAF"));
}

TEST_CASE("Resolve path") {
    TemporaryDirectory tmp;
    auto file = tmp.path() / "input.txt";
    std::ofstream(file) << "text\n";
    REQUIRE(io::resolve_path(file) == file);
    REQUIRE_THROWS_AS(io::resolve_path(tmp.path() / "missing.txt"), io::NoSuchFile);
    REQUIRE_THROWS_WITH(
        io::resolve_path(tmp.path() / "missing.txt"), Catch::Contains("No such file")
    );
}
