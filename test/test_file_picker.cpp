#define CATCH_CONFIG_MAIN

#include <filesystem>
#include <fstream>
#include <sstream>
#include <vector>

#include <catch2/catch.hpp>

#include "textclean/file_picker.hpp"
#include "textclean/temporary_directory.hpp"

using namespace textclean;

struct PickerFixture {
    TemporaryDirectory tmp;

    PickerFixture() {
        for (auto name: {"b.txt", "a.txt", "notes.md", "C.TXT"}) {
            std::ofstream(tmp.path() / name) << "content\n";
        }
        std::filesystem::create_directory(tmp.path() / "dir.txt");
    }

    auto pick(std::string const& answers) -> std::filesystem::path {
        std::istringstream in(answers);
        std::ostringstream out;
        TerminalFilePicker picker(tmp.path(), in, out);
        return picker.pick();
    }
};

TEST_CASE("Text file extension") {
    REQUIRE(has_txt_extension("a.txt"));
    REQUIRE(has_txt_extension("/x/y/A.TXT"));
    REQUIRE_FALSE(has_txt_extension("a.md"));
    REQUIRE_FALSE(has_txt_extension("txt"));
    REQUIRE_FALSE(has_txt_extension("a.txt.bak"));
}

TEST_CASE_METHOD(PickerFixture, "Candidates are the sorted text files") {
    std::istringstream in;
    std::ostringstream out;
    TerminalFilePicker picker(tmp.path(), in, out);
    REQUIRE(
        picker.candidates()
        == std::vector<std::filesystem::path>{
            tmp.path() / "C.TXT", tmp.path() / "a.txt", tmp.path() / "b.txt"
        }
    );
}

TEST_CASE_METHOD(PickerFixture, "Listing is printed before the prompt") {
    std::istringstream in("1\n");
    std::ostringstream out;
    TerminalFilePicker picker(tmp.path(), in, out);
    REQUIRE(picker.pick() == tmp.path() / "C.TXT");
    REQUIRE(out.str().find("[1] C.TXT\n  [2] a.txt\n  [3] b.txt\n") != std::string::npos);
}

TEST_CASE_METHOD(PickerFixture, "Pick by number") {
    REQUIRE(pick("2\n") == tmp.path() / "a.txt");
    REQUIRE(pick("  3  \n") == tmp.path() / "b.txt");
}

TEST_CASE_METHOD(PickerFixture, "Pick by path") {
    REQUIRE(pick("b.txt\n") == tmp.path() / "b.txt");
    auto absolute = (tmp.path() / "a.txt").string();
    REQUIRE(pick(absolute + "\n") == tmp.path() / "a.txt");
}

TEST_CASE_METHOD(PickerFixture, "Invalid answers are asked again") {
    REQUIRE(pick("notes.md\nmissing.txt\n9\n0\ndir.txt\na.txt\n") == tmp.path() / "a.txt");
}

TEST_CASE_METHOD(PickerFixture, "Cancel") {
    REQUIRE_THROWS_AS(pick("\n"), UserCancelled);
    REQUIRE_THROWS_AS(pick("   \n1\n"), UserCancelled);
    REQUIRE_THROWS_AS(pick(""), UserCancelled);
    REQUIRE_THROWS_AS(pick("notes.md\n"), UserCancelled);
}
