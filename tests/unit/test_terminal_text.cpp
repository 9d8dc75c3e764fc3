#include <catch2/catch_test_macros.hpp>
#include "agentrelay/response/terminal_text.hpp"

using namespace agentrelay::response;

TEST_CASE("Strip CSI color and cursor sequences", "[terminal_text]") {
    REQUIRE(strip_control_sequences("\x1b[1;32mdone\x1b[0m") == "done");
    REQUIRE(strip_control_sequences("a\x1b[2Kb\x1b[?25lc") == "abc");
}

TEST_CASE("Strip OSC titles with BEL and ST terminators", "[terminal_text]") {
    REQUIRE(strip_control_sequences("\x1b]0;title\x07text") == "text");
    REQUIRE(strip_control_sequences("\x1b]8;;http://x\x1b\\link") == "link");
}

TEST_CASE("Normalize carriage returns and no-break spaces", "[terminal_text]") {
    REQUIRE(strip_control_sequences("one\r\ntwo\rthree") == "one\ntwo\nthree");
    REQUIRE(strip_control_sequences("a\xc2\xa0" "b") == "a b");
    REQUIRE(strip_control_sequences("bell\x07 del\x7f") == "bell del");
    REQUIRE(strip_control_sequences("tab\tkept") == "tab\tkept");
}

TEST_CASE("Multi-byte glyphs pass through", "[terminal_text]") {
    REQUIRE(strip_control_sequences("⏺ résumé ❯") == "⏺ résumé ❯");
}

TEST_CASE("Split and join lines", "[terminal_text]") {
    auto lines = split_lines("a\n\nb\n");
    REQUIRE(lines.size() == 3);
    REQUIRE(lines[0] == "a");
    REQUIRE(lines[1].empty());
    REQUIRE(lines[2] == "b");
    REQUIRE(join_lines(lines) == "a\n\nb");
    REQUIRE(join_lines(lines, 1, 3) == "\nb");
    REQUIRE(split_lines("").empty());
}

TEST_CASE("Trim helpers", "[terminal_text]") {
    REQUIRE(trim("  x \t") == "x");
    REQUIRE(ltrim("  x ") == "x ");
    REQUIRE(rtrim("  x ") == "  x");
    REQUIRE(is_blank(" \t "));
    REQUIRE_FALSE(is_blank(" . "));

    std::vector<std::string> lines{"", "  ", "body", "", "more", " "};
    trim_blank_lines(lines);
    REQUIRE(lines == std::vector<std::string>{"body", "", "more"});
}
