#include <catch2/catch_test_macros.hpp>
#include "agentrelay/response/response_extractor.hpp"

using namespace agentrelay::response;

namespace {

const PatternLibrary& patterns() {
    static const PatternLibrary library = PatternLibrary::builtin();
    return library;
}

}  // namespace

TEST_CASE("Marker extraction returns exactly the text after the sentinel", "[extractor]") {
    ResponseExtractor extractor(patterns());

    std::string after =
        "old scrollback\n"
        "> what is the answer (ref R-1A2B3C4D)\n"
        "The answer is 42.\n"
        "\n"
        "It has always been 42.\n"
        "\n"
        ">\n"
        "  ? for shortcuts\n";

    auto extraction = extractor.extract("", after, std::string("R-1A2B3C4D"));
    REQUIRE(extraction.strategy == ExtractionStrategy::Marker);
    REQUIRE(extraction.text == "The answer is 42.\n\nIt has always been 42.");
}

TEST_CASE("Marker extraction uses the last occurrence", "[extractor]") {
    ResponseExtractor extractor(patterns());

    std::string after =
        "> first (ref R-00000001)\n"
        "stale answer\n"
        ">\n"
        "> first again (ref R-00000001)\n"
        "fresh answer\n"
        ">\n";

    auto text = extractor.extract_after_marker(after, "R-00000001");
    REQUIRE(text.has_value());
    REQUIRE(*text == "fresh answer");
}

TEST_CASE("Missing sentinel falls back to diff", "[extractor]") {
    ResponseExtractor extractor(patterns());

    std::string before = "⏺ earlier answer\n\n>\n";
    std::string after =
        "⏺ earlier answer\n"
        "> [Pasted text #1 +12 lines]\n"
        "⏺ new answer\n"
        "\n"
        ">\n";

    auto extraction = extractor.extract(before, after, std::string("R-FFFFFFFF"));
    REQUIRE(extraction.strategy == ExtractionStrategy::DiffFallback);
    REQUIRE(extraction.text == "⏺ new answer");
}

TEST_CASE("Diff extraction without a sentinel", "[extractor]") {
    ResponseExtractor extractor(patterns());

    SECTION("before is a prefix of after") {
        auto extraction = extractor.extract("line a\nline b\n>\n", "line a\nline b\n> hi\nhello there\n>\n");
        REQUIRE(extraction.strategy == ExtractionStrategy::Diff);
        REQUIRE(extraction.text == "hello there");
    }

    SECTION("capture window scrolled") {
        std::string before = "one\ntwo\nthree\n>\n";
        std::string after = "two\nthree\n> next\nfour\nfive\n>\n";
        REQUIRE(extractor.extract_diff(before, after) == "four\nfive");
    }

    SECTION("echo only yields nothing") {
        REQUIRE(extractor.extract_diff(">\n", "> ping\n\n>\n").empty());
    }
}

TEST_CASE("Control sequences are stripped before comparing", "[extractor]") {
    ResponseExtractor extractor(patterns());

    std::string before = "\x1b[1mbanner\x1b[0m\n>\n";
    std::string after = "banner\n> q\n\x1b[36manswer\x1b[0m\n>\n";
    REQUIRE(extractor.extract_diff(before, after) == "answer");
}
