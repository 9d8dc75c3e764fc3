#include <catch2/catch_test_macros.hpp>
#include "agentrelay/response/state_classifier.hpp"

#include <string>

using namespace agentrelay::response;
using agentrelay::core::ScreenState;

namespace {

const PatternLibrary& patterns() {
    static const PatternLibrary library = PatternLibrary::builtin();
    return library;
}

}  // namespace

TEST_CASE("Empty prompt after an answer is idle", "[classifier]") {
    StateClassifier classifier(patterns());

    auto result = classifier.explain("> ping\n⏺ pong\n\n>\n");
    REQUIRE(result.state == ScreenState::Idle);
    REQUIRE(result.rule == "bare_prompt");
}

TEST_CASE("Boxed prompt with footer chrome is idle", "[classifier]") {
    StateClassifier classifier(patterns());

    std::string screen =
        "⏺ All done.\n"
        "╭──────────────────────╮\n"
        "│ >                    │\n"
        "╰──────────────────────╯\n"
        "  ? for shortcuts\n";
    REQUIRE(classifier.classify(screen) == ScreenState::Idle);
}

TEST_CASE("Spinner above the always-visible prompt is working", "[classifier]") {
    StateClassifier classifier(patterns());

    std::string screen =
        "> refactor the parser\n"
        "✻ Thinking… (4s · esc to interrupt)\n"
        "╭──────────────────────╮\n"
        "│ >                    │\n"
        "╰──────────────────────╯\n";
    REQUIRE(classifier.classify(screen) == ScreenState::Working);
}

TEST_CASE("Permission prompt has highest priority", "[classifier]") {
    StateClassifier classifier(patterns());

    std::string screen =
        "Bash(rm -rf build)\n"
        "Do you want to proceed?\n"
        "❯ 1. Yes\n"
        "  2. No\n";
    REQUIRE(classifier.classify(screen) == ScreenState::PermissionRequested);

    std::string with_error = "API Error: 500\nAllow this command? (y/n)\n";
    REQUIRE(classifier.classify(with_error) == ScreenState::PermissionRequested);
}

TEST_CASE("Error marker beats idle prompt", "[classifier]") {
    StateClassifier classifier(patterns());

    auto result = classifier.explain("API Error: Repeated 529 Overloaded errors\n\n>\n");
    REQUIRE(result.state == ScreenState::Error);
    REQUIRE(result.rule == "api_error");
}

TEST_CASE("A question in the answer is not a permission prompt", "[classifier]") {
    StateClassifier classifier(patterns());

    REQUIRE(classifier.classify("⏺ Would you like me to continue? yes/no\n\n>\n") == ScreenState::Idle);
}

TEST_CASE("Unrecognised screens are unknown", "[classifier]") {
    StateClassifier classifier(patterns());

    REQUIRE(classifier.classify("") == ScreenState::Unknown);
    REQUIRE(classifier.classify("\n\n   \n") == ScreenState::Unknown);
    REQUIRE(classifier.classify("> ping\n") == ScreenState::Unknown);
}

TEST_CASE("Only the tail window is considered", "[classifier]") {
    StateClassifier classifier(patterns(), 12);

    std::string screen = "Do you want to proceed? (y/n)\n";
    for (int i = 0; i < 15; ++i) {
        screen += "line " + std::to_string(i) + "\n";
    }
    screen += ">\n";

    REQUIRE(classifier.classify(screen) == ScreenState::Idle);
}

TEST_CASE("Control sequences do not hide the prompt", "[classifier]") {
    StateClassifier classifier(patterns());

    REQUIRE(classifier.classify("\x1b[32m⏺ ok\x1b[0m\r\n\x1b[1m>\x1b[0m \r\n") == ScreenState::Idle);
}

TEST_CASE("Numbered options in an answer are not a dialog", "[classifier]") {
    StateClassifier classifier(patterns());

    std::string screen =
        "> which to pick?\n"
        "⏺ Two options:\n"
        "1. Yes, upgrade now\n"
        "2. No, wait a week\n"
        ">\n";
    REQUIRE(classifier.classify(screen) == ScreenState::Idle);
}

TEST_CASE("Quoted error text in an answer is not a session error", "[classifier]") {
    StateClassifier classifier(patterns());

    std::string screen =
        "> why is the job failing?\n"
        "⏺ The log says:\n"
        "Error: connection refused by the DB\n"
        "That means postgres is down.\n"
        ">\n";
    REQUIRE(classifier.classify(screen) == ScreenState::Idle);
}

TEST_CASE("Option menu after a tool call is a dialog", "[classifier]") {
    StateClassifier classifier(patterns());

    std::string screen =
        "> clean up\n"
        "⏺ I'll remove the build directory.\n"
        "⏺ Bash(rm -rf build)\n"
        "❯ 1. Yes\n"
        "  2. No, and tell Claude what to do differently\n";
    auto result = classifier.explain(screen);
    REQUIRE(result.state == ScreenState::PermissionRequested);
    REQUIRE(result.rule == "permission_accept");

    // A lone menu line is not enough
    REQUIRE(classifier.classify("> clean up\n⏺ Bash(rm -rf build)\n❯ 1. Yes\n") != ScreenState::PermissionRequested);
}

TEST_CASE("Errors from an earlier turn are ignored", "[classifier]") {
    StateClassifier classifier(patterns());

    std::string screen =
        "> hi\n"
        "  ⎿  API Error: 529 overloaded\n"
        "> hi again\n"
        "⏺ Hello.\n"
        ">\n";
    REQUIRE(classifier.classify(screen) == ScreenState::Idle);

    auto current = classifier.explain("> hi\n  ⎿  API Error: 529 overloaded\n\n>\n");
    REQUIRE(current.state == ScreenState::Error);
    REQUIRE(current.rule == "api_error");
}
