#include <catch2/catch_test_macros.hpp>
#include "agentrelay/context/context_composer.hpp"
#include "test_support.hpp"

#include <fstream>
#include <sstream>

using namespace agentrelay::context;
using agentrelay::testing::TempDir;

namespace {

ComposerConfig composer_config(const fs::path& dir, int threshold = 1500) {
    ComposerConfig config;
    config.artifact_dir = dir;
    config.inline_threshold = threshold;
    config.include_time = false;
    config.artifact_retention = 3;
    return config;
}

std::string read_file(const fs::path& path) {
    std::ifstream in(path);
    std::stringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

}  // namespace

TEST_CASE("Sections appear in order and empty ones are omitted", "[composer]") {
    TempDir dir;
    ContextComposer composer(composer_config(dir.path()));

    std::vector<Exchange> recent{{"hi", "hello", RequesterKind::Conversational, Clock::now()}};
    auto text = composer.build("Prefers metric units.", recent, "How far is it?");

    auto header = text.find("# CHANNEL CONTEXT");
    auto memory = text.find("## Memory Context");
    auto conversation = text.find("## Recent Conversation");
    auto message = text.find("## Current Message");
    REQUIRE(header == 0);
    REQUIRE(memory != std::string::npos);
    REQUIRE(memory < conversation);
    REQUIRE(conversation < message);
    REQUIRE(text.find("**User:** hi") != std::string::npos);
    REQUIRE(text.find("## Current Time") == std::string::npos);
    REQUIRE(text.substr(text.size() - 14) == "How far is it?");

    auto bare = composer.build("", {}, "ping");
    REQUIRE(bare == "# CHANNEL CONTEXT\n\n## Current Message\nping");
}

TEST_CASE("Current time section is optional", "[composer]") {
    TempDir dir;
    auto config = composer_config(dir.path());
    config.include_time = true;
    ContextComposer composer(config);

    auto text = composer.build("", {}, "ping");
    REQUIRE(text.find("## Current Time") != std::string::npos);
    REQUIRE(text.find("## Current Time") < text.find("## Current Message"));
}

TEST_CASE("Small prompts are submitted inline with the sentinel", "[composer]") {
    TempDir dir;
    ContextComposer composer(composer_config(dir.path()));

    auto submission = composer.compose("", {}, "ping", std::string("R-0000ABCD"));
    REQUIRE(submission.is_ok());
    REQUIRE_FALSE(submission.value().artifact.has_value());
    REQUIRE(submission.value().text == "# CHANNEL CONTEXT\n\n## Current Message\nping (ref R-0000ABCD)");
    REQUIRE(submission.value().sentinel == std::string("R-0000ABCD"));
}

TEST_CASE("Large prompts go to a side artifact", "[composer]") {
    TempDir dir;
    ContextComposer composer(composer_config(dir.path(), 200));

    std::string memory(500, 'm');
    auto submission = composer.compose(memory, {}, "summarize", std::string("R-0000ABCD"));
    REQUIRE(submission.is_ok());

    const auto& value = submission.value();
    REQUIRE(value.artifact.has_value());
    REQUIRE(value.composed_size > 200);
    REQUIRE(fs::exists(*value.artifact));
    REQUIRE(value.artifact->filename().string().rfind("context_ctx_", 0) == 0);
    REQUIRE(value.text == ContextComposer::pointer_instruction(*value.artifact) + " (ref R-0000ABCD)");

    auto contents = read_file(*value.artifact);
    REQUIRE(contents.find(memory) != std::string::npos);
    REQUIRE(contents.find("## Current Message\nsummarize") != std::string::npos);
}

TEST_CASE("Old artifacts are pruned", "[composer]") {
    TempDir dir;
    ContextComposer composer(composer_config(dir.path(), 100));

    std::string memory(300, 'm');
    for (int i = 0; i < 6; ++i) {
        REQUIRE(composer.compose(memory, {}, "q" + std::to_string(i)).is_ok());
    }

    size_t artifacts = 0;
    for (const auto& entry : fs::directory_iterator(dir.path())) {
        if (entry.path().extension() == ".md") {
            ++artifacts;
        }
    }
    REQUIRE(artifacts == 3);
}

TEST_CASE("Pointer instruction wording", "[composer]") {
    REQUIRE(ContextComposer::pointer_instruction("/tmp/context_ctx_1.md") ==
            "Read /tmp/context_ctx_1.md and respond to the user's latest message in the Current Message section.");
}

TEST_CASE("Unwritable artifact directory falls back to inline", "[composer]") {
    TempDir dir;
    auto blocker = dir.path() / "artifacts";
    {
        std::ofstream out(blocker);
        out << "not a directory";
    }
    ContextComposer composer(composer_config(blocker, 100));

    std::string memory(300, 'm');
    auto submission = composer.compose(memory, {}, "summarize", std::string("R-0000ABCD"));
    REQUIRE(submission.is_ok());

    const auto& value = submission.value();
    REQUIRE_FALSE(value.artifact.has_value());
    REQUIRE(value.inline_fallback);
    REQUIRE(value.text.find(memory) != std::string::npos);
    REQUIRE(value.text.size() > value.composed_size);
    REQUIRE(value.text.find("## Current Message\nsummarize (ref R-0000ABCD)") != std::string::npos);
}
