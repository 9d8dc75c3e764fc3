#include "agentrelay/context/context_composer.hpp"
#include "agentrelay/core/uuid.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <sstream>

namespace agentrelay::context {

// PromptBuilder
PromptBuilder& PromptBuilder::with_header(const std::string& header, const std::string& destination) {
    std::ostringstream ss;
    if (!header.empty()) {
        ss << header << "\n";
    }
    if (!destination.empty()) {
        ss << "Destination: " << destination << "\n";
    }
    header_ = ss.str();
    return *this;
}

PromptBuilder& PromptBuilder::with_time(TimePoint now) {
    std::time_t t = Clock::to_time_t(now);
    std::tm local{};
    localtime_r(&t, &local);

    std::ostringstream ss;
    ss << "## Current Time\n" << std::put_time(&local, "%A, %Y-%m-%d %H:%M %Z") << "\n";
    time_ = ss.str();
    return *this;
}

PromptBuilder& PromptBuilder::with_memory_context(const std::string& memory) {
    if (memory.empty()) {
        memory_.clear();
        return *this;
    }
    memory_ = "## Memory Context\n" + memory + "\n";
    return *this;
}

PromptBuilder& PromptBuilder::with_recent(const std::vector<Exchange>& recent) {
    if (recent.empty()) {
        recent_.clear();
        return *this;
    }

    recent_ = "## Recent Conversation\n" + RecentBuffer::format(recent);
    return *this;
}

PromptBuilder& PromptBuilder::with_message(const std::string& message) {
    message_ = "## Current Message\n" + message + "\n";
    return *this;
}

std::string PromptBuilder::build() const {
    std::ostringstream ss;
    bool first = true;
    for (const auto* section : {&header_, &time_, &memory_, &recent_, &message_}) {
        if (section->empty()) {
            continue;
        }
        if (!first) {
            ss << "\n";
        }
        ss << *section;
        first = false;
    }

    std::string out = ss.str();
    while (!out.empty() && (out.back() == '\n' || out.back() == ' ')) {
        out.pop_back();
    }
    return out;
}

// ContextComposer
ContextComposer::ContextComposer(const ComposerConfig& config)
    : config_(config)
{
}

std::string ContextComposer::pointer_instruction(const fs::path& artifact) {
    return "Read " + artifact.string() +
           " and respond to the user's latest message in the Current Message section.";
}

std::string ContextComposer::append_sentinel(const std::string& text, const std::string& sentinel) {
    return text + " (ref " + sentinel + ")";
}

std::string ContextComposer::build(const std::string& memory_context,
                                   const std::vector<Exchange>& recent,
                                   const std::string& request,
                                   const std::string& destination) const
{
    PromptBuilder builder;
    builder.with_header(config_.header, destination)
           .with_memory_context(memory_context)
           .with_recent(recent)
           .with_message(request);

    if (config_.include_time) {
        builder.with_time(Clock::now());
    }

    return builder.build();
}

Result<Submission, Error> ContextComposer::compose(const std::string& memory_context,
                                                   const std::vector<Exchange>& recent,
                                                   const std::string& request,
                                                   const std::optional<std::string>& sentinel,
                                                   const std::string& destination)
{
    Submission submission;
    submission.sentinel = sentinel;

    std::string composed = build(memory_context, recent, request, destination);
    submission.composed_size = composed.size();

    if (composed.size() <= static_cast<size_t>(config_.inline_threshold)) {
        submission.text = sentinel ? append_sentinel(composed, *sentinel) : composed;
        return Result<Submission, Error>::ok(std::move(submission));
    }

    fs::path artifact = config_.artifact_dir / ("context_" + generate_artifact_id() + ".md");
    auto written = write_artifact(artifact, composed);
    if (written.is_err()) {
        spdlog::warn("Context artifact not written, submitting {} bytes inline: {}",
                     composed.size(), written.error().full_message());
        submission.text = sentinel ? append_sentinel(composed, *sentinel) : composed;
        submission.inline_fallback = true;
        return Result<Submission, Error>::ok(std::move(submission));
    }

    spdlog::debug("Prompt of {} bytes written to {}", composed.size(), artifact.string());

    auto pruned = prune_artifacts();
    if (pruned.is_err()) {
        spdlog::warn("Artifact pruning failed: {}", pruned.error().full_message());
    }

    std::string instruction = pointer_instruction(artifact);
    submission.text = sentinel ? append_sentinel(instruction, *sentinel) : instruction;
    submission.artifact = artifact;
    return Result<Submission, Error>::ok(std::move(submission));
}

Result<void, Error> ContextComposer::write_artifact(const fs::path& artifact, const std::string& composed) const {
    try {
        fs::create_directories(config_.artifact_dir);
        std::ofstream file(artifact, std::ios::trunc);
        if (!file) {
            return Result<void, Error>::err(
                ErrorCode::FileWriteFailed, "Failed to write context artifact", artifact.string());
        }
        file << composed << "\n";
        if (!file.flush()) {
            return Result<void, Error>::err(
                ErrorCode::FileWriteFailed, "Failed to write context artifact", artifact.string());
        }
    } catch (const fs::filesystem_error& e) {
        return Result<void, Error>::err(ErrorCode::FileWriteFailed, e.what(), artifact.string());
    }
    return Result<void, Error>::ok();
}

Result<size_t, Error> ContextComposer::prune_artifacts() const {
    if (config_.artifact_retention <= 0) {
        return Result<size_t, Error>::ok(0);
    }

    try {
        std::vector<fs::directory_entry> artifacts;
        for (const auto& entry : fs::directory_iterator(config_.artifact_dir)) {
            auto name = entry.path().filename().string();
            if (entry.is_regular_file() && name.rfind("context_", 0) == 0 && entry.path().extension() == ".md") {
                artifacts.push_back(entry);
            }
        }

        size_t keep = static_cast<size_t>(config_.artifact_retention);
        if (artifacts.size() <= keep) {
            return Result<size_t, Error>::ok(0);
        }

        std::sort(artifacts.begin(), artifacts.end(), [](const auto& a, const auto& b) {
            return a.last_write_time() < b.last_write_time();
        });

        size_t removed = 0;
        for (size_t i = 0; i + keep < artifacts.size(); ++i) {
            if (fs::remove(artifacts[i].path())) {
                ++removed;
            }
        }
        return Result<size_t, Error>::ok(removed);

    } catch (const fs::filesystem_error& e) {
        return Result<size_t, Error>::err(ErrorCode::FileWriteFailed, e.what(), config_.artifact_dir.string());
    }
}

}  // namespace agentrelay::context
