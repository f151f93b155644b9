#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include "protocol/generation_contract.hpp"
#include "protocol/iteration_contract.hpp"
#include "session/session.hpp"
#include "workspace/snapshot.hpp"

namespace protoforge::feedback {

struct ComposerLimits {
    std::size_t max_tree_bytes = 120000;
    std::size_t max_feedback_bytes = 8000;
};

// Builds the next generation request from session state. Identical session
// state gives a byte-identical request.
class FeedbackComposer {
public:
    explicit FeedbackComposer(ComposerLimits limits = {});

    protocol::GenerationRequest compose(const session::Session& session) const;

    const ComposerLimits& limits() const { return limits_; }

private:
    ComposerLimits limits_;
};

// Keeps the head and tail halves around a "[TRUNCATED]" marker.
std::string truncate_middle(const std::string& text, std::size_t max_bytes);

std::string render_tree_digest(const workspace::Snapshot& snapshot, std::size_t max_bytes);

// Empty when there is no previous round or it needs no follow-up.
std::string render_feedback_digest(const std::optional<protocol::IterationRecord>& record,
                                   std::size_t max_bytes);

std::string build_system_prompt(const std::string& test_command,
                                const std::string& working_directory,
                                const std::string& tree_digest);

std::string build_user_prompt(const std::string& spec_text, const std::string& feedback_digest);

nlohmann::json request_to_json(const protocol::GenerationRequest& request);

}  // namespace protoforge::feedback
