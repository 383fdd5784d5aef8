#pragma once

#include "fixloop/model/task.hpp"

#include <string>
#include <string_view>

namespace fixloop {

struct ReviewOutcome {
  Review review;
  // High risk or any reported security issue
  bool needs_human_review{false};
  // False when the answer was not JSON; such a review approves
  bool conclusive{true};
};

[[nodiscard]] auto build_manager_prompt(const Task& task) -> std::string;

// Formats the manager's JSON answer; anything else is used verbatim.
[[nodiscard]] auto parse_plan(std::string_view content) -> std::string;

[[nodiscard]] auto build_coder_prompt(const Task& task, const Attempt& attempt)
    -> std::string;

// Context section for a retried CODING phase. Empty when nothing carries.
[[nodiscard]] auto build_retry_context(const CarriedContext& carried)
    -> std::string;

// A non-JSON answer becomes fix.<language> holding the raw text.
[[nodiscard]] auto parse_patch(std::string_view content,
                               std::string_view language) -> Patch;

[[nodiscard]] auto build_reviewer_prompt(const Task& task, const Patch& patch)
    -> std::string;

[[nodiscard]] auto parse_review(std::string_view content) -> ReviewOutcome;

}  // namespace fixloop
