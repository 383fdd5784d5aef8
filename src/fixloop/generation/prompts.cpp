#include "fixloop/generation/prompts.hpp"

#include "fixloop/model/state_strings.hpp"
#include "fixloop/sandbox/sandbox.hpp"

#include <nlohmann/json.hpp>

#include <format>
#include <iterator>
#include <optional>

namespace fixloop {

namespace {

using nlohmann::json;

// Accepts a bare JSON object or one wrapped in a ``` fence.
auto parse_object(std::string_view content) -> std::optional<json> {
  auto j = json::parse(content, nullptr, false);
  if (!j.is_discarded() && j.is_object()) {
    return j;
  }
  auto open = content.find('{');
  auto close = content.rfind('}');
  if (content.find("```") == std::string_view::npos ||
      open == std::string_view::npos || close == std::string_view::npos ||
      close < open) {
    return std::nullopt;
  }
  j = json::parse(content.substr(open, close - open + 1), nullptr, false);
  if (j.is_discarded() || !j.is_object()) {
    return std::nullopt;
  }
  return j;
}

auto join_strings(const json& j, std::string_view key) -> std::string {
  std::string out;
  auto it = j.find(key);
  if (it == j.end() || !it->is_array()) {
    return out;
  }
  for (const auto& item : *it) {
    if (!item.is_string()) {
      continue;
    }
    if (!out.empty()) {
      out += ", ";
    }
    out += item.get<std::string>();
  }
  return out;
}

auto string_or(const json& j, std::string_view key, std::string_view fallback)
    -> std::string {
  auto it = j.find(key);
  if (it != j.end() && it->is_string()) {
    return it->get<std::string>();
  }
  return std::string(fallback);
}

auto or_none(std::string s) -> std::string {
  return s.empty() ? std::string("None") : s;
}

}  // namespace

auto build_manager_prompt(const Task& task) -> std::string {
  return std::format(R"(You are a senior software engineer analyzing a bug report.

Bug Description:
{}

Repository: {}
Branch: {}
Language: {}
Test Command: {}

Please analyze this bug and provide:
1. Root cause analysis
2. Potential security implications
3. Suggested fix approach
4. Files that likely need modification
5. Test scenarios to validate the fix

Format your response as a JSON object with these keys:
- root_cause: string
- security_risk: boolean
- fix_approach: string
- affected_files: list of strings
- test_scenarios: list of strings
)",
                     task.issue, task.repo.url, task.repo.branch,
                     task.language,
                     task.test_command.value_or("Not specified"));
}

auto parse_plan(std::string_view content) -> std::string {
  auto j = parse_object(content);
  if (!j) {
    return std::string(content);
  }
  bool security = j->value("security_risk", false);
  return std::format(
      "Root Cause: {}\nSecurity Risk: {}\nFix Approach: {}\n"
      "Affected Files: {}\nTest Scenarios: {}\n",
      string_or(*j, "root_cause", "Unknown"), security ? "Yes" : "No",
      string_or(*j, "fix_approach", "Standard debugging"),
      join_strings(*j, "affected_files"), join_strings(*j, "test_scenarios"));
}

auto build_retry_context(const CarriedContext& carried) -> std::string {
  if (carried.empty()) {
    return {};
  }
  std::string out;
  auto it = std::back_inserter(out);
  if (carried.previous_patch) {
    std::format_to(it, "## Previous patch ({})\n```\n{}\n```\n\n",
                   carried.previous_patch->filename,
                   carried.previous_patch->code);
  }
  if (!carried.test_stdout_tail.empty()) {
    std::format_to(it, "## Test stdout (tail)\n{}\n\n", carried.test_stdout_tail);
  }
  if (!carried.test_stderr_tail.empty()) {
    std::format_to(it, "## Test stderr (tail)\n{}\n\n", carried.test_stderr_tail);
  }
  if (!carried.review_comments.empty()) {
    std::format_to(it, "## Reviewer feedback\n{}\n\n", carried.review_comments);
  }
  return out;
}

auto build_coder_prompt(const Task& task, const Attempt& attempt)
    -> std::string {
  auto context = build_retry_context(attempt.carried);
  return std::format(R"(You are an expert programmer fixing a bug.

Bug Description:
{}

Bug Analysis:
{}

{}Language: {}
Repository: {}

Generate a complete, working code patch to fix this bug.
The code should be production-ready and include:
1. The fix implementation
2. Error handling
3. Comments explaining the fix

Format your response as a JSON object with:
- filename: string (main file to patch, relative to the repository root)
- code: string (complete fixed code, or a unified diff)
- dependencies: object (e.g., {{"requirements.txt": "package==version"}})
- explanation: string (what was fixed and why)
)",
                     task.issue,
                     attempt.plan.value_or("No analysis available"),
                     context.empty() ? std::string{}
                                     : std::format("Previous attempt:\n{}",
                                                   context),
                     task.language, task.repo.url);
}

auto parse_patch(std::string_view content, std::string_view language)
    -> Patch {
  Patch patch;
  auto j = parse_object(content);
  if (!j) {
    patch.filename = std::format("fix.{}", language);
    patch.code = std::string(content);
    patch.explanation = "Generated fix";
    return patch;
  }

  const auto* spec = find_language(language);
  patch.filename = string_or(*j, "filename",
                             spec ? spec->code_file : std::string_view("main.py"));
  patch.code = string_or(*j, "code", "");
  patch.explanation = string_or(*j, "explanation", "");
  if (auto deps = j->find("dependencies");
      deps != j->end() && deps->is_object()) {
    for (const auto& [name, value] : deps->items()) {
      if (value.is_string()) {
        patch.dependencies[name] = value.get<std::string>();
      }
    }
  }
  return patch;
}

auto build_reviewer_prompt(const Task& task, const Patch& patch)
    -> std::string {
  return std::format(R"(You are a senior code reviewer performing a security and quality review.

Original Bug:
{}

Proposed Fix ({}):
```{}
{}
```

Explanation: {}

Review this code for:
1. Correctness: Does it fix the bug?
2. Security: Any vulnerabilities introduced?
3. Performance: Any performance issues?
4. Best Practices: Does it follow language conventions?
5. Edge Cases: Are edge cases handled?

Provide your review as a JSON object with:
- status: "approved" or "rejected"
- security_issues: list of security concerns
- quality_issues: list of quality concerns
- suggestions: list of improvement suggestions
- risk_level: "low", "medium", or "high"
)",
                     task.issue, patch.filename, task.language, patch.code,
                     patch.explanation.empty() ? "None provided"
                                               : patch.explanation);
}

auto parse_review(std::string_view content) -> ReviewOutcome {
  ReviewOutcome outcome;
  auto j = parse_object(content);
  if (!j) {
    outcome.conclusive = false;
    outcome.review.approved = true;
    outcome.review.comments = std::string(content);
    return outcome;
  }

  auto status = string_or(*j, "status", "rejected");
  auto risk = string_or(*j, "risk_level", "unknown");
  auto security = join_strings(*j, "security_issues");

  outcome.review.approved = status == "approved";
  outcome.review.risk = parse_risk_level(risk);
  outcome.review.security_issues = !security.empty();
  outcome.review.comments = std::format(
      "Status: {}\nRisk Level: {}\nSecurity Issues: {}\nQuality Issues: {}\n"
      "Suggestions: {}\n",
      status, risk, or_none(security), or_none(join_strings(*j, "quality_issues")),
      or_none(join_strings(*j, "suggestions")));
  outcome.needs_human_review =
      outcome.review.risk == RiskLevel::High || outcome.review.security_issues;
  return outcome;
}

}  // namespace fixloop
