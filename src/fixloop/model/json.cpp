#include "fixloop/model/json.hpp"

#include "fixloop/model/state_strings.hpp"
#include "fixloop/util/log.hpp"

namespace fixloop {

using json = nlohmann::json;

namespace {

template <typename T>
auto read_opt(const json& j, const char* key) -> std::optional<T> {
  if (auto it = j.find(key); it != j.end() && !it->is_null()) {
    return it->get<T>();
  }
  return std::nullopt;
}

template <typename T>
auto write_opt(json& j, const char* key, const std::optional<T>& value)
    -> void {
  if (value) {
    j[key] = *value;
  } else {
    j[key] = nullptr;
  }
}

}  // namespace

void to_json(json& j, const Patch& p) {
  j = json{{"filename", p.filename},
           {"code", p.code},
           {"explanation", p.explanation},
           {"dependencies", p.dependencies}};
}

void from_json(const json& j, Patch& p) {
  p.filename = j.value("filename", "");
  p.code = j.value("code", "");
  p.explanation = j.value("explanation", "");
  p.dependencies =
      j.value("dependencies", std::map<std::string, std::string>{});
}

void to_json(json& j, const Review& r) {
  j = json{{"approved", r.approved},
           {"comments", r.comments},
           {"risk", risk_level_name(r.risk)},
           {"security_issues", r.security_issues}};
}

void from_json(const json& j, Review& r) {
  r.approved = j.value("approved", false);
  r.comments = j.value("comments", "");
  r.risk = parse_risk_level(j.value("risk", "unknown"));
  r.security_issues = j.value("security_issues", false);
}

void to_json(json& j, const TestResult& t) {
  j = json{{"success", t.success},
           {"exit_code", t.exit_code},
           {"stdout", t.stdout_output},
           {"stderr", t.stderr_output},
           {"duration_ms", t.duration.count()},
           {"timed_out", t.timed_out},
           {"resource_exceeded", t.resource_exceeded}};
}

void from_json(const json& j, TestResult& t) {
  t.success = j.value("success", false);
  t.exit_code = j.value("exit_code", -1);
  t.stdout_output = j.value("stdout", "");
  t.stderr_output = j.value("stderr", "");
  t.duration = std::chrono::milliseconds(j.value("duration_ms", 0LL));
  t.timed_out = j.value("timed_out", false);
  t.resource_exceeded = j.value("resource_exceeded", false);
}

void to_json(json& j, const Usage& u) {
  j = json{{"generation_calls", u.generation_calls},
           {"tokens_used", u.tokens_used}};
}

void from_json(const json& j, Usage& u) {
  u.generation_calls = j.value("generation_calls", 0);
  u.tokens_used = j.value("tokens_used", std::int64_t{0});
}

void to_json(json& j, const CarriedContext& c) {
  j = json::object();
  write_opt(j, "previous_patch", c.previous_patch);
  j["test_stdout_tail"] = c.test_stdout_tail;
  j["test_stderr_tail"] = c.test_stderr_tail;
  j["review_comments"] = c.review_comments;
}

void from_json(const json& j, CarriedContext& c) {
  c.previous_patch = read_opt<Patch>(j, "previous_patch");
  c.test_stdout_tail = j.value("test_stdout_tail", "");
  c.test_stderr_tail = j.value("test_stderr_tail", "");
  c.review_comments = j.value("review_comments", "");
}

void to_json(json& j, const Attempt& a) {
  j = json::object();
  j["index"] = a.index;
  write_opt(j, "plan", a.plan);
  write_opt(j, "patch", a.patch);
  write_opt(j, "review", a.review);
  write_opt(j, "test", a.test);
  j["usage"] = a.usage;
  j["rejection_count"] = a.rejection_count;
  j["carried"] = a.carried;
  j["diagnostics"] = a.diagnostics;
}

void from_json(const json& j, Attempt& a) {
  a.index = j.at("index").get<int>();
  a.plan = read_opt<std::string>(j, "plan");
  a.patch = read_opt<Patch>(j, "patch");
  a.review = read_opt<Review>(j, "review");
  a.test = read_opt<TestResult>(j, "test");
  a.usage = j.value("usage", Usage{});
  a.rejection_count = j.value("rejection_count", 0);
  a.carried = j.value("carried", CarriedContext{});
  a.diagnostics = j.value("diagnostics", std::vector<std::string>{});
}

void to_json(json& j, const AttemptSummary& s) {
  j = json::object();
  j["index"] = s.index;
  j["has_patch"] = s.has_patch;
  write_opt(j, "review_approved", s.review_approved);
  j["rejection_count"] = s.rejection_count;
  write_opt(j, "test_success", s.test_success);
  write_opt(j, "exit_code", s.exit_code);
  j["timed_out"] = s.timed_out;
  j["tokens_used"] = s.tokens_used;
}

void to_json(json& j, const TaskView& v) {
  j = json::object();
  j["id"] = v.id.str();
  j["status"] = task_status_name(v.status);
  j["cancel_requested"] = v.cancel_requested;
  j["created_at"] = format_timestamp(v.created_at);
  j["completed_at"] =
      v.completed_at ? json(format_timestamp(*v.completed_at)) : json(nullptr);
  j["attempts"] = v.attempts;
  if (v.result_summary) {
    j["result"] = {{"summary", *v.result_summary},
                   {"failure_kind", failure_kind_name(v.failure_kind)},
                   {"failure_reason", v.failure_reason},
                   {"needs_human_review", v.needs_human_review}};
    if (v.final_patch) {
      j["result"]["patch"] = *v.final_patch;
    }
  }
}

void to_json(json& j, const TaskSummary& s) {
  j = json{{"id", s.id.str()},
           {"repository_url", s.repository_url},
           {"language", s.language},
           {"status", task_status_name(s.status)},
           {"failure_kind", failure_kind_name(s.failure_kind)},
           {"attempts", s.attempt_count},
           {"created_at", format_timestamp(s.created_at)}};
  j["completed_at"] =
      s.completed_at ? json(format_timestamp(*s.completed_at)) : json(nullptr);
}

auto attempt_to_string(const Attempt& attempt) -> std::string {
  return json(attempt).dump();
}

auto attempt_from_string(std::string_view text) -> Result<Attempt> {
  try {
    return json::parse(text).get<Attempt>();
  } catch (const json::exception& e) {
    log::error("Failed to parse attempt payload: {}", e.what());
    return fail(Error::ParseError);
  }
}

}  // namespace fixloop
