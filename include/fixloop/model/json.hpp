#pragma once

#include "fixloop/core/error.hpp"
#include "fixloop/model/task.hpp"

#include <nlohmann/json.hpp>

#include <string>
#include <string_view>

namespace fixloop {

void to_json(nlohmann::json& j, const Patch& p);
void from_json(const nlohmann::json& j, Patch& p);

void to_json(nlohmann::json& j, const Review& r);
void from_json(const nlohmann::json& j, Review& r);

void to_json(nlohmann::json& j, const TestResult& t);
void from_json(const nlohmann::json& j, TestResult& t);

void to_json(nlohmann::json& j, const Usage& u);
void from_json(const nlohmann::json& j, Usage& u);

void to_json(nlohmann::json& j, const CarriedContext& c);
void from_json(const nlohmann::json& j, CarriedContext& c);

void to_json(nlohmann::json& j, const Attempt& a);
void from_json(const nlohmann::json& j, Attempt& a);

void to_json(nlohmann::json& j, const AttemptSummary& s);
void to_json(nlohmann::json& j, const TaskView& v);
void to_json(nlohmann::json& j, const TaskSummary& s);

[[nodiscard]] auto attempt_to_string(const Attempt& attempt) -> std::string;
[[nodiscard]] auto attempt_from_string(std::string_view text)
    -> Result<Attempt>;

}  // namespace fixloop
