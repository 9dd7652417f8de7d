// ---------------------------------------------------------------------------
// decision.cpp
// ---------------------------------------------------------------------------

#include "policy/decision.hpp"

std::string_view decision_to_string(Decision decision) noexcept {
    switch (decision) {
        case Decision::kAllowed: return "allowed";
        case Decision::kBlocked: return "blocked";
        case Decision::kWarned:  return "warned";
        case Decision::kAudited: return "audited";
    }
    return "allowed";
}

std::optional<Decision> decision_from_string(std::string_view s) noexcept {
    if (s == "allowed") { return Decision::kAllowed; }
    if (s == "blocked") { return Decision::kBlocked; }
    if (s == "warned")  { return Decision::kWarned; }
    if (s == "audited") { return Decision::kAudited; }
    return std::nullopt;
}

void to_json(nlohmann::json& j, const Response& response) {
    j             = nlohmann::json::object();
    j["continue"] = response.continue_;
    if (response.context) {
        j["context"] = *response.context;
    }
    if (response.reason) {
        j["reason"] = *response.reason;
    }
}

void from_json(const nlohmann::json& j, Response& response) {
    response = Response{};
    if (const auto it = j.find("continue"); it != j.end() && it->is_boolean()) {
        response.continue_ = it->get<bool>();
    }
    if (const auto it = j.find("context"); it != j.end() && it->is_string()) {
        response.context = it->get<std::string>();
    }
    if (const auto it = j.find("reason"); it != j.end() && it->is_string()) {
        response.reason = it->get<std::string>();
    }
}
