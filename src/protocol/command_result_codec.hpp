#pragma once

#include <nlohmann/json.hpp>
#include "protocol/command_contract.hpp"

namespace inobridge::protocol {

// Field names match the durable cache record layout.
inline void to_json(nlohmann::json& payload, const CommandResult& result) {
    payload = nlohmann::json{{"command", result.logical_command},
                             {"success", result.success},
                             {"output", result.stdout_text},
                             {"error", result.stderr_text}};
}

inline void from_json(const nlohmann::json& payload, CommandResult& result) {
    payload.at("command").get_to(result.logical_command);
    payload.at("success").get_to(result.success);
    payload.at("output").get_to(result.stdout_text);
    result.stderr_text = payload.value("error", std::string());
}

inline nlohmann::json outcome_to_json(const ClassifiedOutcome& outcome) {
    nlohmann::json payload;
    payload["success"] = outcome.success;
    payload["error_category"] = to_string(outcome.error_kind);
    payload["artifact_path"] =
        outcome.artifact_path.has_value() ? outcome.artifact_path.value() : "";
    payload["error_detail"] = outcome.error_detail;
    return payload;
}

inline nlohmann::json report_to_json(const BuildReport& report) {
    nlohmann::json payload;
    payload["command"] = report.command;
    payload["outcome"] = outcome_to_json(report.outcome);
    payload["origin"] = to_string(report.origin);
    payload["attempts"] = report.attempts;
    return payload;
}

}  // namespace inobridge::protocol
