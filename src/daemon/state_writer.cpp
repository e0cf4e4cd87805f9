#include "hostwarden/daemon/state_writer.hpp"

#include "hostwarden/common/fs.hpp"
#include "hostwarden/common/json_util.hpp"
#include "hostwarden/healing/action.hpp"

#include <sstream>

#include <unistd.h>

namespace hostwarden::daemon {

StateWriter::StateWriter(std::filesystem::path state_file) : state_file_(std::move(state_file)) {}

std::string StateWriter::render(const monitor::CycleReport &report,
                                const monitor::AgentState state) {
  std::size_t sent = 0;
  for (const auto &alert : report.alerts) {
    if (alert.result.sent()) {
      ++sent;
    }
  }

  std::ostringstream json;
  json << "{";
  json << "\"written_at\":" << common::json_quote(common::now_rfc3339()) << ",";
  json << "\"pid\":" << getpid() << ",";
  json << "\"state\":" << common::json_quote(std::string(monitor::agent_state_name(state))) << ",";
  json << "\"cycle\":" << report.cycle << ",";
  json << "\"cycle_started_at\":" << common::json_quote(report.started_at) << ",";
  json << "\"duration_ms\":" << report.duration.count() << ",";
  json << "\"overall\":"
       << common::json_quote(std::string(diagnostics::status_name(report.diagnosis.overall)))
       << ",";

  json << "\"subsystems\":{";
  bool first = true;
  for (const auto &subsystem : report.diagnosis.subsystems) {
    if (!first) {
      json << ",";
    }
    first = false;
    json << common::json_quote(std::string(diagnostics::subsystem_name(subsystem.subsystem)))
         << ":{";
    json << "\"status\":"
         << common::json_quote(std::string(diagnostics::status_name(subsystem.status))) << ",";
    json << "\"detail\":" << common::json_quote(subsystem.detail) << ",";
    json << "\"findings\":[";
    for (std::size_t i = 0; i < subsystem.findings.size(); ++i) {
      json << (i == 0 ? "" : ",") << common::json_quote(subsystem.findings[i].alert_key);
    }
    json << "]}";
  }
  json << "},";

  json << "\"alerts_sent\":" << sent << ",";
  json << "\"heals\":[";
  first = true;
  for (const auto &decision : report.heals) {
    const auto *attempt = std::get_if<healing::HealAttempted>(&decision.result);
    if (attempt == nullptr) {
      continue;
    }
    if (!first) {
      json << ",";
    }
    first = false;
    json << "{\"subsystem\":"
         << common::json_quote(std::string(diagnostics::subsystem_name(decision.subsystem)))
         << ",\"action\":" << common::json_quote(std::string(healing::action_name(attempt->action)))
         << ",\"success\":" << (attempt->success ? "true" : "false")
         << ",\"detail\":" << common::json_quote(attempt->detail) << "}";
  }
  json << "],";
  json << "\"maintenance\":"
       << common::json_quote(std::string(monitor::maintenance_outcome_name(report.maintenance)));
  json << "}\n";
  return json.str();
}

common::Status StateWriter::write(const monitor::CycleReport &report,
                                  const monitor::AgentState state) const {
  std::error_code ec;
  std::filesystem::create_directories(state_file_.parent_path(), ec);
  if (ec) {
    return common::Status::error("failed to create state directory: " + ec.message());
  }
  return common::write_file_atomic(state_file_, render(report, state));
}

} // namespace hostwarden::daemon
