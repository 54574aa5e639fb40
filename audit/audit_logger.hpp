#pragma once

#include <string>

namespace qkdsim {

class AuditLogger {
public:
    explicit AuditLogger(const std::string &log_path);

    // Writes a single JSON line with type and payload (already JSON) embedded.
    // Returns false if the line could not be written; the reason goes to
    // stderr.
    bool log_event(const std::string &event_type, const std::string &payload_json) const;

    const std::string &path() const { return log_path_; }

private:
    std::string log_path_;
};

// Compact payload describing a finished run, without the narrative log or
// key material.
struct SimulationResult;
std::string simulation_audit_payload(const SimulationResult &result);

} // namespace qkdsim
