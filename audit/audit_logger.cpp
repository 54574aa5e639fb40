#include "audit_logger.hpp"

#include "../sim/simulation.hpp"

#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <system_error>

namespace qkdsim {

AuditLogger::AuditLogger(const std::string &log_path) : log_path_(log_path) {}

bool AuditLogger::log_event(const std::string &event_type, const std::string &payload_json) const {
    namespace fs = std::filesystem;

    fs::path p(log_path_);
    if (p.has_parent_path()) {
        std::error_code ec;
        fs::create_directories(p.parent_path(), ec);
        if (ec) {
            std::cerr << "audit: cannot create " << p.parent_path() << ": " << ec.message() << "\n";
            return false;
        }
    }

    std::ofstream out(log_path_, std::ios::app);
    if (!out.is_open()) {
        std::cerr << "audit: cannot open " << log_path_ << "\n";
        return false;
    }

    auto now = std::chrono::system_clock::now();
    auto secs = std::chrono::duration_cast<std::chrono::seconds>(now.time_since_epoch()).count();

    out << "{"
        << "\"ts\":" << secs << ","
        << "\"event\":\"" << event_type << "\",";
    // payload_json is assumed to be valid JSON object or value
    out << "\"payload\":" << payload_json;
    out << "}" << '\n';
    return static_cast<bool>(out);
}

std::string simulation_audit_payload(const SimulationResult &r) {
    std::ostringstream oss;
    oss << "{"
        << "\"outcome\":\"" << outcome_to_string(r.outcome) << "\","
        << "\"initial_qubits\":" << r.initial_qubits << ","
        << "\"sifted_key_length\":" << r.sifted_key_length << ",";
    if (r.qber_result) {
        oss << "\"qber\":" << r.qber_result->qber << ",";
    }
    oss << "\"eve_detected\":" << (r.eve_detected ? "true" : "false") << ","
        << "\"errors_corrected\":" << r.errors_corrected << ","
        << "\"keys_reconciled\":" << (r.keys_reconciled ? "true" : "false")
        << "}";
    return oss.str();
}

} // namespace qkdsim
