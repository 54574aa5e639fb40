#include "simulation.hpp"

#include "../crypto/provider_suite.hpp"

#include <cctype>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace qkdsim {

namespace {

// Returns the raw token after "key": for scalar values (number, true/false),
// or an empty string when the key is absent.
std::string extract_json_scalar(const std::string &json, const std::string &key) {
    auto pos = json.find("\"" + key + "\"");
    if (pos == std::string::npos) return {};
    pos = json.find(':', pos);
    if (pos == std::string::npos) return {};
    ++pos;
    while (pos < json.size() && std::isspace(static_cast<unsigned char>(json[pos]))) ++pos;
    auto end = pos;
    while (end < json.size() && json[end] != ',' && json[end] != '}' &&
           !std::isspace(static_cast<unsigned char>(json[end]))) {
        ++end;
    }
    return json.substr(pos, end - pos);
}

std::int64_t parse_json_int(const std::string &token, const std::string &key) {
    try {
        std::size_t used = 0;
        long long v = std::stoll(token, &used, 10);
        if (used != token.size()) {
            throw std::invalid_argument(key);
        }
        return static_cast<std::int64_t>(v);
    } catch (const std::logic_error &) {
        throw std::invalid_argument("invalid integer for " + key + ": " + token);
    }
}

bool parse_json_bool(const std::string &token, const std::string &key) {
    if (token == "true") return true;
    if (token == "false") return false;
    throw std::invalid_argument("invalid boolean for " + key + ": " + token);
}

void read_int(const std::string &json, const std::string &key, std::int64_t &out) {
    const std::string token = extract_json_scalar(json, key);
    if (!token.empty()) out = parse_json_int(token, key);
}

void read_bool(const std::string &json, const std::string &key, bool &out) {
    const std::string token = extract_json_scalar(json, key);
    if (!token.empty()) out = parse_json_bool(token, key);
}

} // namespace

std::string json_escape(const std::string &s) {
    std::ostringstream oss;
    for (char c : s) {
        switch (c) {
        case '"': oss << "\\\""; break;
        case '\\': oss << "\\\\"; break;
        case '\n': oss << "\\n"; break;
        case '\r': oss << "\\r"; break;
        case '\t': oss << "\\t"; break;
        default:
            if (static_cast<unsigned char>(c) < 0x20) {
                oss << "\\u" << std::hex << std::setw(4) << std::setfill('0')
                    << static_cast<int>(static_cast<unsigned char>(c)) << std::dec;
            } else {
                oss << c;
            }
        }
    }
    return oss.str();
}

SimulationParameters parse_simulate_request_json(const std::string &json,
                                                 const SimulationParameters &defaults) {
    SimulationParameters p = defaults;
    read_int(json, "num_qubits", p.num_qubits);

    std::int64_t sample = p.qber_sample_size;
    read_int(json, "qber_sample_size", sample);
    if (sample < 0 || sample > 100) {
        throw std::invalid_argument("qber_sample_size must be a percentage between 0 and 100");
    }
    p.qber_sample_size = static_cast<int>(sample);

    read_int(json, "error_correction_block_size", p.error_correction_block_size);
    read_int(json, "privacy_amplification_length", p.privacy_amplification_length);
    read_bool(json, "enable_eve", p.enable_eve);
    read_bool(json, "enable_secure_mode", p.enable_secure_mode);
    return p;
}

std::string simulation_result_to_json(const SimulationResult &r) {
    std::ostringstream oss;
    oss << "{"
        << "\"kind\":\"SIMULATE\",";
    oss << "\"status\":\"OK\",";
    oss << "\"outcome\":\"" << outcome_to_string(r.outcome) << "\",";
    oss << "\"initial_qubits\":" << r.initial_qubits << ",";
    oss << "\"sifted_key_length\":" << r.sifted_key_length << ",";
    if (r.qber_result) {
        oss << "\"qber_result\":{"
            << "\"qber\":" << r.qber_result->qber << ","
            << "\"errors\":" << r.qber_result->errors << ","
            << "\"sample_size\":" << r.qber_result->sample_size << "},";
    } else {
        oss << "\"qber_result\":null,";
    }
    oss << "\"eve_detected\":" << (r.eve_detected ? "true" : "false") << ",";
    oss << "\"errors_corrected\":" << r.errors_corrected << ",";
    oss << "\"keys_reconciled\":" << (r.keys_reconciled ? "true" : "false") << ",";
    oss << "\"final_key_alice\":\"" << r.final_key_alice << "\",";
    oss << "\"final_key_bob\":\"" << r.final_key_bob << "\",";
    oss << "\"log\":[";
    for (std::size_t i = 0; i < r.log.size(); ++i) {
        if (i) oss << ",";
        oss << "\"" << json_escape(r.log[i]) << "\"";
    }
    oss << "]}";
    return oss.str();
}

SimulationResult handle_simulate_request(const SimulationParameters &params,
                                         const Config &cfg,
                                         SimulationTrace *trace) {
    // Reject bad input before any provider is constructed.
    validate_parameters(params);

    ProviderSuite suite = make_provider_suite(cfg.hash, cfg.seed);
    return run_bb84_simulation(params, suite, trace);
}

} // namespace qkdsim
