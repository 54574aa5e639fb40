#include "../../audit/audit_logger.hpp"
#include "../../crypto/encoding.hpp"
#include "../../policy/config.hpp"
#include "../../sim/simulation.hpp"

#include <iomanip>
#include <iostream>
#include <map>
#include <stdexcept>
#include <string>

namespace {

void usage(std::ostream &out) {
    out << "qkd-sim [--config FILE] [--num-qubits N] [--sample PCT] [--block-size N]\n"
        << "        [--key-length BITS] [--eve] [--secure] [--seed S] [--hash sha256|sha3-256]\n"
        << "        [--audit-log FILE] [--json] [--show-sifted]\n";
}

// Flags carrying a value map onto configuration keys.
const std::map<std::string, std::string> kValueFlags = {
    {"--num-qubits", "num_qubits"},
    {"--sample", "qber_sample_size"},
    {"--block-size", "error_correction_block_size"},
    {"--key-length", "privacy_amplification_length"},
    {"--seed", "seed"},
    {"--hash", "hash"},
    {"--audit-log", "log_path"},
};

void print_summary(const qkdsim::SimulationResult &r) {
    using namespace qkdsim;

    for (std::size_t i = 0; i < r.log.size(); ++i) {
        std::cout << std::setw(3) << i + 1 << ". " << r.log[i] << "\n";
    }
    std::cout << "\n";
    std::cout << "Outcome:           " << outcome_to_string(r.outcome) << "\n";
    std::cout << "Initial qubits:    " << r.initial_qubits << "\n";
    std::cout << "Sifted key length: " << r.sifted_key_length << "\n";
    if (r.qber_result) {
        std::cout << "QBER:              " << std::fixed << std::setprecision(2)
                  << r.qber_result->qber * 100.0 << "% (" << r.qber_result->errors
                  << " errors in " << r.qber_result->sample_size << " samples)\n";
    } else {
        std::cout << "QBER:              N/A\n";
    }
    std::cout << "Eve detected:      " << (r.eve_detected ? "yes" : "no") << "\n";
    std::cout << "Errors corrected:  " << r.errors_corrected << "\n";
    std::cout << "Final key (Alice): " << (r.final_key_alice.empty() ? "N/A" : r.final_key_alice) << "\n";
    std::cout << "Final key (Bob):   " << (r.final_key_bob.empty() ? "N/A" : r.final_key_bob) << "\n";
}

} // namespace

int main(int argc, char **argv) {
    using namespace qkdsim;

    bool as_json = false;
    bool show_sifted = false;
    Config cfg;

    try {
        // --config is applied first so flags override the file regardless of order.
        std::string config_path;
        for (int i = 1; i < argc; ++i) {
            if (std::string(argv[i]) == "--config" && i + 1 < argc) config_path = argv[i + 1];
        }
        cfg = config_path.empty() ? load_config_or_default() : load_config(config_path);

        for (int i = 1; i < argc; ++i) {
            std::string a = argv[i];
            auto next = [&]() -> std::string {
                if (i + 1 >= argc) throw std::invalid_argument("missing value for " + a);
                return argv[++i];
            };
            auto flag = kValueFlags.find(a);
            if (flag != kValueFlags.end()) {
                apply_config_setting(cfg, flag->second, next());
            } else if (a == "--config") {
                next();
            } else if (a == "--eve") {
                cfg.defaults.enable_eve = true;
            } else if (a == "--secure") {
                cfg.defaults.enable_secure_mode = true;
            } else if (a == "--json") {
                as_json = true;
            } else if (a == "--show-sifted") {
                show_sifted = true;
            } else if (a == "--help" || a == "-h") {
                usage(std::cout);
                return 0;
            } else {
                usage(std::cerr);
                return 2;
            }
        }
    } catch (const std::exception &ex) {
        std::cerr << "qkd-sim: " << ex.what() << "\n";
        return 2;
    }

    AuditLogger audit(cfg.log_path);
    audit.log_event("request", parameters_to_json(cfg.defaults));

    SimulationResult result;
    SimulationTrace trace;
    try {
        result = handle_simulate_request(cfg.defaults, cfg, show_sifted ? &trace : nullptr);
    } catch (const std::exception &ex) {
        audit.log_event("error", "\"" + json_escape(ex.what()) + "\"");
        std::cerr << "qkd-sim: simulation failed: " << ex.what() << "\n";
        return 1;
    }
    audit.log_event("simulation", simulation_audit_payload(result));

    if (as_json) {
        std::cout << simulation_result_to_json(result) << "\n";
    } else {
        print_summary(result);
    }

    if (show_sifted) {
        std::cout << "Sifted key (Alice, hex): " << bits_to_hex(trace.sifted.alice) << "\n";
        std::cout << "Sifted key (Bob, hex):   " << bits_to_hex(trace.sifted.bob) << "\n";
    }
    return 0;
}
