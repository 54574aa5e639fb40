#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "../bb84/bb84.hpp"
#include "../policy/config.hpp"

namespace qkdsim {

// Where a run stopped.
enum class Outcome {
    EmptySift,   // no basis agreed
    EveDetected, // secure mode rejected the QBER sample
    EmptyKey,    // nothing left after the QBER sample
    Completed
};

std::string outcome_to_string(Outcome outcome);

struct SimulationResult {
    std::size_t initial_qubits = 0;
    // 0 for EmptySift, full sifted length for EveDetected and EmptyKey,
    // sifted length minus the QBER sample for Completed.
    std::size_t sifted_key_length = 0;
    std::optional<QberResult> qber_result;
    bool eve_detected = false;
    std::size_t errors_corrected = 0;
    std::string final_key_alice; // lowercase hex
    std::string final_key_bob;   // lowercase hex
    std::vector<std::string> log;

    Outcome outcome = Outcome::EmptySift;
    bool keys_reconciled = false;
};

// Intermediate sequences of a run, filled on request for inspection.
struct SimulationTrace {
    PreparedQubits alice;
    InterceptResult eve;     // empty unless Eve was enabled
    BasisSequence bob_bases;
    BitSequence bob_bits;
    SiftedKeys sifted;
    SiftedKeys reconciled;   // Alice's remainder and Bob's corrected key
};

class Simulator {
public:
    Simulator(RandomSource &rng, MeasurementModel &measurement, DigestProvider &digest)
        : rng_(rng), measurement_(measurement), digest_(digest) {}

    // Validates params (std::invalid_argument) and runs the protocol once.
    // Protocol dead ends are reported through result.outcome; only invalid
    // parameters and digest failures throw.
    SimulationResult run(const SimulationParameters &params,
                         SimulationTrace *trace = nullptr);

private:
    RandomSource &rng_;
    MeasurementModel &measurement_;
    DigestProvider &digest_;
};

// Runs one simulation with an ideal measurement model over the suite's
// providers.
SimulationResult run_bb84_simulation(const SimulationParameters &params,
                                     ProviderSuite &suite,
                                     SimulationTrace *trace = nullptr);

// Request handling for the front ends.
SimulationParameters parse_simulate_request_json(const std::string &json,
                                                 const SimulationParameters &defaults);
std::string simulation_result_to_json(const SimulationResult &result);
std::string json_escape(const std::string &s);

SimulationResult handle_simulate_request(const SimulationParameters &params,
                                         const Config &cfg,
                                         SimulationTrace *trace = nullptr);

} // namespace qkdsim
