#include "simulation.hpp"

#include "../crypto/privacy_amplification.hpp"

#include <iomanip>
#include <sstream>
#include <utility>
#include <variant>

namespace qkdsim {

namespace {

struct EmptySift {};

struct EveDetected {
    std::size_t sifted_length;
    QberResult qber;
};

struct EmptyReconciledKey {
    std::size_t sifted_length;
    QberResult qber;
    std::size_t errors_corrected;
};

struct Completed {
    std::size_t key_length; // after the QBER sample
    QberResult qber;
    std::size_t errors_corrected;
    bool keys_match;
    std::string final_key_alice;
    std::string final_key_bob;
};

using Terminal = std::variant<EmptySift, EveDetected, EmptyReconciledKey, Completed>;

std::string percent(double fraction) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2) << fraction * 100.0 << "%";
    return oss.str();
}

std::string digest_display_name(HashAlgorithm alg) {
    switch (alg) {
    case HashAlgorithm::SHA2_256: return "SHA-256";
    case HashAlgorithm::SHA3_256: return "SHA3-256";
    }
    return "SHA-256";
}

// Every exit path converges here.
struct ResultBuilder {
    SimulationResult &r;

    void operator()(const EmptySift &) const {
        r.outcome = Outcome::EmptySift;
        r.sifted_key_length = 0;
    }

    void operator()(const EveDetected &t) const {
        r.outcome = Outcome::EveDetected;
        r.sifted_key_length = t.sifted_length;
        r.qber_result = t.qber;
        r.eve_detected = true;
    }

    void operator()(const EmptyReconciledKey &t) const {
        r.outcome = Outcome::EmptyKey;
        r.sifted_key_length = t.sifted_length;
        r.qber_result = t.qber;
        r.errors_corrected = t.errors_corrected;
    }

    void operator()(const Completed &t) const {
        r.outcome = Outcome::Completed;
        r.sifted_key_length = t.key_length;
        r.qber_result = t.qber;
        r.errors_corrected = t.errors_corrected;
        r.keys_reconciled = t.keys_match;
        r.final_key_alice = t.final_key_alice;
        r.final_key_bob = t.final_key_bob;
    }
};

SimulationResult build_result(std::size_t initial_qubits,
                              const Terminal &terminal,
                              std::vector<std::string> log) {
    SimulationResult r;
    r.initial_qubits = initial_qubits;
    std::visit(ResultBuilder{r}, terminal);
    r.log = std::move(log);
    return r;
}

} // namespace

std::string outcome_to_string(Outcome outcome) {
    switch (outcome) {
    case Outcome::EmptySift: return "empty_sift";
    case Outcome::EveDetected: return "eve_detected";
    case Outcome::EmptyKey: return "empty_key";
    case Outcome::Completed: return "completed";
    }
    return "empty_sift";
}

SimulationResult Simulator::run(const SimulationParameters &params,
                                SimulationTrace *trace) {
    validate_parameters(params);

    const std::size_t n = static_cast<std::size_t>(params.num_qubits);
    const std::size_t block_size = static_cast<std::size_t>(params.error_correction_block_size);
    const std::size_t key_bits = static_cast<std::size_t>(params.privacy_amplification_length);

    std::vector<std::string> log;
    log.push_back("Starting BB84 simulation...");
    log.push_back("Parameters: " + parameters_to_json(params));

    // PREPARE
    PreparedQubits alice = prepare_qubits(n, rng_);
    log.push_back("Alice prepared " + std::to_string(n) + " qubits with random bits and bases.");

    // EVE
    Transmission channel = transmit_unmodified(alice);
    InterceptResult eve;
    if (params.enable_eve) {
        log.push_back("Eve is enabled: performing intercept-resend attack.");
        eve = intercept_resend(channel, rng_, measurement_);
        channel = eve.resent;
        log.push_back("Eve intercepted, measured and re-sent the qubits to Bob using her measurement bases.");
    }

    // MEASURE
    BasisSequence bob_bases = choose_bases(n, rng_);
    BitSequence bob_bits = measure_sequence(channel, bob_bases, measurement_);
    log.push_back("Bob measured " + std::to_string(n) + " qubits with random bases.");

    // SIFT
    SiftedKeys sifted = sift_keys(alice.bases, bob_bases, alice.bits, bob_bits);
    const std::size_t sifted_length = sifted.length();
    log.push_back("Basis sifting completed. Sifted key length: " + std::to_string(sifted_length) + " bits.");

    if (trace) {
        trace->alice = alice;
        trace->eve = eve;
        trace->bob_bases = bob_bases;
        trace->bob_bits = bob_bits;
        trace->sifted = sifted;
    }

    if (sifted_length == 0) {
        log.push_back("No matching bases. Simulation cannot proceed with QBER estimation, "
                      "error correction or privacy amplification.");
        return build_result(n, EmptySift{}, std::move(log));
    }

    // ESTIMATE_QBER
    const QberResult qber = estimate_qber(sifted, params.qber_sample_size);
    log.push_back("QBER check: sample size " + std::to_string(qber.sample_size) +
                  " bits. Errors found: " + std::to_string(qber.errors) +
                  ". QBER: " + percent(qber.qber) + ".");

    switch (assess_qber(qber, params.enable_eve, params.enable_secure_mode)) {
    case QberVerdict::EveDetected:
        log.push_back("ALERT: QBER (" + percent(qber.qber) + ") exceeds threshold (" +
                      percent(kQberThreshold) + "). Eavesdropping detected! Key discarded.");
        return build_result(n, EveDetected{sifted_length, qber}, std::move(log));
    case QberVerdict::SuspectedEve:
        log.push_back("Note: QBER (" + percent(qber.qber) + ") is higher than expected. Eve might be "
                      "present, but secure mode is not enabled to enforce a strict threshold.");
        break;
    case QberVerdict::NoiseObserved:
        log.push_back("Note: minor QBER detected (" + percent(qber.qber) + "). Could be due to "
                      "simulated noise or imperfections in quantum measurements.");
        break;
    case QberVerdict::Clean:
        break;
    }

    SiftedKeys working = discard_sample(sifted, qber.sample_size);
    const std::size_t pre_ec_length = working.length();
    log.push_back("Key for error correction: remaining " + std::to_string(pre_ec_length) +
                  " bits after QBER sampling.");

    // RECONCILE
    ReconciliationResult ec = reconcile_keys(working.alice, working.bob, block_size);
    log.push_back("Error correction completed. " + std::to_string(ec.errors_corrected) +
                  " errors corrected in the remaining key.");
    if (!ec.keys_match) {
        log.push_back("WARNING: keys do not perfectly match after error correction! Blocks with "
                      "more than one error were only partially corrected.");
    } else {
        log.push_back("Keys successfully reconciled: Alice and Bob now share an identical key "
                      "(after QBER sample removal and error correction).");
    }

    if (trace) {
        trace->reconciled.alice = working.alice;
        trace->reconciled.bob = ec.corrected_bob;
    }

    if (pre_ec_length == 0) {
        log.push_back("Cannot perform privacy amplification: reconciled key is empty.");
        return build_result(n, EmptyReconciledKey{sifted_length, qber, ec.errors_corrected},
                            std::move(log));
    }

    // AMPLIFY
    Completed done;
    done.key_length = pre_ec_length;
    done.qber = qber;
    done.errors_corrected = ec.errors_corrected;
    done.keys_match = ec.keys_match;
    done.final_key_alice = amplify_key(working.alice, key_bits, digest_);
    done.final_key_bob = amplify_key(ec.corrected_bob, key_bits, digest_);

    log.push_back("Privacy amplification completed (" + digest_display_name(digest_.algorithm()) +
                  " hashing and truncation). Desired final key length: " +
                  std::to_string(key_bits) + " bits.");
    if (amplified_hex_length(key_bits) > 2 * digest_.digest_size()) {
        log.push_back("Note: requested key length exceeds the " +
                      std::to_string(8 * digest_.digest_size()) +
                      "-bit digest; the final key is the full digest.");
    }
    log.push_back("Final shared key (Alice, hex): " + done.final_key_alice);
    log.push_back("Final shared key (Bob, hex): " + done.final_key_bob);

    return build_result(n, done, std::move(log));
}

SimulationResult run_bb84_simulation(const SimulationParameters &params,
                                     ProviderSuite &suite,
                                     SimulationTrace *trace) {
    ProjectiveMeasurement measurement(*suite.rng);
    Simulator sim(*suite.rng, measurement, *suite.digest);
    return sim.run(params, trace);
}

} // namespace qkdsim
