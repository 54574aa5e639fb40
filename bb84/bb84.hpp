#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

#include "../crypto/interfaces.hpp"
#include "../quantum/measurement.hpp"
#include "../quantum/qubit.hpp"

namespace qkdsim {

// BB84 security bound: above this QBER an eavesdropper's information gain is
// assumed to exceed what privacy amplification can remove.
constexpr double kQberThreshold = 0.11;

struct SimulationParameters {
    std::int64_t num_qubits;
    int qber_sample_size;                       // percent of the sifted key, 0-100
    std::int64_t error_correction_block_size;
    std::int64_t privacy_amplification_length;  // bits
    bool enable_eve;
    bool enable_secure_mode;
};

// Throws std::invalid_argument describing the first offending field.
void validate_parameters(const SimulationParameters &params);

std::string parameters_to_json(const SimulationParameters &params);

// Alice's prepared qubits, index-aligned.
struct PreparedQubits {
    BitSequence bits;
    BasisSequence bases;
};

// What arrives at Bob's detector.
struct Transmission {
    BitSequence bits;
    BasisSequence bases;
};

struct InterceptResult {
    BasisSequence eve_bases;
    BitSequence eve_bits;
    Transmission resent; // Eve's bits re-encoded in her measurement bases
};

// All bits are drawn first, then all bases.
PreparedQubits prepare_qubits(std::size_t num_qubits, RandomSource &rng);

BasisSequence choose_bases(std::size_t count, RandomSource &rng);

BitSequence measure_sequence(const Transmission &channel,
                             const BasisSequence &chosen,
                             MeasurementModel &measurement);

Transmission transmit_unmodified(const PreparedQubits &alice);

InterceptResult intercept_resend(const Transmission &channel,
                                 RandomSource &rng,
                                 MeasurementModel &measurement);

struct SiftedKeys {
    BitSequence alice;
    BitSequence bob;

    std::size_t length() const { return alice.size(); }
};

// Keeps the positions where Alice's and Bob's declared bases agree.
SiftedKeys sift_keys(const BasisSequence &alice_bases,
                     const BasisSequence &bob_bases,
                     const BitSequence &alice_bits,
                     const BitSequence &bob_bits);

struct QberResult {
    double qber;
    std::size_t errors;
    std::size_t sample_size;
};

// ceil(sifted_length * percent / 100), exact.
std::size_t qber_sample_count(std::size_t sifted_length, int percent);

QberResult estimate_qber(const SiftedKeys &sifted, int percent);

// The sampled prefix is disclosed during estimation and never reused.
SiftedKeys discard_sample(const SiftedKeys &sifted, std::size_t sample_count);

enum class QberVerdict {
    Clean,
    EveDetected,      // secure mode and QBER above the threshold
    SuspectedEve,     // Eve enabled, QBER above half the threshold, not enforced
    NoiseObserved     // Eve disabled and QBER non-zero
};

QberVerdict assess_qber(const QberResult &qber, bool enable_eve, bool secure_mode);

struct ReconciliationResult {
    BitSequence corrected_bob;
    std::size_t errors_corrected;
    bool keys_match;
};

Bit block_parity(const BitSequence &key, std::size_t begin, std::size_t end);

// Block-parity reconciliation correcting at most one error per block. Blocks
// holding an even number of errors, or more than one error, are left
// (partly) unreconciled and show up as keys_match == false.
ReconciliationResult reconcile_keys(const BitSequence &alice,
                                    const BitSequence &bob,
                                    std::size_t block_size);

} // namespace qkdsim
