#include "bb84.hpp"

namespace qkdsim {

PreparedQubits prepare_qubits(std::size_t num_qubits, RandomSource &rng) {
    PreparedQubits alice;
    alice.bits.reserve(num_qubits);
    alice.bases.reserve(num_qubits);
    for (std::size_t i = 0; i < num_qubits; ++i) {
        alice.bits.push_back(rng.random_bit());
    }
    for (std::size_t i = 0; i < num_qubits; ++i) {
        alice.bases.push_back(rng.random_basis());
    }
    return alice;
}

BasisSequence choose_bases(std::size_t count, RandomSource &rng) {
    BasisSequence bases;
    bases.reserve(count);
    for (std::size_t i = 0; i < count; ++i) {
        bases.push_back(rng.random_basis());
    }
    return bases;
}

} // namespace qkdsim
