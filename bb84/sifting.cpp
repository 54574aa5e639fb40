#include "bb84.hpp"

#include <stdexcept>

namespace qkdsim {

SiftedKeys sift_keys(const BasisSequence &alice_bases,
                     const BasisSequence &bob_bases,
                     const BitSequence &alice_bits,
                     const BitSequence &bob_bits) {
    const std::size_t n = alice_bases.size();
    if (bob_bases.size() != n || alice_bits.size() != n || bob_bits.size() != n) {
        throw std::invalid_argument("sift_keys: sequence lengths differ");
    }

    SiftedKeys sifted;
    for (std::size_t i = 0; i < n; ++i) {
        if (alice_bases[i] == bob_bases[i]) {
            sifted.alice.push_back(alice_bits[i]);
            sifted.bob.push_back(bob_bits[i]);
        }
    }
    return sifted;
}

} // namespace qkdsim
