#include "bb84.hpp"

#include <algorithm>
#include <stdexcept>

namespace qkdsim {

Bit block_parity(const BitSequence &key, std::size_t begin, std::size_t end) {
    Bit parity = Bit::Zero;
    for (std::size_t i = begin; i < end && i < key.size(); ++i) {
        parity = parity ^ key[i];
    }
    return parity;
}

ReconciliationResult reconcile_keys(const BitSequence &alice,
                                    const BitSequence &bob,
                                    std::size_t block_size) {
    if (alice.size() != bob.size()) {
        throw std::invalid_argument("reconcile_keys: key lengths differ");
    }
    if (block_size == 0) {
        throw std::invalid_argument("reconcile_keys: block size must be positive");
    }

    ReconciliationResult r{bob, 0, false};
    for (std::size_t start = 0; start < alice.size(); start += block_size) {
        const std::size_t end = std::min(start + block_size, alice.size());
        if (block_parity(alice, start, end) == block_parity(r.corrected_bob, start, end)) {
            continue;
        }
        // Single pass: only the first disagreeing bit of the block is fixed.
        for (std::size_t i = start; i < end; ++i) {
            if (alice[i] != r.corrected_bob[i]) {
                r.corrected_bob[i] = alice[i];
                ++r.errors_corrected;
                break;
            }
        }
    }
    r.keys_match = (r.corrected_bob == alice);
    return r;
}

} // namespace qkdsim
