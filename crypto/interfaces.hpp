#pragma once

#include "algorithms.hpp"
#include "../quantum/qubit.hpp"

#include <cstddef>
#include <memory>
#include <stdexcept>
#include <vector>

namespace qkdsim {

// Raised when the underlying digest implementation fails. There is no
// fallback digest; callers see the failure.
class DigestError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class DigestProvider {
public:
    virtual ~DigestProvider() = default;

    virtual HashAlgorithm algorithm() const = 0;

    virtual std::size_t digest_size() const = 0; // bytes, e.g. 32 for SHA-256

    virtual Digest digest(const std::vector<std::uint8_t> &msg) = 0;
};

// Source of protocol randomness. Every random draw made during a run goes
// through one of these so a run can be replayed from a seed.
class RandomSource {
public:
    virtual ~RandomSource() = default;

    virtual Bit random_bit() = 0;
    virtual Basis random_basis() = 0;
};

struct ProviderSuite {
    std::unique_ptr<RandomSource> rng;      // must not be null
    std::unique_ptr<DigestProvider> digest; // must not be null
};

} // namespace qkdsim
