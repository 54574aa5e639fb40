#pragma once

#include "interfaces.hpp"

#include <cstdint>
#include <random>
#include <vector>

namespace qkdsim {

// Draws from the OpenSSL CSPRNG. Bytes are fetched in batches and consumed
// one bit per draw.
class OpenSslRandomSource : public RandomSource {
public:
    explicit OpenSslRandomSource(std::size_t batch_bytes = 256);

    Bit random_bit() override;
    Basis random_basis() override;

private:
    bool next_bit();
    void refill();

    std::vector<std::uint8_t> pool_;
    std::size_t byte_pos_;
    unsigned bit_pos_;
};

// Deterministic source for reproducible runs: identical seeds give identical
// draw sequences.
class SeededRandomSource : public RandomSource {
public:
    explicit SeededRandomSource(std::uint64_t seed) : gen_(seed) {}

    Bit random_bit() override { return (gen_() & 1) ? Bit::One : Bit::Zero; }
    Basis random_basis() override { return (gen_() & 1) ? Basis::Diagonal : Basis::Rectilinear; }

private:
    std::mt19937_64 gen_;
};

} // namespace qkdsim
