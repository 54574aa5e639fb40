#include "random_source.hpp"
#include "factories.hpp"

#include <openssl/rand.h>

#include <stdexcept>

namespace qkdsim {

OpenSslRandomSource::OpenSslRandomSource(std::size_t batch_bytes)
    : pool_(batch_bytes == 0 ? 1 : batch_bytes), byte_pos_(0), bit_pos_(0) {
    refill();
}

void OpenSslRandomSource::refill() {
    if (RAND_bytes(pool_.data(), static_cast<int>(pool_.size())) != 1) {
        throw std::runtime_error("RAND_bytes failed");
    }
    byte_pos_ = 0;
    bit_pos_ = 0;
}

bool OpenSslRandomSource::next_bit() {
    if (bit_pos_ == 8) {
        bit_pos_ = 0;
        if (++byte_pos_ == pool_.size()) {
            refill();
        }
    }
    return (pool_[byte_pos_] >> bit_pos_++) & 1;
}

Bit OpenSslRandomSource::random_bit() {
    return next_bit() ? Bit::One : Bit::Zero;
}

Basis OpenSslRandomSource::random_basis() {
    return next_bit() ? Basis::Diagonal : Basis::Rectilinear;
}

std::unique_ptr<RandomSource> make_openssl_random_source() {
    return std::make_unique<OpenSslRandomSource>();
}

std::unique_ptr<RandomSource> make_seeded_random_source(std::uint64_t seed) {
    return std::make_unique<SeededRandomSource>(seed);
}

} // namespace qkdsim
