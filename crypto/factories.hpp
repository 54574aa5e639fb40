#pragma once

#include "interfaces.hpp"

#include <cstdint>

namespace qkdsim {

// OpenSSL-backed digest factories
std::unique_ptr<DigestProvider> make_sha256_digest_provider();
std::unique_ptr<DigestProvider> make_sha3_256_digest_provider();
std::unique_ptr<DigestProvider> make_digest_provider(HashAlgorithm alg);

// Random sources
std::unique_ptr<RandomSource> make_openssl_random_source();
std::unique_ptr<RandomSource> make_seeded_random_source(std::uint64_t seed);

} // namespace qkdsim
