#pragma once

#include "interfaces.hpp"

#include <cstdint>
#include <optional>

namespace qkdsim {

// Seeded runs are reproducible; unseeded runs draw from the OpenSSL CSPRNG.
ProviderSuite make_provider_suite(HashAlgorithm hash,
                                  std::optional<std::uint64_t> seed);

} // namespace qkdsim
