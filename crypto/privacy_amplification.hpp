#pragma once

#include "interfaces.hpp"

#include <cstddef>
#include <string>

namespace qkdsim {

// Number of hex characters carrying `length_bits` bits (4 bits per digit).
std::size_t amplified_hex_length(std::size_t length_bits);

// Compress a reconciled key: digest its canonical '0'/'1' serialization and
// keep the first ceil(length_bits / 4) lowercase hex characters. When more
// characters are requested than the digest has, the full digest is returned.
// Throws std::invalid_argument for an empty key; digest failures propagate
// as DigestError.
std::string amplify_key(const BitSequence &reconciled,
                        std::size_t length_bits,
                        DigestProvider &digest);

} // namespace qkdsim
