#pragma once

#include "../quantum/qubit.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace qkdsim {

// Lowercase hex, two characters per byte.
std::string to_hex(const std::vector<std::uint8_t> &data);

// One hex character per 4 bits, most significant bit first. The sequence is
// zero-padded on the right to a multiple of 4 bits.
std::string bits_to_hex(const BitSequence &bits);

// Canonical serialization used as privacy amplification input: one '0' or
// '1' character per bit, in key order.
std::string bits_to_string(const BitSequence &bits);

} // namespace qkdsim
