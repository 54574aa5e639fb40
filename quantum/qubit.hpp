#pragma once

#include <cstdint>
#include <vector>

namespace qkdsim {

enum class Bit : std::uint8_t {
    Zero = 0,
    One = 1
};

// The two mutually unbiased BB84 bases. Only equality is meaningful.
enum class Basis : std::uint8_t {
    Rectilinear,
    Diagonal
};

// A qubit abstracted as "prepared as bit in basis".
struct Qubit {
    Bit bit;
    Basis basis;
};

using BitSequence = std::vector<Bit>;
using BasisSequence = std::vector<Basis>;

inline Bit bit_from_int(int v) { return v ? Bit::One : Bit::Zero; }
inline int bit_to_int(Bit b) { return b == Bit::One ? 1 : 0; }
inline Bit operator^(Bit a, Bit b) { return bit_from_int(bit_to_int(a) ^ bit_to_int(b)); }

BitSequence bits_from_ints(const std::vector<int> &values);

} // namespace qkdsim
