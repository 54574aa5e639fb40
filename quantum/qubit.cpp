#include "qubit.hpp"

namespace qkdsim {

BitSequence bits_from_ints(const std::vector<int> &values) {
    BitSequence out;
    out.reserve(values.size());
    for (int v : values) {
        out.push_back(bit_from_int(v));
    }
    return out;
}

} // namespace qkdsim
