#include "measurement.hpp"

namespace qkdsim {

Bit ProjectiveMeasurement::measure(const Qubit &transmitted, Basis chosen) {
    if (transmitted.basis == chosen) {
        return transmitted.bit;
    }
    return rng_.random_bit();
}

} // namespace qkdsim
