#include "bb84.hpp"

#include <stdexcept>

namespace qkdsim {

BitSequence measure_sequence(const Transmission &channel,
                             const BasisSequence &chosen,
                             MeasurementModel &measurement) {
    if (channel.bits.size() != channel.bases.size() || chosen.size() != channel.bits.size()) {
        throw std::invalid_argument("measure_sequence: sequence lengths differ");
    }

    BitSequence out;
    out.reserve(chosen.size());
    for (std::size_t i = 0; i < chosen.size(); ++i) {
        out.push_back(measurement.measure(Qubit{channel.bits[i], channel.bases[i]}, chosen[i]));
    }
    return out;
}

Transmission transmit_unmodified(const PreparedQubits &alice) {
    Transmission t;
    t.bits = alice.bits;
    t.bases = alice.bases;
    return t;
}

InterceptResult intercept_resend(const Transmission &channel,
                                 RandomSource &rng,
                                 MeasurementModel &measurement) {
    InterceptResult r;
    r.eve_bases = choose_bases(channel.bits.size(), rng);
    r.eve_bits = measure_sequence(channel, r.eve_bases, measurement);

    // Eve re-encodes each measured bit in the basis she measured it in.
    r.resent.bits = r.eve_bits;
    r.resent.bases = r.eve_bases;
    return r;
}

} // namespace qkdsim
