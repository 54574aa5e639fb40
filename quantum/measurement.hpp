#pragma once

#include "qubit.hpp"
#include "../crypto/interfaces.hpp"

namespace qkdsim {

// Measurement of a transmitted qubit in a chosen basis. The same model is
// used for every party that measures the channel (Eve and Bob).
class MeasurementModel {
public:
    virtual ~MeasurementModel() = default;

    virtual Bit measure(const Qubit &transmitted, Basis chosen) = 0;
};

// Ideal projective measurement: a matching basis reproduces the prepared
// bit, a mismatched basis yields a fresh uniform bit from the random source.
class ProjectiveMeasurement : public MeasurementModel {
public:
    explicit ProjectiveMeasurement(RandomSource &rng) : rng_(rng) {}

    Bit measure(const Qubit &transmitted, Basis chosen) override;

private:
    RandomSource &rng_;
};

} // namespace qkdsim
