#include "bb84.hpp"

namespace qkdsim {

std::size_t qber_sample_count(std::size_t sifted_length, int percent) {
    if (percent <= 0) return 0;
    if (percent >= 100) return sifted_length;
    const std::size_t p = static_cast<std::size_t>(percent);
    return (sifted_length * p + 99) / 100;
}

QberResult estimate_qber(const SiftedKeys &sifted, int percent) {
    QberResult r{0.0, 0, qber_sample_count(sifted.length(), percent)};
    for (std::size_t i = 0; i < r.sample_size; ++i) {
        if (sifted.alice[i] != sifted.bob[i]) {
            ++r.errors;
        }
    }
    if (r.sample_size > 0) {
        r.qber = static_cast<double>(r.errors) / static_cast<double>(r.sample_size);
    }
    return r;
}

SiftedKeys discard_sample(const SiftedKeys &sifted, std::size_t sample_count) {
    SiftedKeys rest;
    if (sample_count >= sifted.length()) {
        return rest;
    }
    rest.alice.assign(sifted.alice.begin() + sample_count, sifted.alice.end());
    rest.bob.assign(sifted.bob.begin() + sample_count, sifted.bob.end());
    return rest;
}

QberVerdict assess_qber(const QberResult &qber, bool enable_eve, bool secure_mode) {
    if (secure_mode && qber.qber > kQberThreshold) {
        return QberVerdict::EveDetected;
    }
    if (enable_eve && !secure_mode && qber.qber > kQberThreshold / 2) {
        return QberVerdict::SuspectedEve;
    }
    if (!enable_eve && qber.qber > 0) {
        return QberVerdict::NoiseObserved;
    }
    return QberVerdict::Clean;
}

} // namespace qkdsim
