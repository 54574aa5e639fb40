#pragma once

#include "algorithms.hpp"
#include "interfaces.hpp"

namespace qkdsim {

// Message digest via the OpenSSL EVP API. We do NOT reimplement the hash
// functions; only the EVP calls are orchestrated here.
class EvpDigestProvider : public DigestProvider {
public:
    explicit EvpDigestProvider(HashAlgorithm alg) : alg_(alg) {}

    HashAlgorithm algorithm() const override { return alg_; }

    std::size_t digest_size() const override;

    Digest digest(const std::vector<std::uint8_t> &msg) override;

private:
    HashAlgorithm alg_;
};

} // namespace qkdsim
