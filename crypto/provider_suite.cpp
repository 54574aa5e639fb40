#include "interfaces.hpp"
#include "factories.hpp"
#include "provider_suite.hpp"

namespace qkdsim {

// Suite creator that wires the random source and digest provider together.
// It does not perform protocol logic itself; the simulator only sees the
// abstract interfaces.

ProviderSuite make_provider_suite(HashAlgorithm hash,
                                  std::optional<std::uint64_t> seed) {
    ProviderSuite s;
    if (seed) {
        s.rng = make_seeded_random_source(*seed);
    } else {
        s.rng = make_openssl_random_source();
    }
    s.digest = make_digest_provider(hash);
    return s;
}

} // namespace qkdsim
