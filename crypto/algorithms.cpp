#include "algorithms.hpp"

#include <stdexcept>

namespace qkdsim {

HashAlgorithm hash_algorithm_from_string(const std::string &name) {
    if (name == "sha256" || name == "sha2-256") return HashAlgorithm::SHA2_256;
    if (name == "sha3-256") return HashAlgorithm::SHA3_256;
    throw std::invalid_argument("unknown hash algorithm: " + name);
}

std::string hash_algorithm_to_string(HashAlgorithm alg) {
    switch (alg) {
    case HashAlgorithm::SHA2_256: return "sha256";
    case HashAlgorithm::SHA3_256: return "sha3-256";
    }
    return "sha256";
}

} // namespace qkdsim
