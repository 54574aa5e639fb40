#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace qkdsim {

enum class HashAlgorithm {
    SHA2_256,
    SHA3_256
};

HashAlgorithm hash_algorithm_from_string(const std::string &name);
std::string hash_algorithm_to_string(HashAlgorithm alg);

struct Digest {
    std::vector<std::uint8_t> bytes; // raw digest bytes
    HashAlgorithm algorithm;
};

} // namespace qkdsim
