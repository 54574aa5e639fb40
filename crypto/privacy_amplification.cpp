#include "privacy_amplification.hpp"
#include "encoding.hpp"

#include <stdexcept>

namespace qkdsim {

std::size_t amplified_hex_length(std::size_t length_bits) {
    return (length_bits + 3) / 4;
}

std::string amplify_key(const BitSequence &reconciled,
                        std::size_t length_bits,
                        DigestProvider &digest) {
    if (reconciled.empty()) {
        throw std::invalid_argument("privacy amplification requires a non-empty key");
    }

    const std::string serialized = bits_to_string(reconciled);
    const std::vector<std::uint8_t> msg(serialized.begin(), serialized.end());

    const std::string hex = to_hex(digest.digest(msg).bytes);
    return hex.substr(0, amplified_hex_length(length_bits));
}

} // namespace qkdsim
