#include "encoding.hpp"

namespace qkdsim {

namespace {
const char *kHexDigits = "0123456789abcdef";
} // namespace

std::string to_hex(const std::vector<std::uint8_t> &data) {
    std::string out;
    out.reserve(data.size() * 2);
    for (auto b : data) {
        out.push_back(kHexDigits[(b >> 4) & 0x0F]);
        out.push_back(kHexDigits[b & 0x0F]);
    }
    return out;
}

std::string bits_to_hex(const BitSequence &bits) {
    std::string out;
    out.reserve((bits.size() + 3) / 4);
    for (std::size_t i = 0; i < bits.size(); i += 4) {
        int nybble = 0;
        for (std::size_t j = 0; j < 4; ++j) {
            nybble <<= 1;
            if (i + j < bits.size()) {
                nybble |= bit_to_int(bits[i + j]);
            }
        }
        out.push_back(kHexDigits[nybble]);
    }
    return out;
}

std::string bits_to_string(const BitSequence &bits) {
    std::string out;
    out.reserve(bits.size());
    for (auto b : bits) {
        out.push_back(b == Bit::One ? '1' : '0');
    }
    return out;
}

} // namespace qkdsim
