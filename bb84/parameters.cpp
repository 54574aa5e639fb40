#include "bb84.hpp"

#include <sstream>
#include <stdexcept>

namespace qkdsim {

void validate_parameters(const SimulationParameters &params) {
    if (params.num_qubits <= 0) {
        throw std::invalid_argument("num_qubits must be a positive integer");
    }
    if (params.qber_sample_size < 0 || params.qber_sample_size > 100) {
        throw std::invalid_argument("qber_sample_size must be a percentage between 0 and 100");
    }
    if (params.error_correction_block_size <= 0) {
        throw std::invalid_argument("error_correction_block_size must be a positive integer");
    }
    if (params.privacy_amplification_length <= 0) {
        throw std::invalid_argument("privacy_amplification_length must be a positive integer");
    }
}

std::string parameters_to_json(const SimulationParameters &params) {
    std::ostringstream oss;
    oss << "{"
        << "\"num_qubits\":" << params.num_qubits << ","
        << "\"qber_sample_size\":" << params.qber_sample_size << ","
        << "\"error_correction_block_size\":" << params.error_correction_block_size << ","
        << "\"privacy_amplification_length\":" << params.privacy_amplification_length << ","
        << "\"enable_eve\":" << (params.enable_eve ? "true" : "false") << ","
        << "\"enable_secure_mode\":" << (params.enable_secure_mode ? "true" : "false")
        << "}";
    return oss.str();
}

} // namespace qkdsim
