#include "config.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <stdexcept>

namespace qkdsim {

namespace {

const char *kSystemConfigPath = "/etc/qkdsim/qkd-simd.conf";

std::string trim(const std::string &s) {
    const auto first = s.find_first_not_of(" \t\r");
    if (first == std::string::npos) return {};
    const auto last = s.find_last_not_of(" \t\r");
    return s.substr(first, last - first + 1);
}

std::int64_t parse_int(const std::string &key, const std::string &value) {
    try {
        std::size_t used = 0;
        long long v = std::stoll(value, &used, 10);
        if (used != value.size()) {
            throw std::invalid_argument(key);
        }
        return static_cast<std::int64_t>(v);
    } catch (const std::logic_error &) {
        throw std::invalid_argument("invalid integer for " + key + ": " + value);
    }
}

std::uint64_t parse_seed(const std::string &value) {
    try {
        std::size_t used = 0;
        unsigned long long v = std::stoull(value, &used, 0);
        if (used != value.size() || value.front() == '-') {
            throw std::invalid_argument("seed");
        }
        return static_cast<std::uint64_t>(v);
    } catch (const std::logic_error &) {
        throw std::invalid_argument("invalid seed: " + value);
    }
}

bool parse_bool(const std::string &key, const std::string &value) {
    if (value == "true" || value == "yes" || value == "on" || value == "1") return true;
    if (value == "false" || value == "no" || value == "off" || value == "0") return false;
    throw std::invalid_argument("invalid boolean for " + key + ": " + value);
}

} // namespace

SimulationParameters default_simulation_parameters() {
    SimulationParameters p;
    p.num_qubits = 800;
    p.qber_sample_size = 20;
    p.error_correction_block_size = 32;
    p.privacy_amplification_length = 128;
    p.enable_eve = false;
    p.enable_secure_mode = false;
    return p;
}

Config default_config() {
    Config cfg;
    cfg.socket_path = "/run/qkd-simd.sock";
    cfg.log_path = "/var/log/qkdsim/audit.log";
    cfg.hash = HashAlgorithm::SHA2_256;
    cfg.defaults = default_simulation_parameters();
    return cfg;
}

void apply_config_setting(Config &cfg, const std::string &key, const std::string &value) {
    if (key == "socket_path") {
        cfg.socket_path = value;
    } else if (key == "log_path") {
        cfg.log_path = value;
    } else if (key == "hash") {
        cfg.hash = hash_algorithm_from_string(value);
    } else if (key == "seed") {
        if (value.empty() || value == "none") {
            cfg.seed.reset();
        } else {
            cfg.seed = parse_seed(value);
        }
    } else if (key == "num_qubits") {
        cfg.defaults.num_qubits = parse_int(key, value);
    } else if (key == "qber_sample_size") {
        const std::int64_t v = parse_int(key, value);
        if (v < 0 || v > 100) {
            throw std::invalid_argument("qber_sample_size must be a percentage between 0 and 100");
        }
        cfg.defaults.qber_sample_size = static_cast<int>(v);
    } else if (key == "error_correction_block_size") {
        cfg.defaults.error_correction_block_size = parse_int(key, value);
    } else if (key == "privacy_amplification_length") {
        cfg.defaults.privacy_amplification_length = parse_int(key, value);
    } else if (key == "enable_eve") {
        cfg.defaults.enable_eve = parse_bool(key, value);
    } else if (key == "enable_secure_mode") {
        cfg.defaults.enable_secure_mode = parse_bool(key, value);
    }
}

Config load_config(const std::string &path) {
    std::ifstream in(path);
    if (!in) {
        throw std::invalid_argument("cannot open config file: " + path);
    }

    Config cfg = default_config();
    std::string line;
    std::size_t lineno = 0;
    while (std::getline(in, line)) {
        ++lineno;
        auto hash = line.find('#');
        if (hash != std::string::npos) line = line.substr(0, hash);
        line = trim(line);
        if (line.empty()) continue;

        auto eq = line.find('=');
        if (eq == std::string::npos) {
            throw std::invalid_argument(path + ":" + std::to_string(lineno) + ": expected key = value");
        }
        apply_config_setting(cfg, trim(line.substr(0, eq)), trim(line.substr(eq + 1)));
    }

    // Defaults must themselves form a runnable parameter set.
    validate_parameters(cfg.defaults);
    return cfg;
}

Config load_config_or_default() {
    if (const char *env = std::getenv("QKDSIM_CONFIG")) {
        if (*env) return load_config(env);
    }

    std::filesystem::path conf_path{kSystemConfigPath};
    if (std::filesystem::exists(conf_path)) {
        return load_config(conf_path.string());
    }

    return default_config();
}

} // namespace qkdsim
