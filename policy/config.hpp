#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "../bb84/bb84.hpp"
#include "../crypto/algorithms.hpp"

namespace qkdsim {

struct Config {
    std::string socket_path;
    std::string log_path;
    HashAlgorithm hash;
    std::optional<std::uint64_t> seed; // unset: OpenSSL CSPRNG
    SimulationParameters defaults;     // used only to fill absent request fields
};

SimulationParameters default_simulation_parameters();

Config default_config();

// Applies one "key = value" setting. Unknown keys are ignored; malformed
// values throw std::invalid_argument.
void apply_config_setting(Config &cfg, const std::string &key, const std::string &value);

// Defaults overridden by the file at `path`. Throws std::invalid_argument if
// the file cannot be read or holds a malformed value.
Config load_config(const std::string &path);

// $QKDSIM_CONFIG if set, else /etc/qkdsim/qkd-simd.conf if present, else the
// built-in defaults.
Config load_config_or_default();

} // namespace qkdsim
