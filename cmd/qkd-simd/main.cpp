#include "../../audit/audit_logger.hpp"
#include "../../policy/config.hpp"
#include "../../sim/simulation.hpp"

#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>

#include <cerrno>
#include <csignal>
#include <cstdio>
#include <cstring>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>

namespace {

volatile std::sig_atomic_t g_terminate = 0;

void handle_signal(int) {
    g_terminate = 1;
}

bool has_kind(const std::string &line, const std::string &kind) {
    const std::string pattern = "\"kind\":\"" + kind + "\"";
    return line.find(pattern) != std::string::npos;
}

std::string handle_defaults_request(const qkdsim::Config &cfg) {
    using namespace qkdsim;

    std::ostringstream oss;
    oss << "{";
    oss << "\"kind\":\"DEFAULTS\",";
    oss << "\"status\":\"OK\",";
    oss << "\"hash\":\"" << hash_algorithm_to_string(cfg.hash) << "\",";
    oss << "\"seeded\":" << (cfg.seed ? "true" : "false") << ",";
    oss << "\"parameters\":" << parameters_to_json(cfg.defaults);
    oss << "}";
    return oss.str();
}

std::string handle_line(const std::string &line, const qkdsim::Config &cfg,
                        const qkdsim::AuditLogger &audit) {
    using namespace qkdsim;

    try {
        if (has_kind(line, "SIMULATE")) {
            SimulationParameters params = parse_simulate_request_json(line, cfg.defaults);
            SimulationResult result = handle_simulate_request(params, cfg);
            audit.log_event("simulation", simulation_audit_payload(result));
            return simulation_result_to_json(result);
        }
        if (has_kind(line, "DEFAULTS")) {
            return handle_defaults_request(cfg);
        }
        // Unknown kind; return a generic error structure.
        return "{\"status\":\"DENIED\",\"error\":\"unknown_kind\"}";
    } catch (const std::invalid_argument &ex) {
        audit.log_event("error", "\"" + json_escape(ex.what()) + "\"");
        return "{\"status\":\"DENIED\",\"error\":\"" + json_escape(ex.what()) + "\"}";
    } catch (const std::exception &ex) {
        audit.log_event("error", "\"" + json_escape(ex.what()) + "\"");
        return "{\"status\":\"ERROR\",\"error\":\"" + json_escape(ex.what()) + "\"}";
    }
}

} // namespace

int main() {
    using namespace qkdsim;

    Config cfg;
    try {
        cfg = load_config_or_default();
    } catch (const std::exception &ex) {
        std::cerr << "qkd-simd: " << ex.what() << std::endl;
        return 1;
    }
    AuditLogger audit(cfg.log_path);

    std::signal(SIGINT, handle_signal);
    std::signal(SIGTERM, handle_signal);

    int server_fd = ::socket(AF_UNIX, SOCK_STREAM, 0);
    if (server_fd < 0) {
        std::perror("socket");
        return 1;
    }

    ::unlink(cfg.socket_path.c_str());

    sockaddr_un addr{};
    addr.sun_family = AF_UNIX;
    std::strncpy(addr.sun_path, cfg.socket_path.c_str(), sizeof(addr.sun_path) - 1);

    if (::bind(server_fd, reinterpret_cast<sockaddr *>(&addr), sizeof(addr)) < 0) {
        std::perror("bind");
        ::close(server_fd);
        return 1;
    }

    if (::listen(server_fd, 16) < 0) {
        std::perror("listen");
        ::close(server_fd);
        return 1;
    }

    std::cout << "qkd-simd listening on UNIX socket: " << cfg.socket_path << std::endl;

    while (!g_terminate) {
        int client_fd = ::accept(server_fd, nullptr, nullptr);
        if (client_fd < 0) {
            if (errno == EINTR && g_terminate) {
                break;
            }
            std::perror("accept");
            continue;
        }

        std::string buffer;
        char chunk[1024];
        ssize_t n;
        while ((n = ::read(client_fd, chunk, sizeof(chunk))) > 0) {
            buffer.append(chunk, chunk + n);
            std::size_t pos;
            while ((pos = buffer.find('\n')) != std::string::npos) {
                std::string line = buffer.substr(0, pos);
                buffer.erase(0, pos + 1);

                if (line.empty()) continue;

                audit.log_event("request", line);

                std::string response_json = handle_line(line, cfg, audit);
                response_json.push_back('\n');

                const char *data = response_json.data();
                std::size_t left = response_json.size();
                while (left > 0) {
                    ssize_t w = ::write(client_fd, data, left);
                    if (w < 0) {
                        if (errno == EINTR) continue;
                        std::perror("write");
                        break;
                    }
                    data += w;
                    left -= static_cast<std::size_t>(w);
                }
            }
        }

        ::close(client_fd);
    }

    ::close(server_fd);
    ::unlink(cfg.socket_path.c_str());

    return 0;
}
