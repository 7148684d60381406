#include "server/config.hpp"

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <stdexcept>

void load_env_file(const std::string& filepath) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        file.open("backend/" + filepath);
        if (!file.is_open()) return;
    }

    std::string line;
    while (std::getline(file, line)) {
        if (line.empty() || line[0] == '#') continue;

        const size_t eq_pos = line.find('=');
        if (eq_pos == std::string::npos) continue;

        std::string key = line.substr(0, eq_pos);
        std::string value = line.substr(eq_pos + 1);

        key.erase(0, key.find_first_not_of(" \t"));
        key.erase(key.find_last_not_of(" \t") + 1);
        value.erase(0, value.find_first_not_of(" \t\r"));
        value.erase(value.find_last_not_of(" \t\r") + 1);
        if (key.empty()) continue;

        if (value.size() >= 2 &&
            ((value.front() == '"' && value.back() == '"') || (value.front() == '\'' && value.back() == '\''))) {
            value = value.substr(1, value.size() - 2);
        }

        setenv(key.c_str(), value.c_str(), 0); // 0 = keep existing
    }
}

namespace {

std::string env_or(const char* key, const std::string& fallback) {
    const char* v = std::getenv(key);
    return (v && *v) ? std::string(v) : fallback;
}

long env_long(const char* key, long fallback, long min_value) {
    const char* v = std::getenv(key);
    if (!v || !*v) return fallback;
    char* end = nullptr;
    const long n = std::strtol(v, &end, 10);
    if (end == v || *end != '\0' || n < min_value) {
        throw std::runtime_error(std::string(key) + ": expected an integer >= " +
                                 std::to_string(min_value) + ", got '" + v + "'");
    }
    return n;
}

} // namespace

Settings load_settings() {
    Settings s;
    const long port = env_long("PAPER_PORT", s.port, 1);
    if (port > 65535) throw std::runtime_error("PAPER_PORT out of range");
    s.port = static_cast<unsigned short>(port);
    s.secret_key = env_or("PAPER_SECRET_KEY", s.secret_key);
    s.jwt_ttl = std::chrono::minutes(env_long("PAPER_JWT_EXP_MINUTES", s.jwt_ttl.count(), 1));
    s.state_path = env_or("PAPER_STATE_PATH", s.state_path);
    s.state_db_url = env_or("PAPER_STATE_DB_URL", "");
    s.snapshot_interval = std::chrono::seconds(env_long("PAPER_SNAPSHOT_INTERVAL_S", s.snapshot_interval.count(), 1));
    s.outbound_queue = static_cast<std::size_t>(env_long("PAPER_OUTBOUND_QUEUE", static_cast<long>(s.outbound_queue), 1));
    s.order_retention = std::chrono::hours(env_long("PAPER_ORDER_RETENTION_H", s.order_retention.count(), 0));

    if (s.secret_key == "CHANGE_ME_DEV_SECRET") {
        std::cerr << "[setup] PAPER_SECRET_KEY not set; using the development secret" << std::endl;
    }
    return s;
}
