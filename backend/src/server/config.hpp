#pragma once
#include <chrono>
#include <cstddef>
#include <string>

// Loads KEY=VALUE lines from a .env file into the environment. Existing
// variables win. Looks in ./ then ./backend/; a missing file is not an error.
void load_env_file(const std::string& filepath = ".env");

// Runtime settings read from PAPER_* environment variables.
struct Settings {
    unsigned short port{8000};
    std::string secret_key{"CHANGE_ME_DEV_SECRET"};
    std::chrono::minutes jwt_ttl{24 * 60};
    std::string state_path{"data/state.json"};
    std::string state_db_url;  // empty: use the JSON file
    std::chrono::seconds snapshot_interval{5};
    std::size_t outbound_queue{1024};
    std::chrono::hours order_retention{24 * 7};  // zero: keep terminal orders forever
};

// Throws std::runtime_error on a value that does not parse.
Settings load_settings();
