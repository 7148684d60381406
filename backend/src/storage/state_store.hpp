#pragma once
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "auth/user_store.hpp"
#include "engine/engine_state.hpp"

// Everything that survives a restart.
struct StateSnapshot {
    std::vector<User> users;
    EngineState engine;
};

class IStateStore
{
public:
    virtual ~IStateStore() = default;

    // nullopt when nothing was saved yet. Throws std::runtime_error when a
    // saved document exists but cannot be read.
    virtual std::optional<StateSnapshot> load() = 0;

    // Replaces the stored document. Throws std::runtime_error on failure.
    virtual void save(const StateSnapshot& snap) = 0;

    virtual std::string describe() const = 0;
};

// JSON document shared by every store:
// {"users":{name:{"password_hash"}}, "balances":{user:{asset:{"total","available"}}},
//  "orders":[{...}], "next_order_id":N}
std::string encode_snapshot(const StateSnapshot& snap);
StateSnapshot decode_snapshot(const std::string& doc); // throws std::runtime_error

std::unique_ptr<IStateStore> make_json_file_store(const std::string& path);
std::unique_ptr<IStateStore> make_postgres_store(const std::string& connection_string);
