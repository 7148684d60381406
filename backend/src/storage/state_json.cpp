#include "storage/state_store.hpp"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace {

json order_to_json(const Order& o) {
    return {
        {"id", o.id},
        {"user", o.user_id},
        {"symbol", o.symbol},
        {"side", to_cstr(o.side)},
        {"price", o.price},
        {"quantity", o.quantity},
        {"filled_quantity", o.filled_quantity},
        {"reserved", o.reserved},
        {"status", to_cstr(o.status)},
        {"created_at_ns", o.created_at_ns},
        {"updated_at_ns", o.updated_at_ns},
    };
}

Order order_from_json(const json& j) {
    Order o;
    o.id = j.at("id").get<std::uint64_t>();
    o.user_id = j.at("user").get<std::string>();
    o.symbol = j.at("symbol").get<std::string>();

    auto side = parse_side(j.at("side").get<std::string>());
    auto status = parse_status(j.at("status").get<std::string>());
    if (!side || !status) throw std::runtime_error("order " + std::to_string(o.id) + ": bad side or status");
    o.side = *side;
    o.status = *status;

    o.price = j.at("price").get<double>();
    o.quantity = j.at("quantity").get<double>();
    o.filled_quantity = j.value("filled_quantity", 0.0);
    o.reserved = j.value("reserved", 0.0);
    o.created_at_ns = j.value("created_at_ns", std::int64_t{0});
    o.updated_at_ns = j.value("updated_at_ns", o.created_at_ns);
    return o;
}

} // namespace

std::string encode_snapshot(const StateSnapshot& snap) {
    json users = json::object();
    for (const auto& u : snap.users) users[u.username] = {{"password_hash", u.password_hash}};

    json balances = json::object();
    for (const auto& [user, assets] : snap.engine.balances) {
        json a = json::object();
        for (const auto& [asset, b] : assets) a[asset] = {{"total", b.total}, {"available", b.available}};
        balances[user] = std::move(a);
    }

    json orders = json::array();
    for (const auto& o : snap.engine.orders) orders.push_back(order_to_json(o));

    json doc = {
        {"users", std::move(users)},
        {"balances", std::move(balances)},
        {"orders", std::move(orders)},
        {"next_order_id", snap.engine.next_order_id},
    };
    return doc.dump(2);
}

StateSnapshot decode_snapshot(const std::string& doc) {
    try {
        json j = json::parse(doc);
        StateSnapshot snap;

        for (const auto& [name, v] : j.value("users", json::object()).items()) {
            snap.users.push_back(User{name, v.at("password_hash").get<std::string>()});
        }
        for (const auto& [user, assets] : j.value("balances", json::object()).items()) {
            auto& dst = snap.engine.balances[user];
            for (const auto& [asset, v] : assets.items()) {
                dst[asset] = Balance{v.at("total").get<double>(), v.at("available").get<double>()};
            }
        }
        for (const auto& o : j.value("orders", json::array())) snap.engine.orders.push_back(order_from_json(o));

        snap.engine.next_order_id = j.value("next_order_id", std::uint64_t{1});
        return snap;
    } catch (const json::exception& e) {
        throw std::runtime_error(std::string("invalid state document: ") + e.what());
    }
}

// ---------------------------------------------------------------------------

namespace {

class JsonFileStateStore final : public IStateStore
{
public:
    explicit JsonFileStateStore(std::string path) : path_(std::move(path)) {}

    std::optional<StateSnapshot> load() override {
        std::error_code ec;
        if (!fs::exists(path_, ec)) return std::nullopt;

        std::ifstream in(path_, std::ios::binary);
        if (!in) throw std::runtime_error("cannot open " + path_);
        std::ostringstream buf;
        buf << in.rdbuf();
        return decode_snapshot(buf.str());
    }

    // Write-then-rename so a crash mid-save never leaves a truncated file.
    void save(const StateSnapshot& snap) override {
        const fs::path target(path_);
        if (target.has_parent_path()) fs::create_directories(target.parent_path());

        const fs::path tmp = target.string() + ".tmp";
        {
            std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
            if (!out) throw std::runtime_error("cannot write " + tmp.string());
            out << encode_snapshot(snap);
            out.flush();
            if (!out) throw std::runtime_error("short write to " + tmp.string());
        }
        fs::rename(tmp, target);
    }

    std::string describe() const override { return "json file " + path_; }

private:
    std::string path_;
};

} // namespace

std::unique_ptr<IStateStore> make_json_file_store(const std::string& path) {
    return std::make_unique<JsonFileStateStore>(path);
}
