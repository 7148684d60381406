#pragma once
#include <chrono>
#include <cstdint>
#include <iostream>
#include <mutex>
#include <string>

#include "auth/user_store.hpp"
#include "engine/matching_engine.hpp"
#include "storage/state_store.hpp"
#include "util/periodic_task.hpp"

// Snapshots users and engine state into the store on a fixed cadence.
// A save is skipped when the document is unchanged since the last one.
class StatePersister {
public:
    StatePersister(IStateStore& store, const UserStore& users, const MatchingEngine& engine,
                   std::chrono::milliseconds interval)
        : store_(store), users_(users), engine_(engine),
          task_("store", interval, [this] { persist(); }) {}

    void start() { task_.start(); }

    // Stops the cadence and writes one final snapshot.
    void stop() {
        task_.stop();
        try {
            persist();
        } catch (const std::exception& e) {
            std::cerr << "[store] final save failed: " << e.what() << std::endl;
        }
    }

    // Returns true when a save happened. Throws what the store throws.
    bool persist() {
        std::lock_guard<std::mutex> lk(m_);
        StateSnapshot snap{users_.export_users(), engine_.export_state()};
        std::string doc = encode_snapshot(snap);
        if (doc == last_doc_) return false;
        store_.save(snap);
        last_doc_ = std::move(doc);
        ++saves_;
        return true;
    }

    // Marks `snap` as already stored (the one just loaded at startup).
    void seed(const StateSnapshot& snap) {
        std::lock_guard<std::mutex> lk(m_);
        last_doc_ = encode_snapshot(snap);
    }

    std::uint64_t saves() const {
        std::lock_guard<std::mutex> lk(m_);
        return saves_;
    }

private:
    IStateStore& store_;
    const UserStore& users_;
    const MatchingEngine& engine_;

    mutable std::mutex m_;
    std::string last_doc_;
    std::uint64_t saves_{0};

    PeriodicTask task_;
};
