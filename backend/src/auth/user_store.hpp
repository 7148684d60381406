#pragma once
#include <algorithm>
#include <cstddef>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "auth/auth_utils.hpp"
#include "auth/token_verifier.hpp"
#include "common/errors.hpp"

struct User {
    std::string username;
    std::string password_hash; // never returned by the API
};

// In-memory user registry; persisted through the state snapshot.
class UserStore {
public:
    static constexpr std::size_t kMinUsername = 3;
    static constexpr std::size_t kMinPassword = 6;

    std::optional<EngineError> create_user(const std::string& username, const std::string& password) {
        if (username.size() < kMinUsername) {
            return EngineError{ErrorCode::Malformed, "username must be at least 3 characters"};
        }
        if (password.size() < kMinPassword) {
            return EngineError{ErrorCode::Malformed, "password must be at least 6 characters"};
        }
        {
            std::lock_guard<std::mutex> lk(m_);
            if (users_.count(username)) return EngineError{ErrorCode::Malformed, "user already exists"};
        }

        // PBKDF2 is slow; hash outside the lock and re-check on insert.
        std::string hash = hash_password(password);

        std::lock_guard<std::mutex> lk(m_);
        if (!users_.emplace(username, std::move(hash)).second) {
            return EngineError{ErrorCode::Malformed, "user already exists"};
        }
        return std::nullopt;
    }

    bool check_credentials(const std::string& username, const std::string& password) const {
        std::string hash;
        {
            std::lock_guard<std::mutex> lk(m_);
            auto it = users_.find(username);
            if (it == users_.end()) return false;
            hash = it->second;
        }
        return verify_password(password, hash);
    }

    bool exists(const std::string& username) const {
        std::lock_guard<std::mutex> lk(m_);
        return users_.count(username) > 0;
    }

    std::size_t size() const {
        std::lock_guard<std::mutex> lk(m_);
        return users_.size();
    }

    // Sorted by username.
    std::vector<User> export_users() const {
        std::vector<User> out;
        {
            std::lock_guard<std::mutex> lk(m_);
            out.reserve(users_.size());
            for (const auto& [name, hash] : users_) out.push_back(User{name, hash});
        }
        std::sort(out.begin(), out.end(), [](const User& a, const User& b) { return a.username < b.username; });
        return out;
    }

    void load(const std::vector<User>& users) {
        std::lock_guard<std::mutex> lk(m_);
        users_.clear();
        for (const auto& u : users) users_[u.username] = u.password_hash;
    }

private:
    mutable std::mutex m_;
    std::unordered_map<std::string, std::string> users_;
};

// Accepts a token only if it verifies and its subject is still registered.
class RegisteredUserVerifier : public ITokenVerifier {
public:
    RegisteredUserVerifier(const ITokenVerifier& tokens, const UserStore& users)
        : tokens_(tokens), users_(users) {}

    std::optional<std::string> verify(const std::string& token) const override {
        auto user = tokens_.verify(token);
        if (!user || !users_.exists(*user)) return std::nullopt;
        return user;
    }

private:
    const ITokenVerifier& tokens_;
    const UserStore& users_;
};
