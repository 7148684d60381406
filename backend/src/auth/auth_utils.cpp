#include "auth/auth_utils.hpp"

#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <openssl/rand.h>

#include <stdexcept>
#include <vector>

std::string base64_encode(const std::string& bytes) {
    if (bytes.empty()) return {};
    std::vector<unsigned char> out(4 * ((bytes.size() + 2) / 3) + 1);
    const int n = EVP_EncodeBlock(out.data(),
                                  reinterpret_cast<const unsigned char*>(bytes.data()),
                                  static_cast<int>(bytes.size()));
    return std::string(reinterpret_cast<const char*>(out.data()), static_cast<std::size_t>(n));
}

std::optional<std::string> base64_decode(const std::string& text) {
    if (text.empty()) return std::string{};
    if (text.size() % 4 != 0) return std::nullopt;

    std::vector<unsigned char> out(3 * (text.size() / 4) + 1);
    const int n = EVP_DecodeBlock(out.data(),
                                  reinterpret_cast<const unsigned char*>(text.data()),
                                  static_cast<int>(text.size()));
    if (n < 0) return std::nullopt;

    // EVP_DecodeBlock keeps the zero bytes produced by '=' padding.
    std::size_t len = static_cast<std::size_t>(n);
    if (text[text.size() - 1] == '=') --len;
    if (text[text.size() - 2] == '=') --len;
    return std::string(reinterpret_cast<const char*>(out.data()), len);
}

std::string base64url_encode(const std::string& bytes) {
    std::string s = base64_encode(bytes);
    while (!s.empty() && s.back() == '=') s.pop_back();
    for (auto& c : s) {
        if (c == '+') c = '-';
        else if (c == '/') c = '_';
    }
    return s;
}

std::optional<std::string> base64url_decode(const std::string& text) {
    std::string s = text;
    for (auto& c : s) {
        if (c == '-') c = '+';
        else if (c == '_') c = '/';
        else if (c == '+' || c == '/' || c == '=') return std::nullopt;
    }
    if (s.size() % 4 == 1) return std::nullopt;
    while (s.size() % 4 != 0) s.push_back('=');
    return base64_decode(s);
}

std::string hmac_sha256(const std::string& key, const std::string& data) {
    unsigned char mac[EVP_MAX_MD_SIZE];
    unsigned int mac_len = 0;
    if (!HMAC(EVP_sha256(), key.data(), static_cast<int>(key.size()),
              reinterpret_cast<const unsigned char*>(data.data()), data.size(),
              mac, &mac_len)) {
        throw std::runtime_error("HMAC-SHA256 failed");
    }
    return std::string(reinterpret_cast<const char*>(mac), mac_len);
}

std::string random_bytes(std::size_t n) {
    std::string out(n, '\0');
    if (n > 0 && RAND_bytes(reinterpret_cast<unsigned char*>(out.data()), static_cast<int>(n)) != 1) {
        throw std::runtime_error("RAND_bytes failed");
    }
    return out;
}

bool bytes_equal(const std::string& a, const std::string& b) {
    if (a.size() != b.size()) return false;
    return CRYPTO_memcmp(a.data(), b.data(), a.size()) == 0;
}

namespace {

std::string pbkdf2(const std::string& password, const std::string& salt) {
    unsigned char digest[32];
    if (PKCS5_PBKDF2_HMAC(password.data(), static_cast<int>(password.size()),
                          reinterpret_cast<const unsigned char*>(salt.data()), static_cast<int>(salt.size()),
                          kPbkdf2Iterations, EVP_sha256(), sizeof(digest), digest) != 1) {
        throw std::runtime_error("PBKDF2 failed");
    }
    return std::string(reinterpret_cast<const char*>(digest), sizeof(digest));
}

} // namespace

std::string hash_password(const std::string& password) {
    const std::string salt = random_bytes(kSaltBytes);
    return base64_encode(salt + pbkdf2(password, salt));
}

bool verify_password(const std::string& password, const std::string& stored_hash) {
    auto raw = base64_decode(stored_hash);
    if (!raw || raw->size() <= kSaltBytes) return false;
    const std::string salt = raw->substr(0, kSaltBytes);
    const std::string digest = raw->substr(kSaltBytes);
    return bytes_equal(pbkdf2(password, salt), digest);
}
