#pragma once
#include <cstddef>
#include <optional>
#include <string>

// Byte helpers over OpenSSL's EVP/HMAC/RAND primitives. Strings hold raw bytes.

std::string base64_encode(const std::string& bytes);
std::optional<std::string> base64_decode(const std::string& text);

// RFC 4648 section 5 alphabet, no padding.
std::string base64url_encode(const std::string& bytes);
std::optional<std::string> base64url_decode(const std::string& text);

std::string hmac_sha256(const std::string& key, const std::string& data);
std::string random_bytes(std::size_t n);

// Constant-time equality.
bool bytes_equal(const std::string& a, const std::string& b);

// PBKDF2-HMAC-SHA256 with a fresh 16-byte salt; returns base64(salt || digest).
inline constexpr int kPbkdf2Iterations = 120000;
inline constexpr std::size_t kSaltBytes = 16;

std::string hash_password(const std::string& password);
bool verify_password(const std::string& password, const std::string& stored_hash);
