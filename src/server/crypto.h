#pragma once

#include <optional>
#include <string>

namespace aiexec {

std::string Sha256Hex(const std::string& data);
std::string HmacSha256(const std::string& key, const std::string& data);

// Hex string of `bytes` random bytes from the OpenSSL CSPRNG. Empty on failure.
std::string RandomHex(size_t bytes);

bool ConstantTimeEquals(const std::string& a, const std::string& b);

std::string Base64UrlEncode(const std::string& data);
std::optional<std::string> Base64UrlDecode(const std::string& text);

// "pbkdf2-sha256$<iterations>$<salt hex>$<digest hex>"
std::string HashPassword(const std::string& password, int iterations = 120000);
bool VerifyPassword(const std::string& password, const std::string& encoded);

} // namespace aiexec
