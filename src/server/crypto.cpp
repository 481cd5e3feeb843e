#include "src/server/crypto.h"
#include "src/server/logger.h"

#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <openssl/rand.h>

#include <cstdlib>
#include <vector>

namespace aiexec {

namespace {

constexpr const char* kPasswordScheme = "pbkdf2-sha256";
constexpr size_t kSaltBytes = 16;
constexpr size_t kDigestBytes = 32;

std::string ToHex(const unsigned char* data, size_t size) {
    static const char* const kDigits = "0123456789abcdef";
    std::string out;
    out.reserve(size * 2);
    for (size_t i = 0; i < size; i++) {
        out.push_back(kDigits[data[i] >> 4]);
        out.push_back(kDigits[data[i] & 0xF]);
    }
    return out;
}

std::optional<std::string> FromHex(const std::string& hex) {
    if (hex.size() % 2) return std::nullopt;

    auto nibble = [](char c) -> int {
        if (c >= '0' && c <= '9') return c - '0';
        if (c >= 'a' && c <= 'f') return c - 'a' + 10;
        if (c >= 'A' && c <= 'F') return c - 'A' + 10;
        return -1;
    };

    std::string out;
    out.reserve(hex.size() / 2);
    for (size_t i = 0; i < hex.size(); i += 2) {
        int hi = nibble(hex[i]);
        int lo = nibble(hex[i + 1]);
        if (hi < 0 || lo < 0) return std::nullopt;
        out.push_back(static_cast<char>((hi << 4) | lo));
    }
    return out;
}

std::string Pbkdf2(const std::string& password, const std::string& salt, int iterations) {
    unsigned char digest[kDigestBytes];
    if (PKCS5_PBKDF2_HMAC(password.data(), static_cast<int>(password.size()),
                          reinterpret_cast<const unsigned char*>(salt.data()), static_cast<int>(salt.size()),
                          iterations, EVP_sha256(), kDigestBytes, digest) != 1) {
        return "";
    }
    return std::string(reinterpret_cast<const char*>(digest), kDigestBytes);
}

} // namespace

std::string Sha256Hex(const std::string& data) {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int size = 0;
    if (EVP_Digest(data.data(), data.size(), digest, &size, EVP_sha256(), nullptr) != 1) {
        Logger::Error("SHA-256 digest failed");
        return "";
    }
    return ToHex(digest, size);
}

std::string HmacSha256(const std::string& key, const std::string& data) {
    unsigned char mac[EVP_MAX_MD_SIZE];
    unsigned int size = 0;
    if (!HMAC(EVP_sha256(), key.data(), static_cast<int>(key.size()),
              reinterpret_cast<const unsigned char*>(data.data()), data.size(), mac, &size)) {
        Logger::Error("HMAC-SHA256 failed");
        return "";
    }
    return std::string(reinterpret_cast<const char*>(mac), size);
}

std::string RandomHex(size_t bytes) {
    std::vector<unsigned char> buffer(bytes);
    if (RAND_bytes(buffer.data(), static_cast<int>(buffer.size())) != 1) {
        Logger::Error("RAND_bytes failed");
        return "";
    }
    return ToHex(buffer.data(), buffer.size());
}

bool ConstantTimeEquals(const std::string& a, const std::string& b) {
    if (a.size() != b.size()) return false;
    return CRYPTO_memcmp(a.data(), b.data(), a.size()) == 0;
}

std::string Base64UrlEncode(const std::string& data) {
    std::vector<unsigned char> out(4 * ((data.size() + 2) / 3) + 1);
    int len = EVP_EncodeBlock(out.data(), reinterpret_cast<const unsigned char*>(data.data()),
                              static_cast<int>(data.size()));

    std::string text(reinterpret_cast<const char*>(out.data()), static_cast<size_t>(len));
    while (!text.empty() && text.back() == '=') text.pop_back();
    for (char& c : text) {
        if (c == '+') c = '-';
        else if (c == '/') c = '_';
    }
    return text;
}

std::optional<std::string> Base64UrlDecode(const std::string& text) {
    if (text.size() % 4 == 1) return std::nullopt;

    std::string padded;
    padded.reserve(text.size() + 3);
    for (char c : text) {
        if (c == '-') padded.push_back('+');
        else if (c == '_') padded.push_back('/');
        else if ((c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9')) padded.push_back(c);
        else return std::nullopt;
    }
    size_t padding = (4 - padded.size() % 4) % 4;
    padded.append(padding, '=');

    std::vector<unsigned char> out(padded.size() / 4 * 3 + 1);
    int len = EVP_DecodeBlock(out.data(), reinterpret_cast<const unsigned char*>(padded.data()),
                              static_cast<int>(padded.size()));
    if (len < 0) return std::nullopt;

    // EVP_DecodeBlock counts the bytes that padding stands for.
    size_t size = static_cast<size_t>(len) - padding;
    return std::string(reinterpret_cast<const char*>(out.data()), size);
}

std::string HashPassword(const std::string& password, int iterations) {
    std::string salt_hex = RandomHex(kSaltBytes);
    if (salt_hex.empty()) return "";
    std::string salt = *FromHex(salt_hex);

    std::string digest = Pbkdf2(password, salt, iterations);
    if (digest.empty()) return "";

    return std::string(kPasswordScheme) + "$" + std::to_string(iterations) + "$" + salt_hex + "$" +
           ToHex(reinterpret_cast<const unsigned char*>(digest.data()), digest.size());
}

bool VerifyPassword(const std::string& password, const std::string& encoded) {
    size_t first = encoded.find('$');
    size_t second = first == std::string::npos ? first : encoded.find('$', first + 1);
    size_t third = second == std::string::npos ? second : encoded.find('$', second + 1);
    if (third == std::string::npos) return false;
    if (encoded.compare(0, first, kPasswordScheme) != 0) return false;

    int iterations = std::atoi(encoded.substr(first + 1, second - first - 1).c_str());
    auto salt = FromHex(encoded.substr(second + 1, third - second - 1));
    auto expected = FromHex(encoded.substr(third + 1));
    if (iterations <= 0 || !salt || !expected) return false;

    std::string digest = Pbkdf2(password, *salt, iterations);
    return !digest.empty() && ConstantTimeEquals(digest, *expected);
}

} // namespace aiexec
