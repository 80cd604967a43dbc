#include "agentfleet/utils/crypto.hpp"
#include <openssl/crypto.h>
#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <openssl/rand.h>
#include <sstream>

namespace agentfleet {
namespace utils {

namespace {
    const char kHexDigits[] = "0123456789abcdef";

    // Helper to get OpenSSL error string
    std::string getOpenSSLError() {
        std::stringstream ss;
        unsigned long err;
        while ((err = ERR_get_error()) != 0) {
            char buf[256];
            ERR_error_string_n(err, buf, sizeof(buf));
            ss << buf << "; ";
        }
        return ss.str();
    }

    bool isBase64UrlChar(char c) {
        return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') ||
               c == '-' || c == '_';
    }

    int hexValue(char c) {
        if (c >= '0' && c <= '9') return c - '0';
        if (c >= 'a' && c <= 'f') return c - 'a' + 10;
        if (c >= 'A' && c <= 'F') return c - 'A' + 10;
        return -1;
    }
}

std::string sha256Hex(const std::string& data) {
    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int hashLen = 0;

    EVP_MD_CTX* ctx = EVP_MD_CTX_new();
    EVP_DigestInit_ex(ctx, EVP_sha256(), nullptr);
    EVP_DigestUpdate(ctx, data.data(), data.size());
    EVP_DigestFinal_ex(ctx, hash, &hashLen);
    EVP_MD_CTX_free(ctx);

    return toHex(Bytes(hash, hash + hashLen));
}

Result<Bytes> hmacSha256(const Bytes& key, const Bytes& data) {
    Bytes mac(EVP_MAX_MD_SIZE);
    unsigned int macLen = 0;
    if (!HMAC(EVP_sha256(), key.data(), static_cast<int>(key.size()),
              data.data(), data.size(), mac.data(), &macLen)) {
        return Error(ErrorCode::StorageError, "failed to compute HMAC: " + getOpenSSLError());
    }
    mac.resize(macLen);
    return mac;
}

Result<Bytes> randomBytes(std::size_t count) {
    Bytes out(count);
    if (count > 0 && RAND_bytes(out.data(), static_cast<int>(out.size())) != 1) {
        return Error(ErrorCode::StorageError, "failed to generate random bytes: " + getOpenSSLError());
    }
    return out;
}

bool constantTimeEquals(const Bytes& a, const Bytes& b) {
    if (a.size() != b.size()) {
        return false;
    }
    return CRYPTO_memcmp(a.data(), b.data(), a.size()) == 0;
}

std::string toHex(const Bytes& data) {
    std::string out;
    out.reserve(data.size() * 2);
    for (uint8_t byte : data) {
        out.push_back(kHexDigits[byte >> 4]);
        out.push_back(kHexDigits[byte & 0x0f]);
    }
    return out;
}

Result<Bytes> fromHex(const std::string& hex) {
    if (hex.size() % 2 != 0) {
        return Error(ErrorCode::ValidationError, "hex string has odd length");
    }
    Bytes out;
    out.reserve(hex.size() / 2);
    for (std::size_t i = 0; i < hex.size(); i += 2) {
        int hi = hexValue(hex[i]);
        int lo = hexValue(hex[i + 1]);
        if (hi < 0 || lo < 0) {
            return Error(ErrorCode::ValidationError, "invalid hex digit");
        }
        out.push_back(static_cast<uint8_t>((hi << 4) | lo));
    }
    return out;
}

std::string base64UrlEncode(const Bytes& data) {
    // EVP_EncodeBlock writes padded standard base64 plus a terminating NUL.
    std::string out(4 * ((data.size() + 2) / 3) + 1, '\0');
    int written = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(&out[0]),
                                  data.data(), static_cast<int>(data.size()));
    out.resize(static_cast<std::size_t>(written));

    while (!out.empty() && out.back() == '=') {
        out.pop_back();
    }
    for (char& c : out) {
        if (c == '+') {
            c = '-';
        } else if (c == '/') {
            c = '_';
        }
    }
    return out;
}

Result<Bytes> base64UrlDecode(const std::string& text) {
    if (text.size() % 4 == 1) {
        return Error(ErrorCode::ValidationError, "invalid base64url length");
    }
    if (text.empty()) {
        return Bytes();
    }

    std::string standard = text;
    for (char& c : standard) {
        if (!isBase64UrlChar(c)) {
            return Error(ErrorCode::ValidationError, "invalid base64url character");
        }
        if (c == '-') {
            c = '+';
        } else if (c == '_') {
            c = '/';
        }
    }
    std::size_t padding = (4 - standard.size() % 4) % 4;
    standard.append(padding, '=');

    Bytes out(standard.size() / 4 * 3);
    int decoded = EVP_DecodeBlock(out.data(), reinterpret_cast<const unsigned char*>(standard.data()),
                                  static_cast<int>(standard.size()));
    if (decoded < 0) {
        return Error(ErrorCode::ValidationError, "invalid base64url: " + getOpenSSLError());
    }
    // EVP_DecodeBlock counts the bytes that padding stands for.
    out.resize(static_cast<std::size_t>(decoded) - padding);

    // Non-zero trailing bits decode fine but do not round-trip.
    if (base64UrlEncode(out) != text) {
        return Error(ErrorCode::ValidationError, "non-canonical base64url trailing bits");
    }
    return out;
}

} // namespace utils
} // namespace agentfleet
