#include "agentfleet/core/pagination_cursor.hpp"
#include <stdexcept>

namespace agentfleet {
namespace core {

namespace {
    constexpr uint8_t kTokenVersion = 1;
    constexpr std::size_t kHeaderSize = 1 + sizeof(uint32_t);
    constexpr std::size_t kMinSecretSize = 16;
    constexpr std::size_t kMaxTokenSize = 4096;

    Error invalidCursor(const std::string& why) {
        return Error(ErrorCode::InvalidCursor, "invalid continue token: " + why);
    }
}

PaginationCursor::PaginationCursor(utils::Bytes secret) : secret_(std::move(secret)) {
    if (secret_.size() < kMinSecretSize) {
        throw std::invalid_argument("pagination secret must be at least 16 bytes");
    }
}

PaginationCursor PaginationCursor::withRandomSecret() {
    auto secret = utils::randomBytes(32);
    if (secret.has_error()) {
        throw std::runtime_error(secret.error().message);
    }
    return PaginationCursor(secret.value());
}

std::string PaginationCursor::encode(const std::string& lastKey, uint32_t limit) const {
    utils::Bytes payload;
    payload.reserve(kHeaderSize + lastKey.size());
    payload.push_back(kTokenVersion);
    payload.push_back(static_cast<uint8_t>((limit >> 24) & 0xff));
    payload.push_back(static_cast<uint8_t>((limit >> 16) & 0xff));
    payload.push_back(static_cast<uint8_t>((limit >> 8) & 0xff));
    payload.push_back(static_cast<uint8_t>(limit & 0xff));
    payload.insert(payload.end(), lastKey.begin(), lastKey.end());

    auto mac = utils::hmacSha256(secret_, payload);
    if (mac.has_error()) {
        // HMAC over in-memory buffers only fails if OpenSSL itself is broken.
        throw std::runtime_error(mac.error().message);
    }
    return utils::base64UrlEncode(payload) + "." + utils::base64UrlEncode(mac.value());
}

Result<CursorPosition> PaginationCursor::decode(const std::string& token) const {
    if (token.empty() || token.size() > kMaxTokenSize) {
        return invalidCursor("bad length");
    }

    auto dot = token.find('.');
    if (dot == std::string::npos || token.find('.', dot + 1) != std::string::npos) {
        return invalidCursor("malformed");
    }

    auto payload = utils::base64UrlDecode(token.substr(0, dot));
    auto mac = utils::base64UrlDecode(token.substr(dot + 1));
    if (payload.has_error() || mac.has_error()) {
        return invalidCursor("not base64url");
    }

    auto expected = utils::hmacSha256(secret_, payload.value());
    if (expected.has_error() || !utils::constantTimeEquals(expected.value(), mac.value())) {
        return invalidCursor("signature mismatch");
    }

    const utils::Bytes& data = payload.value();
    if (data.size() < kHeaderSize || data[0] != kTokenVersion) {
        return invalidCursor("unsupported version");
    }

    CursorPosition position;
    position.limit = (uint32_t(data[1]) << 24) | (uint32_t(data[2]) << 16) |
                     (uint32_t(data[3]) << 8) | uint32_t(data[4]);
    position.lastKey.assign(data.begin() + kHeaderSize, data.end());
    return position;
}

} // namespace core
} // namespace agentfleet
