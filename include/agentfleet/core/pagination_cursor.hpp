#ifndef AGENTFLEET_CORE_PAGINATION_CURSOR_HPP
#define AGENTFLEET_CORE_PAGINATION_CURSOR_HPP

#include <algorithm>
#include <cstdint>
#include <iterator>
#include <string>
#include <vector>
#include "agentfleet/core/list_options.hpp"
#include "agentfleet/utils/crypto.hpp"
#include "agentfleet/utils/result.hpp"

namespace agentfleet {
namespace core {

/**
 * @brief Position decoded from a continuation token.
 */
struct CursorPosition {
    std::string lastKey;  ///< Sort key of the last item already returned
    uint32_t limit{0};    ///< Page size the token was issued for

    bool operator==(const CursorPosition& other) const {
        return lastKey == other.lastKey && limit == other.limit;
    }
};

/**
 * @brief Codec for opaque, tamper-evident continuation tokens.
 *
 * Token layout is base64url(payload) "." base64url(mac), where the payload is
 * a version byte, the big-endian 32-bit limit, then the raw last-key bytes, and
 * mac is HMAC-SHA-256 over the payload. Tokens are only accepted by a codec
 * holding the same secret.
 *
 * Thread-safe: the secret is immutable after construction.
 */
class PaginationCursor {
public:
    /**
     * @brief Constructs a codec with the given signing secret.
     * @throws std::invalid_argument if the secret is shorter than 16 bytes
     */
    explicit PaginationCursor(utils::Bytes secret);

    /**
     * @brief Constructs a codec with a freshly generated random secret.
     * @throws std::runtime_error if the random source fails
     */
    static PaginationCursor withRandomSecret();

    std::string encode(const std::string& lastKey, uint32_t limit) const;

    /**
     * @brief Decodes a token produced by encode().
     * @return The position, or InvalidCursor for anything else. Never throws.
     */
    Result<CursorPosition> decode(const std::string& token) const;

private:
    utils::Bytes secret_;
};

/**
 * @brief Applies ListOptions to a snapshot already sorted by key.
 *
 * Items whose key is strictly greater than the token's last key form the page.
 * A zero limit with a token reuses the token's limit; zero without a token means
 * the whole remainder.
 *
 * @param sorted Snapshot sorted ascending by keyOf
 * @param keyOf Callable returning the std::string sort key of an item
 * @return The page, ValidationError for a negative limit, InvalidCursor for a bad token
 */
template <typename T, typename KeyFn>
Result<ListResponse<T>> paginate(const std::vector<T>& sorted,
                                 KeyFn keyOf,
                                 const ListOptions& options,
                                 const PaginationCursor& cursor) {
    if (options.limit < 0) {
        return Error(ErrorCode::ValidationError, "limit must not be negative");
    }
    if (options.limit > static_cast<int64_t>(UINT32_MAX)) {
        return Error(ErrorCode::ValidationError, "limit is too large");
    }

    uint32_t limit = static_cast<uint32_t>(options.limit);
    auto begin = sorted.begin();

    if (!options.continueToken.empty()) {
        auto position = cursor.decode(options.continueToken);
        if (position.has_error()) {
            return position.error();
        }
        if (limit == 0) {
            limit = position.value().limit;
        }
        const std::string& lastKey = position.value().lastKey;
        begin = std::upper_bound(sorted.begin(), sorted.end(), lastKey,
            [&keyOf](const std::string& key, const T& item) { return key < keyOf(item); });
    }

    auto available = static_cast<std::size_t>(std::distance(begin, sorted.end()));
    std::size_t take = (limit == 0) ? available : std::min<std::size_t>(limit, available);

    ListResponse<T> response;
    response.items.assign(begin, begin + static_cast<std::ptrdiff_t>(take));
    response.remainingItemCount = static_cast<int64_t>(available - take);
    if (response.remainingItemCount > 0 && !response.items.empty()) {
        response.continueToken = cursor.encode(keyOf(response.items.back()), limit);
    }
    return response;
}

} // namespace core
} // namespace agentfleet

#endif // AGENTFLEET_CORE_PAGINATION_CURSOR_HPP
