#ifndef AGENTFLEET_CORE_LIST_OPTIONS_HPP
#define AGENTFLEET_CORE_LIST_OPTIONS_HPP

#include <cstdint>
#include <string>
#include <vector>

namespace agentfleet {
namespace core {

/**
 * @brief Paging request shared by every listing in the system.
 */
struct ListOptions {
    int64_t limit{0};           ///< Maximum items per page, 0 means no limit
    std::string continueToken;  ///< Token from the previous page, empty for the first page
};

/**
 * @brief Paging envelope shared by every listing in the system.
 */
template <typename T>
struct ListResponse {
    std::vector<T> items;
    std::string continueToken;      ///< Empty once the last page has been returned
    int64_t remainingItemCount{0};  ///< Items after this page at snapshot time
};

} // namespace core
} // namespace agentfleet

#endif // AGENTFLEET_CORE_LIST_OPTIONS_HPP
