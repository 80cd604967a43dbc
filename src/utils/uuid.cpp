#include "agentfleet/utils/uuid.hpp"
#include <uuid/uuid.h>

namespace agentfleet {
namespace utils {

std::string generateUuid() {
    uuid_t uuid;
    uuid_generate_random(uuid);

    char text[37];
    uuid_unparse_lower(uuid, text);
    return std::string(text);
}

bool isValidUuid(const std::string& text) {
    // uuid_parse accepts exactly the 36 character hyphenated form.
    uuid_t parsed;
    return text.size() == 36 && uuid_parse(text.c_str(), parsed) == 0;
}

} // namespace utils
} // namespace agentfleet
