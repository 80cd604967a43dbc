#ifndef AGENTFLEET_CORE_MESSAGE_CODEC_HPP
#define AGENTFLEET_CORE_MESSAGE_CODEC_HPP

#include <string>
#include "agentfleet/core/protocol.hpp"
#include "agentfleet/utils/result.hpp"

namespace agentfleet {
namespace core {

/**
 * @brief JSON text encoding of the session protocol messages.
 *
 * One message per frame. Decoding never throws: malformed input of any kind
 * is reported as ProtocolError.
 */
class MessageCodec {
public:
    static Result<AgentToServer> decodeAgentToServer(const std::string& frame);
    static std::string encodeAgentToServer(const AgentToServer& message);

    static Result<ServerToAgent> decodeServerToAgent(const std::string& frame);
    static std::string encodeServerToAgent(const ServerToAgent& message);
};

} // namespace core
} // namespace agentfleet

#endif // AGENTFLEET_CORE_MESSAGE_CODEC_HPP
