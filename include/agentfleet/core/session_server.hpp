#ifndef AGENTFLEET_CORE_SESSION_SERVER_HPP
#define AGENTFLEET_CORE_SESSION_SERVER_HPP

#include <atomic>
#include <cstdint>
#include <list>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include "agentfleet/core/session_handler.hpp"

namespace agentfleet {
namespace core {

/**
 * @brief TCP listener that feeds agent sessions into a SessionHandler.
 *
 * Each accepted socket is served by its own thread. Frames are single-line
 * JSON documents terminated by '\n'; every inbound frame gets exactly one
 * reply frame.
 */
class SessionServer {
public:
    static constexpr std::size_t kMaxFrameSize = 1024 * 1024;

    /**
     * @param handler Receives every connection event; must outlive the server
     * @param listenAddress IPv4 address to bind
     * @param listenPort Port to bind, 0 for a system-assigned port
     */
    SessionServer(SessionHandler& handler, std::string listenAddress, uint16_t listenPort);
    ~SessionServer();

    // Prevent copying
    SessionServer(const SessionServer&) = delete;
    SessionServer& operator=(const SessionServer&) = delete;

    /**
     * @brief Binds, listens and starts accepting.
     * @throws std::system_error if the socket cannot be set up
     * @throws std::logic_error if the server is already running
     */
    void start();

    /**
     * @brief Closes the listener and every client socket, then joins all threads. Idempotent.
     */
    void stop();

    bool isRunning() const { return running_.load(); }

    /**
     * @brief Port actually bound; only meaningful after start().
     */
    uint16_t boundPort() const { return boundPort_.load(); }

    std::size_t activeConnections() const;

private:
    struct Client {
        int fd{-1};
        std::thread thread;
        std::atomic<bool> finished{false};
    };

    void acceptLoop();
    void serve(Client& client, const std::string& connId);
    bool writeFrame(int fd, const std::string& frame);
    // Caller holds clientsMutex_.
    void reapFinishedClients();

    SessionHandler& handler_;
    std::string listenAddress_;
    uint16_t listenPort_;

    std::atomic<bool> running_{false};
    std::atomic<uint16_t> boundPort_{0};
    int listenFd_{-1};
    std::thread acceptThread_;

    mutable std::mutex clientsMutex_;
    std::list<std::unique_ptr<Client>> clients_;
};

} // namespace core
} // namespace agentfleet

#endif // AGENTFLEET_CORE_SESSION_SERVER_HPP
