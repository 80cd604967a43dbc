#include "agentfleet/core/session_server.hpp"
#include "agentfleet/core/message_codec.hpp"
#include "agentfleet/utils/logging.hpp"
#include "agentfleet/utils/uuid.hpp"
#include <cerrno>
#include <exception>
#include <functional>
#include <stdexcept>
#include <system_error>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

namespace agentfleet {
namespace core {

namespace {
    constexpr int kListenBacklog = 128;
    constexpr std::size_t kReadChunk = 4096;

    std::system_error socketError(const std::string& what) {
        return std::system_error(errno, std::generic_category(), what);
    }
}

SessionServer::SessionServer(SessionHandler& handler, std::string listenAddress, uint16_t listenPort)
    : handler_(handler), listenAddress_(std::move(listenAddress)), listenPort_(listenPort) {}

SessionServer::~SessionServer() {
    stop();
}

void SessionServer::start() {
    if (running_.load()) {
        throw std::logic_error("session server already running");
    }

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(listenPort_);
    if (inet_pton(AF_INET, listenAddress_.c_str(), &addr.sin_addr) != 1) {
        throw std::system_error(EINVAL, std::generic_category(),
                                "invalid listen address " + listenAddress_);
    }

    int fd = ::socket(AF_INET, SOCK_STREAM, 0);
    if (fd < 0) {
        throw socketError("socket");
    }

    int reuse = 1;
    if (::setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse)) < 0) {
        auto error = socketError("setsockopt(SO_REUSEADDR)");
        ::close(fd);
        throw error;
    }
    if (::bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        auto error = socketError("bind " + listenAddress_ + ":" + std::to_string(listenPort_));
        ::close(fd);
        throw error;
    }
    if (::listen(fd, kListenBacklog) < 0) {
        auto error = socketError("listen");
        ::close(fd);
        throw error;
    }

    sockaddr_in bound{};
    socklen_t len = sizeof(bound);
    if (::getsockname(fd, reinterpret_cast<sockaddr*>(&bound), &len) < 0) {
        auto error = socketError("getsockname");
        ::close(fd);
        throw error;
    }

    listenFd_ = fd;
    boundPort_.store(ntohs(bound.sin_port));
    running_.store(true);
    acceptThread_ = std::thread(&SessionServer::acceptLoop, this);

    AGENTFLEET_LOG_INFO("session server listening on {}:{}", listenAddress_, boundPort_.load());
}

void SessionServer::stop() {
    if (!running_.exchange(false)) {
        return;
    }

    // Unblocks accept().
    ::shutdown(listenFd_, SHUT_RDWR);
    if (acceptThread_.joinable()) {
        acceptThread_.join();
    }
    ::close(listenFd_);
    listenFd_ = -1;

    std::list<std::unique_ptr<Client>> clients;
    {
        std::lock_guard<std::mutex> lock(clientsMutex_);
        clients.swap(clients_);
    }
    for (auto& client : clients) {
        ::shutdown(client->fd, SHUT_RDWR);
    }
    for (auto& client : clients) {
        if (client->thread.joinable()) {
            client->thread.join();
        }
        ::close(client->fd);
    }

    AGENTFLEET_LOG_INFO("session server stopped");
}

std::size_t SessionServer::activeConnections() const {
    std::lock_guard<std::mutex> lock(clientsMutex_);
    std::size_t active = 0;
    for (const auto& client : clients_) {
        if (!client->finished.load()) {
            ++active;
        }
    }
    return active;
}

void SessionServer::reapFinishedClients() {
    for (auto it = clients_.begin(); it != clients_.end();) {
        if ((*it)->finished.load()) {
            if ((*it)->thread.joinable()) {
                (*it)->thread.join();
            }
            ::close((*it)->fd);
            it = clients_.erase(it);
        } else {
            ++it;
        }
    }
}

void SessionServer::acceptLoop() {
    while (running_.load()) {
        int fd = ::accept(listenFd_, nullptr, nullptr);
        if (fd < 0) {
            if (!running_.load()) {
                break;
            }
            if (errno == EINTR || errno == ECONNABORTED) {
                continue;
            }
            AGENTFLEET_LOG_ERROR("accept failed: {}", std::system_category().message(errno));
            break;
        }

        std::string connId = utils::generateUuid();

        std::lock_guard<std::mutex> lock(clientsMutex_);
        reapFinishedClients();
        if (!running_.load()) {
            ::close(fd);
            break;
        }
        auto client = std::make_unique<Client>();
        client->fd = fd;
        Client& ref = *client;
        clients_.push_back(std::move(client));
        ref.thread = std::thread(&SessionServer::serve, this, std::ref(ref), connId);
    }
}

bool SessionServer::writeFrame(int fd, const std::string& frame) {
    std::string data = frame;
    data.push_back('\n');
    std::size_t sent = 0;
    while (sent < data.size()) {
        ssize_t n = ::send(fd, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            return false;
        }
        sent += static_cast<std::size_t>(n);
    }
    return true;
}

void SessionServer::serve(Client& client, const std::string& connId) {
    auto connected = handler_.onConnected(connId);
    if (connected.has_error()) {
        client.finished.store(true);
        return;
    }

    std::string buffer;
    std::size_t scanFrom = 0;  // bytes before this hold no newline
    bool discarding = false;
    char chunk[kReadChunk];

    while (true) {
        ssize_t n = ::recv(client.fd, chunk, sizeof(chunk), 0);
        if (n < 0 && errno == EINTR) {
            continue;
        }
        if (n <= 0) {
            break;
        }
        buffer.append(chunk, static_cast<std::size_t>(n));

        bool open = true;
        std::size_t newline;
        while (open && (newline = buffer.find('\n', scanFrom)) != std::string::npos) {
            std::string frame = buffer.substr(0, newline);
            buffer.erase(0, newline + 1);
            scanFrom = 0;
            if (discarding) {
                // Tail of an oversize frame that was already answered.
                discarding = false;
                continue;
            }
            if (!frame.empty() && frame.back() == '\r') {
                frame.pop_back();
            }
            if (frame.empty()) {
                continue;
            }
            std::string encoded;
            try {
                ServerToAgent reply = frame.size() > kMaxFrameSize ? SessionHandler::rejection("")
                                                                   : handler_.onFrame(connId, frame);
                encoded = MessageCodec::encodeServerToAgent(reply);
            } catch (const std::exception& e) {
                AGENTFLEET_LOG_ERROR("failed to handle frame on connection {}: {}", connId, e.what());
                encoded = MessageCodec::encodeServerToAgent(SessionHandler::rejection(""));
            }
            open = writeFrame(client.fd, encoded);
        }
        if (!open) {
            break;
        }
        scanFrom = buffer.size();

        if (buffer.size() > kMaxFrameSize) {
            if (!discarding) {
                AGENTFLEET_LOG_WARN("frame over {} bytes on connection {}, discarding", kMaxFrameSize, connId);
                if (!writeFrame(client.fd, MessageCodec::encodeServerToAgent(SessionHandler::rejection("")))) {
                    break;
                }
                discarding = true;
            }
            buffer.clear();
            scanFrom = 0;
        }
    }

    handler_.onConnectionClosed(connId);
    client.finished.store(true);
}

} // namespace core
} // namespace agentfleet
