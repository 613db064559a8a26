// =============================================================================
// FakeAdbServer - loopback stand-in for the ADB server used by client tests
// =============================================================================
// Listens on 127.0.0.1 and runs `handler` on its own thread for every
// accepted connection. Requests read through Conn::readRequest() are
// recorded so tests can assert on the exact wire traffic.
// =============================================================================
#pragma once

#include <sys/socket.h>
#include <netinet/in.h>
#include <arpa/inet.h>
#include <unistd.h>
#include <atomic>
#include <cerrno>
#include <cstdint>
#include <cstring>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>
#include "adb_protocol.hpp"

namespace snapadb {
namespace test_support {

class FakeAdbServer {
public:
    class Conn {
    public:
        Conn(int fd, FakeAdbServer* server) : fd_(fd), server_(server) {}

        // One framed request; nullopt when the client hangs up.
        std::optional<std::string> readRequest() {
            std::string header;
            if (!readExact(4, header)) return std::nullopt;
            auto len = protocol::parseHexLength(header);
            if (!len) return std::nullopt;
            std::string body;
            if (!readExact(*len, body)) return std::nullopt;
            server_->record(body);
            return body;
        }

        // "host:transport:<serial>" answered with OKAY, then the service
        // request that follows it.
        std::optional<std::string> acceptTransport() {
            auto transport = readRequest();
            if (!transport || transport->compare(0, 15, "host:transport:") != 0) return std::nullopt;
            writeOkay();
            return readRequest();
        }

        // Sync header sent by the client: id, path.
        bool readSyncRequest(std::string& id, std::string& path) {
            std::string header;
            if (!readExact(8, header)) return false;
            id = header.substr(0, 4);
            uint32_t len = protocol::readLE32(reinterpret_cast<const uint8_t*>(header.data() + 4));
            if (!readExact(len, path)) return false;
            std::string nul;
            return readExact(1, nul) && nul[0] == '\0';
        }

        bool readExact(size_t n, std::string& out) {
            out.assign(n, '\0');
            size_t got = 0;
            while (got < n) {
                ssize_t r = ::recv(fd_, &out[got], n - got, 0);
                if (r <= 0) return false;
                got += static_cast<size_t>(r);
            }
            return true;
        }

        void write(const std::string& bytes) {
            size_t off = 0;
            while (off < bytes.size()) {
                ssize_t n = ::send(fd_, bytes.data() + off, bytes.size() - off, MSG_NOSIGNAL);
                if (n <= 0) return;
                off += static_cast<size_t>(n);
            }
        }

        void writeOkay() { write("OKAY"); }
        void writeFail(const std::string& message) {
            write("FAIL" + protocol::formatHexLength(message.size()) + message);
        }
        void writeSync(const char* id, const std::string& payload) {
            uint8_t len[4];
            protocol::writeLE32(static_cast<uint32_t>(payload.size()), len);
            write(std::string(id, 4) + std::string(reinterpret_cast<const char*>(len), 4) + payload);
        }

        // Ends the stream the way adbd does when a shell command exits.
        void finish() { ::shutdown(fd_, SHUT_WR); }

    private:
        int fd_;
        FakeAdbServer* server_;
    };

    using Handler = std::function<void(Conn&)>;

    explicit FakeAdbServer(Handler handler) : handler_(std::move(handler)) {}
    ~FakeAdbServer() { stop(); }

    FakeAdbServer(const FakeAdbServer&) = delete;
    FakeAdbServer& operator=(const FakeAdbServer&) = delete;

    // port 0 picks an ephemeral port.
    bool start(uint16_t port = 0) {
        listen_fd_ = ::socket(AF_INET, SOCK_STREAM, 0);
        if (listen_fd_ < 0) return false;
        int one = 1;
        setsockopt(listen_fd_, SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one));

        struct sockaddr_in addr;
        std::memset(&addr, 0, sizeof(addr));
        addr.sin_family = AF_INET;
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        addr.sin_port = htons(port);
        if (::bind(listen_fd_, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) != 0 ||
            ::listen(listen_fd_, 16) != 0) {
            ::close(listen_fd_);
            listen_fd_ = -1;
            return false;
        }
        socklen_t len = sizeof(addr);
        ::getsockname(listen_fd_, reinterpret_cast<struct sockaddr*>(&addr), &len);
        port_ = ntohs(addr.sin_port);

        running_ = true;
        accept_thread_ = std::thread([this]() { acceptLoop(); });
        return true;
    }

    void stop() {
        if (!running_.exchange(false)) return;
        ::shutdown(listen_fd_, SHUT_RDWR);
        ::close(listen_fd_);
        if (accept_thread_.joinable()) accept_thread_.join();

        std::vector<std::thread> workers;
        std::vector<int> fds;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            for (int fd : client_fds_) ::shutdown(fd, SHUT_RDWR);
            workers.swap(workers_);
            fds.swap(client_fds_);
        }
        for (auto& t : workers) t.join();
        for (int fd : fds) ::close(fd);
    }

    uint16_t port() const { return port_; }
    int connectionCount() const { return connections_.load(); }

    std::vector<std::string> requests() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return requests_;
    }

    bool sawRequest(const std::string& prefix) const {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& r : requests_) {
            if (r.compare(0, prefix.size(), prefix) == 0) return true;
        }
        return false;
    }

    void record(const std::string& request) {
        std::lock_guard<std::mutex> lock(mutex_);
        requests_.push_back(request);
    }

    // Binds and releases an ephemeral loopback port nobody listens on.
    static uint16_t unusedPort() {
        int fd = ::socket(AF_INET, SOCK_STREAM, 0);
        struct sockaddr_in addr;
        std::memset(&addr, 0, sizeof(addr));
        addr.sin_family = AF_INET;
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        addr.sin_port = 0;
        ::bind(fd, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr));
        socklen_t len = sizeof(addr);
        ::getsockname(fd, reinterpret_cast<struct sockaddr*>(&addr), &len);
        ::close(fd);
        return ntohs(addr.sin_port);
    }

private:
    void acceptLoop() {
        while (running_) {
            int fd = ::accept(listen_fd_, nullptr, nullptr);
            if (fd < 0) {
                if (!running_) return;
                if (errno == EINTR) continue;
                return;
            }
            connections_++;
            std::lock_guard<std::mutex> lock(mutex_);
            client_fds_.push_back(fd);
            workers_.emplace_back([this, fd]() {
                Conn conn(fd, this);
                handler_(conn);
                ::shutdown(fd, SHUT_RDWR);
            });
        }
    }

    Handler handler_;
    int listen_fd_ = -1;
    uint16_t port_ = 0;
    std::atomic<bool> running_{false};
    std::atomic<int> connections_{0};
    std::thread accept_thread_;

    mutable std::mutex mutex_;
    std::vector<std::string> requests_;
    std::vector<int> client_fds_;
    std::vector<std::thread> workers_;
};

} // namespace test_support
} // namespace snapadb
