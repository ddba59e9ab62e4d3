// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#include "rendezvous.h"

#include <cerrno>
#include <cstdint>
#include <cstring>
#include <stdexcept>
#include <thread>

#include <arpa/inet.h>
#include <netdb.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <fmt/core.h>

namespace {

constexpr std::uint64_t kRendezvousMagic = 0x6c6f636b73746570ull;   // "lockstep"

[[noreturn]] void throw_socket_error(const char* what) {
    throw std::runtime_error(fmt::format("rendezvous: {} failed: {}", what, std::strerror(errno)));
}

void send_all(int fd, const void* data, std::size_t size) {
    const auto* ptr = static_cast<const char*>(data);
    while (size > 0) {
        ssize_t sent = ::send(fd, ptr, size, MSG_NOSIGNAL);
        if (sent < 0) {
            if (errno == EINTR) continue;
            throw_socket_error("send");
        }
        ptr += sent;
        size -= static_cast<std::size_t>(sent);
    }
}

void recv_all(int fd, void* data, std::size_t size) {
    auto* ptr = static_cast<char*>(data);
    while (size > 0) {
        ssize_t received = ::recv(fd, ptr, size, 0);
        if (received < 0) {
            if (errno == EINTR) continue;
            throw_socket_error("recv");
        }
        if (received == 0) {
            throw std::runtime_error("rendezvous: connection closed before the payload was complete");
        }
        ptr += received;
        size -= static_cast<std::size_t>(received);
    }
}

class ScopedSocket {
public:
    explicit ScopedSocket(int fd) : mFd(fd) {}
    ~ScopedSocket() { if (mFd >= 0) ::close(mFd); }
    ScopedSocket(const ScopedSocket&) = delete;
    ScopedSocket& operator=(const ScopedSocket&) = delete;
    [[nodiscard]] int get() const { return mFd; }
private:
    int mFd;
};

//! Single connection attempt; returns -1 if the peer is not (yet) accepting connections.
int try_connect(const std::string& address, int port) {
    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    addrinfo* result = nullptr;
    std::string service = std::to_string(port);
    if (int rc = ::getaddrinfo(address.c_str(), service.c_str(), &hints, &result); rc != 0) {
        throw std::runtime_error(fmt::format("rendezvous: cannot resolve {}:{}: {}", address, port, gai_strerror(rc)));
    }

    int connected = -1;
    for (addrinfo* ai = result; ai != nullptr && connected < 0; ai = ai->ai_next) {
        int fd = ::socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
        if (fd < 0) continue;
        if (::connect(fd, ai->ai_addr, ai->ai_addrlen) == 0) {
            connected = fd;
        } else {
            ::close(fd);
        }
    }
    ::freeaddrinfo(result);
    return connected;
}

} // namespace

RendezvousServer::RendezvousServer(int port) {
    mSocket = ::socket(AF_INET, SOCK_STREAM, 0);
    if (mSocket < 0) {
        throw_socket_error("socket");
    }
    int reuse = 1;
    if (::setsockopt(mSocket, SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse)) != 0) {
        ::close(mSocket);
        throw_socket_error("setsockopt");
    }

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_ANY);
    addr.sin_port = htons(static_cast<std::uint16_t>(port));
    if (::bind(mSocket, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) != 0) {
        ::close(mSocket);
        throw std::runtime_error(fmt::format("rendezvous: cannot bind port {}: {}", port, std::strerror(errno)));
    }
    if (::listen(mSocket, SOMAXCONN) != 0) {
        ::close(mSocket);
        throw_socket_error("listen");
    }

    socklen_t len = sizeof(addr);
    if (::getsockname(mSocket, reinterpret_cast<sockaddr*>(&addr), &len) != 0) {
        ::close(mSocket);
        throw_socket_error("getsockname");
    }
    mPort = ntohs(addr.sin_port);
}

RendezvousServer::~RendezvousServer() {
    if (mSocket >= 0) {
        ::close(mSocket);
    }
}

void RendezvousServer::serve(const std::vector<std::byte>& payload, int clients) {
    const auto size = static_cast<std::uint32_t>(payload.size());
    for (int served = 0; served < clients; ++served) {
        int fd = ::accept(mSocket, nullptr, nullptr);
        if (fd < 0) {
            if (errno == EINTR) {
                --served;
                continue;
            }
            throw_socket_error("accept");
        }
        ScopedSocket client(fd);
        send_all(client.get(), &kRendezvousMagic, sizeof(kRendezvousMagic));
        send_all(client.get(), &size, sizeof(size));
        send_all(client.get(), payload.data(), payload.size());
    }
}

std::vector<std::byte> rendezvous_fetch(const std::string& address, int port, std::size_t size,
                                        std::chrono::milliseconds timeout) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    int fd = try_connect(address, port);
    while (fd < 0) {
        if (std::chrono::steady_clock::now() >= deadline) {
            throw std::runtime_error(fmt::format("rendezvous: could not reach {}:{} within {} ms",
                                                 address, port, timeout.count()));
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        fd = try_connect(address, port);
    }
    ScopedSocket server(fd);

    std::uint64_t magic = 0;
    std::uint32_t announced = 0;
    recv_all(server.get(), &magic, sizeof(magic));
    if (magic != kRendezvousMagic) {
        throw std::runtime_error(fmt::format("rendezvous: {}:{} is not a rendezvous server", address, port));
    }
    recv_all(server.get(), &announced, sizeof(announced));
    if (announced != size) {
        throw std::runtime_error(fmt::format("rendezvous: expected {} bytes, server announced {}", size, announced));
    }

    std::vector<std::byte> payload(size);
    recv_all(server.get(), payload.data(), payload.size());
    return payload;
}
