// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#ifndef LOCKSTEP_SRC_UTILITIES_RENDEZVOUS_H
#define LOCKSTEP_SRC_UTILITIES_RENDEZVOUS_H

#include <chrono>
#include <cstddef>
#include <string>
#include <vector>

/**
 * @brief TCP listener on the master rank that hands out one blob to every other rank.
 *
 * Used to distribute the NCCL unique id before the communicator exists. The wire format
 * is a fixed magic number, a 32-bit payload size, and the payload bytes.
 */
class RendezvousServer {
public:
    //! Bind and listen on all interfaces. Port 0 picks an ephemeral port.
    explicit RendezvousServer(int port);
    ~RendezvousServer();

    RendezvousServer(const RendezvousServer&) = delete;
    RendezvousServer& operator=(const RendezvousServer&) = delete;

    [[nodiscard]] int port() const { return mPort; }

    //! Accept exactly @p clients connections and send @p payload to each of them.
    void serve(const std::vector<std::byte>& payload, int clients);

private:
    int mSocket = -1;
    int mPort = 0;
};

/**
 * @brief Connect to the rendezvous server and receive its payload.
 *
 * Connection attempts are retried until @p timeout expires, since the master rank may
 * still be starting up.
 *
 * @throws std::runtime_error On timeout, malformed reply, or a payload size other than @p size.
 */
std::vector<std::byte> rendezvous_fetch(const std::string& address, int port, std::size_t size,
                                        std::chrono::milliseconds timeout);

#endif //LOCKSTEP_SRC_UTILITIES_RENDEZVOUS_H
