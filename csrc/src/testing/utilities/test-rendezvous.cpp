// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//
// Tests for the TCP rendezvous that distributes the NCCL unique id

#include <catch2/catch_test_macros.hpp>

#include <chrono>
#include <future>
#include <thread>
#include <stdexcept>
#include <vector>

#include "utilities/rendezvous.h"

namespace {

std::vector<std::byte> make_payload(std::size_t size) {
    std::vector<std::byte> payload(size);
    for (std::size_t i = 0; i < size; ++i) {
        payload[i] = static_cast<std::byte>((i * 31 + 7) & 0xff);
    }
    return payload;
}

} // anonymous namespace

TEST_CASE("rendezvous delivers the payload to every client", "[rendezvous]") {
    RendezvousServer server(0);
    REQUIRE(server.port() > 0);

    const auto payload = make_payload(128);
    const int port = server.port();
    auto fetch = [port]() {
        return rendezvous_fetch("127.0.0.1", port, 128, std::chrono::milliseconds(10000));
    };
    auto first = std::async(std::launch::async, fetch);
    auto second = std::async(std::launch::async, fetch);
    auto third = std::async(std::launch::async, fetch);

    server.serve(payload, 3);

    CHECK(first.get() == payload);
    CHECK(second.get() == payload);
    CHECK(third.get() == payload);
}

TEST_CASE("rendezvous client retries until the server listens", "[rendezvous]") {
    int port = 0;
    {
        RendezvousServer probe(0);
        port = probe.port();
    }

    const auto payload = make_payload(16);
    auto client = std::async(std::launch::async, [port]() {
        return rendezvous_fetch("127.0.0.1", port, 16, std::chrono::milliseconds(10000));
    });

    std::this_thread::sleep_for(std::chrono::milliseconds(250));
    RendezvousServer server(port);
    server.serve(payload, 1);

    CHECK(client.get() == payload);
}

TEST_CASE("rendezvous client gives up after the timeout", "[rendezvous]") {
    int port = 0;
    {
        RendezvousServer probe(0);
        port = probe.port();
    }
    CHECK_THROWS_AS(rendezvous_fetch("127.0.0.1", port, 16, std::chrono::milliseconds(300)), std::runtime_error);
}

TEST_CASE("rendezvous client rejects a payload of unexpected size", "[rendezvous]") {
    RendezvousServer server(0);
    const int port = server.port();
    auto client = std::async(std::launch::async, [port]() {
        return rendezvous_fetch("127.0.0.1", port, 8, std::chrono::milliseconds(10000));
    });
    server.serve(make_payload(4), 1);
    CHECK_THROWS_AS(client.get(), std::runtime_error);
}
