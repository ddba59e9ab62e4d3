// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#include "bootstrap.h"

#include <charconv>
#include <cstdlib>
#include <string_view>
#include <system_error>

#include <fmt/core.h>

namespace {

int parse_int(const char* name, const char* value) {
    std::string_view text(value);
    int result = 0;
    auto [end, ec] = std::from_chars(text.data(), text.data() + text.size(), result);
    if (ec != std::errc{} || end != text.data() + text.size() || text.empty()) {
        throw BootstrapError(fmt::format("Environment variable {}='{}' is not an integer", name, text));
    }
    return result;
}

int require_int(const EnvLookup& env, const char* name) {
    const char* value = env(name);
    if (!value) {
        throw BootstrapError(fmt::format("Environment variable {} is not set", name));
    }
    return parse_int(name, value);
}

int require_port(const char* name, int port) {
    if (port < 1 || port > 65535) {
        throw BootstrapError(fmt::format("{}={} is not a valid port", name, port));
    }
    return port;
}

} // namespace

EnvLookup process_environment() {
    return [](const char* name) -> const char* { return std::getenv(name); };
}

std::optional<LaunchEnvironment> read_launch_environment(const EnvLookup& env, int local_rank_override, int from_rank) {
    LaunchEnvironment result;
    const char* rank_var = nullptr;
    const char* world_var = nullptr;
    const char* local_var = nullptr;

    if (env("WORLD_SIZE") || env("RANK")) {
        result.Launcher = ELauncher::Torch;
        rank_var = "RANK";
        world_var = "WORLD_SIZE";
        local_var = "LOCAL_RANK";
    } else if (env("OMPI_COMM_WORLD_SIZE") || env("OMPI_COMM_WORLD_RANK")) {
        result.Launcher = ELauncher::OpenMPI;
        rank_var = "OMPI_COMM_WORLD_RANK";
        world_var = "OMPI_COMM_WORLD_SIZE";
        local_var = "OMPI_COMM_WORLD_LOCAL_RANK";
    } else {
        return std::nullopt;
    }

    int world = require_int(env, world_var);
    int rank = require_int(env, rank_var);
    if (world <= 0) {
        throw BootstrapError(fmt::format("{} must be positive, got {}", world_var, world));
    }
    if (rank < 0 || rank >= world) {
        throw BootstrapError(fmt::format("{}={} is outside of [0, {})", rank_var, rank, world));
    }

    int local_rank = local_rank_override;
    if (local_rank < 0) {
        local_rank = require_int(env, local_var);
    }
    if (local_rank < 0) {
        throw BootstrapError(fmt::format("Local rank must not be negative, got {}", local_rank));
    }
    if (from_rank < 0) {
        throw BootstrapError(fmt::format("Device offset must not be negative, got {}", from_rank));
    }

    const char* addr = env("MASTER_ADDR");
    if (!addr || *addr == '\0') {
        throw BootstrapError("Environment variable MASTER_ADDR is not set");
    }
    const int port = require_port("MASTER_PORT", require_int(env, "MASTER_PORT"));
    int rendezvous_port = 0;
    if (const char* value = env("LOCKSTEP_RENDEZVOUS_PORT")) {
        rendezvous_port = require_port("LOCKSTEP_RENDEZVOUS_PORT", parse_int("LOCKSTEP_RENDEZVOUS_PORT", value));
    } else {
        // torchrun's agent store listens on MASTER_PORT itself
        rendezvous_port = require_port("MASTER_PORT + 1", port + 1);
    }

    result.Identity = WorkerIdentity{.Rank = rank, .WorldSize = world, .DeviceIndex = local_rank + from_rank};
    result.LocalRank = local_rank;
    result.MasterAddr = addr;
    result.MasterPort = port;
    result.RendezvousPort = rendezvous_port;
    return result;
}
