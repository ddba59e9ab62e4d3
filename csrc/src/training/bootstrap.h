// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#ifndef LOCKSTEP_SRC_TRAINING_BOOTSTRAP_H
#define LOCKSTEP_SRC_TRAINING_BOOTSTRAP_H

#include <functional>
#include <optional>
#include <stdexcept>
#include <string>

#include "utilities/comm.h"

/// Startup precondition failure; training never begins after one of these.
class BootstrapError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

enum class ELauncher {
    Torch,      ///< torch.distributed.launch / torchrun: RANK, WORLD_SIZE, LOCAL_RANK
    OpenMPI     ///< mpirun: OMPI_COMM_WORLD_*
};

//! Everything a worker learns from its launcher.
struct LaunchEnvironment {
    WorkerIdentity Identity;
    int LocalRank = 0;
    std::string MasterAddr;
    int MasterPort = 0;
    //! Port rank 0 serves the NCCL id on; the launcher's own store may already hold MasterPort.
    int RendezvousPort = 0;
    ELauncher Launcher = ELauncher::Torch;
};

//! Environment lookup; returns nullptr for unset variables.
using EnvLookup = std::function<const char*(const char*)>;

//! EnvLookup backed by the process environment.
EnvLookup process_environment();

/**
 * @brief Read the launcher's coordination variables.
 *
 * The device index is `local_rank + from_rank`, where a non-negative
 * @p local_rank_override (the legacy `--local_rank` argument) takes precedence over the
 * launcher's local rank variable.
 *
 * The NCCL id is exchanged on `LOCKSTEP_RENDEZVOUS_PORT` if set, else on `MASTER_PORT + 1`.
 *
 * @return std::nullopt if no launcher variables are present at all (single-process launch).
 * @throws BootstrapError If the variables are incomplete or malformed.
 */
std::optional<LaunchEnvironment> read_launch_environment(const EnvLookup& env, int local_rank_override, int from_rank);

/**
 * @brief Bind the calling process (or thread) to @p device.
 *
 * @throws BootstrapError If no accelerator is available or @p device does not exist.
 */
void bind_device(int device);

//! Number of visible accelerators; throws BootstrapError if there are none.
int available_devices();

#endif //LOCKSTEP_SRC_TRAINING_BOOTSTRAP_H
