// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// Copyright (c) 2025, IST Austria, developed by Erik Schultheis
// SPDX-License-Identifier: Apache-2.0
//

#include "comm.h"

#include <algorithm>
#include <cstdio>
#include <exception>
#include <mutex>
#include <string>
#include <thread>
#include <utility>

#include <fmt/core.h>

const char* collective_name(ECollective op) {
    switch (op) {
        case ECollective::Barrier: return "barrier";
        case ECollective::ParameterBroadcast: return "parameter-broadcast";
        case ECollective::GradientSync: return "gradient-sync";
        case ECollective::MetricReduce: return "metric-reduce";
    }
    return "unknown";
}

Communicator::Communicator(WorkerIdentity identity, bool check_lockstep) :
    mIdentity(identity), mCheckLockstep(check_lockstep)
{
    if (mIdentity.WorldSize <= 0) {
        throw std::invalid_argument(fmt::format("Communicator: world size must be positive, got {}", mIdentity.WorldSize));
    }
    if (mIdentity.Rank < 0 || mIdentity.Rank >= mIdentity.WorldSize) {
        throw std::invalid_argument(fmt::format("Communicator: rank {} outside of [0, {})", mIdentity.Rank, mIdentity.WorldSize));
    }
}

/**
 * @brief Exchange @p tag between all ranks and compare.
 *
 * Every rank sees the same gathered tags, so either all ranks return normally or all
 * ranks throw; a mismatch never leaves part of the group blocked in the next collective.
 *
 * @param tag Position of the caller in the training program.
 *
 * @throws LockstepError If any rank reports a different tag than rank 0.
 */
void Communicator::check_lockstep(const LockstepTag& tag) {
    if (!mCheckLockstep) return;

    auto tags = host_all_gather(tag);
    auto mismatch = std::find_if(tags.begin(), tags.end(), [&](const LockstepTag& other) { return !(other == tags.front()); });
    if (mismatch == tags.end()) {
        return;
    }

    std::string detail;
    for (std::size_t r = 0; r < tags.size(); ++r) {
        detail += fmt::format("\n  rank {}: epoch {} step {} {}", r, tags[r].Epoch, tags[r].Step, collective_name(tags[r].Op));
    }
    throw LockstepError(fmt::format("Workers diverged at a collective (seen from rank {}):{}", rank(), detail));
}

void run_worker_threads(int world, const std::function<void(int rank)>& work) {
    std::vector<std::exception_ptr> exceptions(world);
    std::mutex mutex;

    {
        std::vector<std::jthread> threads;
        threads.reserve(world);
        for (int rank = 0; rank < world; ++rank) {
            threads.emplace_back([rank, &work, &exceptions, &mutex]() {
                try {
                    work(rank);
                } catch (...) {
                    std::lock_guard<std::mutex> lock(mutex);
                    exceptions[rank] = std::current_exception();
                }
            });
        }
    }

    for (int rank = 0; rank < world; ++rank) {
        if (auto error = exceptions[rank]; error) {
            fprintf(stderr, "Thread %d exited with uncaught exception\n", rank);
            fflush(stderr);
            std::rethrow_exception(error);
        }
    }
}
