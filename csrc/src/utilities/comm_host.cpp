// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// Copyright (c) 2025, IST Austria, developed by Erik Schultheis
// SPDX-License-Identifier: Apache-2.0
//

#include "comm.h"

#include <algorithm>
#include <atomic>
#include <barrier>
#include <exception>
#include <cstring>
#include <memory>
#include <utility>

#include <fmt/core.h>

/**
 * @brief Thread-based communicator that exchanges data through host memory.
 *
 * Every rank is a thread of the current process. Ranks publish a pointer to their
 * buffer, synchronize on a shared std::barrier, read each other's buffers, and
 * synchronize again before the buffers may be reused. Reductions visit ranks in
 * order, so all ranks obtain bit-identical results.
 */
class HostCommunicator : public Communicator {
public:
    struct SharedState {
        explicit SharedState(int world) : Barrier(world), Buffer(world, nullptr) {}

        std::barrier<> Barrier;
        std::vector<const std::byte*> Buffer;     // one pointer per thread
        std::atomic<bool> Aborted{false};         // set by a rank that left through an exception
    };

    HostCommunicator(int rank, int world, std::shared_ptr<SharedState> state);

    /**
     * @brief Drops out of the shared barrier on destruction.
     *
     * A rank that leaves early (e.g. because of an exception) must not keep the remaining
     * ranks waiting for it; their next barrier fails instead.
     */
    ~HostCommunicator() override;

    void barrier() override;
    void all_reduce_sum(std::int64_t* values, int n) override;
    void all_reduce_sum(double* values, int n) override;
    void all_reduce_avg(float* values, std::size_t n) override;
    void broadcast(float* values, std::size_t n, int root) override;

protected:
    void gather_bytes_host(std::byte* recv, const std::byte* object, std::size_t size) override;
    void all_gather_bytes_host(std::byte* recv, const std::byte* object, std::size_t size) override;

private:
    template<typename T>
    void reduce_sum(T* values, std::size_t n, std::vector<T>& result);

    std::shared_ptr<SharedState> mShare;
};

HostCommunicator::HostCommunicator(int rank, int world, std::shared_ptr<SharedState> state) :
    Communicator(WorkerIdentity{.Rank = rank, .WorldSize = world, .DeviceIndex = -1}, true),
    mShare(std::move(state))
{
}

HostCommunicator::~HostCommunicator() {
    if (mShare) {
        if (std::uncaught_exceptions() > 0) {
            mShare->Aborted = true;
        }
        mShare->Barrier.arrive_and_drop();
    }
}

void HostCommunicator::barrier() {
    mShare->Barrier.arrive_and_wait();
    if (mShare->Aborted) {
        throw std::runtime_error(fmt::format("rank {}: another rank left the process group", rank()));
    }
}

template<typename T>
void HostCommunicator::reduce_sum(T* values, std::size_t n, std::vector<T>& result) {
    result.assign(n, T{});
    mShare->Buffer[rank()] = reinterpret_cast<const std::byte*>(values);
    barrier();
    for (int r = 0; r < world_size(); ++r) {
        const T* src = reinterpret_cast<const T*>(mShare->Buffer[r]);
        for (std::size_t i = 0; i < n; ++i) {
            result[i] += src[i];
        }
    }
    // nobody may overwrite its input before all ranks have read it
    barrier();
}

void HostCommunicator::all_reduce_sum(std::int64_t* values, int n) {
    std::vector<std::int64_t> result;
    reduce_sum(values, static_cast<std::size_t>(n), result);
    std::copy(result.begin(), result.end(), values);
}

void HostCommunicator::all_reduce_sum(double* values, int n) {
    std::vector<double> result;
    reduce_sum(values, static_cast<std::size_t>(n), result);
    std::copy(result.begin(), result.end(), values);
}

void HostCommunicator::all_reduce_avg(float* values, std::size_t n) {
    std::vector<float> result;
    reduce_sum(values, n, result);
    const float scale = 1.f / static_cast<float>(world_size());
    std::transform(result.begin(), result.end(), values, [scale](float v) { return v * scale; });
}

void HostCommunicator::broadcast(float* values, std::size_t n, int root) {
    if (root < 0 || root >= world_size()) {
        throw std::invalid_argument(fmt::format("broadcast: invalid root {}", root));
    }
    mShare->Buffer[rank()] = reinterpret_cast<const std::byte*>(values);
    barrier();
    if (rank() != root) {
        std::memcpy(values, mShare->Buffer[root], n * sizeof(float));
    }
    barrier();
}

void HostCommunicator::gather_bytes_host(std::byte* recv, const std::byte* object, std::size_t size) {
    mShare->Buffer[rank()] = object;
    barrier();
    if (rank() == 0) {
        for (int r = 0; r < world_size(); ++r) {
            std::memcpy(recv + r * size, mShare->Buffer[r], size);
        }
    }
    barrier();
}

void HostCommunicator::all_gather_bytes_host(std::byte* recv, const std::byte* object, std::size_t size) {
    mShare->Buffer[rank()] = object;
    barrier();
    for (int r = 0; r < world_size(); ++r) {
        std::memcpy(recv + r * size, mShare->Buffer[r], size);
    }
    barrier();
}

void Communicator::run_host_communicators(int world, std::function<void(Communicator& comm)> work) {
    if (world <= 0) {
        throw std::invalid_argument(fmt::format("run_host_communicators: world size must be positive, got {}", world));
    }
    auto shared_state = std::make_shared<HostCommunicator::SharedState>(world);
    run_worker_threads(world, [&](int rank) {
        HostCommunicator comm(rank, world, shared_state);
        work(comm);
    });
}
