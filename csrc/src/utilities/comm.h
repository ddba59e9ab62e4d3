// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// Copyright (c) 2025, IST Austria, developed by Erik Schultheis
// SPDX-License-Identifier: Apache-2.0
//

#ifndef LOCKSTEP_SRC_UTILITIES_COMM_H
#define LOCKSTEP_SRC_UTILITIES_COMM_H

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <stdexcept>
#include <type_traits>
#include <vector>

struct LaunchEnvironment;

/**
 * @brief Identity of one worker in the process group.
 *
 * Assigned once by the bootstrap and passed by value to everything that needs to know
 * which worker it runs on. Trivially copyable so it can be exchanged between ranks.
 */
struct WorkerIdentity {
    int Rank = 0;
    int WorldSize = 1;
    int DeviceIndex = 0;
};

//! Collective operations that are tagged for lockstep verification.
enum class ECollective : int {
    Barrier = 0,
    ParameterBroadcast = 1,
    GradientSync = 2,
    MetricReduce = 3
};

const char* collective_name(ECollective op);

//! Position in the training program at which a collective is entered.
struct LockstepTag {
    int Epoch = 0;
    int Step = 0;
    ECollective Op = ECollective::Barrier;

    bool operator==(const LockstepTag&) const = default;
};

/// Thrown when the workers of a process group reach different collectives.
class LockstepError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief Collective channel between the workers of one training run.
 *
 * All operations work on host memory and are blocking; every rank must call the same
 * sequence of collectives in the same order. Implementations:
 *  - host communicator: one thread per rank, shared memory exchange (tests, simulation);
 *  - NCCL communicator: one device per rank, staged through device buffers.
 */
class Communicator {
public:
    Communicator(WorkerIdentity identity, bool check_lockstep);
    virtual ~Communicator() = default;

    Communicator(const Communicator&) = delete;
    Communicator& operator=(const Communicator&) = delete;

    // Cpu-side barrier across all ranks
    virtual void barrier() = 0;

    virtual void all_reduce_sum(std::int64_t* values, int n) = 0;
    virtual void all_reduce_sum(double* values, int n) = 0;

    //! All-reduce in-place using average (gradient averaging in data parallelism)
    virtual void all_reduce_avg(float* values, std::size_t n) = 0;

    //! Overwrite @p values on every rank with the contents on @p root.
    virtual void broadcast(float* values, std::size_t n, int root) = 0;

    /**
     * @brief Verify that all ranks are about to enter the same collective.
     *
     * No-op unless lockstep checking is enabled. Otherwise every rank exchanges @p tag
     * and all ranks throw LockstepError if any tag differs.
     */
    void check_lockstep(const LockstepTag& tag);

    [[nodiscard]] bool lockstep_checks() const { return mCheckLockstep; }
    [[nodiscard]] const WorkerIdentity& identity() const { return mIdentity; }
    [[nodiscard]] int rank() const { return mIdentity.Rank; }
    [[nodiscard]] int world_size() const { return mIdentity.WorldSize; }
    [[nodiscard]] int local_device() const { return mIdentity.DeviceIndex; }

    //! On the root rank, returns a vector of (memcpyable) T objects that
    //! have been gathered from all ranks.
    template<typename T>
    std::vector<T> host_gather(const T& object) {
        static_assert(std::is_trivially_copyable_v<T>, "Cannot communicate type with non-trivial copy operator");
        std::vector<T> result;
        if(rank() == 0) {
            result.resize(world_size());
        }

        gather_bytes_host(reinterpret_cast<std::byte*>(result.data()), reinterpret_cast<const std::byte*>(&object), sizeof(T));
        return result;
    }

    template<typename T>
    std::vector<T> host_all_gather(const T& object) {
        static_assert(std::is_trivially_copyable_v<T>, "Cannot communicate type with non-trivial copy operator");
        std::vector<T> result(world_size());
        all_gather_bytes_host(reinterpret_cast<std::byte*>(result.data()), reinterpret_cast<const std::byte*>(&object), sizeof(T));
        return result;
    }

    /**
     * @brief Run @p world ranks as threads of this process, exchanging data through host memory (blocking).
     *
     * Lockstep checking is always enabled. An exception thrown by any rank is rethrown
     * after all threads have finished.
     */
    static void run_host_communicators(int world, std::function<void(Communicator& comm)> work);

    /**
     * @brief Run distributed training with one thread per local GPU (blocking).
     *
     * @param ngpus Number of local GPUs to use (0 = auto-detect all available).
     * @param first_device Device index of rank 0; rank r uses device first_device + r.
     * @param check_lockstep Enable lockstep verification at tagged collectives.
     * @param work Callable invoked once per GPU with that GPU's communicator.
     */
    static void run_nccl_communicators(int ngpus, int first_device, bool check_lockstep,
                                       std::function<void(Communicator& comm)> work);

    /**
     * @brief Join a multi-process group described by launcher environment variables.
     *
     * Rank 0 creates the NCCL unique id and serves it to the other ranks over TCP at the
     * master address. The calling process must already be bound to its device.
     */
    static std::unique_ptr<Communicator> make_process_group(const LaunchEnvironment& env, bool check_lockstep);

protected:
    virtual void gather_bytes_host(std::byte* recv, const std::byte* object, std::size_t size) = 0;
    virtual void all_gather_bytes_host(std::byte* recv, const std::byte* object, std::size_t size) = 0;

private:
    WorkerIdentity mIdentity;
    bool mCheckLockstep;
};

/**
 * @brief Run @p work once per rank on its own thread and wait for all of them.
 *
 * Exceptions are captured per rank and the first one (by rank) is rethrown once every
 * thread has been joined.
 */
void run_worker_threads(int world, const std::function<void(int rank)>& work);

#endif //LOCKSTEP_SRC_UTILITIES_COMM_H
