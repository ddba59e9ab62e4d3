// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// Copyright (c) 2025, IST Austria, developed by Erik Schultheis
// SPDX-License-Identifier: Apache-2.0
//

#include "comm.h"

#include <chrono>
#include <cstdio>
#include <cstring>
#include <exception>
#include <future>
#include <stdexcept>
#include <utility>

#include <cuda_runtime.h>
#include <nccl.h>
#include <fmt/core.h>

#include "cuda_check.h"
#include "rendezvous.h"
#include "training/bootstrap.h"

/**
 * @brief Throws a std::runtime_error if an NCCL call returned an error.
 *
 * @param status NCCL status code returned by an NCCL API call.
 * @param file Source file where the failing call was made.
 * @param line Source line where the failing call was made.
 *
 * @throws std::runtime_error Always thrown when @p status != ncclSuccess.
 */
void nccl_check(ncclResult_t status, const char* file, int line) {
    if (status != ncclSuccess) {
        throw std::runtime_error(fmt::format("NCCL error at {}:{}: {}", file, line, ncclGetErrorString(status)));
    }
}
#define ncclCheck(err) (nccl_check(err, __FILE__, __LINE__))

namespace {
constexpr auto kRendezvousTimeout = std::chrono::minutes(5);
}

/**
 * @brief NCCL-backed communicator; one instance per device.
 *
 * The public API takes host buffers, so every collective copies its input into a device
 * staging buffer, runs on the dedicated comms stream, copies back, and synchronizes.
 */
class NCCLCommunicator : public Communicator {
public:
    /**
     * @brief Sets the CUDA device, initializes the NCCL communicator from @p nccl_id,
     * and creates the comms stream on that device.
     *
     * @throws std::runtime_error If NCCL initialization fails.
     */
    NCCLCommunicator(WorkerIdentity identity, bool check_lockstep, const ncclUniqueId& nccl_id);
    ~NCCLCommunicator() override;

    void barrier() override;
    void all_reduce_sum(std::int64_t* values, int n) override;
    void all_reduce_sum(double* values, int n) override;
    void all_reduce_avg(float* values, std::size_t n) override;
    void broadcast(float* values, std::size_t n, int root) override;

protected:
    void gather_bytes_host(std::byte* recv, const std::byte* object, std::size_t size) override;
    void all_gather_bytes_host(std::byte* recv, const std::byte* object, std::size_t size) override;

private:
    void terminate_nccl(bool unwinding);
    std::byte* staging(std::size_t bytes);
    void all_reduce_host(void* values, std::size_t count, std::size_t elem_size, ncclDataType_t dtype, ncclRedOp_t op);

    ncclComm_t mNcclComm = nullptr;
    cudaStream_t mCommsStream = nullptr;
    std::byte* mStaging = nullptr;
    std::size_t mStagingBytes = 0;
};

NCCLCommunicator::NCCLCommunicator(WorkerIdentity identity, bool check_lockstep, const ncclUniqueId& nccl_id) :
    Communicator(identity, check_lockstep)
{
    CUDA_CHECK(cudaSetDevice(local_device()));
    ncclCheck(ncclCommInitRank(&mNcclComm, world_size(), nccl_id, rank()));

    // must be created _after_ we set the device
    mCommsStream = create_named_stream("nccl_stream");
}

/**
 * @brief Destructor that attempts to terminate NCCL without hanging the calling thread.
 *
 * NCCL finalization can hang if a peer is gone; teardown runs in a helper thread with a
 * timeout and the future is leaked on timeout. CUDA resources are released best-effort.
 */
NCCLCommunicator::~NCCLCommunicator() {
    // the helper thread has no exception in flight, so decide here
    const bool unwinding = std::uncaught_exceptions() > 0;
    auto terminate_future = std::async(std::launch::async, [this, unwinding]() {
        this->terminate_nccl(unwinding);
    });

    if (terminate_future.wait_for(std::chrono::seconds(2)) == std::future_status::timeout) {
        fprintf(stderr, "NCCL termination timed out, detaching\n");
        // this *will* leak resources, but at least we're not hanging forever
        new auto(std::move(terminate_future));
    } else {
        try {
            terminate_future.get();
        } catch (const std::exception& e) {
            fprintf(stderr, "WARNING: NCCL teardown failed: %s\n", e.what());
            fflush(stderr);
        }
    }

    if (mStaging) {
        const cudaError_t st = cudaFree(mStaging);
        if (st != cudaSuccess) {
            fprintf(stderr, "WARNING: cudaFree(nccl staging) failed: %s\n", cudaGetErrorString(st));
            (void)cudaGetLastError();
        }
    }
    if (mCommsStream) {
        const cudaError_t st = cudaStreamDestroy(mCommsStream);
        if (st != cudaSuccess) {
            fprintf(stderr, "WARNING: cudaStreamDestroy(nccl_stream) failed: %s\n", cudaGetErrorString(st));
            fflush(stderr);
            (void)cudaGetLastError();
        }
    }
}

/**
 * @brief Finalize and destroy the communicator, or abort it if an error is pending.
 */
void NCCLCommunicator::terminate_nccl(bool unwinding) {
    ncclResult_t result;
    ncclCheck(ncclCommGetAsyncError(mNcclComm, &result));
    // do "nice" shutdown if we're in a good state,
    // just abort if there is something weird going on.
    if (!unwinding && result == ncclSuccess) {
        CUDA_CHECK(cudaStreamSynchronize(mCommsStream));
        ncclCheck(ncclCommFinalize(mNcclComm));
        ncclCheck(ncclCommDestroy(mNcclComm));
    } else {
        ncclCheck(ncclCommAbort(mNcclComm));
    }
}

std::byte* NCCLCommunicator::staging(std::size_t bytes) {
    if (bytes > mStagingBytes) {
        if (mStaging) {
            CUDA_CHECK(cudaFree(mStaging));
            mStaging = nullptr;
            mStagingBytes = 0;
        }
        CUDA_CHECK(cudaMalloc(&mStaging, bytes));
        mStagingBytes = bytes;
    }
    return mStaging;
}

void NCCLCommunicator::all_reduce_host(void* values, std::size_t count, std::size_t elem_size, ncclDataType_t dtype, ncclRedOp_t op) {
    if (count == 0) return;
    const std::size_t bytes = count * elem_size;
    std::byte* buffer = staging(bytes);
    CUDA_CHECK(cudaMemcpyAsync(buffer, values, bytes, cudaMemcpyHostToDevice, mCommsStream));
    ncclCheck(ncclAllReduce(buffer, buffer, count, dtype, op, mNcclComm, mCommsStream));
    CUDA_CHECK(cudaMemcpyAsync(values, buffer, bytes, cudaMemcpyDeviceToHost, mCommsStream));
    CUDA_CHECK(cudaStreamSynchronize(mCommsStream));
}

void NCCLCommunicator::barrier() {
    // NCCL has no barrier; all-reduce a single value instead
    std::int64_t token = 0;
    all_reduce_host(&token, 1, sizeof(token), ncclInt64, ncclSum);
}

void NCCLCommunicator::all_reduce_sum(std::int64_t* values, int n) {
    all_reduce_host(values, static_cast<std::size_t>(n), sizeof(std::int64_t), ncclInt64, ncclSum);
}

void NCCLCommunicator::all_reduce_sum(double* values, int n) {
    all_reduce_host(values, static_cast<std::size_t>(n), sizeof(double), ncclFloat64, ncclSum);
}

void NCCLCommunicator::all_reduce_avg(float* values, std::size_t n) {
    if (world_size() == 1) return;
    all_reduce_host(values, n, sizeof(float), ncclFloat, ncclAvg);
}

void NCCLCommunicator::broadcast(float* values, std::size_t n, int root) {
    if (n == 0) return;
    const std::size_t bytes = n * sizeof(float);
    std::byte* buffer = staging(bytes);
    CUDA_CHECK(cudaMemcpyAsync(buffer, values, bytes, cudaMemcpyHostToDevice, mCommsStream));
    ncclCheck(ncclBroadcast(buffer, buffer, n, ncclFloat, root, mNcclComm, mCommsStream));
    CUDA_CHECK(cudaMemcpyAsync(values, buffer, bytes, cudaMemcpyDeviceToHost, mCommsStream));
    CUDA_CHECK(cudaStreamSynchronize(mCommsStream));
}

void NCCLCommunicator::all_gather_bytes_host(std::byte* recv, const std::byte* object, std::size_t size) {
    const std::size_t total = size * world_size();
    std::byte* buffer = staging(total);
    std::byte* send = buffer + rank() * size;
    CUDA_CHECK(cudaMemcpyAsync(send, object, size, cudaMemcpyHostToDevice, mCommsStream));
    ncclCheck(ncclAllGather(send, buffer, size, ncclChar, mNcclComm, mCommsStream));
    CUDA_CHECK(cudaMemcpyAsync(recv, buffer, total, cudaMemcpyDeviceToHost, mCommsStream));
    CUDA_CHECK(cudaStreamSynchronize(mCommsStream));
}

void NCCLCommunicator::gather_bytes_host(std::byte* recv, const std::byte* object, std::size_t size) {
    // no native gather, so gather = allgather + discard on non-root
    std::vector<std::byte> all(size * world_size());
    all_gather_bytes_host(all.data(), object, size);
    if (rank() == 0) {
        std::memcpy(recv, all.data(), all.size());
    }
}

// ============================================================================
// Main Entry Points
// ============================================================================

void Communicator::run_nccl_communicators(int ngpus, int first_device, bool check_lockstep,
                                          std::function<void(Communicator& comm)> work) {
    int gpus_available = available_devices();
    if (ngpus == 0) {
        ngpus = gpus_available - first_device;
    }
    if (ngpus <= 0 || first_device < 0 || first_device + ngpus > gpus_available) {
        throw BootstrapError(fmt::format("Requested {} GPUs starting at device {}, but only {} available",
                                         ngpus, first_device, gpus_available));
    }

    ncclUniqueId nccl_id;
    ncclCheck(ncclGetUniqueId(&nccl_id));

    run_worker_threads(ngpus, [&](int rank) {
        NCCLCommunicator comm(WorkerIdentity{.Rank = rank, .WorldSize = ngpus, .DeviceIndex = first_device + rank},
                              check_lockstep, nccl_id);
        work(comm);
    });
}

std::unique_ptr<Communicator> Communicator::make_process_group(const LaunchEnvironment& env, bool check_lockstep) {
    const WorkerIdentity& identity = env.Identity;
    ncclUniqueId nccl_id;

    if (identity.Rank == 0) {
        ncclCheck(ncclGetUniqueId(&nccl_id));
        if (identity.WorldSize > 1) {
            std::vector<std::byte> payload(sizeof(nccl_id));
            std::memcpy(payload.data(), &nccl_id, sizeof(nccl_id));
            RendezvousServer server(env.RendezvousPort);
            server.serve(payload, identity.WorldSize - 1);
        }
    } else {
        auto payload = rendezvous_fetch(env.MasterAddr, env.RendezvousPort, sizeof(nccl_id),
                                        std::chrono::duration_cast<std::chrono::milliseconds>(kRendezvousTimeout));
        std::memcpy(&nccl_id, payload.data(), sizeof(nccl_id));
    }

    return std::make_unique<NCCLCommunicator>(identity, check_lockstep, nccl_id);
}
