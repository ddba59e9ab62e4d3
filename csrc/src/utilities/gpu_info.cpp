// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// Copyright (c) 2025, IST Austria, developed by Erik Schultheis
// SPDX-License-Identifier: Apache-2.0
//

#include "gpu_info.h"

#include <cstring>

#include <cuda_runtime.h>
#include <nccl.h>

#include "comm.h"
#include "cuda_check.h"

DeviceInfo query_device_info(int rank) {
    DeviceInfo info;
    info.rank = rank;
    CUDA_CHECK(cudaGetDevice(&info.device_id));

    cudaDeviceProp prop;
    CUDA_CHECK(cudaGetDeviceProperties(&prop, info.device_id));
    std::strncpy(info.name, prop.name, sizeof(info.name) - 1);
    info.major = prop.major;
    info.minor = prop.minor;

    CUDA_CHECK(cudaDriverGetVersion(&info.driver_version));
    CUDA_CHECK(cudaRuntimeGetVersion(&info.runtime_version));
    if (ncclGetVersion(&info.nccl_version) != ncclSuccess) {
        info.nccl_version = 0;
    }
    CUDA_CHECK(cudaMemGetInfo(&info.mem_free, &info.mem_total));
    return info;
}

std::vector<DeviceInfo> gather_device_info(Communicator& comm) {
    return comm.host_gather(query_device_info(comm.rank()));
}
