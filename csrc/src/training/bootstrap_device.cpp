// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#include "bootstrap.h"

#include <cuda_runtime.h>
#include <fmt/core.h>

#include "utilities/cuda_check.h"

int available_devices() {
    int count = 0;
    cudaError_t status = cudaGetDeviceCount(&count);
    if (status != cudaSuccess || count == 0) {
        [[maybe_unused]] cudaError_t clear_error = cudaGetLastError();
        throw BootstrapError(fmt::format("No CUDA device available ({})",
                                         status == cudaSuccess ? "device count is 0" : cudaGetErrorString(status)));
    }
    return count;
}

void bind_device(int device) {
    int count = available_devices();
    if (device < 0 || device >= count) {
        throw BootstrapError(fmt::format("Device {} requested, but only {} CUDA devices are visible", device, count));
    }
    CUDA_CHECK(cudaSetDevice(device));
}
