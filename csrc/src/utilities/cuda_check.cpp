// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#include "cuda_check.h"

#include <cuda_runtime.h>
#include <fmt/format.h>
#include <nvtx3/nvToolsExt.h>
#include <nvtx3/nvToolsExtCudaRt.h>

/**
 * @brief Throws a cuda_error if a CUDA runtime call failed.
 *
 * The message contains file/line, the failed statement, and the CUDA error name and
 * string. The CUDA error state is cleared before throwing so that CUDA calls made by
 * exception handlers do not observe the stale error.
 *
 * @param status The CUDA runtime status returned by the evaluated statement.
 * @param statement The stringified CUDA statement/expression that produced @p status.
 * @param file Source file where the error occurred.
 * @param line Source line where the error occurred.
 *
 * @throws cuda_error If @p status != cudaSuccess.
 */
void cuda_throw_on_error(cudaError_t status, const char* statement, const char* file, int line) {
    if (status != cudaSuccess) {
        std::string msg = fmt::format("Cuda Error in {}:{} ({}): {}: {}", file, line, statement,
                                      cudaGetErrorName(status), cudaGetErrorString(status));
        [[maybe_unused]] cudaError_t clear_error = cudaGetLastError();
        throw cuda_error(status, msg);
    }
}

NvtxRange::NvtxRange(const char* s) noexcept { nvtxRangePush(s); }

NvtxRange::~NvtxRange() noexcept { nvtxRangePop(); }

/**
 * @brief Creates a CUDA stream and assigns it an NVTX name.
 *
 * @param name Null-terminated stream name used for NVTX visualization.
 * @return Newly created CUDA stream handle; the caller must destroy it with cudaStreamDestroy().
 *
 * @throws cuda_error If cudaStreamCreate fails (via CUDA_CHECK).
 */
cudaStream_t create_named_stream(const char* name) {
    cudaStream_t stream;
    CUDA_CHECK(cudaStreamCreate(&stream));
    nvtxNameCudaStreamA(stream, name);
    return stream;
}
