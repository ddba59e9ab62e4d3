// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#ifndef LOCKSTEP_SRC_UTILITIES_CUDA_CHECK_H
#define LOCKSTEP_SRC_UTILITIES_CUDA_CHECK_H

#include <stdexcept>
#include <string>

#include <driver_types.h>

/// This exception will be thrown for reported cuda errors
class cuda_error : public std::runtime_error {
public:
    cuda_error(cudaError_t err, const std::string& arg) :
            std::runtime_error(arg), code(err){};

    cudaError_t code;
};

/// Check `status`; if it isn't `cudaSuccess`, throw the corresponding `cuda_error`
void cuda_throw_on_error(cudaError_t status, const char* statement, const char* file, int line);

#define CUDA_CHECK(status) cuda_throw_on_error(status, #status, __FILE__, __LINE__)

// ----------------------------------------------------------------------------
// NVTX utils

class NvtxRange {
public:
    explicit NvtxRange(const char* s) noexcept;
    ~NvtxRange() noexcept;
};

cudaStream_t create_named_stream(const char* name);

#endif //LOCKSTEP_SRC_UTILITIES_CUDA_CHECK_H
