// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// Copyright (c) 2025, IST Austria, developed by Erik Schultheis
// SPDX-License-Identifier: Apache-2.0
//

#ifndef LOCKSTEP_SRC_UTILITIES_GPU_INFO_H
#define LOCKSTEP_SRC_UTILITIES_GPU_INFO_H

#include <cstddef>
#include <vector>

class Communicator;

//! Device description of one rank; trivially copyable so it can be gathered over the communicator.
struct DeviceInfo {
    int rank = 0;
    int device_id = 0;
    char name[256] = {};
    int major = 0;
    int minor = 0;
    int driver_version = 0;
    int runtime_version = 0;
    int nccl_version = 0;
    std::size_t mem_free = 0;
    std::size_t mem_total = 0;
};

//! Describes the device the calling thread is bound to.
DeviceInfo query_device_info(int rank);

//! Gathers the DeviceInfo of every rank onto rank 0 (collective; empty on other ranks).
std::vector<DeviceInfo> gather_device_info(Communicator& comm);

#endif //LOCKSTEP_SRC_UTILITIES_GPU_INFO_H
