// SPDX-FileCopyrightText: Copyright (c) 2025 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#pragma once

// Monotonic clock access - no OpenXR dependency.

#include <cerrno>
#include <cstdint>
#include <cstring>
#include <stdexcept>
#include <string>
#include <time.h>

namespace rigtrack
{

/*!
 * @brief Returns CLOCK_MONOTONIC in nanoseconds.
 * @throws std::runtime_error if clock_gettime fails.
 */
inline int64_t os_monotonic_now_ns()
{
    struct timespec ts;
    if (clock_gettime(CLOCK_MONOTONIC, &ts) != 0)
    {
        throw std::runtime_error(std::string("os_monotonic_now_ns: clock_gettime failed: ") + std::strerror(errno));
    }
    return static_cast<int64_t>(ts.tv_sec) * 1000000000LL + static_cast<int64_t>(ts.tv_nsec);
}

} // namespace rigtrack
