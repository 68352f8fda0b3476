// SPDX-FileCopyrightText: Copyright (c) 2025 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#pragma once

// Host monotonic clock, no OpenXR dependency.

#if defined(_WIN32)
#    include <Windows.h>
#else
#    include <cerrno>
#    include <cstring>
#    include <time.h>
#endif

#include <cstdint>
#include <stdexcept>
#include <string>

namespace immersive
{

/*!
 * @brief Returns the host monotonic time in nanoseconds.
 *
 * This is the "common" clock stamped on every recorded frame next to the
 * device XrTime, and the clock the OpenXR backend converts into XrTime when
 * it samples the viewer pose outside a frame loop.
 *
 * @throws std::runtime_error if the OS clock query fails.
 */
inline int64_t os_monotonic_now_ns()
{
#if defined(_WIN32)
    static const LARGE_INTEGER frequency = []()
    {
        LARGE_INTEGER f;
        if (!QueryPerformanceFrequency(&f))
        {
            throw std::runtime_error("os_monotonic_now_ns: QueryPerformanceFrequency failed");
        }
        return f;
    }();
    LARGE_INTEGER counter;
    if (!QueryPerformanceCounter(&counter))
    {
        throw std::runtime_error("os_monotonic_now_ns: QueryPerformanceCounter failed");
    }
    const int64_t seconds = counter.QuadPart / frequency.QuadPart;
    const int64_t remainder = counter.QuadPart % frequency.QuadPart;
    return seconds * 1000000000LL + remainder * 1000000000LL / frequency.QuadPart;
#else
    struct timespec ts;
    if (clock_gettime(CLOCK_MONOTONIC, &ts) != 0)
    {
        throw std::runtime_error(std::string("os_monotonic_now_ns: clock_gettime failed: ") + std::strerror(errno));
    }
    return static_cast<int64_t>(ts.tv_sec) * 1000000000LL + static_cast<int64_t>(ts.tv_nsec);
#endif
}

} // namespace immersive
