// SPDX-FileCopyrightText: Copyright (c) 2025 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include "os_time.hpp"
#include "oxr_funcs.hpp"

#if defined(XR_USE_PLATFORM_WIN32)
#    include <Unknwn.h>
#    include <Windows.h>
#elif defined(XR_USE_TIMESPEC)
#    include <time.h>
#endif
#include <openxr/openxr_platform.h>

#include <stdexcept>
#include <string>
#include <vector>

namespace immersive
{

/*!
 * @brief Converts the host monotonic clock to XrTime.
 *
 * A headless session has no frame loop and therefore no predicted display
 * time; the backend samples poses at "now" expressed as XrTime instead.
 *
 * @code
 *     XrTimeConverter converter(instance, xrGetInstanceProcAddr); // throws if unavailable
 *     XrTime now = converter.os_monotonic_now();
 * @endcode
 */
class XrTimeConverter
{
public:
    // OpenXR extensions the converter needs on this platform
    static std::vector<std::string> get_required_extensions()
    {
#if defined(XR_USE_PLATFORM_WIN32)
        return { XR_KHR_WIN32_CONVERT_PERFORMANCE_COUNTER_TIME_EXTENSION_NAME };
#elif defined(XR_USE_TIMESPEC)
        return { XR_KHR_CONVERT_TIMESPEC_TIME_EXTENSION_NAME };
#else
        return {};
#endif
    }

    XrTimeConverter(XrInstance instance, PFN_xrGetInstanceProcAddr get_proc_addr) : instance_(instance)
    {
#if defined(XR_USE_PLATFORM_WIN32)
        load_extension_function(instance_, get_proc_addr, "xrConvertWin32PerformanceCounterToTimeKHR",
                                reinterpret_cast<PFN_xrVoidFunction*>(&pfn_convert_win32_));
#elif defined(XR_USE_TIMESPEC)
        load_extension_function(instance_, get_proc_addr, "xrConvertTimespecTimeToTimeKHR",
                                reinterpret_cast<PFN_xrVoidFunction*>(&pfn_convert_timespec_));
#endif
    }

    XrTime os_monotonic_now() const
    {
        return convert_monotonic_ns_to_xrtime(os_monotonic_now_ns());
    }

    // monotonic_ns must come from os_monotonic_now_ns(); other clock domains give wrong results
    XrTime convert_monotonic_ns_to_xrtime(int64_t monotonic_ns) const
    {
        XrTime time = 0;
#if defined(XR_USE_PLATFORM_WIN32)
        LARGE_INTEGER frequency;
        if (!QueryPerformanceFrequency(&frequency))
        {
            throw std::runtime_error("convert_monotonic_ns_to_xrtime: QueryPerformanceFrequency failed");
        }
        LARGE_INTEGER counter;
        counter.QuadPart = (monotonic_ns / 1000000000LL) * frequency.QuadPart +
                           (monotonic_ns % 1000000000LL) * frequency.QuadPart / 1000000000LL;

        XrResult result = pfn_convert_win32_(instance_, &counter, &time);
        if (XR_FAILED(result))
        {
            throw std::runtime_error("xrConvertWin32PerformanceCounterToTimeKHR failed: " + std::to_string(result));
        }
#elif defined(XR_USE_TIMESPEC)
        struct timespec ts;
        ts.tv_sec = static_cast<time_t>(monotonic_ns / 1000000000LL);
        ts.tv_nsec = static_cast<long>(monotonic_ns % 1000000000LL);

        XrResult result = pfn_convert_timespec_(instance_, &ts, &time);
        if (XR_FAILED(result))
        {
            throw std::runtime_error("xrConvertTimespecTimeToTimeKHR failed: " + std::to_string(result));
        }
#else
        static_assert(false, "OpenXR time conversion not implemented on this platform.");
#endif
        return time;
    }

private:
    XrInstance instance_;

#if defined(XR_USE_PLATFORM_WIN32)
    PFN_xrConvertWin32PerformanceCounterToTimeKHR pfn_convert_win32_{};
#elif defined(XR_USE_TIMESPEC)
    PFN_xrConvertTimespecTimeToTimeKHR pfn_convert_timespec_{};
#endif
};

} // namespace immersive
