// SPDX-FileCopyrightText: Copyright (c) 2025 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <openxr/openxr.h>

#include <cassert>
#include <functional>
#include <stdexcept>
#include <string>
#include <utility>

namespace immersive
{

// Resolve an instance-level function through xrGetInstanceProcAddr - throws if the runtime does not provide it
inline void load_extension_function(XrInstance instance,
                                    PFN_xrGetInstanceProcAddr get_proc_addr,
                                    const char* name,
                                    PFN_xrVoidFunction* function)
{
    assert(get_proc_addr && "xrGetInstanceProcAddr cannot be null");

    XrResult result = get_proc_addr(instance, name, function);
    if (XR_FAILED(result) || *function == nullptr)
    {
        throw std::runtime_error(std::string("Failed to load ") + name + ": " + std::to_string(result));
    }
}

// Function pointers of XR_EXT_plane_detection
struct PlaneDetectionFunctions
{
    PFN_xrCreatePlaneDetectorEXT xrCreatePlaneDetectorEXT;
    PFN_xrDestroyPlaneDetectorEXT xrDestroyPlaneDetectorEXT;
    PFN_xrBeginPlaneDetectionEXT xrBeginPlaneDetectionEXT;
    PFN_xrGetPlaneDetectionStateEXT xrGetPlaneDetectionStateEXT;
    PFN_xrGetPlaneDetectionsEXT xrGetPlaneDetectionsEXT;
    PFN_xrGetPlanePolygonBufferEXT xrGetPlanePolygonBufferEXT;

    static PlaneDetectionFunctions load(XrInstance instance, PFN_xrGetInstanceProcAddr get_proc_addr)
    {
        PlaneDetectionFunctions funcs{};
        load_extension_function(instance, get_proc_addr, "xrCreatePlaneDetectorEXT",
                                reinterpret_cast<PFN_xrVoidFunction*>(&funcs.xrCreatePlaneDetectorEXT));
        load_extension_function(instance, get_proc_addr, "xrDestroyPlaneDetectorEXT",
                                reinterpret_cast<PFN_xrVoidFunction*>(&funcs.xrDestroyPlaneDetectorEXT));
        load_extension_function(instance, get_proc_addr, "xrBeginPlaneDetectionEXT",
                                reinterpret_cast<PFN_xrVoidFunction*>(&funcs.xrBeginPlaneDetectionEXT));
        load_extension_function(instance, get_proc_addr, "xrGetPlaneDetectionStateEXT",
                                reinterpret_cast<PFN_xrVoidFunction*>(&funcs.xrGetPlaneDetectionStateEXT));
        load_extension_function(instance, get_proc_addr, "xrGetPlaneDetectionsEXT",
                                reinterpret_cast<PFN_xrVoidFunction*>(&funcs.xrGetPlaneDetectionsEXT));
        load_extension_function(instance, get_proc_addr, "xrGetPlanePolygonBufferEXT",
                                reinterpret_cast<PFN_xrVoidFunction*>(&funcs.xrGetPlanePolygonBufferEXT));
        return funcs;
    }
};

// Owns an OpenXR handle and destroys it through the supplied function
template <typename HandleType>
class OpenXRHandle
{
public:
    OpenXRHandle() : handle_(XR_NULL_HANDLE), deleter_(nullptr)
    {
    }

    OpenXRHandle(HandleType handle, std::function<void(HandleType)> deleter)
        : handle_(handle), deleter_(std::move(deleter))
    {
    }

    ~OpenXRHandle()
    {
        reset();
    }

    OpenXRHandle(OpenXRHandle&& other) noexcept : handle_(other.handle_), deleter_(std::move(other.deleter_))
    {
        other.handle_ = XR_NULL_HANDLE;
    }

    OpenXRHandle& operator=(OpenXRHandle&& other) noexcept
    {
        if (this != &other)
        {
            reset();
            handle_ = other.handle_;
            deleter_ = std::move(other.deleter_);
            other.handle_ = XR_NULL_HANDLE;
        }
        return *this;
    }

    OpenXRHandle(const OpenXRHandle&) = delete;
    OpenXRHandle& operator=(const OpenXRHandle&) = delete;

    HandleType get() const
    {
        return handle_;
    }
    explicit operator bool() const
    {
        return handle_ != XR_NULL_HANDLE;
    }

    void reset()
    {
        if (handle_ != XR_NULL_HANDLE)
        {
            assert(deleter_);
            deleter_(handle_);
            handle_ = XR_NULL_HANDLE;
        }
    }

private:
    HandleType handle_;
    std::function<void(HandleType)> deleter_;
};

using XrInstancePtr = OpenXRHandle<XrInstance>;
using XrSessionPtr = OpenXRHandle<XrSession>;
using XrSpacePtr = OpenXRHandle<XrSpace>;
using XrPlaneDetectorPtr = OpenXRHandle<XrPlaneDetectorEXT>;

} // namespace immersive
