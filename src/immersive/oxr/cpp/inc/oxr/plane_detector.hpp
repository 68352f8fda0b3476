// SPDX-FileCopyrightText: Copyright (c) 2025 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <device/records.hpp>
#include <openxr/openxr.h>
#include <oxr_utils/oxr_funcs.hpp>

#include <vector>

namespace immersive
{

/**
 * @brief Continuous plane detection through XR_EXT_plane_detection.
 *
 * Each update() advances the asynchronous detection: a new detection is begun
 * when none is running, and its results replace planes() once the runtime
 * reports it done. Polygons are converted to a plane space whose normal is +Y.
 */
class PlaneDetector
{
public:
    // Throws std::runtime_error if the extension functions cannot be loaded or the detector cannot be created
    PlaneDetector(XrInstance instance, XrSession session, PFN_xrGetInstanceProcAddr get_proc_addr);

    /**
     * @brief Advances detection relative to base_space.
     * @return true if planes() was refreshed by this call.
     */
    bool update(XrSpace base_space, XrTime time);

    const std::vector<PlaneRecord>& planes() const
    {
        return planes_;
    }

    static constexpr uint32_t kMaxPlanes = 64;

private:
    void read_planes(XrSpace base_space, XrTime time);
    std::vector<XrVector3f> read_polygon(const XrPlaneDetectorLocationEXT& location) const;

    PlaneDetectionFunctions funcs_;
    XrPlaneDetectorPtr detector_;
    bool detecting_ = false;
    std::vector<PlaneRecord> planes_;
};

} // namespace immersive
