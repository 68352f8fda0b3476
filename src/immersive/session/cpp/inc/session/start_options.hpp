// SPDX-FileCopyrightText: Copyright (c) 2025 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <device/types.hpp>

#include <optional>
#include <string>
#include <vector>

namespace immersive
{

struct DepthSensingOptions
{
    // Moved to the front of the preference list sent to the device
    std::optional<DepthUsage> usage_preference;
    std::optional<DepthFormat> data_format_preference;
};

// Optional features a caller asks for when starting a session.
// AR-only options are ignored for other session types.
struct StartOptions
{
    bool anchors = false;
    bool image_tracking = false;
    bool plane_detection = false;
    bool mesh_detection = false;
    std::optional<DepthSensingOptions> depth_sensing;
    bool camera_color = false;
    // Feature strings appended verbatim to the optional features
    std::vector<std::string> optional_features;
    // Requests "dom-overlay" with this root when the device supports it
    std::optional<std::string> dom_overlay_root;
};

// Session manager settings
struct SessionManagerConfig
{
    // Record every session to this MCAP file; empty disables recording.
    // The IMMERSIVE_MCAP_RECORDING environment variable overrides it.
    std::string mcap_recording_path;
};

} // namespace immersive
