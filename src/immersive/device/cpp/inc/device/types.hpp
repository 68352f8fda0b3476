// SPDX-FileCopyrightText: Copyright (c) 2025 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <schema/depth_generated.h>

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace immersive
{

// Opaque identity the device assigns to a tracked object, stable while the object is tracked
using DeviceId = uint64_t;

enum class SessionType
{
    Inline,
    VR,
    AR
};

enum class ReferenceSpaceType
{
    Viewer,
    Local,
    LocalFloor,
    BoundedFloor,
    Unbounded
};

enum class VisibilityState
{
    Visible,
    VisibleBlurred,
    Hidden
};

// Capabilities negotiated when a session is requested
enum class Feature
{
    HitTest,
    LightEstimation,
    ImageTracking,
    PlaneDetection,
    MeshDetection,
    Anchors,
    DepthSensing,
    CameraAccess,
    DomOverlay,
    HandTracking
};

// Session type strings: "inline", "immersive-vr", "immersive-ar"
std::string_view to_string(SessionType type);
std::optional<SessionType> session_type_from_string(std::string_view name);

// Reference space strings: "viewer", "local", "local-floor", "bounded-floor", "unbounded"
std::string_view to_string(ReferenceSpaceType type);
std::optional<ReferenceSpaceType> reference_space_type_from_string(std::string_view name);

std::string_view to_string(VisibilityState state);

// Feature descriptor strings, e.g. "plane-detection"
std::string_view to_string(Feature feature);
std::optional<Feature> feature_from_string(std::string_view name);

// Depth usage strings: "cpu-optimized", "gpu-optimized"
std::string_view to_string(DepthUsage usage);
// Depth format strings: "luminance-alpha", "float32"
std::string_view to_string(DepthFormat format);

// Completion callbacks of asynchronous device calls. Exactly one of the pair fires, exactly once,
// either inside the call or later from the host tick.
using FailureCallback = std::function<void(const std::string& message)>;
using DoneCallback = std::function<void()>;

/// Decoded reference image, ready to be handed to the device.
struct Bitmap
{
    uint32_t width = 0;
    uint32_t height = 0;
    std::vector<uint8_t> rgba;
};

/// Encoded reference image as supplied by the application.
struct ImageSource
{
    std::string name;
    std::vector<uint8_t> data;
};

struct TrackedImageRequest
{
    std::shared_ptr<const Bitmap> image;
    float width_in_meters = 0.0f;
};

struct DepthSensingRequest
{
    std::vector<DepthUsage> usage_preference;
    std::vector<DepthFormat> data_format_preference;
};

/// Capability request sent to the device when a session is requested. Immutable once issued.
struct FeatureRequest
{
    std::vector<std::string> required_features;
    std::vector<std::string> optional_features;
    std::vector<TrackedImageRequest> tracked_images;
    std::optional<DepthSensingRequest> depth_sensing;
    std::optional<std::string> dom_overlay_root;

    bool requests(std::string_view feature) const;
};

} // namespace immersive
