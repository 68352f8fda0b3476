// SPDX-FileCopyrightText: Copyright (c) 2025 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include "types.hpp"

#include <openxr/openxr.h>
#include <schema/plane_generated.h>

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

// Per-frame records a device reports for the entities it tracks.
// Poses are expressed in the reference space the session was started with;
// std::nullopt means the object is tracked but could not be located this frame.

namespace immersive
{

struct View
{
    // Column-major 4x4 projection matrix
    std::array<float, 16> projection_matrix{};
    XrPosef transform{};
};

struct ViewerPose
{
    XrPosef transform{};
    std::vector<View> views;
};

struct PlaneRecord
{
    DeviceId id = 0;
    std::optional<XrPosef> pose;
    PlaneOrientation orientation = PlaneOrientation_Unknown;
    // Polygon in plane space, normal along +Y so every point has y == 0
    std::vector<XrVector3f> polygon;
    std::string label;
    int64_t last_changed_time = 0;
};

struct MeshRecord
{
    DeviceId id = 0;
    std::optional<XrPosef> pose;
    std::vector<XrVector3f> vertices;
    std::vector<uint32_t> indices;
    std::string label;
    int64_t last_changed_time = 0;
};

struct AnchorRecord
{
    DeviceId id = 0;
    // False while the device has not yet created a space for the anchor
    bool has_space = true;
    std::optional<XrPosef> pose;
};

enum class ImageTrackingState
{
    Tracked,
    Emulated
};

struct ImageTrackingResultRecord
{
    // Index into FeatureRequest::tracked_images
    uint32_t index = 0;
    std::optional<XrPosef> pose;
    ImageTrackingState tracking_state = ImageTrackingState::Tracked;
    float measured_width_in_meters = 0.0f;
};

struct HitTestResultsRecord
{
    DeviceId source = 0;
    std::vector<XrPosef> results;
};

struct LightEstimateRecord
{
    XrVector3f primary_light_direction{ 0.0f, 1.0f, 0.0f };
    XrVector3f primary_light_intensity{ 0.0f, 0.0f, 0.0f };
    // 9 RGB coefficients
    std::array<float, 27> spherical_harmonics_coefficients{};
};

struct DepthInformationRecord
{
    uint32_t width = 0;
    uint32_t height = 0;
    float raw_value_to_meters = 0.0f;
    // Row-major CPU buffer: 16-bit little endian values for luminance-alpha, 32-bit floats for float32.
    // Empty when the depth buffer lives on the GPU.
    std::vector<uint8_t> data;
};

} // namespace immersive
