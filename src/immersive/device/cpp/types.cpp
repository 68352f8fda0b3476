// SPDX-FileCopyrightText: Copyright (c) 2025 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#include "inc/device/types.hpp"

#include <algorithm>
#include <array>
#include <utility>

namespace immersive
{

namespace
{

constexpr std::array<std::pair<SessionType, std::string_view>, 3> kSessionTypes = { {
    { SessionType::Inline, "inline" },
    { SessionType::VR, "immersive-vr" },
    { SessionType::AR, "immersive-ar" },
} };

constexpr std::array<std::pair<ReferenceSpaceType, std::string_view>, 5> kReferenceSpaceTypes = { {
    { ReferenceSpaceType::Viewer, "viewer" },
    { ReferenceSpaceType::Local, "local" },
    { ReferenceSpaceType::LocalFloor, "local-floor" },
    { ReferenceSpaceType::BoundedFloor, "bounded-floor" },
    { ReferenceSpaceType::Unbounded, "unbounded" },
} };

constexpr std::array<std::pair<Feature, std::string_view>, 10> kFeatures = { {
    { Feature::HitTest, "hit-test" },
    { Feature::LightEstimation, "light-estimation" },
    { Feature::ImageTracking, "image-tracking" },
    { Feature::PlaneDetection, "plane-detection" },
    { Feature::MeshDetection, "mesh-detection" },
    { Feature::Anchors, "anchors" },
    { Feature::DepthSensing, "depth-sensing" },
    { Feature::CameraAccess, "camera-access" },
    { Feature::DomOverlay, "dom-overlay" },
    { Feature::HandTracking, "hand-tracking" },
} };

template <typename Enum, size_t N>
std::string_view lookup_name(const std::array<std::pair<Enum, std::string_view>, N>& table, Enum value)
{
    for (const auto& [key, name] : table)
    {
        if (key == value)
        {
            return name;
        }
    }
    return "unknown";
}

template <typename Enum, size_t N>
std::optional<Enum> lookup_value(const std::array<std::pair<Enum, std::string_view>, N>& table, std::string_view name)
{
    for (const auto& [key, entry] : table)
    {
        if (entry == name)
        {
            return key;
        }
    }
    return std::nullopt;
}

} // namespace

std::string_view to_string(SessionType type)
{
    return lookup_name(kSessionTypes, type);
}

std::optional<SessionType> session_type_from_string(std::string_view name)
{
    return lookup_value(kSessionTypes, name);
}

std::string_view to_string(ReferenceSpaceType type)
{
    return lookup_name(kReferenceSpaceTypes, type);
}

std::optional<ReferenceSpaceType> reference_space_type_from_string(std::string_view name)
{
    return lookup_value(kReferenceSpaceTypes, name);
}

std::string_view to_string(VisibilityState state)
{
    switch (state)
    {
    case VisibilityState::Visible:
        return "visible";
    case VisibilityState::VisibleBlurred:
        return "visible-blurred";
    case VisibilityState::Hidden:
        return "hidden";
    }
    return "unknown";
}

std::string_view to_string(Feature feature)
{
    return lookup_name(kFeatures, feature);
}

std::optional<Feature> feature_from_string(std::string_view name)
{
    return lookup_value(kFeatures, name);
}

std::string_view to_string(DepthUsage usage)
{
    return usage == DepthUsage_GPU ? "gpu-optimized" : "cpu-optimized";
}

std::string_view to_string(DepthFormat format)
{
    return format == DepthFormat_Float32 ? "float32" : "luminance-alpha";
}

bool FeatureRequest::requests(std::string_view feature) const
{
    auto matches = [feature](const std::string& name) { return name == feature; };
    return std::any_of(required_features.begin(), required_features.end(), matches) ||
           std::any_of(optional_features.begin(), optional_features.end(), matches);
}

} // namespace immersive
