// SPDX-FileCopyrightText: Copyright (c) 2025 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <openxr/openxr.h>
#include <schema/pose_generated.h>

namespace immersive
{

// Convert immersive::Pose (FlatBuffers) to XrPosef (OpenXR)
inline XrPosef to_xr_posef(const Pose& pose)
{
    XrPosef result{};
    result.position.x = pose.position().x();
    result.position.y = pose.position().y();
    result.position.z = pose.position().z();
    result.orientation.x = pose.orientation().x();
    result.orientation.y = pose.orientation().y();
    result.orientation.z = pose.orientation().z();
    result.orientation.w = pose.orientation().w();
    return result;
}

inline Point to_point(const XrVector3f& v)
{
    return Point(v.x, v.y, v.z);
}

inline Quaternion to_quaternion(const XrQuaternionf& q)
{
    return Quaternion(q.x, q.y, q.z, q.w);
}

// Convert XrPosef (OpenXR) to immersive::Pose (FlatBuffers)
inline Pose to_pose(const XrPosef& pose)
{
    return Pose(to_point(pose.position), to_quaternion(pose.orientation));
}

inline XrPosef identity_xr_posef()
{
    XrPosef result{};
    result.orientation.w = 1.0f;
    return result;
}

} // namespace immersive
