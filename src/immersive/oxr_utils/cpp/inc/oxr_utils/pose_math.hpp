// SPDX-FileCopyrightText: Copyright (c) 2025 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <openxr/openxr.h>

#include <cmath>

namespace immersive
{

constexpr float kDegToRad = 3.14159265358979323846f / 180.0f;

constexpr XrQuaternionf multiply_quaternions(const XrQuaternionf& a, const XrQuaternionf& b)
{
    XrQuaternionf result{};
    result.w = a.w * b.w - a.x * b.x - a.y * b.y - a.z * b.z;
    result.x = a.w * b.x + a.x * b.w + a.y * b.z - a.z * b.y;
    result.y = a.w * b.y - a.x * b.z + a.y * b.w + a.z * b.x;
    result.z = a.w * b.z + a.x * b.y - a.y * b.x + a.z * b.w;
    return result;
}

constexpr XrVector3f rotate_vector(const XrQuaternionf& q, const XrVector3f& v)
{
    // t = 2 * cross(q.xyz, v)
    float tx = 2.0f * (q.y * v.z - q.z * v.y);
    float ty = 2.0f * (q.z * v.x - q.x * v.z);
    float tz = 2.0f * (q.x * v.y - q.y * v.x);

    // v' = v + q.w * t + cross(q.xyz, t)
    XrVector3f result{};
    result.x = v.x + q.w * tx + (q.y * tz - q.z * ty);
    result.y = v.y + q.w * ty + (q.z * tx - q.x * tz);
    result.z = v.z + q.w * tz + (q.x * ty - q.y * tx);
    return result;
}

// result = a * b, i.e. b expressed in a's frame moved to a's parent frame
constexpr XrPosef multiply_poses(const XrPosef& a, const XrPosef& b)
{
    XrPosef result{};
    result.orientation = multiply_quaternions(a.orientation, b.orientation);

    XrVector3f rotated = rotate_vector(a.orientation, b.position);
    result.position.x = a.position.x + rotated.x;
    result.position.y = a.position.y + rotated.y;
    result.position.z = a.position.z + rotated.z;
    return result;
}

inline XrQuaternionf axis_angle_quaternion(const XrVector3f& axis, float degrees)
{
    const float half = degrees * kDegToRad * 0.5f;
    const float s = std::sin(half);
    return XrQuaternionf{ axis.x * s, axis.y * s, axis.z * s, std::cos(half) };
}

// Rotation whose -Z axis points along `direction` with +Y as close to world up as possible.
// Falls back to world +Z as the up hint when `direction` is vertical.
inline XrQuaternionf look_rotation(const XrVector3f& direction)
{
    auto normalize = [](XrVector3f v)
    {
        const float len = std::sqrt(v.x * v.x + v.y * v.y + v.z * v.z);
        return len > 0.0f ? XrVector3f{ v.x / len, v.y / len, v.z / len } : XrVector3f{ 0.0f, 0.0f, 0.0f };
    };
    auto cross = [](const XrVector3f& a, const XrVector3f& b)
    { return XrVector3f{ a.y * b.z - a.z * b.y, a.z * b.x - a.x * b.z, a.x * b.y - a.y * b.x }; };

    // z points away from the target
    const XrVector3f z = normalize(XrVector3f{ -direction.x, -direction.y, -direction.z });
    XrVector3f x = normalize(cross(XrVector3f{ 0.0f, 1.0f, 0.0f }, z));
    if (x.x == 0.0f && x.y == 0.0f && x.z == 0.0f)
    {
        x = normalize(cross(XrVector3f{ 0.0f, 0.0f, 1.0f }, z));
    }
    const XrVector3f y = cross(z, x);

    // Rotation matrix with columns x, y, z to quaternion
    const float trace = x.x + y.y + z.z;
    XrQuaternionf q{};
    if (trace > 0.0f)
    {
        const float s = std::sqrt(trace + 1.0f) * 2.0f;
        q.w = 0.25f * s;
        q.x = (y.z - z.y) / s;
        q.y = (z.x - x.z) / s;
        q.z = (x.y - y.x) / s;
    }
    else if (x.x > y.y && x.x > z.z)
    {
        const float s = std::sqrt(1.0f + x.x - y.y - z.z) * 2.0f;
        q.w = (y.z - z.y) / s;
        q.x = 0.25f * s;
        q.y = (y.x + x.y) / s;
        q.z = (z.x + x.z) / s;
    }
    else if (y.y > z.z)
    {
        const float s = std::sqrt(1.0f + y.y - x.x - z.z) * 2.0f;
        q.w = (z.x - x.z) / s;
        q.x = (y.x + x.y) / s;
        q.y = 0.25f * s;
        q.z = (z.y + y.z) / s;
    }
    else
    {
        const float s = std::sqrt(1.0f + z.z - x.x - y.y) * 2.0f;
        q.w = (x.y - y.x) / s;
        q.x = (z.x + x.z) / s;
        q.y = (z.y + y.z) / s;
        q.z = 0.25f * s;
    }
    return q;
}

} // namespace immersive
