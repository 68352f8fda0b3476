// SPDX-FileCopyrightText: Copyright (c) 2025 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include "device_api.hpp"
#include "types.hpp"

#include <openxr/openxr.h>

#include <cstdint>
#include <functional>
#include <memory>

// Collaborators the host application provides around the session core:
// rendering surface, camera, views, input and image decoding.

namespace immersive
{

// Intrinsics derived from the first view of a session
struct CameraIntrinsics
{
    float aspect_ratio = 1.0f;
    // Vertical field of view in degrees
    float fov = 90.0f;
    float near_clip = 0.1f;
    float far_clip = 1000.0f;
    bool horizontal_fov = false;
};

class ICamera
{
public:
    virtual ~ICamera() = default;

    virtual float near_clip() const = 0;
    virtual float far_clip() const = 0;

    // Returns an id for remove_clip_listener
    virtual uint64_t add_clip_listener(std::function<void(float near_clip, float far_clip)> listener) = 0;
    virtual void remove_clip_listener(uint64_t id) = 0;

    virtual void set_transform(const XrPosef& pose) = 0;
    virtual void set_intrinsics(const CameraIntrinsics& intrinsics) = 0;

    // Back reference to the session rendering through this camera; nullptr clears it
    virtual void set_device_session(std::shared_ptr<IDeviceSession> session) = 0;
};

// Drawable surface (layer / framebuffer) negotiated for a session
class IDrawableSurface
{
public:
    virtual ~IDrawableSurface() = default;

    virtual uint32_t framebuffer_width() const = 0;
    virtual uint32_t framebuffer_height() const = 0;
};

// Per-eye texture access offered by some rendering backends
class IGraphicsBinding
{
public:
    virtual ~IGraphicsBinding() = default;
};

struct SurfaceBundle
{
    std::shared_ptr<IDrawableSurface> surface;
    // May be null
    std::shared_ptr<IGraphicsBinding> binding;
};

class IGraphicsDevice
{
public:
    virtual ~IGraphicsDevice() = default;

    virtual float max_pixel_ratio() const = 0;
    virtual float device_pixel_ratio() const = 0;

    // Throws std::runtime_error when the surface cannot be built
    virtual SurfaceBundle create_surface(IDeviceSession& session, float scale_factor) = 0;

    virtual void set_resolution(uint32_t width, uint32_t height) = 0;

    // Makes the graphics context usable for immersive rendering again after a device loss
    virtual void make_compatible(DoneCallback on_success, FailureCallback on_failure) = 0;
};

class IViews
{
public:
    virtual ~IViews() = default;

    virtual void update(const IFrame& frame, const std::vector<View>& views) = 0;
};

class IInput
{
public:
    virtual ~IInput() = default;

    virtual void update(const IFrame& frame) = 0;
};

class IImageDecoder
{
public:
    virtual ~IImageDecoder() = default;

    virtual void decode(const ImageSource& source,
                        std::function<void(std::shared_ptr<const Bitmap>)> on_success,
                        FailureCallback on_failure) = 0;
};

} // namespace immersive
