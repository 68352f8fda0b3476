// SPDX-FileCopyrightText: Copyright (c) 2025 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#include <oxr/openxr_device.hpp>
#include <session/session_manager.hpp>

#include <chrono>
#include <iostream>
#include <map>
#include <memory>
#include <thread>

using namespace immersive;

/**
 * Session Demo - runs an AR session on the installed OpenXR runtime
 *
 * The runtime must offer XR_MND_headless. Planes are detected when it also
 * offers XR_EXT_plane_detection. Nothing is rendered: the demo camera and
 * graphics device only print what the session manager hands them.
 */

namespace
{

class DemoCamera : public ICamera
{
public:
    float near_clip() const override
    {
        return near_clip_;
    }

    float far_clip() const override
    {
        return far_clip_;
    }

    uint64_t add_clip_listener(std::function<void(float, float)> listener) override
    {
        listeners_[++next_id_] = std::move(listener);
        return next_id_;
    }

    void remove_clip_listener(uint64_t id) override
    {
        listeners_.erase(id);
    }

    void set_transform(const XrPosef& pose) override
    {
        pose_ = pose;
    }

    void set_intrinsics(const CameraIntrinsics& intrinsics) override
    {
        std::cout << "  Camera intrinsics: fov " << intrinsics.fov << ", aspect " << intrinsics.aspect_ratio
                  << std::endl;
    }

    void set_device_session(std::shared_ptr<IDeviceSession> session) override
    {
        std::cout << "  Camera " << (session ? "attached to" : "detached from") << " the session" << std::endl;
    }

    const XrPosef& pose() const
    {
        return pose_;
    }

private:
    float near_clip_ = 0.1f;
    float far_clip_ = 1000.0f;
    XrPosef pose_{ { 0.0f, 0.0f, 0.0f, 1.0f }, { 0.0f, 0.0f, 0.0f } };
    uint64_t next_id_ = 0;
    std::map<uint64_t, std::function<void(float, float)>> listeners_;
};

class HeadlessSurface : public IDrawableSurface
{
public:
    uint32_t framebuffer_width() const override
    {
        return 1280;
    }

    uint32_t framebuffer_height() const override
    {
        return 720;
    }
};

class HeadlessGraphics : public IGraphicsDevice
{
public:
    float max_pixel_ratio() const override
    {
        return 1.0f;
    }

    float device_pixel_ratio() const override
    {
        return 1.0f;
    }

    SurfaceBundle create_surface(IDeviceSession& /*session*/, float scale_factor) override
    {
        std::cout << "  Surface created at scale " << scale_factor << std::endl;
        return { std::make_shared<HeadlessSurface>(), nullptr };
    }

    void set_resolution(uint32_t width, uint32_t height) override
    {
        std::cout << "  Resolution " << width << "x" << height << std::endl;
    }

    void make_compatible(DoneCallback on_success, FailureCallback /*on_failure*/) override
    {
        on_success();
    }
};

} // namespace

int main()
{
    std::cout << "Immersive Session Demo" << std::endl;
    std::cout << "======================" << std::endl;
    std::cout << std::endl;

    // Step 1: Query the runtime
    std::cout << "[Step 1] Querying the OpenXR runtime..." << std::endl;
    auto device_api = std::make_shared<OpenXRDeviceApi>(OpenXRDeviceConfig{ .app_name = "SessionDemo" });
    std::cout << "  Plane detection: " << (device_api->supports(Feature::PlaneDetection) ? "YES" : "NO") << std::endl;
    std::cout << std::endl;

    // Step 2: Create the session manager and listen to its events
    std::cout << "[Step 2] Creating session manager..." << std::endl;
    auto camera = std::make_shared<DemoCamera>();
    SessionManager manager(device_api, { .graphics = std::make_shared<HeadlessGraphics>() });

    manager.events().subscribe(
        [](const SessionEvent& event)
        {
            if (const auto* changed = std::get_if<AvailabilityChanged>(&event))
            {
                std::cout << "  Event: " << to_string(changed->type) << (changed->available ? " available" : " unavailable")
                          << std::endl;
            }
            else if (std::holds_alternative<SessionStarted>(event))
            {
                std::cout << "  Event: session started" << std::endl;
            }
            else if (std::holds_alternative<SessionEnded>(event))
            {
                std::cout << "  Event: session ended" << std::endl;
            }
            else if (const auto* error = std::get_if<SessionErrorEvent>(&event))
            {
                std::cerr << "  Event: error - " << error->message << std::endl;
            }
        });

    manager.plane_detection().events().subscribe(
        [](const PlaneDetection::Event& event)
        {
            if (const auto* added = std::get_if<EntityAdded<Plane>>(&event))
            {
                std::cout << "  Plane " << added->entity->id() << " added (" << added->entity->label() << ")"
                          << std::endl;
            }
            else if (const auto* removed = std::get_if<EntityRemoved<Plane>>(&event))
            {
                std::cout << "  Plane " << removed->entity->id() << " removed" << std::endl;
            }
        });

    manager.poll_availability();
    if (!manager.is_available(SessionType::AR))
    {
        std::cerr << "  ✗ AR sessions are not available (XR_MND_headless missing?)" << std::endl;
        return 1;
    }
    std::cout << std::endl;

    // Step 3: Start the session
    std::cout << "[Step 3] Starting AR session..." << std::endl;
    auto started = manager.start(camera, SessionType::AR, ReferenceSpaceType::Local, { .plane_detection = true });
    try
    {
        started.get();
    }
    catch (const std::exception& e)
    {
        std::cerr << "  ✗ Failed to start session: " << e.what() << std::endl;
        return 1;
    }

    auto xr_session = std::dynamic_pointer_cast<OpenXRDeviceSession>(manager.session());
    if (!xr_session)
    {
        std::cerr << "  ✗ Unexpected device session" << std::endl;
        return 1;
    }
    std::cout << "  ✓ Session running" << std::endl;
    std::cout << std::endl;

    // Step 4: Drive frames
    std::cout << "[Step 4] Running 100 frames..." << std::endl;
    for (int i = 0; i < 100 && manager.active(); ++i)
    {
        xr_session->poll_events();
        auto frame = xr_session->next_frame();
        if (!frame)
        {
            break;
        }
        manager.update(*frame);

        if (i % 25 == 0)
        {
            const auto& p = camera->pose().position;
            std::cout << "  Frame " << i << ": viewer at [" << p.x << ", " << p.y << ", " << p.z << "], "
                      << manager.plane_detection().size() << " planes" << std::endl;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(16));
    }
    std::cout << std::endl;

    // Step 5: End the session
    std::cout << "[Step 5] Ending session..." << std::endl;
    auto ended = manager.end();
    while (ended.wait_for(std::chrono::milliseconds(0)) != std::future_status::ready)
    {
        xr_session->poll_events();
        std::this_thread::sleep_for(std::chrono::milliseconds(16));
    }
    std::cout << "  ✓ Session ended" << std::endl;

    return 0;
}
