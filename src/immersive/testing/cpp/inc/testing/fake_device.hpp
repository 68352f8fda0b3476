// SPDX-FileCopyrightText: Copyright (c) 2025 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#pragma once

// In-memory device API and host collaborators for tests. Asynchronous
// completions are queued and run when the test calls Completions::run_all(),
// or inline when Completions::immediate is set.

#include <device/device_api.hpp>
#include <device/host.hpp>

#include <algorithm>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

namespace immersive::testing
{

class Completions
{
public:
    bool immediate = false;

    void post(std::function<void()> completion)
    {
        if (immediate)
        {
            completion();
            return;
        }
        queue_.push_back(std::move(completion));
    }

    // Runs queued completions, including those posted while running; returns how many ran
    size_t run_all()
    {
        size_t count = 0;
        while (!queue_.empty())
        {
            auto completion = std::move(queue_.front());
            queue_.pop_front();
            completion();
            ++count;
        }
        return count;
    }

    // Runs the oldest queued completion; returns false if none was queued
    bool run_one()
    {
        if (queue_.empty())
        {
            return false;
        }
        auto completion = std::move(queue_.front());
        queue_.pop_front();
        completion();
        return true;
    }

    size_t pending() const
    {
        return queue_.size();
    }

private:
    std::deque<std::function<void()>> queue_;
};

inline XrPosef make_pose(float x, float y, float z)
{
    XrPosef pose{};
    pose.position = { x, y, z };
    pose.orientation.w = 1.0f;
    return pose;
}

class FakeReferenceSpace : public IReferenceSpace
{
public:
    explicit FakeReferenceSpace(ReferenceSpaceType type) : type_(type)
    {
    }

    ReferenceSpaceType type() const override
    {
        return type_;
    }

private:
    ReferenceSpaceType type_;
};

struct AnchorCreation
{
    XrPosef pose;
    std::function<void(DeviceId)> on_success;
    FailureCallback on_failure;
};

class FakeFrame : public IFrame
{
public:
    XrTime time = 1000;
    std::optional<ViewerPose> pose = ViewerPose{ .transform = make_pose(0.0f, 1.6f, 0.0f), .views = {} };
    std::vector<PlaneRecord> planes;
    std::vector<MeshRecord> meshes;
    std::vector<AnchorRecord> anchors;
    std::vector<ImageTrackingResultRecord> images;
    std::vector<HitTestResultsRecord> hit_tests;
    std::map<DeviceId, LightEstimateRecord> light;
    std::optional<DepthInformationRecord> depth;

    // create_anchor() calls, completed by the test
    mutable std::vector<AnchorCreation> anchor_creations;

    // Throws from detected_planes() when set
    std::optional<std::string> plane_error;

    // Called from viewer_pose(), lets a test end the session mid-frame
    std::function<void()> on_viewer_pose;

    XrTime predicted_display_time() const override
    {
        return time;
    }

    std::optional<ViewerPose> viewer_pose(const IReferenceSpace& /*space*/) const override
    {
        if (on_viewer_pose)
        {
            on_viewer_pose();
        }
        return pose;
    }

    std::vector<PlaneRecord> detected_planes() const override
    {
        if (plane_error)
        {
            throw std::runtime_error(*plane_error);
        }
        return planes;
    }

    std::vector<MeshRecord> detected_meshes() const override
    {
        return meshes;
    }

    std::vector<AnchorRecord> tracked_anchors() const override
    {
        return anchors;
    }

    std::vector<ImageTrackingResultRecord> image_tracking_results() const override
    {
        return images;
    }

    std::vector<HitTestResultsRecord> hit_test_results() const override
    {
        return hit_tests;
    }

    std::optional<LightEstimateRecord> light_estimate(DeviceId probe) const override
    {
        auto it = light.find(probe);
        if (it == light.end())
        {
            return std::nullopt;
        }
        return it->second;
    }

    std::optional<DepthInformationRecord> depth_information() const override
    {
        return depth;
    }

    void create_anchor(const XrPosef& pose,
                       std::function<void(DeviceId)> on_success,
                       FailureCallback on_failure) const override
    {
        anchor_creations.push_back({ pose, std::move(on_success), std::move(on_failure) });
    }
};

class FakeDeviceSession : public IDeviceSession
{
public:
    FakeDeviceSession(Completions& completions, std::vector<Feature> granted)
        : completions_(completions), granted_(std::move(granted))
    {
    }

    // Behaviour knobs
    bool auto_end = true;
    std::optional<std::string> reference_space_error;
    bool null_reference_space = false;
    bool light_probe_supported = true;
    std::vector<bool> image_scores;
    std::optional<std::string> image_scores_error;
    bool anchor_persistence = false;
    std::vector<std::string> stored_uuids;
    bool room_capture_supported = false;
    std::optional<std::string> room_capture_error;
    DepthUsage granted_depth_usage = DepthUsage_CPU;
    DepthFormat granted_depth_format = DepthFormat_LuminanceAlpha;
    VisibilityState visibility = VisibilityState::Visible;

    // Observations
    int end_calls = 0;
    bool ended = false;
    std::vector<ReferenceSpaceType> reference_space_requests;
    std::vector<RenderState> render_states;
    std::vector<HitTestOptions> hit_test_requests;
    std::vector<DeviceId> cancelled_hit_tests;
    std::vector<DeviceId> deleted_anchors;
    std::vector<DeviceId> persisted_anchors;
    std::vector<std::string> forgotten_uuids;
    int light_probe_requests = 0;

    std::vector<Feature> enabled_features() const override
    {
        return granted_;
    }

    VisibilityState visibility_state() const override
    {
        return visibility;
    }

    void end() override
    {
        ++end_calls;
        if (auto_end)
        {
            completions_.post([this]() { fire_end(); });
        }
    }

    // Device-side end, as when the user takes the headset off
    void fire_end()
    {
        if (ended)
        {
            return;
        }
        ended = true;
        auto handler = end_handler_;
        if (handler)
        {
            handler();
        }
    }

    void fire_visibility(VisibilityState state)
    {
        visibility = state;
        auto handler = visibility_handler_;
        if (handler)
        {
            handler(state);
        }
    }

    bool has_end_handler() const
    {
        return static_cast<bool>(end_handler_);
    }

    bool has_visibility_handler() const
    {
        return static_cast<bool>(visibility_handler_);
    }

    void request_reference_space(ReferenceSpaceType type,
                                 std::function<void(std::shared_ptr<IReferenceSpace>)> on_success,
                                 FailureCallback on_failure) override
    {
        reference_space_requests.push_back(type);
        completions_.post(
            [this, type, on_success, on_failure]()
            {
                if (reference_space_error)
                {
                    on_failure(*reference_space_error);
                    return;
                }
                on_success(null_reference_space ? nullptr : std::make_shared<FakeReferenceSpace>(type));
            });
    }

    void update_render_state(const RenderState& state) override
    {
        render_states.push_back(state);
    }

    void set_end_handler(std::function<void()> handler) override
    {
        end_handler_ = std::move(handler);
    }

    void set_visibility_handler(std::function<void(VisibilityState)> handler) override
    {
        visibility_handler_ = std::move(handler);
    }

    void request_hit_test_source(const HitTestOptions& options,
                                 std::function<void(DeviceId)> on_success,
                                 FailureCallback /*on_failure*/) override
    {
        hit_test_requests.push_back(options);
        const DeviceId id = next_id_++;
        completions_.post([on_success, id]() { on_success(id); });
    }

    void cancel_hit_test_source(DeviceId source) override
    {
        cancelled_hit_tests.push_back(source);
    }

    bool supports_light_probe() const override
    {
        return light_probe_supported;
    }

    void request_light_probe(std::function<void(DeviceId)> on_success, FailureCallback /*on_failure*/) override
    {
        ++light_probe_requests;
        const DeviceId id = next_id_++;
        completions_.post([on_success, id]() { on_success(id); });
    }

    void tracked_image_scores(std::function<void(std::vector<bool>)> on_success, FailureCallback on_failure) override
    {
        completions_.post(
            [this, on_success, on_failure]()
            {
                if (image_scores_error)
                {
                    on_failure(*image_scores_error);
                    return;
                }
                on_success(image_scores);
            });
    }

    void delete_anchor(DeviceId anchor) override
    {
        deleted_anchors.push_back(anchor);
    }

    bool supports_anchor_persistence() const override
    {
        return anchor_persistence;
    }

    void persist_anchor(DeviceId anchor,
                        std::function<void(const std::string& uuid)> on_success,
                        FailureCallback /*on_failure*/) override
    {
        persisted_anchors.push_back(anchor);
        const std::string uuid = "uuid-" + std::to_string(anchor);
        completions_.post(
            [this, on_success, uuid]()
            {
                stored_uuids.push_back(uuid);
                on_success(uuid);
            });
    }

    void restore_anchor(const std::string& uuid,
                        std::function<void(DeviceId)> on_success,
                        FailureCallback on_failure) override
    {
        completions_.post(
            [this, uuid, on_success, on_failure]()
            {
                auto it = restorable.find(uuid);
                if (it == restorable.end())
                {
                    on_failure("Unknown anchor " + uuid);
                    return;
                }
                on_success(it->second);
            });
    }

    void forget_anchor(const std::string& uuid, DoneCallback on_success, FailureCallback /*on_failure*/) override
    {
        forgotten_uuids.push_back(uuid);
        completions_.post(
            [this, uuid, on_success]()
            {
                stored_uuids.erase(std::remove(stored_uuids.begin(), stored_uuids.end(), uuid), stored_uuids.end());
                on_success();
            });
    }

    std::vector<std::string> persistent_anchor_uuids() const override
    {
        return stored_uuids;
    }

    DepthUsage depth_usage() const override
    {
        return granted_depth_usage;
    }

    DepthFormat depth_data_format() const override
    {
        return granted_depth_format;
    }

    bool supports_room_capture() const override
    {
        return room_capture_supported;
    }

    void initiate_room_capture(DoneCallback on_success, FailureCallback on_failure) override
    {
        completions_.post(
            [this, on_success, on_failure]()
            {
                if (room_capture_error)
                {
                    on_failure(*room_capture_error);
                    return;
                }
                on_success();
            });
    }

    // uuid -> anchor id handed out by restore_anchor()
    std::map<std::string, DeviceId> restorable;

private:
    Completions& completions_;
    std::vector<Feature> granted_;
    std::function<void()> end_handler_;
    std::function<void(VisibilityState)> visibility_handler_;
    DeviceId next_id_ = 100;
};

class FakeDeviceApi : public IDeviceApi
{
public:
    Completions completions;

    std::set<Feature> supported_features;
    std::map<SessionType, bool> available = { { SessionType::Inline, true },
                                              { SessionType::VR, true },
                                              { SessionType::AR, true } };
    // Requested features the device refuses to grant
    std::set<Feature> denied_features;
    std::optional<std::string> request_error;

    // Applied to every new session before it is handed out
    std::function<void(FakeDeviceSession&)> configure_session;

    std::vector<FeatureRequest> requests;
    std::vector<std::shared_ptr<FakeDeviceSession>> sessions;

    std::shared_ptr<FakeDeviceSession> last_session() const
    {
        return sessions.empty() ? nullptr : sessions.back();
    }

    bool supports(Feature feature) const override
    {
        return supported_features.count(feature) > 0;
    }

    void is_session_supported(SessionType type,
                              std::function<void(bool)> on_result,
                              FailureCallback /*on_failure*/) override
    {
        const bool result = available[type];
        completions.post([on_result, result]() { on_result(result); });
    }

    void request_session(SessionType /*type*/,
                         const FeatureRequest& request,
                         std::function<void(std::shared_ptr<IDeviceSession>)> on_success,
                         FailureCallback on_failure) override
    {
        requests.push_back(request);
        completions.post(
            [this, request, on_success, on_failure]()
            {
                if (request_error)
                {
                    on_failure(*request_error);
                    return;
                }

                std::vector<Feature> granted;
                for (const auto& name : request.optional_features)
                {
                    auto feature = feature_from_string(name);
                    if (feature && denied_features.count(*feature) == 0 &&
                        std::find(granted.begin(), granted.end(), *feature) == granted.end())
                    {
                        granted.push_back(*feature);
                    }
                }

                auto session = std::make_shared<FakeDeviceSession>(completions, granted);
                if (configure_session)
                {
                    configure_session(*session);
                }
                sessions.push_back(session);
                on_success(session);
            });
    }
};

class FakeCamera : public ICamera
{
public:
    float near_plane = 0.1f;
    float far_plane = 1000.0f;
    std::optional<XrPosef> transform;
    std::vector<CameraIntrinsics> intrinsics;
    std::shared_ptr<IDeviceSession> device_session;
    int session_bindings = 0;

    float near_clip() const override
    {
        return near_plane;
    }

    float far_clip() const override
    {
        return far_plane;
    }

    uint64_t add_clip_listener(std::function<void(float, float)> listener) override
    {
        const uint64_t id = ++last_listener_id_;
        listeners_[id] = std::move(listener);
        return id;
    }

    void remove_clip_listener(uint64_t id) override
    {
        listeners_.erase(id);
    }

    size_t clip_listener_count() const
    {
        return listeners_.size();
    }

    void set_clip(float near_clip, float far_clip)
    {
        near_plane = near_clip;
        far_plane = far_clip;
        auto listeners = listeners_;
        for (auto& [id, listener] : listeners)
        {
            listener(near_plane, far_plane);
        }
    }

    void set_transform(const XrPosef& pose) override
    {
        transform = pose;
    }

    void set_intrinsics(const CameraIntrinsics& value) override
    {
        intrinsics.push_back(value);
    }

    void set_device_session(std::shared_ptr<IDeviceSession> session) override
    {
        if (session)
        {
            ++session_bindings;
        }
        device_session = std::move(session);
    }

private:
    std::map<uint64_t, std::function<void(float, float)>> listeners_;
    uint64_t last_listener_id_ = 0;
};

class FakeSurface : public IDrawableSurface
{
public:
    uint32_t width = 1920;
    uint32_t height = 1080;

    uint32_t framebuffer_width() const override
    {
        return width;
    }

    uint32_t framebuffer_height() const override
    {
        return height;
    }
};

class FakeGraphicsDevice : public IGraphicsDevice
{
public:
    explicit FakeGraphicsDevice(Completions& completions) : completions_(completions)
    {
    }

    float max_pixel_ratio_value = 2.0f;
    float device_pixel_ratio_value = 1.0f;
    bool fail_surface = false;
    std::optional<std::string> compatible_error;

    std::vector<float> surface_scales;
    std::shared_ptr<FakeSurface> surface;
    std::vector<std::pair<uint32_t, uint32_t>> resolutions;

    float max_pixel_ratio() const override
    {
        return max_pixel_ratio_value;
    }

    float device_pixel_ratio() const override
    {
        return device_pixel_ratio_value;
    }

    SurfaceBundle create_surface(IDeviceSession& /*session*/, float scale_factor) override
    {
        surface_scales.push_back(scale_factor);
        if (fail_surface)
        {
            throw std::runtime_error("no drawable surface");
        }
        surface = std::make_shared<FakeSurface>();
        return SurfaceBundle{ .surface = surface, .binding = nullptr };
    }

    void set_resolution(uint32_t width, uint32_t height) override
    {
        resolutions.emplace_back(width, height);
    }

    void make_compatible(DoneCallback on_success, FailureCallback on_failure) override
    {
        completions_.post(
            [this, on_success, on_failure]()
            {
                if (compatible_error)
                {
                    on_failure(*compatible_error);
                    return;
                }
                on_success();
            });
    }

private:
    Completions& completions_;
};

class FakeViews : public IViews
{
public:
    int updates = 0;
    size_t last_view_count = 0;

    void update(const IFrame& /*frame*/, const std::vector<View>& views) override
    {
        ++updates;
        last_view_count = views.size();
    }
};

class FakeInput : public IInput
{
public:
    int updates = 0;

    void update(const IFrame& /*frame*/) override
    {
        ++updates;
    }
};

class FakeImageDecoder : public IImageDecoder
{
public:
    explicit FakeImageDecoder(Completions& completions) : completions_(completions)
    {
    }

    // Sources with these names fail to decode
    std::set<std::string> corrupt;
    std::vector<std::string> decoded;

    void decode(const ImageSource& source,
                std::function<void(std::shared_ptr<const Bitmap>)> on_success,
                FailureCallback on_failure) override
    {
        decoded.push_back(source.name);
        const bool fail = corrupt.count(source.name) > 0;
        completions_.post(
            [on_success, on_failure, fail]()
            {
                if (fail)
                {
                    on_failure("corrupt image data");
                    return;
                }
                auto bitmap = std::make_shared<Bitmap>();
                bitmap->width = 2;
                bitmap->height = 2;
                bitmap->rgba.assign(16, 255);
                on_success(bitmap);
            });
    }

private:
    Completions& completions_;
};

} // namespace immersive::testing
