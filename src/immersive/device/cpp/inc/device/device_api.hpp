// SPDX-FileCopyrightText: Copyright (c) 2025 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include "records.hpp"
#include "types.hpp"

#include <openxr/openxr.h>

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace immersive
{

// Forward declarations
class IDrawableSurface;

// Reference space handed out by the device; opaque to the core
class IReferenceSpace
{
public:
    virtual ~IReferenceSpace() = default;

    virtual ReferenceSpaceType type() const = 0;
};

struct Ray
{
    XrVector3f origin{ 0.0f, 0.0f, 0.0f };
    XrVector3f direction{ 0.0f, 0.0f, -1.0f };
};

enum class HitTestTrackableType
{
    Point,
    Plane,
    Mesh
};

struct HitTestOptions
{
    // Space the ray is cast from; ignored when `profile` is set
    ReferenceSpaceType space_type = ReferenceSpaceType::Viewer;
    // Input profile of a transient input source (e.g. "generic-touchscreen")
    std::optional<std::string> profile;
    std::optional<Ray> offset_ray;
    std::vector<HitTestTrackableType> entity_types = { HitTestTrackableType::Plane };
};

struct RenderState
{
    std::shared_ptr<IDrawableSurface> surface;
    float depth_near = 0.1f;
    float depth_far = 1000.0f;
};

/**
 * @brief One frame of device data, valid only during the tick that supplied it.
 */
class IFrame
{
public:
    virtual ~IFrame() = default;

    virtual XrTime predicted_display_time() const = 0;

    // std::nullopt when tracking is lost this frame
    virtual std::optional<ViewerPose> viewer_pose(const IReferenceSpace& space) const = 0;

    virtual std::vector<PlaneRecord> detected_planes() const = 0;
    virtual std::vector<MeshRecord> detected_meshes() const = 0;
    virtual std::vector<AnchorRecord> tracked_anchors() const = 0;
    virtual std::vector<ImageTrackingResultRecord> image_tracking_results() const = 0;
    virtual std::vector<HitTestResultsRecord> hit_test_results() const = 0;
    virtual std::optional<LightEstimateRecord> light_estimate(DeviceId probe) const = 0;
    virtual std::optional<DepthInformationRecord> depth_information() const = 0;

    // Creates an anchor at `pose` in the session reference space; on_success receives the new anchor id
    virtual void create_anchor(const XrPosef& pose,
                               std::function<void(DeviceId)> on_success,
                               FailureCallback on_failure) const = 0;
};

/**
 * @brief A granted device session.
 *
 * Methods for optional capabilities have default implementations that report
 * the capability as unsupported; backends override what they provide.
 */
class IDeviceSession
{
public:
    virtual ~IDeviceSession() = default;

    // Features the device actually granted
    virtual std::vector<Feature> enabled_features() const = 0;
    bool has_feature(Feature feature) const;

    virtual VisibilityState visibility_state() const = 0;

    // Asks the device to end the session; the end handler fires once it has
    virtual void end() = 0;

    virtual void request_reference_space(ReferenceSpaceType type,
                                         std::function<void(std::shared_ptr<IReferenceSpace>)> on_success,
                                         FailureCallback on_failure) = 0;

    virtual void update_render_state(const RenderState& state) = 0;

    // Only one handler of each kind is kept; pass nullptr to detach
    virtual void set_end_handler(std::function<void()> handler) = 0;
    virtual void set_visibility_handler(std::function<void(VisibilityState)> handler) = 0;

    // Hit test
    virtual void request_hit_test_source(const HitTestOptions& options,
                                         std::function<void(DeviceId)> on_success,
                                         FailureCallback on_failure);
    virtual void cancel_hit_test_source(DeviceId source);

    // Light estimation
    virtual bool supports_light_probe() const;
    virtual void request_light_probe(std::function<void(DeviceId)> on_success, FailureCallback on_failure);

    // Image tracking: one entry per requested image, false when the device cannot track it
    virtual void tracked_image_scores(std::function<void(std::vector<bool>)> on_success, FailureCallback on_failure);

    // Anchors
    virtual void delete_anchor(DeviceId anchor);
    virtual bool supports_anchor_persistence() const;
    virtual void persist_anchor(DeviceId anchor,
                                std::function<void(const std::string& uuid)> on_success,
                                FailureCallback on_failure);
    virtual void restore_anchor(const std::string& uuid,
                                std::function<void(DeviceId)> on_success,
                                FailureCallback on_failure);
    virtual void forget_anchor(const std::string& uuid, DoneCallback on_success, FailureCallback on_failure);
    virtual std::vector<std::string> persistent_anchor_uuids() const;

    // Depth sensing, meaningful only when DepthSensing was granted
    virtual DepthUsage depth_usage() const;
    virtual DepthFormat depth_data_format() const;

    // Room capture
    virtual bool supports_room_capture() const;
    virtual void initiate_room_capture(DoneCallback on_success, FailureCallback on_failure);
};

/**
 * @brief Entry point of a device backend, injected into the session manager.
 */
class IDeviceApi
{
public:
    virtual ~IDeviceApi() = default;

    // Platform capability presence; fixed for the lifetime of the api object
    virtual bool supports(Feature feature) const = 0;

    virtual void is_session_supported(SessionType type,
                                      std::function<void(bool)> on_result,
                                      FailureCallback on_failure) = 0;

    virtual void request_session(SessionType type,
                                 const FeatureRequest& request,
                                 std::function<void(std::shared_ptr<IDeviceSession>)> on_success,
                                 FailureCallback on_failure) = 0;
};

} // namespace immersive
