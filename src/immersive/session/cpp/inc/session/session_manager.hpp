// SPDX-FileCopyrightText: Copyright (c) 2025 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include "session_error.hpp"
#include "session_negotiator.hpp"
#include "start_options.hpp"

#include <detection/anchors.hpp>
#include <detection/depth_sensing.hpp>
#include <detection/hit_test.hpp>
#include <detection/image_tracking.hpp>
#include <detection/light_estimation.hpp>
#include <detection/mesh_detection.hpp>
#include <detection/plane_detection.hpp>
#include <device/device_api.hpp>
#include <device/host.hpp>
#include <events/event_emitter.hpp>

#include <future>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <variant>
#include <vector>

namespace immersive
{

// Forward declarations
class McapRecorder;

enum class SessionState
{
    Idle,
    Starting,
    Running,
    Ending
};

std::string_view to_string(SessionState state);

struct AvailabilityChanged
{
    SessionType type;
    bool available;
};

struct SessionStarted
{
};

// Fired once per established session, after every subsystem was torn down
struct SessionEnded
{
};

// The raw frame, valid only during the handler call
struct FrameUpdated
{
    const IFrame& frame;
};

struct VisibilityChanged
{
    VisibilityState state;
};

struct SessionErrorEvent
{
    std::string message;
};

using SessionEvent = std::variant<AvailabilityChanged,
                                  SessionStarted,
                                  SessionEnded,
                                  FrameUpdated,
                                  VisibilityChanged,
                                  SessionErrorEvent>;

// Host-side collaborators; views, input and image_decoder may be null
struct HostCollaborators
{
    std::shared_ptr<IGraphicsDevice> graphics;
    std::shared_ptr<IViews> views;
    std::shared_ptr<IInput> input;
    std::shared_ptr<IImageDecoder> image_decoder;
};

/**
 * @brief Owns the immersive session lifecycle: Idle -> Starting -> Running -> Ending -> Idle.
 *
 * Single threaded. The host calls update() once per device frame and drives
 * the asynchronous completions of the device API from the same thread.
 *
 * Usage:
 *   SessionManager manager(device_api, { .graphics = graphics });
 *   auto started = manager.start(camera, SessionType::AR, ReferenceSpaceType::LocalFloor,
 *                                { .plane_detection = true });
 *   // ... tick the device until `started` is ready, then per frame:
 *   manager.update(frame);
 */
class SessionManager
{
public:
    // Throws std::runtime_error if device_api or host.graphics is null
    SessionManager(std::shared_ptr<IDeviceApi> device_api, HostCollaborators host, SessionManagerConfig config = {});
    ~SessionManager();

    SessionManager(const SessionManager&) = delete;
    SessionManager& operator=(const SessionManager&) = delete;

    /**
     * @brief Negotiates and starts a session rendering through `camera`.
     *
     * The future is ready once the session runs or failed to start; failures
     * carry a SessionError. Asynchronous failures also emit SessionErrorEvent.
     *
     * @throws std::invalid_argument if camera is null.
     */
    std::future<void> start(std::shared_ptr<ICamera> camera,
                            SessionType type,
                            ReferenceSpaceType space_type,
                            const StartOptions& options = {});

    // Ready once the device reported the session as ended and teardown completed
    std::future<void> end();

    /**
     * @brief Processes one device frame.
     * @return false when no session is running or the frame had no viewer pose.
     */
    bool update(const IFrame& frame);

    std::future<void> initiate_room_capture();

    // Re-queries every session type; AvailabilityChanged fires only on change
    void poll_availability();
    void on_device_changed();

    // Graphics device loss: the surface is dropped, the session keeps running
    void on_device_lost();
    void on_device_restored();

    EventSource<SessionEvent>& events()
    {
        return emitter_;
    }

    SessionState state() const
    {
        return state_;
    }

    bool active() const
    {
        return state_ == SessionState::Running;
    }

    bool is_available(SessionType type) const;

    std::optional<SessionType> type() const
    {
        return type_;
    }

    std::optional<ReferenceSpaceType> space_type() const
    {
        return space_type_;
    }

    std::optional<VisibilityState> visibility_state() const;

    std::shared_ptr<ICamera> camera() const
    {
        return camera_;
    }

    std::shared_ptr<IDeviceSession> session() const
    {
        return session_;
    }

    std::shared_ptr<IReferenceSpace> reference_space() const
    {
        return reference_space_;
    }

    HitTest& hit_test()
    {
        return *hit_test_;
    }
    LightEstimation& light_estimation()
    {
        return *light_estimation_;
    }
    ImageTracking& image_tracking()
    {
        return *image_tracking_;
    }
    Anchors& anchors()
    {
        return *anchors_;
    }
    PlaneDetection& plane_detection()
    {
        return *plane_detection_;
    }
    DepthSensing& depth_sensing()
    {
        return *depth_sensing_;
    }
    MeshDetection& mesh_detection()
    {
        return *mesh_detection_;
    }

    // Subsystems in per-frame dispatch order
    const std::vector<std::shared_ptr<DetectionSubsystem>>& subsystems() const
    {
        return subsystems_;
    }

private:
    std::set<Feature> supported_features() const;

    void on_session_granted(const std::shared_ptr<IDeviceSession>& session);
    void on_reference_space(const std::shared_ptr<IReferenceSpace>& space);
    void on_negotiation_failed(const SessionError& error);
    void fail_acquisition(const SessionError& error);
    void on_device_session_end();

    void create_surface();
    void set_clip_planes(float near_clip, float far_clip);
    void apply_intrinsics(const View& view);
    void warn_missing_features() const;
    void start_recording();
    void record(const IFrame& frame);

    // Clears every per-session field in teardown order and returns to Idle
    void teardown();

    void reject_start(const SessionError& error);
    void report_error(const std::string& message);

    std::shared_ptr<IDeviceApi> device_api_;
    HostCollaborators host_;
    SessionManagerConfig config_;
    SessionNegotiator negotiator_;
    EventEmitter<SessionEvent> emitter_;

    // Callbacks handed to the device hold a weak reference and bail out once the manager is gone
    std::shared_ptr<bool> alive_ = std::make_shared<bool>(true);

    std::map<SessionType, bool> available_;

    SessionState state_ = SessionState::Idle;
    std::optional<SessionType> type_;
    std::optional<ReferenceSpaceType> space_type_;
    StartOptions options_;
    std::shared_ptr<ICamera> camera_;
    std::optional<uint64_t> clip_listener_;
    std::shared_ptr<IDeviceSession> session_;
    std::shared_ptr<IReferenceSpace> reference_space_;
    std::shared_ptr<IDrawableSurface> surface_;
    std::shared_ptr<IGraphicsBinding> binding_;
    std::optional<VisibilityState> visibility_;
    uint32_t width_ = 0;
    uint32_t height_ = 0;
    float depth_near_ = 0.1f;
    float depth_far_ = 1000.0f;
    bool intrinsics_applied_ = false;
    bool subsystems_started_ = false;
    // Acquisition failed; no SessionEnded for this session
    bool failed_ = false;

    std::optional<std::promise<void>> start_promise_;
    std::vector<std::promise<void>> end_promises_;

    std::shared_ptr<HitTest> hit_test_;
    std::shared_ptr<LightEstimation> light_estimation_;
    std::shared_ptr<ImageTracking> image_tracking_;
    std::shared_ptr<Anchors> anchors_;
    std::shared_ptr<PlaneDetection> plane_detection_;
    std::shared_ptr<DepthSensing> depth_sensing_;
    std::shared_ptr<MeshDetection> mesh_detection_;
    std::vector<std::shared_ptr<DetectionSubsystem>> subsystems_;

    std::unique_ptr<McapRecorder> recorder_;
};

} // namespace immersive
