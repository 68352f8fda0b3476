// SPDX-FileCopyrightText: Copyright (c) 2025 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#include "inc/session/session_manager.hpp"

#include <mcap_recorder.hpp>
#include <oxr_utils/os_time.hpp>

#include <array>
#include <cmath>
#include <cstdlib>
#include <iostream>
#include <stdexcept>

namespace immersive
{

namespace
{

constexpr std::array<SessionType, 3> kSessionTypes = { SessionType::Inline, SessionType::VR, SessionType::AR };

constexpr std::array<Feature, 10> kFeatures = { Feature::HitTest,      Feature::LightEstimation, Feature::ImageTracking,
                                                Feature::PlaneDetection, Feature::MeshDetection, Feature::Anchors,
                                                Feature::DepthSensing,   Feature::CameraAccess,  Feature::DomOverlay,
                                                Feature::HandTracking };

constexpr float kRadToDeg = 180.0f / 3.14159265358979323846f;

std::future<void> rejected(ErrorCode code, const std::string& message)
{
    std::promise<void> promise;
    promise.set_exception(std::make_exception_ptr(SessionError(code, message)));
    return promise.get_future();
}

} // namespace

std::string_view to_string(SessionState state)
{
    switch (state)
    {
    case SessionState::Idle:
        return "idle";
    case SessionState::Starting:
        return "starting";
    case SessionState::Running:
        return "running";
    case SessionState::Ending:
        return "ending";
    }
    return "unknown";
}

// ============================================================================
// Construction
// ============================================================================

SessionManager::SessionManager(std::shared_ptr<IDeviceApi> device_api, HostCollaborators host, SessionManagerConfig config)
    : device_api_(std::move(device_api)),
      host_(std::move(host)),
      config_(std::move(config)),
      negotiator_(device_api_, host_.image_decoder)
{
    if (!device_api_)
    {
        throw std::runtime_error("SessionManager: device api cannot be null");
    }
    if (!host_.graphics)
    {
        throw std::runtime_error("SessionManager: graphics device cannot be null");
    }

    hit_test_ = std::make_shared<HitTest>(device_api_->supports(Feature::HitTest));
    light_estimation_ = std::make_shared<LightEstimation>();
    image_tracking_ = std::make_shared<ImageTracking>(device_api_->supports(Feature::ImageTracking));
    anchors_ = std::make_shared<Anchors>(device_api_->supports(Feature::Anchors));
    plane_detection_ = std::make_shared<PlaneDetection>(device_api_->supports(Feature::PlaneDetection));
    depth_sensing_ = std::make_shared<DepthSensing>(device_api_->supports(Feature::DepthSensing));
    mesh_detection_ = std::make_shared<MeshDetection>(device_api_->supports(Feature::MeshDetection));

    // Per-frame dispatch order
    subsystems_ = { hit_test_, light_estimation_, image_tracking_, anchors_, plane_detection_, depth_sensing_,
                    mesh_detection_ };

    for (SessionType type : kSessionTypes)
    {
        available_[type] = false;
    }
    poll_availability();
}

SessionManager::~SessionManager()
{
    alive_.reset();

    if (session_)
    {
        std::cout << "SessionManager: Ending " << to_string(state_) << " session on shutdown" << std::endl;
        if (camera_)
        {
            if (clip_listener_)
            {
                camera_->remove_clip_listener(*clip_listener_);
            }
            camera_->set_device_session(nullptr);
        }
        state_ = SessionState::Ending;
        session_->set_end_handler(nullptr);
        session_->set_visibility_handler(nullptr);
        session_->end();
    }

    // Rejects outstanding requests and detaches entities that callers may still hold
    if (subsystems_started_)
    {
        for (const auto& subsystem : subsystems_)
        {
            subsystem->on_session_end();
        }
        subsystems_started_ = false;
    }
}

std::set<Feature> SessionManager::supported_features() const
{
    std::set<Feature> supported;
    for (Feature feature : kFeatures)
    {
        if (device_api_->supports(feature))
        {
            supported.insert(feature);
        }
    }
    return supported;
}

bool SessionManager::is_available(SessionType type) const
{
    auto it = available_.find(type);
    return it != available_.end() && it->second;
}

std::optional<VisibilityState> SessionManager::visibility_state() const
{
    if (!session_)
    {
        return std::nullopt;
    }
    return visibility_;
}

// ============================================================================
// Availability
// ============================================================================

void SessionManager::poll_availability()
{
    std::weak_ptr<bool> alive = alive_;
    for (SessionType type : kSessionTypes)
    {
        device_api_->is_session_supported(
            type,
            [this, alive, type](bool available)
            {
                if (alive.expired() || available_[type] == available)
                {
                    return;
                }
                available_[type] = available;
                emitter_.emit(AvailabilityChanged{ .type = type, .available = available });
            },
            [this, alive](const std::string& message)
            {
                if (alive.expired())
                {
                    return;
                }
                report_error(message);
            });
    }
}

void SessionManager::on_device_changed()
{
    poll_availability();
}

// ============================================================================
// Start
// ============================================================================

std::future<void> SessionManager::start(std::shared_ptr<ICamera> camera,
                                        SessionType type,
                                        ReferenceSpaceType space_type,
                                        const StartOptions& options)
{
    if (!camera)
    {
        throw std::invalid_argument("SessionManager: camera cannot be null");
    }
    if (!is_available(type))
    {
        return rejected(ErrorCode::NotAvailable, "XR is not available");
    }
    if (state_ != SessionState::Idle)
    {
        return rejected(ErrorCode::AlreadyActive, "XR session is already started");
    }

    std::cout << "SessionManager: Starting " << to_string(type) << " session in " << to_string(space_type)
              << " space" << std::endl;

    start_promise_.emplace();
    auto future = start_promise_->get_future();

    camera_ = std::move(camera);
    type_ = type;
    space_type_ = space_type;
    options_ = options;
    failed_ = false;
    state_ = SessionState::Starting;
    set_clip_planes(camera_->near_clip(), camera_->far_clip());

    std::weak_ptr<bool> alive = alive_;
    negotiator_.negotiate(
        type, space_type, options, supported_features(), image_tracking_.get(),
        [this, alive](std::shared_ptr<IDeviceSession> session)
        {
            if (alive.expired())
            {
                session->end();
                return;
            }
            on_session_granted(session);
        },
        [this, alive](const SessionError& error)
        {
            if (alive.expired())
            {
                return;
            }
            on_negotiation_failed(error);
        });

    return future;
}

void SessionManager::on_negotiation_failed(const SessionError& error)
{
    if (state_ != SessionState::Starting || session_)
    {
        return;
    }

    std::cerr << "SessionManager: Failed to start session: " << error.what() << std::endl;

    camera_ = nullptr;
    type_.reset();
    space_type_.reset();
    state_ = SessionState::Idle;

    reject_start(error);
    emitter_.emit(SessionErrorEvent{ error.what() });
}

void SessionManager::on_session_granted(const std::shared_ptr<IDeviceSession>& session)
{
    if (state_ != SessionState::Starting || session_)
    {
        // Nobody is waiting for this session any more
        session->end();
        return;
    }

    session_ = session;
    visibility_ = session->visibility_state();

    std::weak_ptr<bool> alive = alive_;
    IDeviceSession* raw = session.get();

    session->set_end_handler(
        [this, alive, raw]()
        {
            if (alive.expired() || session_.get() != raw)
            {
                return;
            }
            on_device_session_end();
        });
    session->set_visibility_handler(
        [this, alive, raw](VisibilityState state)
        {
            if (alive.expired() || session_.get() != raw)
            {
                return;
            }
            visibility_ = state;
            emitter_.emit(VisibilityChanged{ state });
        });

    camera_->set_device_session(session);
    clip_listener_ = camera_->add_clip_listener(
        [this, alive](float near_clip, float far_clip)
        {
            if (alive.expired())
            {
                return;
            }
            set_clip_planes(near_clip, far_clip);
        });

    try
    {
        create_surface();
    }
    catch (const std::exception& e)
    {
        fail_acquisition(SessionError(ErrorCode::SurfaceFailed, std::string("Failed to create surface: ") + e.what()));
        return;
    }

    session->request_reference_space(
        *space_type_,
        [this, alive, raw](std::shared_ptr<IReferenceSpace> space)
        {
            if (alive.expired() || session_.get() != raw || state_ != SessionState::Starting)
            {
                return;
            }
            if (!space)
            {
                fail_acquisition(SessionError(ErrorCode::ReferenceSpaceFailed, "Device returned no reference space"));
                return;
            }
            on_reference_space(space);
        },
        [this, alive, raw](const std::string& message)
        {
            if (alive.expired() || session_.get() != raw || state_ != SessionState::Starting)
            {
                return;
            }
            fail_acquisition(SessionError(ErrorCode::ReferenceSpaceFailed, message));
        });
}

void SessionManager::on_reference_space(const std::shared_ptr<IReferenceSpace>& space)
{
    reference_space_ = space;

    const SessionContext context{ .session = session_, .type = *type_, .reference_space = space };
    subsystems_started_ = true;
    for (const auto& subsystem : subsystems_)
    {
        subsystem->on_session_start(context);
    }

    warn_missing_features();
    start_recording();

    state_ = SessionState::Running;
    std::cout << "SessionManager: " << to_string(*type_) << " session running" << std::endl;

    if (start_promise_)
    {
        start_promise_->set_value();
        start_promise_.reset();
    }
    emitter_.emit(SessionStarted{});
}

void SessionManager::fail_acquisition(const SessionError& error)
{
    std::cerr << "SessionManager: Failed to start session: " << error.what() << std::endl;

    failed_ = true;
    auto session = session_;
    session->set_end_handler(nullptr);
    teardown();

    // The device would otherwise keep the granted session running
    session->end();

    reject_start(error);
    emitter_.emit(SessionErrorEvent{ error.what() });
}

void SessionManager::warn_missing_features() const
{
    const auto request = SessionNegotiator::build_request(*type_, *space_type_, options_, supported_features());
    for (const auto& name : request.optional_features)
    {
        auto feature = feature_from_string(name);
        if (feature && !session_->has_feature(*feature))
        {
            std::cerr << "SessionManager: Warning - " << name << " was requested but not granted" << std::endl;
        }
    }
}

void SessionManager::create_surface()
{
    const float device_pixel_ratio = host_.graphics->device_pixel_ratio();
    const float scale = device_pixel_ratio > 0.0f ? host_.graphics->max_pixel_ratio() / device_pixel_ratio : 1.0f;

    SurfaceBundle bundle = host_.graphics->create_surface(*session_, scale);
    if (!bundle.surface)
    {
        throw std::runtime_error("graphics device returned no surface");
    }
    surface_ = std::move(bundle.surface);
    binding_ = std::move(bundle.binding);

    session_->update_render_state(RenderState{ .surface = surface_, .depth_near = depth_near_, .depth_far = depth_far_ });
}

void SessionManager::set_clip_planes(float near_clip, float far_clip)
{
    if (depth_near_ == near_clip && depth_far_ == far_clip)
    {
        return;
    }
    depth_near_ = near_clip;
    depth_far_ = far_clip;
    if (!session_)
    {
        return;
    }
    session_->update_render_state(RenderState{ .surface = surface_, .depth_near = depth_near_, .depth_far = depth_far_ });
}

// ============================================================================
// End
// ============================================================================

std::future<void> SessionManager::end()
{
    switch (state_)
    {
    case SessionState::Idle:
        return rejected(ErrorCode::NotActive, "XR session is not initialized");
    case SessionState::Starting:
        return rejected(ErrorCode::NotEstablished, "XR session is not yet established");
    case SessionState::Ending:
        return rejected(ErrorCode::NotActive, "XR session is already ending");
    case SessionState::Running:
        break;
    }

    std::cout << "SessionManager: Ending session" << std::endl;

    state_ = SessionState::Ending;
    binding_ = nullptr;

    end_promises_.emplace_back();
    auto future = end_promises_.back().get_future();

    // The end handler may run inside this call
    auto session = session_;
    session->end();
    return future;
}

void SessionManager::on_device_session_end()
{
    const bool was_starting = state_ == SessionState::Starting;

    // The end handler is running; it stays attached and is ignored once session_ is cleared
    teardown();

    if (was_starting)
    {
        const SessionError error(ErrorCode::SessionEnded, "XR session ended before it started");
        std::cerr << "SessionManager: " << error.what() << std::endl;
        reject_start(error);
        emitter_.emit(SessionErrorEvent{ error.what() });
    }
    else if (!failed_)
    {
        std::cout << "SessionManager: Session ended" << std::endl;
        emitter_.emit(SessionEnded{});
    }

    auto promises = std::move(end_promises_);
    end_promises_.clear();
    for (auto& promise : promises)
    {
        promise.set_value();
    }
}

void SessionManager::teardown()
{
    // Listeners notified while the subsystems drain must not see a live session
    state_ = SessionState::Ending;

    if (camera_)
    {
        if (clip_listener_)
        {
            camera_->remove_clip_listener(*clip_listener_);
        }
        camera_->set_device_session(nullptr);
        camera_ = nullptr;
    }
    clip_listener_.reset();

    surface_ = nullptr;
    binding_ = nullptr;
    reference_space_ = nullptr;
    width_ = 0;
    height_ = 0;
    type_.reset();
    space_type_.reset();

    if (session_)
    {
        session_->set_visibility_handler(nullptr);
    }
    session_ = nullptr;
    visibility_.reset();

    if (subsystems_started_)
    {
        for (const auto& subsystem : subsystems_)
        {
            subsystem->on_session_end();
        }
        subsystems_started_ = false;
    }

    recorder_.reset();
    intrinsics_applied_ = false;
    state_ = SessionState::Idle;
}

void SessionManager::reject_start(const SessionError& error)
{
    if (start_promise_)
    {
        start_promise_->set_exception(std::make_exception_ptr(error));
        start_promise_.reset();
    }
}

void SessionManager::report_error(const std::string& message)
{
    std::cerr << "SessionManager: Error - " << message << std::endl;
    emitter_.emit(SessionErrorEvent{ message });
}

// ============================================================================
// Frame loop
// ============================================================================

bool SessionManager::update(const IFrame& frame)
{
    if (state_ != SessionState::Running || !session_)
    {
        return false;
    }

    // Anything below may end the session
    const auto session = session_;
    auto ended = [this, &session]() { return session_ != session; };

    if (surface_)
    {
        const uint32_t width = surface_->framebuffer_width();
        const uint32_t height = surface_->framebuffer_height();
        if (width != width_ || height != height_)
        {
            width_ = width;
            height_ = height;
            host_.graphics->set_resolution(width, height);
        }
    }

    auto pose = frame.viewer_pose(*reference_space_);
    if (!pose || ended())
    {
        return false;
    }

    if (host_.views)
    {
        host_.views->update(frame, pose->views);
        if (ended())
        {
            return false;
        }
    }

    if (!intrinsics_applied_ && !pose->views.empty())
    {
        apply_intrinsics(pose->views.front());
    }

    camera_->set_transform(pose->transform);

    if (host_.input)
    {
        host_.input->update(frame);
        if (ended())
        {
            return false;
        }
    }

    if (type_ == SessionType::AR)
    {
        for (const auto& subsystem : subsystems_)
        {
            if (!subsystem->update(frame))
            {
                std::cerr << "SessionManager: Warning - " << subsystem->get_name() << " update failed" << std::endl;
            }
            if (ended())
            {
                return false;
            }
        }
    }

    record(frame);
    emitter_.emit(FrameUpdated{ frame });
    return true;
}

void SessionManager::apply_intrinsics(const View& view)
{
    // Column-major projection matrix
    const auto& m = view.projection_matrix;

    CameraIntrinsics intrinsics;
    intrinsics.fov = 2.0f * std::atan(1.0f / m[5]) * kRadToDeg;
    intrinsics.aspect_ratio = m[5] / m[0];
    intrinsics.far_clip = m[14] / (m[10] + 1.0f);
    intrinsics.near_clip = m[14] / (m[10] - 1.0f);
    intrinsics.horizontal_fov = false;

    camera_->set_intrinsics(intrinsics);
    intrinsics_applied_ = true;
}

// ============================================================================
// Device loss, room capture
// ============================================================================

void SessionManager::on_device_lost()
{
    if (!session_)
    {
        return;
    }

    std::cout << "SessionManager: Graphics device lost, dropping surface" << std::endl;
    surface_ = nullptr;
    binding_ = nullptr;
    session_->update_render_state(RenderState{ .surface = nullptr, .depth_near = depth_near_, .depth_far = depth_far_ });
}

void SessionManager::on_device_restored()
{
    if (!session_)
    {
        return;
    }

    std::weak_ptr<bool> alive = alive_;
    IDeviceSession* raw = session_.get();
    host_.graphics->make_compatible(
        [this, alive, raw]()
        {
            if (alive.expired() || session_.get() != raw)
            {
                return;
            }
            try
            {
                create_surface();
                std::cout << "SessionManager: Surface rebuilt after device restore" << std::endl;
            }
            catch (const std::exception& e)
            {
                report_error(std::string("Failed to rebuild surface: ") + e.what());
            }
        },
        [this, alive](const std::string& message)
        {
            if (alive.expired())
            {
                return;
            }
            report_error(message);
        });
}

std::future<void> SessionManager::initiate_room_capture()
{
    if (!session_ || state_ != SessionState::Running)
    {
        return rejected(ErrorCode::NotActive, "Session is not active");
    }
    if (!session_->supports_room_capture())
    {
        return rejected(ErrorCode::FeatureUnavailable, "Session does not support manual room capture");
    }

    auto promise = std::make_shared<std::promise<void>>();
    auto future = promise->get_future();
    session_->initiate_room_capture(
        [promise]() { promise->set_value(); },
        [promise](const std::string& message)
        { promise->set_exception(std::make_exception_ptr(SessionError(ErrorCode::RequestFailed, message))); });
    return future;
}

// ============================================================================
// MCAP recording
// ============================================================================

void SessionManager::start_recording()
{
    std::string path = config_.mcap_recording_path;
    const char* env_path = std::getenv("IMMERSIVE_MCAP_RECORDING");
    if (env_path != nullptr && std::string(env_path) != "")
    {
        path = env_path;
    }
    if (path.empty())
    {
        return;
    }

    try
    {
        recorder_ = McapRecorder::create(path, subsystems_);
    }
    catch (const std::exception& e)
    {
        std::cerr << "SessionManager: Warning - Failed to start MCAP recording to " << path << ": " << e.what()
                  << std::endl;
    }
}

void SessionManager::record(const IFrame& frame)
{
    if (!recorder_)
    {
        return;
    }
    recorder_->record(Timestamp(frame.predicted_display_time(), os_monotonic_now_ns()));
}

} // namespace immersive
