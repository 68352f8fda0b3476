// SPDX-FileCopyrightText: Copyright (c) 2025 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#include "inc/oxr/openxr_device.hpp"

#include <oxr_utils/pose_conversions.hpp>

#include <algorithm>
#include <cstring>
#include <iostream>
#include <stdexcept>

namespace immersive
{

namespace
{

constexpr const char* kHeadlessExtension = "XR_MND_headless";
constexpr const char* kPlaneDetectionExtension = "XR_EXT_plane_detection";

// One sample of a headless session
class OpenXRFrame : public IFrame
{
public:
    OpenXRFrame(XrTime time, XrSpace view_space, std::vector<PlaneRecord> planes)
        : time_(time), view_space_(view_space), planes_(std::move(planes))
    {
    }

    XrTime predicted_display_time() const override
    {
        return time_;
    }

    std::optional<ViewerPose> viewer_pose(const IReferenceSpace& space) const override
    {
        const auto* xr_space = dynamic_cast<const OpenXRReferenceSpace*>(&space);
        if (xr_space == nullptr)
        {
            std::cerr << "OpenXRFrame: Reference space does not belong to an OpenXR session" << std::endl;
            return std::nullopt;
        }

        XrSpaceLocation location{ XR_TYPE_SPACE_LOCATION };
        XrResult result = xrLocateSpace(view_space_, xr_space->handle(), time_, &location);
        if (XR_FAILED(result))
        {
            std::cerr << "OpenXRFrame: xrLocateSpace failed: " << result << std::endl;
            return std::nullopt;
        }

        constexpr XrSpaceLocationFlags kValid =
            XR_SPACE_LOCATION_POSITION_VALID_BIT | XR_SPACE_LOCATION_ORIENTATION_VALID_BIT;
        if ((location.locationFlags & kValid) != kValid)
        {
            return std::nullopt;
        }

        // Headless sessions have no views to render
        return ViewerPose{ .transform = location.pose, .views = {} };
    }

    std::vector<PlaneRecord> detected_planes() const override
    {
        return planes_;
    }

    std::vector<MeshRecord> detected_meshes() const override
    {
        return {};
    }

    std::vector<AnchorRecord> tracked_anchors() const override
    {
        return {};
    }

    std::vector<ImageTrackingResultRecord> image_tracking_results() const override
    {
        return {};
    }

    std::vector<HitTestResultsRecord> hit_test_results() const override
    {
        return {};
    }

    std::optional<LightEstimateRecord> light_estimate(DeviceId /*probe*/) const override
    {
        return std::nullopt;
    }

    std::optional<DepthInformationRecord> depth_information() const override
    {
        return std::nullopt;
    }

    void create_anchor(const XrPosef& /*pose*/,
                       std::function<void(DeviceId)> /*on_success*/,
                       FailureCallback on_failure) const override
    {
        on_failure("Anchors are not supported by the OpenXR backend");
    }

private:
    XrTime time_;
    XrSpace view_space_;
    std::vector<PlaneRecord> planes_;
};

bool is_granted(const std::vector<Feature>& granted, Feature feature)
{
    return std::find(granted.begin(), granted.end(), feature) != granted.end();
}

} // namespace

// ============================================================================
// OpenXRDeviceSession
// ============================================================================

OpenXRDeviceSession::OpenXRDeviceSession(SessionType type, std::vector<Feature> granted)
    : type_(type), granted_(std::move(granted))
{
}

OpenXRDeviceSession::~OpenXRDeviceSession()
{
    if (running_ && session_)
    {
        xrEndSession(session_.get());
        running_ = false;
    }
    // RAII cleanup - detector, spaces, session and instance are destroyed in that order
}

std::vector<std::string> OpenXRDeviceSession::get_required_extensions(const std::vector<Feature>& granted)
{
    std::set<std::string> all_extensions;

    all_extensions.insert(kHeadlessExtension);

    // Required for getting the time without a frame loop
    for (const auto& ext : XrTimeConverter::get_required_extensions())
    {
        all_extensions.insert(ext);
    }

    if (is_granted(granted, Feature::PlaneDetection))
    {
        all_extensions.insert(kPlaneDetectionExtension);
    }

    return std::vector<std::string>(all_extensions.begin(), all_extensions.end());
}

std::shared_ptr<OpenXRDeviceSession> OpenXRDeviceSession::create(const OpenXRDeviceConfig& config,
                                                                 SessionType type,
                                                                 const std::vector<Feature>& granted)
{
    auto session = std::shared_ptr<OpenXRDeviceSession>(new OpenXRDeviceSession(type, granted));

    // These methods throw on failure
    session->create_instance(config);
    session->create_system();
    session->create_session();

    session->time_converter_ = std::make_unique<XrTimeConverter>(session->instance(), ::xrGetInstanceProcAddr);
    if (is_granted(granted, Feature::PlaneDetection))
    {
        session->plane_detector_ =
            std::make_unique<PlaneDetector>(session->instance(), session->handle(), ::xrGetInstanceProcAddr);
    }

    session->begin();
    return session;
}

void OpenXRDeviceSession::create_instance(const OpenXRDeviceConfig& config)
{
    XrInstanceCreateInfo create_info{ XR_TYPE_INSTANCE_CREATE_INFO };
    create_info.applicationInfo.apiVersion = XR_CURRENT_API_VERSION;
    strncpy(create_info.applicationInfo.applicationName, config.app_name.c_str(), XR_MAX_APPLICATION_NAME_SIZE - 1);
    strncpy(create_info.applicationInfo.engineName, "immersive", XR_MAX_ENGINE_NAME_SIZE - 1);

    std::set<std::string> unique_extensions(config.extensions.begin(), config.extensions.end());
    for (const auto& ext : get_required_extensions(granted_))
    {
        unique_extensions.insert(ext);
    }
    std::vector<std::string> all_extensions(unique_extensions.begin(), unique_extensions.end());

    // Convert vector<string> to array of const char* for OpenXR API
    std::vector<const char*> extension_ptrs;
    for (const auto& ext : all_extensions)
    {
        extension_ptrs.push_back(ext.c_str());
    }

    create_info.enabledExtensionCount = static_cast<uint32_t>(extension_ptrs.size());
    create_info.enabledExtensionNames = extension_ptrs.empty() ? nullptr : extension_ptrs.data();

    XrInstance instance = XR_NULL_HANDLE;
    XrResult result = xrCreateInstance(&create_info, &instance);
    if (XR_FAILED(result))
    {
        throw std::runtime_error("Failed to create OpenXR instance: " + std::to_string(result));
    }
    instance_ = XrInstancePtr(instance, xrDestroyInstance);

    std::cout << "OpenXRDeviceSession: Created OpenXR instance with " << all_extensions.size() << " extensions"
              << std::endl;
}

void OpenXRDeviceSession::create_system()
{
    XrSystemGetInfo system_info{ XR_TYPE_SYSTEM_GET_INFO };
    system_info.formFactor = XR_FORM_FACTOR_HEAD_MOUNTED_DISPLAY;

    XrResult result = xrGetSystem(instance_.get(), &system_info, &system_id_);
    if (XR_FAILED(result))
    {
        throw std::runtime_error("Failed to get OpenXR system: " + std::to_string(result));
    }
}

void OpenXRDeviceSession::create_session()
{
    XrSessionCreateInfo create_info{ XR_TYPE_SESSION_CREATE_INFO };
    create_info.systemId = system_id_;

    XrSession session = XR_NULL_HANDLE;
    XrResult result = xrCreateSession(instance_.get(), &create_info, &session);
    if (XR_FAILED(result))
    {
        throw std::runtime_error("Failed to create OpenXR session: " + std::to_string(result));
    }
    session_ = XrSessionPtr(session, xrDestroySession);

    XrReferenceSpaceCreateInfo space_info{ XR_TYPE_REFERENCE_SPACE_CREATE_INFO };
    space_info.referenceSpaceType = XR_REFERENCE_SPACE_TYPE_VIEW;
    space_info.poseInReferenceSpace = identity_xr_posef();

    XrSpace view_space = XR_NULL_HANDLE;
    result = xrCreateReferenceSpace(session_.get(), &space_info, &view_space);
    if (XR_FAILED(result))
    {
        throw std::runtime_error("Failed to create view space: " + std::to_string(result));
    }
    view_space_ = XrSpacePtr(view_space, xrDestroySpace);

    std::cout << "OpenXRDeviceSession: Created " << to_string(type_) << " session (headless mode)" << std::endl;
}

void OpenXRDeviceSession::begin()
{
    // Enumerate view configurations to find a valid one
    uint32_t view_config_count = 0;
    XrResult result = xrEnumerateViewConfigurations(instance_.get(), system_id_, 0, &view_config_count, nullptr);
    if (XR_FAILED(result) || view_config_count == 0)
    {
        throw std::runtime_error("Failed to enumerate view configurations: " + std::to_string(result));
    }

    std::vector<XrViewConfigurationType> view_configs(view_config_count);
    result = xrEnumerateViewConfigurations(
        instance_.get(), system_id_, view_config_count, &view_config_count, view_configs.data());
    if (XR_FAILED(result))
    {
        throw std::runtime_error("Failed to get view configurations: " + std::to_string(result));
    }

    // Prefer primary stereo, otherwise use the first available
    XrViewConfigurationType selected_view_config = view_configs[0];
    for (const auto& config : view_configs)
    {
        if (config == XR_VIEW_CONFIGURATION_TYPE_PRIMARY_STEREO)
        {
            selected_view_config = config;
            break;
        }
    }

    XrSessionBeginInfo begin_info{ XR_TYPE_SESSION_BEGIN_INFO };
    begin_info.primaryViewConfigurationType = selected_view_config;

    result = xrBeginSession(session_.get(), &begin_info);
    if (XR_FAILED(result))
    {
        throw std::runtime_error("Failed to begin OpenXR session: " + std::to_string(result));
    }
    running_ = true;
}

void OpenXRDeviceSession::poll_events()
{
    if (ended_)
    {
        return;
    }

    // Keep this session alive while handlers run
    auto self = shared_from_this();

    XrEventDataBuffer event{ XR_TYPE_EVENT_DATA_BUFFER };
    while (!ended_ && xrPollEvent(instance_.get(), &event) == XR_SUCCESS)
    {
        switch (event.type)
        {
        case XR_TYPE_EVENT_DATA_SESSION_STATE_CHANGED:
        {
            const auto* changed = reinterpret_cast<const XrEventDataSessionStateChanged*>(&event);
            on_state_changed(changed->state);
            break;
        }
        case XR_TYPE_EVENT_DATA_INSTANCE_LOSS_PENDING:
            std::cerr << "OpenXRDeviceSession: Instance loss pending" << std::endl;
            finish();
            break;
        default:
            break;
        }
        event = XrEventDataBuffer{ XR_TYPE_EVENT_DATA_BUFFER };
    }
}

void OpenXRDeviceSession::on_state_changed(XrSessionState state)
{
    switch (state)
    {
    case XR_SESSION_STATE_READY:
        if (!running_)
        {
            try
            {
                begin();
            }
            catch (const std::exception& e)
            {
                std::cerr << "OpenXRDeviceSession: " << e.what() << std::endl;
                finish();
            }
        }
        break;
    case XR_SESSION_STATE_SYNCHRONIZED:
        set_visibility(VisibilityState::Hidden);
        break;
    case XR_SESSION_STATE_VISIBLE:
        set_visibility(VisibilityState::VisibleBlurred);
        break;
    case XR_SESSION_STATE_FOCUSED:
        set_visibility(VisibilityState::Visible);
        break;
    case XR_SESSION_STATE_STOPPING:
        set_visibility(VisibilityState::Hidden);
        if (running_)
        {
            XrResult result = xrEndSession(session_.get());
            if (XR_FAILED(result))
            {
                std::cerr << "OpenXRDeviceSession: xrEndSession failed: " << result << std::endl;
            }
            running_ = false;
        }
        break;
    case XR_SESSION_STATE_EXITING:
    case XR_SESSION_STATE_LOSS_PENDING:
        finish();
        break;
    default:
        break;
    }
}

void OpenXRDeviceSession::set_visibility(VisibilityState state)
{
    if (visibility_ == state)
    {
        return;
    }
    visibility_ = state;
    auto handler = visibility_handler_;
    if (handler)
    {
        handler(state);
    }
}

void OpenXRDeviceSession::finish()
{
    if (ended_)
    {
        return;
    }
    ended_ = true;
    plane_detector_.reset();

    std::cout << "OpenXRDeviceSession: Session ended" << std::endl;

    // Copy first: the handler may replace itself
    auto handler = end_handler_;
    if (handler)
    {
        handler();
    }
}

void OpenXRDeviceSession::end()
{
    if (ended_)
    {
        return;
    }

    XrResult result = xrRequestExitSession(session_.get());
    if (XR_FAILED(result))
    {
        std::cerr << "OpenXRDeviceSession: xrRequestExitSession failed: " << result << ", ending locally" << std::endl;
        if (running_)
        {
            xrEndSession(session_.get());
            running_ = false;
        }
        finish();
    }
    // Otherwise the runtime walks the session through STOPPING and EXITING, seen by poll_events()
}

void OpenXRDeviceSession::request_reference_space(ReferenceSpaceType type,
                                                  std::function<void(std::shared_ptr<IReferenceSpace>)> on_success,
                                                  FailureCallback on_failure)
{
    if (ended_)
    {
        on_failure("Session has ended");
        return;
    }

    XrReferenceSpaceType xr_type = XR_REFERENCE_SPACE_TYPE_LOCAL;
    switch (type)
    {
    case ReferenceSpaceType::Viewer:
        xr_type = XR_REFERENCE_SPACE_TYPE_VIEW;
        break;
    case ReferenceSpaceType::Local:
        xr_type = XR_REFERENCE_SPACE_TYPE_LOCAL;
        break;
    case ReferenceSpaceType::LocalFloor:
    case ReferenceSpaceType::BoundedFloor:
        xr_type = XR_REFERENCE_SPACE_TYPE_STAGE;
        break;
    case ReferenceSpaceType::Unbounded:
        on_failure("Reference space unbounded is not supported");
        return;
    }

    XrReferenceSpaceCreateInfo create_info{ XR_TYPE_REFERENCE_SPACE_CREATE_INFO };
    create_info.referenceSpaceType = xr_type;
    create_info.poseInReferenceSpace = identity_xr_posef();

    XrSpace space = XR_NULL_HANDLE;
    XrResult result = xrCreateReferenceSpace(session_.get(), &create_info, &space);
    if (XR_FAILED(result))
    {
        on_failure("Failed to create reference space: " + std::to_string(result));
        return;
    }

    auto reference_space =
        std::make_shared<OpenXRReferenceSpace>(type, XrSpacePtr(space, xrDestroySpace), shared_from_this());
    base_space_ = reference_space;
    on_success(reference_space);
}

void OpenXRDeviceSession::update_render_state(const RenderState& state)
{
    // Headless: nothing is submitted, the state is only kept
    render_state_ = state;
}

std::unique_ptr<IFrame> OpenXRDeviceSession::next_frame()
{
    if (ended_)
    {
        return nullptr;
    }

    const XrTime time = time_converter_->os_monotonic_now();

    std::vector<PlaneRecord> planes;
    if (plane_detector_)
    {
        if (auto space = base_space_.lock())
        {
            try
            {
                plane_detector_->update(space->handle(), time);
            }
            catch (const std::exception& e)
            {
                std::cerr << "OpenXRDeviceSession: Plane detection failed: " << e.what() << std::endl;
            }
        }
        planes = plane_detector_->planes();
    }

    return std::make_unique<OpenXRFrame>(time, view_space_.get(), std::move(planes));
}

// ============================================================================
// OpenXRDeviceApi
// ============================================================================

OpenXRDeviceApi::OpenXRDeviceApi(OpenXRDeviceConfig config) : config_(std::move(config))
{
    uint32_t count = 0;
    XrResult result = xrEnumerateInstanceExtensionProperties(nullptr, 0, &count, nullptr);
    if (XR_FAILED(result))
    {
        std::cerr << "OpenXRDeviceApi: Warning - No OpenXR runtime available: " << result << std::endl;
        return;
    }

    std::vector<XrExtensionProperties> properties(count, XrExtensionProperties{ XR_TYPE_EXTENSION_PROPERTIES });
    result = xrEnumerateInstanceExtensionProperties(nullptr, count, &count, properties.data());
    if (XR_FAILED(result))
    {
        std::cerr << "OpenXRDeviceApi: Warning - Failed to enumerate extensions: " << result << std::endl;
        return;
    }
    properties.resize(count);

    for (const auto& property : properties)
    {
        extensions_.insert(property.extensionName);
    }
    std::cout << "OpenXRDeviceApi: Runtime offers " << extensions_.size() << " extensions" << std::endl;
}

bool OpenXRDeviceApi::supports(Feature feature) const
{
    switch (feature)
    {
    case Feature::PlaneDetection:
        return has_extension(kPlaneDetectionExtension);
    default:
        return false;
    }
}

void OpenXRDeviceApi::is_session_supported(SessionType type,
                                           std::function<void(bool)> on_result,
                                           FailureCallback /*on_failure*/)
{
    on_result(type != SessionType::Inline && has_extension(kHeadlessExtension));
}

void OpenXRDeviceApi::request_session(SessionType type,
                                      const FeatureRequest& request,
                                      std::function<void(std::shared_ptr<IDeviceSession>)> on_success,
                                      FailureCallback on_failure)
{
    if (type == SessionType::Inline || !has_extension(kHeadlessExtension))
    {
        on_failure("Session type " + std::string(to_string(type)) + " is not supported");
        return;
    }

    for (const auto& name : request.required_features)
    {
        auto space = reference_space_type_from_string(name);
        if (!space || *space == ReferenceSpaceType::Unbounded)
        {
            on_failure("Required feature " + name + " is not supported");
            return;
        }
    }

    std::vector<Feature> granted;
    if (request.requests(to_string(Feature::PlaneDetection)) && supports(Feature::PlaneDetection))
    {
        granted.push_back(Feature::PlaneDetection);
    }

    std::shared_ptr<OpenXRDeviceSession> session;
    try
    {
        session = OpenXRDeviceSession::create(config_, type, granted);
    }
    catch (const std::exception& e)
    {
        on_failure(e.what());
        return;
    }
    on_success(session);
}

} // namespace immersive
