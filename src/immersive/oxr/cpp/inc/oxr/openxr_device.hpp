// SPDX-FileCopyrightText: Copyright (c) 2025 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include "plane_detector.hpp"

#include <device/device_api.hpp>
#include <openxr/openxr.h>
#include <oxr_utils/oxr_funcs.hpp>
#include <oxr_utils/oxr_time.hpp>

#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace immersive
{

struct OpenXRDeviceConfig
{
    std::string app_name = "immersive";
    // Extra instance extensions to enable
    std::vector<std::string> extensions;
};

// Reference space created on an OpenXR session
class OpenXRReferenceSpace : public IReferenceSpace
{
public:
    OpenXRReferenceSpace(ReferenceSpaceType type, XrSpacePtr space, std::shared_ptr<const void> owner)
        : type_(type), space_(std::move(space)), owner_(std::move(owner))
    {
    }

    ReferenceSpaceType type() const override
    {
        return type_;
    }

    XrSpace handle() const
    {
        return space_.get();
    }

private:
    ReferenceSpaceType type_;
    XrSpacePtr space_;
    // Keeps the session alive while the space exists
    std::shared_ptr<const void> owner_;
};

/**
 * @brief Headless OpenXR session (XR_MND_headless).
 *
 * There is no frame loop: the host calls poll_events() and next_frame() from
 * its own tick. Frames sample the device at the current host time converted to
 * XrTime, report the viewer pose without views and, when XR_EXT_plane_detection
 * was granted, the detected planes.
 */
class OpenXRDeviceSession : public IDeviceSession, public std::enable_shared_from_this<OpenXRDeviceSession>
{
public:
    // Throws std::runtime_error on any OpenXR failure
    static std::shared_ptr<OpenXRDeviceSession> create(const OpenXRDeviceConfig& config,
                                                       SessionType type,
                                                       const std::vector<Feature>& granted);

    ~OpenXRDeviceSession() override;

    static std::vector<std::string> get_required_extensions(const std::vector<Feature>& granted);

    // Drains the OpenXR event queue; may fire the end and visibility handlers
    void poll_events();

    // Samples the device now. Returns nullptr once the session ended.
    std::unique_ptr<IFrame> next_frame();

    bool ended() const
    {
        return ended_;
    }

    XrInstance instance() const
    {
        return instance_.get();
    }

    XrSession handle() const
    {
        return session_.get();
    }

    // IDeviceSession
    std::vector<Feature> enabled_features() const override
    {
        return granted_;
    }
    VisibilityState visibility_state() const override
    {
        return visibility_;
    }
    void end() override;
    void request_reference_space(ReferenceSpaceType type,
                                 std::function<void(std::shared_ptr<IReferenceSpace>)> on_success,
                                 FailureCallback on_failure) override;
    void update_render_state(const RenderState& state) override;
    void set_end_handler(std::function<void()> handler) override
    {
        end_handler_ = std::move(handler);
    }
    void set_visibility_handler(std::function<void(VisibilityState)> handler) override
    {
        visibility_handler_ = std::move(handler);
    }

private:
    OpenXRDeviceSession(SessionType type, std::vector<Feature> granted);

    void create_instance(const OpenXRDeviceConfig& config);
    void create_system();
    void create_session();
    void begin();

    void on_state_changed(XrSessionState state);
    void set_visibility(VisibilityState state);
    void finish();

    SessionType type_;
    std::vector<Feature> granted_;

    XrInstancePtr instance_;
    XrSystemId system_id_ = XR_NULL_SYSTEM_ID;
    XrSessionPtr session_;
    XrSpacePtr view_space_;
    std::unique_ptr<XrTimeConverter> time_converter_;
    std::unique_ptr<PlaneDetector> plane_detector_;

    // Space of the most recent reference space request, used as plane detection base
    std::weak_ptr<OpenXRReferenceSpace> base_space_;

    RenderState render_state_;
    VisibilityState visibility_ = VisibilityState::Hidden;
    bool running_ = false;
    bool ended_ = false;
    std::function<void()> end_handler_;
    std::function<void(VisibilityState)> visibility_handler_;
};

/**
 * @brief Device API backed by the installed OpenXR runtime.
 *
 * Inline sessions are not offered. Immersive sessions are available when the
 * runtime exposes XR_MND_headless; plane detection when it exposes
 * XR_EXT_plane_detection.
 */
class OpenXRDeviceApi : public IDeviceApi
{
public:
    explicit OpenXRDeviceApi(OpenXRDeviceConfig config = {});

    bool supports(Feature feature) const override;

    void is_session_supported(SessionType type,
                              std::function<void(bool)> on_result,
                              FailureCallback on_failure) override;

    void request_session(SessionType type,
                         const FeatureRequest& request,
                         std::function<void(std::shared_ptr<IDeviceSession>)> on_success,
                         FailureCallback on_failure) override;

    bool has_extension(const std::string& name) const
    {
        return extensions_.count(name) > 0;
    }

private:
    OpenXRDeviceConfig config_;
    std::set<std::string> extensions_;
};

} // namespace immersive
