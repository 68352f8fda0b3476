// SPDX-FileCopyrightText: Copyright (c) 2025 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#include "inc/session/session_negotiator.hpp"

#include <algorithm>
#include <iostream>

namespace immersive
{

namespace
{

// Moves `preferred` to the front of `values` without duplicating it
template <typename T>
void move_to_front(std::vector<T>& values, const std::optional<T>& preferred)
{
    if (!preferred)
    {
        return;
    }
    values.erase(std::remove(values.begin(), values.end(), *preferred), values.end());
    values.insert(values.begin(), *preferred);
}

void add_if(FeatureRequest& request, bool requested, const std::set<Feature>& supported, Feature feature)
{
    if (requested && supported.count(feature) > 0)
    {
        request.optional_features.emplace_back(to_string(feature));
    }
}

void request_session(const std::shared_ptr<IDeviceApi>& device_api,
                     SessionType type,
                     const FeatureRequest& request,
                     SessionNegotiator::GrantedCallback on_granted,
                     SessionNegotiator::ErrorCallback on_error)
{
    device_api->request_session(
        type, request,
        [on_granted, on_error](std::shared_ptr<IDeviceSession> session)
        {
            if (!session)
            {
                on_error(SessionError(ErrorCode::NegotiationFailed, "Device granted no session"));
                return;
            }
            on_granted(std::move(session));
        },
        [on_error](const std::string& message) { on_error(SessionError(ErrorCode::NegotiationFailed, message)); });
}

} // namespace

FeatureRequest SessionNegotiator::build_request(SessionType type,
                                                ReferenceSpaceType space_type,
                                                const StartOptions& options,
                                                const std::set<Feature>& supported)
{
    FeatureRequest request;
    request.required_features.emplace_back(to_string(space_type));

    if (type == SessionType::AR)
    {
        request.optional_features.emplace_back(to_string(Feature::HitTest));
        request.optional_features.emplace_back(to_string(Feature::LightEstimation));

        add_if(request, options.image_tracking, supported, Feature::ImageTracking);
        add_if(request, options.plane_detection, supported, Feature::PlaneDetection);
        add_if(request, options.mesh_detection, supported, Feature::MeshDetection);
        add_if(request, options.anchors, supported, Feature::Anchors);

        if (options.depth_sensing && supported.count(Feature::DepthSensing) > 0)
        {
            request.optional_features.emplace_back(to_string(Feature::DepthSensing));

            DepthSensingRequest depth{ .usage_preference = { DepthUsage_CPU },
                                       .data_format_preference = { DepthFormat_LuminanceAlpha } };
            move_to_front(depth.usage_preference, options.depth_sensing->usage_preference);
            move_to_front(depth.data_format_preference, options.depth_sensing->data_format_preference);
            request.depth_sensing = std::move(depth);
        }

        add_if(request, options.camera_color, supported, Feature::CameraAccess);

        if (options.dom_overlay_root && supported.count(Feature::DomOverlay) > 0)
        {
            request.optional_features.emplace_back(to_string(Feature::DomOverlay));
            request.dom_overlay_root = options.dom_overlay_root;
        }
    }
    else if (type == SessionType::VR)
    {
        request.optional_features.emplace_back(to_string(Feature::HandTracking));
    }

    request.optional_features.insert(
        request.optional_features.end(), options.optional_features.begin(), options.optional_features.end());

    return request;
}

void SessionNegotiator::negotiate(SessionType type,
                                  ReferenceSpaceType space_type,
                                  const StartOptions& options,
                                  const std::set<Feature>& supported,
                                  ImageTracking* image_tracking,
                                  GrantedCallback on_granted,
                                  ErrorCallback on_error)
{
    auto request = std::make_shared<FeatureRequest>(build_request(type, space_type, options, supported));

    const bool needs_images = image_tracking != nullptr && !image_tracking->images().empty() &&
                              request->requests(to_string(Feature::ImageTracking));
    if (!needs_images)
    {
        request_session(device_api_, type, *request, std::move(on_granted), std::move(on_error));
        return;
    }

    if (!image_decoder_)
    {
        on_error(SessionError(ErrorCode::ImagePreparationFailed, "No image decoder to prepare reference images"));
        return;
    }

    std::cout << "SessionNegotiator: Preparing " << image_tracking->images().size() << " reference images"
              << std::endl;

    image_tracking->prepare(
        *image_decoder_,
        [device_api = device_api_, type, request, on_granted, on_error](std::vector<TrackedImageRequest> tracked_images)
        {
            request->tracked_images = std::move(tracked_images);
            request_session(device_api, type, *request, on_granted, on_error);
        },
        [on_error](const std::string& message) { on_error(SessionError(ErrorCode::ImagePreparationFailed, message)); });
}

} // namespace immersive
