// SPDX-FileCopyrightText: Copyright (c) 2025 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include "session_error.hpp"
#include "start_options.hpp"

#include <detection/image_tracking.hpp>
#include <device/device_api.hpp>
#include <device/host.hpp>

#include <functional>
#include <memory>
#include <set>
#include <utility>

namespace immersive
{

/**
 * @brief Turns start options into a device FeatureRequest and requests the session.
 *
 * The request always requires the reference space. AR sessions always ask for
 * hit-test and light-estimation; every other optional feature is asked for only
 * when the caller requested it and the platform supports it. Reference images
 * are decoded before the device is contacted, so a bad image fails negotiation
 * without any device request.
 */
class SessionNegotiator
{
public:
    using GrantedCallback = std::function<void(std::shared_ptr<IDeviceSession>)>;
    using ErrorCallback = std::function<void(const SessionError&)>;

    // image_decoder may be null when reference images are never registered
    SessionNegotiator(std::shared_ptr<IDeviceApi> device_api, std::shared_ptr<IImageDecoder> image_decoder)
        : device_api_(std::move(device_api)), image_decoder_(std::move(image_decoder))
    {
    }

    /**
     * @brief Builds the FeatureRequest without tracked images.
     *
     * @param supported Features the platform supports.
     */
    static FeatureRequest build_request(SessionType type,
                                        ReferenceSpaceType space_type,
                                        const StartOptions& options,
                                        const std::set<Feature>& supported);

    /**
     * @brief Prepares reference images if needed, then requests the session.
     *
     * Exactly one of on_granted / on_error fires, exactly once. Errors carry
     * ImagePreparationFailed or NegotiationFailed.
     *
     * @param image_tracking Source of the reference images, may be null.
     */
    void negotiate(SessionType type,
                   ReferenceSpaceType space_type,
                   const StartOptions& options,
                   const std::set<Feature>& supported,
                   ImageTracking* image_tracking,
                   GrantedCallback on_granted,
                   ErrorCallback on_error);

private:
    std::shared_ptr<IDeviceApi> device_api_;
    std::shared_ptr<IImageDecoder> image_decoder_;
};

} // namespace immersive
