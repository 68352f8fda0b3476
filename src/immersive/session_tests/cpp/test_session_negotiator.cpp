// SPDX-FileCopyrightText: Copyright (c) 2025 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#include <catch2/catch_test_macros.hpp>
#include <session/session_negotiator.hpp>
#include <testing/fake_device.hpp>

#include <optional>
#include <string>
#include <vector>

using namespace immersive;
using namespace immersive::testing;

namespace
{

const std::set<Feature> kEverything = { Feature::HitTest,      Feature::LightEstimation, Feature::ImageTracking,
                                        Feature::PlaneDetection, Feature::MeshDetection, Feature::Anchors,
                                        Feature::DepthSensing,  Feature::CameraAccess,   Feature::DomOverlay,
                                        Feature::HandTracking };

using Strings = std::vector<std::string>;

} // namespace

TEST_CASE("build_request requires the reference space", "[negotiator]")
{
    auto request = SessionNegotiator::build_request(SessionType::Inline, ReferenceSpaceType::Viewer, {}, kEverything);
    CHECK(request.required_features == Strings{ "viewer" });
    CHECK(request.optional_features.empty());
    CHECK_FALSE(request.depth_sensing);
}

TEST_CASE("build_request asks AR sessions for hit test and light estimation", "[negotiator]")
{
    auto request = SessionNegotiator::build_request(SessionType::AR, ReferenceSpaceType::LocalFloor, {}, {});
    CHECK(request.required_features == Strings{ "local-floor" });
    CHECK(request.optional_features == Strings{ "hit-test", "light-estimation" });
}

TEST_CASE("build_request orders requested AR features", "[negotiator]")
{
    StartOptions options;
    options.anchors = true;
    options.image_tracking = true;
    options.plane_detection = true;
    options.mesh_detection = true;
    options.depth_sensing = DepthSensingOptions{};
    options.camera_color = true;
    options.dom_overlay_root = "overlay";
    options.optional_features = { "layers" };

    auto request = SessionNegotiator::build_request(SessionType::AR, ReferenceSpaceType::Local, options, kEverything);
    CHECK(request.optional_features == Strings{ "hit-test", "light-estimation", "image-tracking", "plane-detection",
                                                "mesh-detection", "anchors", "depth-sensing", "camera-access",
                                                "dom-overlay", "layers" });
    CHECK(request.dom_overlay_root == "overlay");
    REQUIRE(request.depth_sensing);
    CHECK(request.depth_sensing->usage_preference == std::vector<DepthUsage>{ DepthUsage_CPU });
    CHECK(request.depth_sensing->data_format_preference == std::vector<DepthFormat>{ DepthFormat_LuminanceAlpha });

    SECTION("unsupported features are left out")
    {
        auto partial = SessionNegotiator::build_request(
            SessionType::AR, ReferenceSpaceType::Local, options, { Feature::PlaneDetection });
        CHECK(partial.optional_features == Strings{ "hit-test", "light-estimation", "plane-detection", "layers" });
        CHECK_FALSE(partial.depth_sensing);
        CHECK_FALSE(partial.dom_overlay_root);
    }
}

TEST_CASE("build_request puts the preferred depth configuration first", "[negotiator]")
{
    StartOptions options;
    options.depth_sensing =
        DepthSensingOptions{ .usage_preference = DepthUsage_GPU, .data_format_preference = DepthFormat_Float32 };

    auto request = SessionNegotiator::build_request(SessionType::AR, ReferenceSpaceType::Local, options, kEverything);
    REQUIRE(request.depth_sensing);
    CHECK(request.depth_sensing->usage_preference == std::vector<DepthUsage>{ DepthUsage_GPU, DepthUsage_CPU });
    CHECK(request.depth_sensing->data_format_preference ==
          std::vector<DepthFormat>{ DepthFormat_Float32, DepthFormat_LuminanceAlpha });

    SECTION("a preference equal to the default is not duplicated")
    {
        options.depth_sensing->usage_preference = DepthUsage_CPU;
        auto same = SessionNegotiator::build_request(SessionType::AR, ReferenceSpaceType::Local, options, kEverything);
        CHECK(same.depth_sensing->usage_preference == std::vector<DepthUsage>{ DepthUsage_CPU });
    }
}

TEST_CASE("build_request ignores AR options for VR sessions", "[negotiator]")
{
    StartOptions options;
    options.plane_detection = true;
    options.depth_sensing = DepthSensingOptions{};
    options.optional_features = { "layers" };

    auto request = SessionNegotiator::build_request(SessionType::VR, ReferenceSpaceType::BoundedFloor, options, kEverything);
    CHECK(request.required_features == Strings{ "bounded-floor" });
    CHECK(request.optional_features == Strings{ "hand-tracking", "layers" });
    CHECK_FALSE(request.depth_sensing);
}

TEST_CASE("negotiate requests the session from the device", "[negotiator]")
{
    auto device = std::make_shared<FakeDeviceApi>();
    SessionNegotiator negotiator(device, nullptr);

    std::shared_ptr<IDeviceSession> granted;
    std::optional<SessionError> error;
    auto on_granted = [&](std::shared_ptr<IDeviceSession> session) { granted = std::move(session); };
    auto on_error = [&](const SessionError& e) { error = e; };

    SECTION("grant")
    {
        negotiator.negotiate(SessionType::AR, ReferenceSpaceType::Local, {}, {}, nullptr, on_granted, on_error);
        REQUIRE(device->requests.size() == 1);
        device->completions.run_all();
        CHECK(granted);
        CHECK_FALSE(error);
    }

    SECTION("refusal")
    {
        device->request_error = "user declined";
        negotiator.negotiate(SessionType::AR, ReferenceSpaceType::Local, {}, {}, nullptr, on_granted, on_error);
        device->completions.run_all();
        CHECK_FALSE(granted);
        REQUIRE(error);
        CHECK(error->code() == ErrorCode::NegotiationFailed);
        CHECK(std::string(error->what()) == "user declined");
    }
}

TEST_CASE("negotiate prepares reference images first", "[negotiator][images]")
{
    auto device = std::make_shared<FakeDeviceApi>();
    auto decoder = std::make_shared<FakeImageDecoder>(device->completions);
    SessionNegotiator negotiator(device, decoder);

    ImageTracking tracking(true);
    tracking.add(ImageSource{ .name = "poster", .data = { 1 } }, 0.3f);

    StartOptions options;
    options.image_tracking = true;

    std::shared_ptr<IDeviceSession> granted;
    std::optional<SessionError> error;
    auto on_granted = [&](std::shared_ptr<IDeviceSession> session) { granted = std::move(session); };
    auto on_error = [&](const SessionError& e) { error = e; };

    SECTION("images travel with the request")
    {
        negotiator.negotiate(SessionType::AR, ReferenceSpaceType::Local, options, { Feature::ImageTracking },
                             &tracking, on_granted, on_error);
        // Nothing reaches the device before the images are decoded
        CHECK(device->requests.empty());
        device->completions.run_all();
        REQUIRE(device->requests.size() == 1);
        REQUIRE(device->requests[0].tracked_images.size() == 1);
        CHECK(device->requests[0].tracked_images[0].image);
        CHECK(granted);
    }

    SECTION("a bad image fails without contacting the device")
    {
        decoder->corrupt = { "poster" };
        negotiator.negotiate(SessionType::AR, ReferenceSpaceType::Local, options, { Feature::ImageTracking },
                             &tracking, on_granted, on_error);
        device->completions.run_all();
        CHECK(device->requests.empty());
        REQUIRE(error);
        CHECK(error->code() == ErrorCode::ImagePreparationFailed);
    }

    SECTION("images are skipped when image tracking is not requested")
    {
        negotiator.negotiate(SessionType::AR, ReferenceSpaceType::Local, {}, { Feature::ImageTracking }, &tracking,
                             on_granted, on_error);
        CHECK(device->requests.size() == 1);
        CHECK(decoder->decoded.empty());
    }

    SECTION("no decoder")
    {
        SessionNegotiator without_decoder(device, nullptr);
        without_decoder.negotiate(SessionType::AR, ReferenceSpaceType::Local, options, { Feature::ImageTracking },
                                  &tracking, on_granted, on_error);
        REQUIRE(error);
        CHECK(error->code() == ErrorCode::ImagePreparationFailed);
        CHECK(device->requests.empty());
    }
}
