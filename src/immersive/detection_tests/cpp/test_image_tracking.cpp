// SPDX-FileCopyrightText: Copyright (c) 2025 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>
#include <detection/image_tracking.hpp>
#include <testing/fake_device.hpp>

#include <optional>
#include <string>
#include <variant>
#include <vector>

using namespace immersive;
using namespace immersive::testing;

namespace
{

ImageSource source(const std::string& name)
{
    return ImageSource{ .name = name, .data = { 1, 2, 3 } };
}

ImageTrackingResultRecord result(uint32_t index, ImageTrackingState state = ImageTrackingState::Tracked)
{
    return ImageTrackingResultRecord{
        .index = index, .pose = make_pose(0.0f, 0.0f, -0.5f), .tracking_state = state, .measured_width_in_meters = 0.21f
    };
}

} // namespace

TEST_CASE("ImageTracking registers images only while idle", "[images]")
{
    Completions completions;
    ImageTracking tracking(true);

    auto poster = tracking.add(source("poster"), 0.5f);
    auto card = tracking.add(source("card"), 0.1f);
    REQUIRE(poster);
    REQUIRE(card);
    CHECK(poster->index() == 0);
    CHECK(card->index() == 1);
    CHECK(card->width() == Catch::Approx(0.1f));

    SECTION("removing an image renumbers the rest")
    {
        CHECK(tracking.remove(poster));
        CHECK(tracking.images().size() == 1);
        CHECK(card->index() == 0);
        CHECK_FALSE(tracking.remove(poster));
    }

    SECTION("the image list is frozen while a session runs")
    {
        tracking.on_session_start(
            { .session = std::make_shared<FakeDeviceSession>(completions, std::vector<Feature>{}),
              .type = SessionType::AR,
              .reference_space = nullptr });
        CHECK_FALSE(tracking.add(source("late"), 1.0f));
        CHECK_FALSE(tracking.remove(card));
        CHECK(tracking.images().size() == 2);

        tracking.on_session_end();
        CHECK(tracking.add(source("late"), 1.0f));
    }

    SECTION("unsupported platforms refuse images")
    {
        ImageTracking unsupported(false);
        CHECK_FALSE(unsupported.add(source("poster"), 0.5f));
    }
}

TEST_CASE("ImageTracking prepares reference images", "[images]")
{
    Completions completions;
    FakeImageDecoder decoder(completions);
    ImageTracking tracking(true);
    tracking.add(source("poster"), 0.5f);
    tracking.add(source("card"), 0.1f);

    std::optional<std::vector<TrackedImageRequest>> prepared;
    std::vector<std::string> failures;
    auto prepare = [&]()
    {
        tracking.prepare(
            decoder, [&](std::vector<TrackedImageRequest> requests) { prepared = std::move(requests); },
            [&](const std::string& message) { failures.push_back(message); });
        completions.run_all();
    };

    SECTION("every image is decoded in registration order")
    {
        prepare();
        REQUIRE(prepared);
        REQUIRE(prepared->size() == 2);
        CHECK((*prepared)[0].width_in_meters == Catch::Approx(0.5f));
        CHECK((*prepared)[1].width_in_meters == Catch::Approx(0.1f));
        CHECK((*prepared)[0].image);
        CHECK(decoder.decoded == std::vector<std::string>{ "poster", "card" });
        CHECK(failures.empty());
    }

    SECTION("decoded bitmaps are reused")
    {
        prepare();
        prepared.reset();
        prepare();
        REQUIRE(prepared);
        CHECK(decoder.decoded.size() == 2);
        CHECK((*prepared)[1].image == tracking.images()[1]->bitmap());
    }

    SECTION("a corrupt image fails preparation once")
    {
        decoder.corrupt = { "poster", "card" };
        prepare();
        CHECK_FALSE(prepared);
        REQUIRE(failures.size() == 1);
        CHECK(failures[0].find("poster") != std::string::npos);
    }

    SECTION("nothing registered completes immediately")
    {
        ImageTracking empty(true);
        empty.prepare(
            decoder, [&](std::vector<TrackedImageRequest> requests) { prepared = std::move(requests); },
            [&](const std::string& message) { failures.push_back(message); });
        REQUIRE(prepared);
        CHECK(prepared->empty());
    }
}

TEST_CASE("ImageTracking reports tracked images", "[images]")
{
    Completions completions;
    ImageTracking tracking(true);
    auto poster = tracking.add(source("poster"), 0.5f);
    auto card = tracking.add(source("card"), 0.1f);

    std::vector<std::string> events;
    tracking.events().subscribe(
        [&](const ImageTracking::Event& event)
        {
            if (std::holds_alternative<SubsystemAvailable>(event))
            {
                events.push_back("available");
            }
            else if (auto* added = std::get_if<EntityAdded<ImageTrackingResult>>(&event))
            {
                events.push_back("tracked:" + added->entity->image()->source().name);
            }
            else if (auto* removed = std::get_if<EntityRemoved<ImageTrackingResult>>(&event))
            {
                events.push_back("lost:" + removed->entity->image()->source().name);
            }
            else if (std::holds_alternative<EntityChanged<ImageTrackingResult>>(event))
            {
                events.push_back("changed");
            }
            else if (std::holds_alternative<SubsystemUnavailable>(event))
            {
                events.push_back("unavailable");
            }
        });

    auto session = std::make_shared<FakeDeviceSession>(completions, std::vector<Feature>{ Feature::ImageTracking });
    session->image_scores = { true, false };
    tracking.on_session_start({ .session = session, .type = SessionType::AR, .reference_space = nullptr });

    // Available only once the device answered with the trackability scores
    CHECK_FALSE(tracking.available());
    completions.run_all();
    REQUIRE(tracking.available());
    CHECK(poster->trackable());
    CHECK_FALSE(card->trackable());

    FakeFrame frame;
    frame.images = { result(0), result(7) };
    REQUIRE(tracking.update(frame));
    CHECK(tracking.size() == 1);
    CHECK(poster->tracking());
    CHECK(poster->measured_width() == Catch::Approx(0.21f));
    REQUIRE(poster->pose());

    frame.images = { result(0, ImageTrackingState::Emulated) };
    REQUIRE(tracking.update(frame));
    CHECK(poster->emulated());

    frame.images = {};
    REQUIRE(tracking.update(frame));
    CHECK_FALSE(poster->tracking());
    CHECK_FALSE(poster->pose());

    tracking.on_session_end();
    CHECK_FALSE(poster->trackable());
    CHECK(events ==
          std::vector<std::string>{ "available", "tracked:poster", "changed", "lost:poster", "unavailable" });
}

TEST_CASE("ImageTracking ignores scores arriving after the session ended", "[images]")
{
    Completions completions;
    ImageTracking tracking(true);
    tracking.add(source("poster"), 0.5f);

    auto session = std::make_shared<FakeDeviceSession>(completions, std::vector<Feature>{ Feature::ImageTracking });
    session->image_scores = { true };
    tracking.on_session_start({ .session = session, .type = SessionType::AR, .reference_space = nullptr });
    tracking.on_session_end();

    completions.run_all();
    CHECK_FALSE(tracking.available());
    CHECK_FALSE(tracking.images()[0]->trackable());
}
