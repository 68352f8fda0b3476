// SPDX-FileCopyrightText: Copyright (c) 2025 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>
#include <detection/hit_test.hpp>
#include <testing/fake_device.hpp>

#include <string>
#include <variant>
#include <vector>

using namespace immersive;
using namespace immersive::testing;

TEST_CASE("HitTest delivers sources and their results", "[hit_test]")
{
    Completions completions;
    auto session = std::make_shared<FakeDeviceSession>(completions, std::vector<Feature>{ Feature::HitTest });
    HitTest hit_test(true);
    hit_test.on_session_start({ .session = session, .type = SessionType::AR, .reference_space = nullptr });
    REQUIRE(hit_test.available());

    std::vector<size_t> result_counts;
    hit_test.events().subscribe(
        [&](const HitTest::Event& event)
        {
            if (auto* results = std::get_if<HitTestResultEvent>(&event))
            {
                result_counts.push_back(results->results.size());
            }
        });

    std::shared_ptr<HitTestSource> source;
    std::string failure;
    HitTestOptions options;
    options.profile = "generic-touchscreen";
    hit_test.start(
        options, [&](const std::shared_ptr<HitTestSource>& s) { source = s; },
        [&](const std::string& message) { failure = message; });
    REQUIRE(session->hit_test_requests.size() == 1);
    CHECK(session->hit_test_requests[0].profile == "generic-touchscreen");

    completions.run_all();
    CHECK_FALSE(source);

    FakeFrame frame;
    frame.hit_tests = { HitTestResultsRecord{ .source = 100, .results = { make_pose(0.0f, 0.0f, -2.0f) } } };
    REQUIRE(hit_test.update(frame));
    REQUIRE(source);
    CHECK(source->transient());
    CHECK(source->active());
    REQUIRE(source->results().size() == 1);
    CHECK(source->results()[0].position().z() == Catch::Approx(-2.0f));
    CHECK(result_counts == std::vector<size_t>{ 1 });

    SECTION("frames without hits raise no result event")
    {
        frame.hit_tests[0].results.clear();
        REQUIRE(hit_test.update(frame));
        CHECK(result_counts == std::vector<size_t>{ 1 });
        CHECK(source->results().empty());
    }

    SECTION("removing a source cancels it on the device")
    {
        source->remove();
        CHECK(session->cancelled_hit_tests == std::vector<DeviceId>{ 100 });
        frame.hit_tests.clear();
        REQUIRE(hit_test.update(frame));
        CHECK_FALSE(source->active());
        CHECK(hit_test.size() == 0);
    }

    SECTION("session end deactivates every source")
    {
        hit_test.on_session_end();
        CHECK_FALSE(source->active());
        CHECK_FALSE(hit_test.available());
        CHECK(failure.empty());
    }
}

TEST_CASE("HitTest fails requests it cannot serve", "[hit_test]")
{
    Completions completions;
    std::string failure;
    auto ignore = [](const std::shared_ptr<HitTestSource>&) {};
    auto fail = [&](const std::string& message) { failure = message; };

    SECTION("unsupported platform")
    {
        HitTest hit_test(false);
        hit_test.start({}, ignore, fail);
        CHECK(failure == "XR HitTest is not supported");
    }

    SECTION("no session")
    {
        HitTest hit_test(true);
        hit_test.start({}, ignore, fail);
        CHECK(failure == "XR HitTest is not available");
    }

    SECTION("session ended before the source was reported")
    {
        auto session = std::make_shared<FakeDeviceSession>(completions, std::vector<Feature>{ Feature::HitTest });
        HitTest hit_test(true);
        hit_test.on_session_start({ .session = session, .type = SessionType::AR, .reference_space = nullptr });
        hit_test.start({}, ignore, fail);
        completions.run_all();
        hit_test.on_session_end();
        CHECK(failure == "session ended");
    }
}
