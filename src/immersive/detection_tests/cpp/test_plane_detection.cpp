// SPDX-FileCopyrightText: Copyright (c) 2025 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>
#include <detection/plane_detection.hpp>
#include <testing/fake_device.hpp>

#include <string>
#include <variant>
#include <vector>

using namespace immersive;
using namespace immersive::testing;

namespace
{

PlaneRecord make_plane(DeviceId id, int64_t changed, std::string label = "floor")
{
    PlaneRecord record;
    record.id = id;
    record.pose = make_pose(0.0f, 0.0f, -1.0f);
    record.orientation = PlaneOrientation_Horizontal;
    record.polygon = { { -1.0f, 0.0f, -1.0f }, { 1.0f, 0.0f, -1.0f }, { 1.0f, 0.0f, 1.0f } };
    record.label = std::move(label);
    record.last_changed_time = changed;
    return record;
}

struct PlaneEvents
{
    std::vector<std::string> kinds;
    std::vector<std::shared_ptr<Plane>> planes;

    explicit PlaneEvents(PlaneDetection& detection)
    {
        detection.events().subscribe(
            [this](const PlaneDetection::Event& event)
            {
                if (std::holds_alternative<SubsystemAvailable>(event))
                {
                    kinds.push_back("available");
                }
                else if (std::holds_alternative<SubsystemUnavailable>(event))
                {
                    kinds.push_back("unavailable");
                }
                else if (auto* added = std::get_if<EntityAdded<Plane>>(&event))
                {
                    kinds.push_back("added");
                    planes.push_back(added->entity);
                }
                else if (std::holds_alternative<EntityRemoved<Plane>>(event))
                {
                    kinds.push_back("removed");
                }
                else if (std::holds_alternative<EntityChanged<Plane>>(event))
                {
                    kinds.push_back("changed");
                }
                else if (std::holds_alternative<SubsystemError>(event))
                {
                    kinds.push_back("error");
                }
            });
    }
};

SessionContext make_context(Completions& completions, std::vector<Feature> granted)
{
    return SessionContext{ .session = std::make_shared<FakeDeviceSession>(completions, std::move(granted)),
                           .type = SessionType::AR,
                           .reference_space = std::make_shared<FakeReferenceSpace>(ReferenceSpaceType::Local) };
}

} // namespace

TEST_CASE("PlaneDetection follows the session lifecycle", "[planes]")
{
    Completions completions;
    PlaneDetection detection(true);
    PlaneEvents events(detection);

    CHECK(detection.supported());
    CHECK_FALSE(detection.available());

    detection.on_session_start(make_context(completions, { Feature::PlaneDetection }));
    CHECK(detection.available());

    FakeFrame frame;
    frame.planes = { make_plane(11, 100), make_plane(12, 100, "wall") };
    CHECK(detection.update(frame));
    CHECK(detection.size() == 2);

    SECTION("reports a plane once")
    {
        CHECK(detection.update(frame));
        CHECK(events.kinds == std::vector<std::string>{ "available", "added", "added" });
    }

    SECTION("reports changes only when the device's change time moves")
    {
        frame.planes[1] = make_plane(12, 200, "table");
        CHECK(detection.update(frame));
        CHECK(events.kinds == std::vector<std::string>{ "available", "added", "added", "changed" });
        CHECK(detection.list()[1]->label() == "table");
        CHECK(detection.list()[1]->last_changed_time() == 200);
    }

    SECTION("removes planes the device lost")
    {
        auto lost = detection.list()[0];
        frame.planes = { make_plane(12, 100, "wall") };
        CHECK(detection.update(frame));
        CHECK(detection.size() == 1);
        CHECK_FALSE(lost->tracked());
        CHECK_FALSE(lost->pose().has_value());
        CHECK(events.kinds.back() == "removed");
    }

    SECTION("session end removes every plane before becoming unavailable")
    {
        auto planes = detection.list();
        detection.on_session_end();
        CHECK(detection.size() == 0);
        CHECK_FALSE(detection.available());
        CHECK(events.kinds ==
              std::vector<std::string>{ "available", "added", "added", "removed", "removed", "unavailable" });
        for (const auto& plane : planes)
        {
            CHECK_FALSE(plane->tracked());
        }
    }
}

TEST_CASE("PlaneDetection copies the device record into the plane", "[planes]")
{
    Completions completions;
    PlaneDetection detection(true);
    detection.on_session_start(make_context(completions, { Feature::PlaneDetection }));

    FakeFrame frame;
    frame.planes = { make_plane(42, 7, "ceiling") };
    frame.planes[0].orientation = PlaneOrientation_Vertical;
    REQUIRE(detection.update(frame));

    auto plane = detection.list().at(0);
    CHECK(plane->device_id() == 42);
    CHECK(plane->id() == 1);
    CHECK(plane->orientation() == PlaneOrientation_Vertical);
    CHECK(plane->label() == "ceiling");
    REQUIRE(plane->polygon().size() == 3);
    CHECK(plane->polygon()[1].x() == Catch::Approx(1.0f));
    CHECK(plane->polygon()[1].y() == Catch::Approx(0.0f));
    REQUIRE(plane->pose().has_value());
    CHECK(plane->pose()->position().z() == Catch::Approx(-1.0f));

    SECTION("an unlocated plane keeps its polygon but loses its pose")
    {
        frame.planes[0].pose.reset();
        REQUIRE(detection.update(frame));
        CHECK_FALSE(plane->pose().has_value());
        CHECK(plane->polygon().size() == 3);
        CHECK(plane->tracked());
    }
}

TEST_CASE("PlaneDetection stays idle unless the feature was granted", "[planes]")
{
    Completions completions;
    FakeFrame frame;
    frame.planes = { make_plane(1, 1) };

    SECTION("not granted")
    {
        PlaneDetection detection(true);
        PlaneEvents events(detection);
        detection.on_session_start(make_context(completions, { Feature::HitTest }));
        CHECK_FALSE(detection.available());
        CHECK(detection.update(frame));
        CHECK(detection.size() == 0);
        detection.on_session_end();
        CHECK(events.kinds.empty());
    }

    SECTION("not supported")
    {
        PlaneDetection detection(false);
        detection.on_session_start(make_context(completions, { Feature::PlaneDetection }));
        CHECK_FALSE(detection.available());
        CHECK(detection.update(frame));
        CHECK(detection.size() == 0);
    }
}

TEST_CASE("PlaneDetection reports device errors without throwing", "[planes]")
{
    Completions completions;
    PlaneDetection detection(true);
    PlaneEvents events(detection);
    detection.on_session_start(make_context(completions, { Feature::PlaneDetection }));

    FakeFrame frame;
    frame.plane_error = "plane query failed";

    CHECK_FALSE(detection.update(frame));
    CHECK(events.kinds == std::vector<std::string>{ "available", "error" });
    CHECK(detection.available());
}

TEST_CASE("PlaneDetection serializes the current planes", "[planes][record]")
{
    Completions completions;
    PlaneDetection detection(true);
    detection.on_session_start(make_context(completions, { Feature::PlaneDetection }));

    FakeFrame frame;
    frame.planes = { make_plane(5, 1, "floor"), make_plane(6, 1, "wall") };
    REQUIRE(detection.update(frame));

    flatbuffers::FlatBufferBuilder builder;
    detection.serialize(builder, Timestamp(123, 456));

    flatbuffers::Verifier verifier(builder.GetBufferPointer(), builder.GetSize());
    REQUIRE(VerifyPlaneDetectionRecordBuffer(verifier));

    auto record = GetPlaneDetectionRecord(builder.GetBufferPointer());
    REQUIRE(record->planes()->size() == 2);
    CHECK(record->planes()->Get(1)->label()->str() == "wall");
    CHECK(record->planes()->Get(0)->is_pose_valid());
    CHECK(record->timestamp()->device_time() == 123);
    CHECK(record->timestamp()->common_time() == 456);
    CHECK(detection.get_record_channel() == "planes");
    CHECK(detection.get_schema_name() == "immersive.PlaneDetectionRecord");
    CHECK_FALSE(detection.get_schema_text().empty());
}
