// SPDX-FileCopyrightText: Copyright (c) 2025 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#include "inc/oxr/plane_detector.hpp"

#include <oxr_utils/pose_conversions.hpp>
#include <oxr_utils/pose_math.hpp>

#include <iostream>
#include <map>
#include <stdexcept>
#include <string>

namespace immersive
{

namespace
{

PlaneOrientation to_plane_orientation(XrPlaneDetectorOrientationEXT orientation)
{
    switch (orientation)
    {
    case XR_PLANE_DETECTOR_ORIENTATION_HORIZONTAL_UPWARD_EXT:
    case XR_PLANE_DETECTOR_ORIENTATION_HORIZONTAL_DOWNWARD_EXT:
        return PlaneOrientation_Horizontal;
    case XR_PLANE_DETECTOR_ORIENTATION_VERTICAL_EXT:
        return PlaneOrientation_Vertical;
    default:
        return PlaneOrientation_Unknown;
    }
}

std::string to_label(XrPlaneDetectorSemanticTypeEXT semantic_type)
{
    switch (semantic_type)
    {
    case XR_PLANE_DETECTOR_SEMANTIC_TYPE_CEILING_EXT:
        return "ceiling";
    case XR_PLANE_DETECTOR_SEMANTIC_TYPE_FLOOR_EXT:
        return "floor";
    case XR_PLANE_DETECTOR_SEMANTIC_TYPE_WALL_EXT:
        return "wall";
    case XR_PLANE_DETECTOR_SEMANTIC_TYPE_PLATFORM_EXT:
        return "table";
    default:
        return "";
    }
}

bool same_pose(const std::optional<XrPosef>& a, const std::optional<XrPosef>& b)
{
    if (a.has_value() != b.has_value())
    {
        return false;
    }
    if (!a)
    {
        return true;
    }
    return a->position.x == b->position.x && a->position.y == b->position.y && a->position.z == b->position.z &&
           a->orientation.x == b->orientation.x && a->orientation.y == b->orientation.y &&
           a->orientation.z == b->orientation.z && a->orientation.w == b->orientation.w;
}

bool same_polygon(const std::vector<XrVector3f>& a, const std::vector<XrVector3f>& b)
{
    if (a.size() != b.size())
    {
        return false;
    }
    for (size_t i = 0; i < a.size(); ++i)
    {
        if (a[i].x != b[i].x || a[i].y != b[i].y || a[i].z != b[i].z)
        {
            return false;
        }
    }
    return true;
}

} // namespace

PlaneDetector::PlaneDetector(XrInstance instance, XrSession session, PFN_xrGetInstanceProcAddr get_proc_addr)
    : funcs_(PlaneDetectionFunctions::load(instance, get_proc_addr))
{
    XrPlaneDetectorCreateInfoEXT create_info{ XR_TYPE_PLANE_DETECTOR_CREATE_INFO_EXT };
    create_info.flags = XR_PLANE_DETECTOR_ENABLE_CONTOUR_BIT_EXT;

    XrPlaneDetectorEXT detector = XR_NULL_HANDLE;
    XrResult result = funcs_.xrCreatePlaneDetectorEXT(session, &create_info, &detector);
    if (XR_FAILED(result))
    {
        throw std::runtime_error("Failed to create plane detector: " + std::to_string(result));
    }
    detector_ = XrPlaneDetectorPtr(detector, funcs_.xrDestroyPlaneDetectorEXT);
}

bool PlaneDetector::update(XrSpace base_space, XrTime time)
{
    if (!detecting_)
    {
        XrPlaneDetectorBeginInfoEXT begin_info{ XR_TYPE_PLANE_DETECTOR_BEGIN_INFO_EXT };
        begin_info.baseSpace = base_space;
        begin_info.time = time;
        begin_info.maxPlanes = kMaxPlanes;
        begin_info.minArea = 0.0f;
        begin_info.boundingBoxPose = identity_xr_posef();
        begin_info.boundingBoxExtent = { 100.0f, 100.0f, 100.0f };

        XrResult result = funcs_.xrBeginPlaneDetectionEXT(detector_.get(), &begin_info);
        if (XR_FAILED(result))
        {
            std::cerr << "PlaneDetector: xrBeginPlaneDetectionEXT failed: " << result << std::endl;
            return false;
        }
        detecting_ = true;
    }

    XrPlaneDetectionStateEXT state = XR_PLANE_DETECTION_STATE_NONE_EXT;
    XrResult result = funcs_.xrGetPlaneDetectionStateEXT(detector_.get(), &state);
    if (XR_FAILED(result))
    {
        std::cerr << "PlaneDetector: xrGetPlaneDetectionStateEXT failed: " << result << std::endl;
        detecting_ = false;
        return false;
    }

    switch (state)
    {
    case XR_PLANE_DETECTION_STATE_DONE_EXT:
        detecting_ = false;
        read_planes(base_space, time);
        return true;
    case XR_PLANE_DETECTION_STATE_ERROR_EXT:
    case XR_PLANE_DETECTION_STATE_FATAL_EXT:
        std::cerr << "PlaneDetector: Plane detection failed, restarting" << std::endl;
        detecting_ = false;
        return false;
    default:
        return false;
    }
}

void PlaneDetector::read_planes(XrSpace base_space, XrTime time)
{
    XrPlaneDetectorGetInfoEXT get_info{ XR_TYPE_PLANE_DETECTOR_GET_INFO_EXT };
    get_info.baseSpace = base_space;
    get_info.time = time;

    XrPlaneDetectorLocationsEXT locations{ XR_TYPE_PLANE_DETECTOR_LOCATIONS_EXT };
    XrResult result = funcs_.xrGetPlaneDetectionsEXT(detector_.get(), &get_info, &locations);
    if (XR_FAILED(result))
    {
        throw std::runtime_error("xrGetPlaneDetectionsEXT failed: " + std::to_string(result));
    }

    std::vector<XrPlaneDetectorLocationEXT> plane_locations(
        locations.planeLocationCountOutput, XrPlaneDetectorLocationEXT{ XR_TYPE_PLANE_DETECTOR_LOCATION_EXT });
    locations.planeLocationCapacityInput = static_cast<uint32_t>(plane_locations.size());
    locations.planeLocations = plane_locations.data();
    if (!plane_locations.empty())
    {
        result = funcs_.xrGetPlaneDetectionsEXT(detector_.get(), &get_info, &locations);
        if (XR_FAILED(result))
        {
            throw std::runtime_error("xrGetPlaneDetectionsEXT failed: " + std::to_string(result));
        }
        plane_locations.resize(locations.planeLocationCountOutput);
    }

    std::map<DeviceId, const PlaneRecord*> previous;
    for (const auto& plane : planes_)
    {
        previous[plane.id] = &plane;
    }

    // Plane space of the extension has its normal along +Z
    const XrPosef to_y_up{ axis_angle_quaternion(XrVector3f{ 1.0f, 0.0f, 0.0f }, 90.0f), { 0.0f, 0.0f, 0.0f } };
    constexpr XrSpaceLocationFlags kValid = XR_SPACE_LOCATION_POSITION_VALID_BIT | XR_SPACE_LOCATION_ORIENTATION_VALID_BIT;

    std::vector<PlaneRecord> planes;
    planes.reserve(plane_locations.size());
    for (const auto& location : plane_locations)
    {
        PlaneRecord record;
        record.id = location.planeId;
        if ((location.locationFlags & kValid) == kValid)
        {
            record.pose = multiply_poses(location.pose, to_y_up);
        }
        record.orientation = to_plane_orientation(location.orientation);
        record.polygon = read_polygon(location);
        record.label = to_label(location.semanticType);
        record.last_changed_time = time;

        auto it = previous.find(record.id);
        if (it != previous.end() && same_pose(it->second->pose, record.pose) &&
            same_polygon(it->second->polygon, record.polygon))
        {
            record.last_changed_time = it->second->last_changed_time;
        }
        planes.push_back(std::move(record));
    }
    planes_ = std::move(planes);
}

std::vector<XrVector3f> PlaneDetector::read_polygon(const XrPlaneDetectorLocationEXT& location) const
{
    std::vector<XrVector2f> vertices;
    if (location.polygonBufferCount > 0)
    {
        XrPlaneDetectorPolygonBufferEXT buffer{ XR_TYPE_PLANE_DETECTOR_POLYGON_BUFFER_EXT };
        XrResult result = funcs_.xrGetPlanePolygonBufferEXT(detector_.get(), location.planeId, 0, &buffer);
        if (XR_FAILED(result))
        {
            throw std::runtime_error("xrGetPlanePolygonBufferEXT failed: " + std::to_string(result));
        }
        vertices.resize(buffer.vertexCountOutput);
        buffer.vertexCapacityInput = static_cast<uint32_t>(vertices.size());
        buffer.vertices = vertices.data();
        if (!vertices.empty())
        {
            result = funcs_.xrGetPlanePolygonBufferEXT(detector_.get(), location.planeId, 0, &buffer);
            if (XR_FAILED(result))
            {
                throw std::runtime_error("xrGetPlanePolygonBufferEXT failed: " + std::to_string(result));
            }
            vertices.resize(buffer.vertexCountOutput);
        }
    }

    if (vertices.empty())
    {
        // No contour, fall back to the bounding rectangle
        const float hw = location.extents.width * 0.5f;
        const float hh = location.extents.height * 0.5f;
        vertices = { { -hw, -hh }, { hw, -hh }, { hw, hh }, { -hw, hh } };
    }

    std::vector<XrVector3f> polygon;
    polygon.reserve(vertices.size());
    for (const auto& v : vertices)
    {
        polygon.push_back(XrVector3f{ v.x, 0.0f, -v.y });
    }
    return polygon;
}

} // namespace immersive
