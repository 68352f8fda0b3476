// SPDX-FileCopyrightText: Copyright (c) 2025 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <openxr/openxr.h>

#include <deque>
#include <string>
#include <vector>

namespace mock_openxr
{

struct MockPlane
{
    uint64_t id = 0;
    XrPosef pose{ { 0.0f, 0.0f, 0.0f, 1.0f }, { 0.0f, 0.0f, 0.0f } };
    XrPlaneDetectorOrientationEXT orientation = XR_PLANE_DETECTOR_ORIENTATION_HORIZONTAL_UPWARD_EXT;
    XrPlaneDetectorSemanticTypeEXT semantic_type = XR_PLANE_DETECTOR_SEMANTIC_TYPE_FLOOR_EXT;
    XrExtent2Df extents{ 1.0f, 1.0f };
    // Empty means the runtime reports no contour
    std::vector<XrVector2f> contour;
};

// Runtime behaviour and call log shared by the mocked entry points
struct MockRuntime
{
    std::vector<std::string> extensions = { "XR_MND_headless", "XR_KHR_convert_timespec_time",
                                            "XR_EXT_plane_detection" };
    XrResult enumerate_result = XR_SUCCESS;
    XrResult create_instance_result = XR_SUCCESS;
    XrResult request_exit_result = XR_SUCCESS;

    XrPosef view_pose{ { 0.0f, 0.0f, 0.0f, 1.0f }, { 0.0f, 1.6f, 0.0f } };
    bool pose_valid = true;

    XrPlaneDetectionStateEXT plane_state = XR_PLANE_DETECTION_STATE_DONE_EXT;
    std::vector<MockPlane> planes;

    std::deque<XrEventDataBuffer> events;

    // Call log
    std::vector<std::string> enabled_extensions;
    std::vector<XrReferenceSpaceType> created_spaces;
    int begin_session_calls = 0;
    int end_session_calls = 0;
    int destroyed_spaces = 0;
    int destroyed_sessions = 0;
    int destroyed_instances = 0;
    int plane_detections_begun = 0;
    int destroyed_plane_detectors = 0;
};

MockRuntime& runtime();

// Restores defaults between tests
void reset();

void push_state_change(XrSessionState state);

} // namespace mock_openxr
