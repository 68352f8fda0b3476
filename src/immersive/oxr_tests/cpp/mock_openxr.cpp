// SPDX-FileCopyrightText: Copyright (c) 2025 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#include "mock_openxr.hpp"

#include <time.h>

#include <openxr/openxr.h>
#include <openxr/openxr_platform.h>

#include <cstring>
#include <string>

namespace mock_openxr
{

MockRuntime& runtime()
{
    static MockRuntime instance;
    return instance;
}

void reset()
{
    runtime() = MockRuntime{};
}

void push_state_change(XrSessionState state)
{
    XrEventDataBuffer buffer{ XR_TYPE_EVENT_DATA_BUFFER };
    auto* changed = reinterpret_cast<XrEventDataSessionStateChanged*>(&buffer);
    changed->type = XR_TYPE_EVENT_DATA_SESSION_STATE_CHANGED;
    changed->next = nullptr;
    changed->session = (XrSession)0x2;
    changed->state = state;
    changed->time = 0;
    runtime().events.push_back(buffer);
}

} // namespace mock_openxr

using mock_openxr::runtime;

// --- Mock Extension Functions ---

XRAPI_ATTR XrResult XRAPI_CALL mock_xrConvertTimespecTimeToTimeKHR(XrInstance instance,
                                                                   const struct timespec* timespecTime,
                                                                   XrTime* time)
{
    *time = static_cast<XrTime>(timespecTime->tv_sec) * 1000000000LL + timespecTime->tv_nsec;
    return XR_SUCCESS;
}

XRAPI_ATTR XrResult XRAPI_CALL mock_xrCreatePlaneDetectorEXT(XrSession session,
                                                             const XrPlaneDetectorCreateInfoEXT* createInfo,
                                                             XrPlaneDetectorEXT* planeDetector)
{
    *planeDetector = (XrPlaneDetectorEXT)0x10;
    return XR_SUCCESS;
}

XRAPI_ATTR XrResult XRAPI_CALL mock_xrDestroyPlaneDetectorEXT(XrPlaneDetectorEXT planeDetector)
{
    runtime().destroyed_plane_detectors++;
    return XR_SUCCESS;
}

XRAPI_ATTR XrResult XRAPI_CALL mock_xrBeginPlaneDetectionEXT(XrPlaneDetectorEXT planeDetector,
                                                             const XrPlaneDetectorBeginInfoEXT* beginInfo)
{
    runtime().plane_detections_begun++;
    return XR_SUCCESS;
}

XRAPI_ATTR XrResult XRAPI_CALL mock_xrGetPlaneDetectionStateEXT(XrPlaneDetectorEXT planeDetector,
                                                                XrPlaneDetectionStateEXT* state)
{
    *state = runtime().plane_state;
    return XR_SUCCESS;
}

XRAPI_ATTR XrResult XRAPI_CALL mock_xrGetPlaneDetectionsEXT(XrPlaneDetectorEXT planeDetector,
                                                            const XrPlaneDetectorGetInfoEXT* info,
                                                            XrPlaneDetectorLocationsEXT* locations)
{
    const auto& planes = runtime().planes;
    locations->planeLocationCountOutput = static_cast<uint32_t>(planes.size());
    if (locations->planeLocationCapacityInput == 0)
    {
        return XR_SUCCESS;
    }
    if (locations->planeLocationCapacityInput < planes.size())
    {
        return XR_ERROR_SIZE_INSUFFICIENT;
    }

    for (size_t i = 0; i < planes.size(); ++i)
    {
        auto& location = locations->planeLocations[i];
        location.planeId = planes[i].id;
        location.locationFlags = XR_SPACE_LOCATION_POSITION_VALID_BIT | XR_SPACE_LOCATION_ORIENTATION_VALID_BIT;
        location.pose = planes[i].pose;
        location.extents = planes[i].extents;
        location.orientation = planes[i].orientation;
        location.semanticType = planes[i].semantic_type;
        location.polygonBufferCount = planes[i].contour.empty() ? 0 : 1;
    }
    return XR_SUCCESS;
}

XRAPI_ATTR XrResult XRAPI_CALL mock_xrGetPlanePolygonBufferEXT(XrPlaneDetectorEXT planeDetector,
                                                               uint64_t planeId,
                                                               uint32_t polygonBufferIndex,
                                                               XrPlaneDetectorPolygonBufferEXT* polygonBuffer)
{
    for (const auto& plane : runtime().planes)
    {
        if (plane.id != planeId)
        {
            continue;
        }
        polygonBuffer->vertexCountOutput = static_cast<uint32_t>(plane.contour.size());
        if (polygonBuffer->vertexCapacityInput == 0)
        {
            return XR_SUCCESS;
        }
        if (polygonBuffer->vertexCapacityInput < plane.contour.size())
        {
            return XR_ERROR_SIZE_INSUFFICIENT;
        }
        std::memcpy(polygonBuffer->vertices, plane.contour.data(), plane.contour.size() * sizeof(XrVector2f));
        return XR_SUCCESS;
    }
    return XR_ERROR_VALIDATION_FAILURE;
}

// --- Core Functions ---

extern "C"
{

    XRAPI_ATTR XrResult XRAPI_CALL xrEnumerateInstanceExtensionProperties(const char* layerName,
                                                                          uint32_t propertyCapacityInput,
                                                                          uint32_t* propertyCountOutput,
                                                                          XrExtensionProperties* properties)
    {
        if (XR_FAILED(runtime().enumerate_result))
        {
            return runtime().enumerate_result;
        }

        const auto& extensions = runtime().extensions;
        *propertyCountOutput = static_cast<uint32_t>(extensions.size());
        if (propertyCapacityInput == 0)
        {
            return XR_SUCCESS;
        }
        if (propertyCapacityInput < extensions.size())
        {
            return XR_ERROR_SIZE_INSUFFICIENT;
        }
        for (size_t i = 0; i < extensions.size(); ++i)
        {
            std::strncpy(properties[i].extensionName, extensions[i].c_str(), XR_MAX_EXTENSION_NAME_SIZE - 1);
            properties[i].extensionVersion = 1;
        }
        return XR_SUCCESS;
    }

    XRAPI_ATTR XrResult XRAPI_CALL xrCreateInstance(const XrInstanceCreateInfo* createInfo, XrInstance* instance)
    {
        if (XR_FAILED(runtime().create_instance_result))
        {
            return runtime().create_instance_result;
        }

        runtime().enabled_extensions.clear();
        for (uint32_t i = 0; i < createInfo->enabledExtensionCount; ++i)
        {
            runtime().enabled_extensions.emplace_back(createInfo->enabledExtensionNames[i]);
        }
        *instance = (XrInstance)0x1;
        return XR_SUCCESS;
    }

    XRAPI_ATTR XrResult XRAPI_CALL xrDestroyInstance(XrInstance instance)
    {
        runtime().destroyed_instances++;
        return XR_SUCCESS;
    }

    XRAPI_ATTR XrResult XRAPI_CALL xrGetInstanceProcAddr(XrInstance instance, const char* name, PFN_xrVoidFunction* function)
    {
        const std::string fn_name(name);
        if (fn_name == "xrConvertTimespecTimeToTimeKHR")
        {
            *function = reinterpret_cast<PFN_xrVoidFunction>(mock_xrConvertTimespecTimeToTimeKHR);
        }
        else if (fn_name == "xrCreatePlaneDetectorEXT")
        {
            *function = reinterpret_cast<PFN_xrVoidFunction>(mock_xrCreatePlaneDetectorEXT);
        }
        else if (fn_name == "xrDestroyPlaneDetectorEXT")
        {
            *function = reinterpret_cast<PFN_xrVoidFunction>(mock_xrDestroyPlaneDetectorEXT);
        }
        else if (fn_name == "xrBeginPlaneDetectionEXT")
        {
            *function = reinterpret_cast<PFN_xrVoidFunction>(mock_xrBeginPlaneDetectionEXT);
        }
        else if (fn_name == "xrGetPlaneDetectionStateEXT")
        {
            *function = reinterpret_cast<PFN_xrVoidFunction>(mock_xrGetPlaneDetectionStateEXT);
        }
        else if (fn_name == "xrGetPlaneDetectionsEXT")
        {
            *function = reinterpret_cast<PFN_xrVoidFunction>(mock_xrGetPlaneDetectionsEXT);
        }
        else if (fn_name == "xrGetPlanePolygonBufferEXT")
        {
            *function = reinterpret_cast<PFN_xrVoidFunction>(mock_xrGetPlanePolygonBufferEXT);
        }
        else
        {
            *function = nullptr;
            return XR_ERROR_FUNCTION_UNSUPPORTED;
        }
        return XR_SUCCESS;
    }

    XRAPI_ATTR XrResult XRAPI_CALL xrGetSystem(XrInstance instance, const XrSystemGetInfo* getInfo, XrSystemId* systemId)
    {
        *systemId = 1;
        return XR_SUCCESS;
    }

    XRAPI_ATTR XrResult XRAPI_CALL xrCreateSession(XrInstance instance,
                                                   const XrSessionCreateInfo* createInfo,
                                                   XrSession* session)
    {
        *session = (XrSession)0x2;
        return XR_SUCCESS;
    }

    XRAPI_ATTR XrResult XRAPI_CALL xrDestroySession(XrSession session)
    {
        runtime().destroyed_sessions++;
        return XR_SUCCESS;
    }

    XRAPI_ATTR XrResult XRAPI_CALL xrCreateReferenceSpace(XrSession session,
                                                          const XrReferenceSpaceCreateInfo* createInfo,
                                                          XrSpace* space)
    {
        runtime().created_spaces.push_back(createInfo->referenceSpaceType);
        // Distinct handle per space
        *space = (XrSpace)(0x100 + runtime().created_spaces.size());
        return XR_SUCCESS;
    }

    XRAPI_ATTR XrResult XRAPI_CALL xrDestroySpace(XrSpace space)
    {
        runtime().destroyed_spaces++;
        return XR_SUCCESS;
    }

    XRAPI_ATTR XrResult XRAPI_CALL xrEnumerateViewConfigurations(XrInstance instance,
                                                                 XrSystemId systemId,
                                                                 uint32_t viewConfigurationTypeCapacityInput,
                                                                 uint32_t* viewConfigurationTypeCountOutput,
                                                                 XrViewConfigurationType* viewConfigurationTypes)
    {
        *viewConfigurationTypeCountOutput = 1;
        if (viewConfigurationTypeCapacityInput >= 1 && viewConfigurationTypes != nullptr)
        {
            viewConfigurationTypes[0] = XR_VIEW_CONFIGURATION_TYPE_PRIMARY_STEREO;
        }
        return XR_SUCCESS;
    }

    XRAPI_ATTR XrResult XRAPI_CALL xrBeginSession(XrSession session, const XrSessionBeginInfo* beginInfo)
    {
        runtime().begin_session_calls++;
        return XR_SUCCESS;
    }

    XRAPI_ATTR XrResult XRAPI_CALL xrEndSession(XrSession session)
    {
        runtime().end_session_calls++;
        return XR_SUCCESS;
    }

    XRAPI_ATTR XrResult XRAPI_CALL xrRequestExitSession(XrSession session)
    {
        if (XR_FAILED(runtime().request_exit_result))
        {
            return runtime().request_exit_result;
        }
        mock_openxr::push_state_change(XR_SESSION_STATE_STOPPING);
        mock_openxr::push_state_change(XR_SESSION_STATE_EXITING);
        return XR_SUCCESS;
    }

    XRAPI_ATTR XrResult XRAPI_CALL xrPollEvent(XrInstance instance, XrEventDataBuffer* eventData)
    {
        auto& events = runtime().events;
        if (events.empty())
        {
            return XR_EVENT_UNAVAILABLE;
        }
        *eventData = events.front();
        events.pop_front();
        return XR_SUCCESS;
    }

    XRAPI_ATTR XrResult XRAPI_CALL xrLocateSpace(XrSpace space, XrSpace baseSpace, XrTime time, XrSpaceLocation* location)
    {
        location->locationFlags = runtime().pose_valid ?
                                      (XR_SPACE_LOCATION_POSITION_VALID_BIT | XR_SPACE_LOCATION_ORIENTATION_VALID_BIT) :
                                      0;
        location->pose = runtime().view_pose;
        return XR_SUCCESS;
    }

} // extern "C"
