// SPDX-FileCopyrightText: Copyright (c) 2025 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#include "inc/session/session_error.hpp"

namespace immersive
{

std::string_view to_string(ErrorCode code)
{
    switch (code)
    {
    case ErrorCode::NotAvailable:
        return "NotAvailable";
    case ErrorCode::AlreadyActive:
        return "AlreadyActive";
    case ErrorCode::NotActive:
        return "NotActive";
    case ErrorCode::NotEstablished:
        return "NotEstablished";
    case ErrorCode::NegotiationFailed:
        return "NegotiationFailed";
    case ErrorCode::ImagePreparationFailed:
        return "ImagePreparationFailed";
    case ErrorCode::ReferenceSpaceFailed:
        return "ReferenceSpaceFailed";
    case ErrorCode::SurfaceFailed:
        return "SurfaceFailed";
    case ErrorCode::FeatureUnavailable:
        return "FeatureUnavailable";
    case ErrorCode::SessionEnded:
        return "SessionEnded";
    case ErrorCode::RequestFailed:
        return "RequestFailed";
    }
    return "Unknown";
}

} // namespace immersive
