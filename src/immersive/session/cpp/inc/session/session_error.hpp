// SPDX-FileCopyrightText: Copyright (c) 2025 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

namespace immersive
{

enum class ErrorCode
{
    // The requested session type is not available on the device
    NotAvailable,
    AlreadyActive,
    NotActive,
    // end() while the session is still being negotiated
    NotEstablished,
    NegotiationFailed,
    ImagePreparationFailed,
    ReferenceSpaceFailed,
    SurfaceFailed,
    FeatureUnavailable,
    // The device ended the session before start() completed
    SessionEnded,
    // The device rejected a request made on a running session
    RequestFailed
};

std::string_view to_string(ErrorCode code);

// Error delivered through the futures returned by SessionManager
class SessionError : public std::runtime_error
{
public:
    SessionError(ErrorCode code, const std::string& message) : std::runtime_error(message), code_(code)
    {
    }

    ErrorCode code() const
    {
        return code_;
    }

private:
    ErrorCode code_;
};

} // namespace immersive
