// SPDX-FileCopyrightText: Copyright (c) 2025 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <memory>
#include <string>

// Event kinds shared by the detection subsystems

namespace immersive
{

// The current session negotiated the subsystem's feature
struct SubsystemAvailable
{
};

// The session ended; every entity has already been removed
struct SubsystemUnavailable
{
};

struct SubsystemError
{
    std::string message;
};

template <typename Entity>
struct EntityAdded
{
    std::shared_ptr<Entity> entity;
};

template <typename Entity>
struct EntityRemoved
{
    std::shared_ptr<Entity> entity;
};

// The device reported new attributes for an entity already in the index
template <typename Entity>
struct EntityChanged
{
    std::shared_ptr<Entity> entity;
};

} // namespace immersive
