// SPDX-FileCopyrightText: Copyright (c) 2025 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <detection/detection_subsystem.hpp>
#include <schema/timestamp_generated.h>

#include <memory>
#include <string>
#include <vector>

namespace immersive
{

/**
 * @brief Records detection subsystem snapshots to an MCAP file.
 *
 * Each subsystem gets one channel named after its record channel ("planes",
 * "meshes", ...) carrying its FlatBuffer record type, so the file can be
 * inspected with tools like Foxglove.
 *
 * Usage:
 *   auto recorder = McapRecorder::create("session.mcap", { planes, anchors });
 *   // After each frame update:
 *   recorder->record(Timestamp(frame.predicted_display_time(), os_monotonic_now_ns()));
 *   // The file is closed when the recorder is destroyed
 */
class McapRecorder
{
public:
    /**
     * @brief Opens the file and registers one schema and channel per subsystem.
     *
     * MCAP logTime and publishTime are the timestamp's common_time (host
     * monotonic ns); the device time stays in the FlatBuffer payload.
     *
     * @throws std::runtime_error if the file cannot be opened or two subsystems share a channel name.
     */
    static std::unique_ptr<McapRecorder> create(const std::string& filename,
                                                const std::vector<std::shared_ptr<DetectionSubsystem>>& subsystems);

    ~McapRecorder();

    /**
     * @brief Writes one message for every registered subsystem that is currently available.
     * @return Number of messages written.
     */
    size_t record(const Timestamp& timestamp);

    // Returns false if the subsystem is not registered or the write failed
    bool record(const DetectionSubsystem& subsystem, const Timestamp& timestamp);

    uint64_t message_count() const;
    const std::string& filename() const;

private:
    McapRecorder();

    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace immersive
