// SPDX-FileCopyrightText: Copyright (c) 2025 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include "detection_subsystem.hpp"

#include <device/host.hpp>
#include <schema/tracked_image_bfbs_generated.h>
#include <schema/tracked_image_generated.h>

#include <memory>
#include <optional>
#include <vector>

namespace immersive
{

// Reference image registered for tracking before a session starts
class TrackedImage
{
public:
    TrackedImage(uint32_t index, ImageSource source, float width_in_meters);

    uint32_t index() const
    {
        return state_.index;
    }
    const ImageSource& source() const
    {
        return source_;
    }
    // Physical width the application declared for the image
    float width() const
    {
        return state_.width;
    }

    // False if the device reported the image as untrackable for the current session
    bool trackable() const
    {
        return trackable_;
    }
    bool tracking() const
    {
        return state_.tracking;
    }
    // True while the device extrapolates the pose without actually seeing the image
    bool emulated() const
    {
        return state_.emulated;
    }
    float measured_width() const
    {
        return state_.measured_width;
    }
    std::optional<Pose> pose() const;

    // Decoded bitmap, null until the image was prepared once
    std::shared_ptr<const Bitmap> bitmap() const
    {
        return bitmap_;
    }

    const TrackedImageStateT& state() const
    {
        return state_;
    }

private:
    friend class ImageTracking;

    ImageSource source_;
    std::shared_ptr<const Bitmap> bitmap_;
    TrackedImageStateT state_;
    bool trackable_ = false;
};

// One continuous stretch of tracking of a registered image
class ImageTrackingResult
{
public:
    ImageTrackingResult(uint64_t id, std::shared_ptr<TrackedImage> image) : id_(id), image_(std::move(image))
    {
    }

    uint64_t id() const
    {
        return id_;
    }

    const std::shared_ptr<TrackedImage>& image() const
    {
        return image_;
    }

private:
    uint64_t id_;
    std::shared_ptr<TrackedImage> image_;
};

/**
 * @brief Tracks registered reference images.
 *
 * EntityAdded means an image became tracked, EntityRemoved that it lost tracking.
 */
class ImageTracking : public ReconcilingSubsystem<ImageTrackingResult, ImageTrackingResultRecord, uint32_t>
{
public:
    explicit ImageTracking(bool supported) : ReconcilingSubsystem(supported)
    {
    }

    std::string_view get_name() const override
    {
        return "ImageTracking";
    }

    Feature get_feature() const override
    {
        return Feature::ImageTracking;
    }

    // Registers an image; returns nullptr when unsupported or while a session is running
    std::shared_ptr<TrackedImage> add(ImageSource source, float width_in_meters);

    // Returns false when the image is unknown or a session is running
    bool remove(const std::shared_ptr<TrackedImage>& image);

    const std::vector<std::shared_ptr<TrackedImage>>& images() const
    {
        return images_;
    }

    /**
     * @brief Decodes every registered image, reusing bitmaps decoded earlier.
     *
     * on_success receives one request per image in registration order. The first
     * decode failure calls on_failure; later completions are ignored.
     */
    void prepare(IImageDecoder& decoder,
                 std::function<void(std::vector<TrackedImageRequest>)> on_success,
                 FailureCallback on_failure);

    void on_session_start(const SessionContext& context) override;
    void on_session_end() override;

    std::string_view get_schema_name() const override
    {
        return "immersive.ImageTrackingRecord";
    }

    std::string_view get_schema_text() const override
    {
        return std::string_view(reinterpret_cast<const char*>(ImageTrackingRecordBinarySchema::data()),
                                ImageTrackingRecordBinarySchema::size());
    }

    std::string_view get_record_channel() const override
    {
        return "images";
    }

    void serialize(flatbuffers::FlatBufferBuilder& builder, const Timestamp& timestamp) const override;

private:
    std::vector<ImageTrackingResultRecord> collect(const IFrame& frame) override;
    uint32_t key_of(const ImageTrackingResultRecord& record) const override
    {
        return record.index;
    }
    EntityPtr create_entity(const ImageTrackingResultRecord& record) override;
    bool update_entity(ImageTrackingResult& result, const ImageTrackingResultRecord& record) override;
    void teardown_entity(ImageTrackingResult& result) override;

    std::vector<std::shared_ptr<TrackedImage>> images_;
};

} // namespace immersive
