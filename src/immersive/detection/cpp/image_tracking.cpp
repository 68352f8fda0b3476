// SPDX-FileCopyrightText: Copyright (c) 2025 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#include "inc/detection/image_tracking.hpp"

#include <oxr_utils/pose_conversions.hpp>

#include <algorithm>

namespace immersive
{

// ============================================================================
// TrackedImage
// ============================================================================

TrackedImage::TrackedImage(uint32_t index, ImageSource source, float width_in_meters) : source_(std::move(source))
{
    state_.index = index;
    state_.width = width_in_meters;
}

std::optional<Pose> TrackedImage::pose() const
{
    if (!state_.is_pose_valid || !state_.pose)
    {
        return std::nullopt;
    }
    return *state_.pose;
}

// ============================================================================
// ImageTracking
// ============================================================================

std::shared_ptr<TrackedImage> ImageTracking::add(ImageSource source, float width_in_meters)
{
    if (!supported_ || session_)
    {
        return nullptr;
    }

    auto image =
        std::make_shared<TrackedImage>(static_cast<uint32_t>(images_.size()), std::move(source), width_in_meters);
    images_.push_back(image);
    return image;
}

bool ImageTracking::remove(const std::shared_ptr<TrackedImage>& image)
{
    if (session_)
    {
        return false;
    }

    auto it = std::find(images_.begin(), images_.end(), image);
    if (it == images_.end())
    {
        return false;
    }
    images_.erase(it);

    // Indices follow registration order, which is also the order images are sent to the device
    for (size_t i = 0; i < images_.size(); ++i)
    {
        images_[i]->state_.index = static_cast<uint32_t>(i);
    }
    return true;
}

void ImageTracking::prepare(IImageDecoder& decoder,
                            std::function<void(std::vector<TrackedImageRequest>)> on_success,
                            FailureCallback on_failure)
{
    struct Pending
    {
        std::vector<TrackedImageRequest> requests;
        size_t remaining = 0;
        bool failed = false;
        std::function<void(std::vector<TrackedImageRequest>)> on_success;
        FailureCallback on_failure;
    };

    auto pending = std::make_shared<Pending>();
    pending->requests.resize(images_.size());
    pending->on_success = std::move(on_success);
    pending->on_failure = std::move(on_failure);

    std::vector<size_t> to_decode;
    for (size_t i = 0; i < images_.size(); ++i)
    {
        pending->requests[i].width_in_meters = images_[i]->width();
        if (images_[i]->bitmap_)
        {
            pending->requests[i].image = images_[i]->bitmap_;
        }
        else
        {
            to_decode.push_back(i);
        }
    }

    pending->remaining = to_decode.size();
    if (pending->remaining == 0)
    {
        pending->on_success(std::move(pending->requests));
        return;
    }

    for (size_t i : to_decode)
    {
        auto image = images_[i];
        decoder.decode(
            image->source(),
            [pending, image, i](std::shared_ptr<const Bitmap> bitmap)
            {
                image->bitmap_ = bitmap;
                pending->requests[i].image = std::move(bitmap);
                if (--pending->remaining == 0 && !pending->failed)
                {
                    pending->on_success(std::move(pending->requests));
                }
            },
            [pending, image](const std::string& message)
            {
                --pending->remaining;
                if (pending->failed)
                {
                    return;
                }
                pending->failed = true;
                pending->on_failure("Failed to prepare image '" + image->source().name + "': " + message);
            });
    }
}

void ImageTracking::on_session_start(const SessionContext& context)
{
    session_ = context.session;
    session_type_ = context.type;
    if (!supported_ || !session_ || !session_->has_feature(Feature::ImageTracking))
    {
        return;
    }

    // Available once the device told which images it can track
    std::weak_ptr<IDeviceSession> requested_for = session_;
    std::weak_ptr<bool> alive = alive_;
    session_->tracked_image_scores(
        [this, alive, requested_for](std::vector<bool> scores)
        {
            if (alive.expired() || requested_for.expired() || requested_for.lock() != session_)
            {
                return;
            }
            for (size_t i = 0; i < images_.size(); ++i)
            {
                images_[i]->trackable_ = i < scores.size() && scores[i];
            }
            available_ = true;
            emitter_.emit(SubsystemAvailable{});
        },
        [this, alive, requested_for](const std::string& message)
        {
            if (alive.expired() || requested_for.expired() || requested_for.lock() != session_)
            {
                return;
            }
            report_error(message);
        });
}

void ImageTracking::on_session_end()
{
    ReconcilingSubsystem::on_session_end();
    for (const auto& image : images_)
    {
        image->trackable_ = false;
    }
}

std::vector<ImageTrackingResultRecord> ImageTracking::collect(const IFrame& frame)
{
    auto results = frame.image_tracking_results();
    results.erase(std::remove_if(results.begin(), results.end(),
                                 [this](const ImageTrackingResultRecord& r) { return r.index >= images_.size(); }),
                  results.end());
    return results;
}

ImageTracking::EntityPtr ImageTracking::create_entity(const ImageTrackingResultRecord& record)
{
    return std::make_shared<ImageTrackingResult>(next_local_id(), images_[record.index]);
}

bool ImageTracking::update_entity(ImageTrackingResult& result, const ImageTrackingResultRecord& record)
{
    TrackedImageStateT& state = result.image()->state_;
    const bool emulated = record.tracking_state == ImageTrackingState::Emulated;
    const bool changed = state.tracking && state.emulated != emulated;

    state.tracking = true;
    state.emulated = emulated;
    state.measured_width = record.measured_width_in_meters;
    state.is_pose_valid = record.pose.has_value();
    if (record.pose)
    {
        state.pose = std::make_unique<Pose>(to_pose(*record.pose));
    }
    return changed;
}

void ImageTracking::teardown_entity(ImageTrackingResult& result)
{
    TrackedImageStateT& state = result.image()->state_;
    state.tracking = false;
    state.emulated = false;
    state.is_pose_valid = false;
}

void ImageTracking::serialize(flatbuffers::FlatBufferBuilder& builder, const Timestamp& timestamp) const
{
    std::vector<flatbuffers::Offset<TrackedImageState>> images;
    for (const auto& image : images_)
    {
        images.push_back(TrackedImageState::Pack(builder, &image->state()));
    }
    auto images_offset = builder.CreateVector(images);

    ImageTrackingRecordBuilder record_builder(builder);
    record_builder.add_images(images_offset);
    record_builder.add_timestamp(&timestamp);
    builder.Finish(record_builder.Finish());
}

} // namespace immersive
