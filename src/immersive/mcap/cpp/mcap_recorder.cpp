// SPDX-FileCopyrightText: Copyright (c) 2025 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#define MCAP_IMPLEMENTATION
#include "inc/mcap_recorder.hpp"

#include <flatbuffers/flatbuffers.h>
#include <mcap/writer.hpp>

#include <iostream>
#include <set>
#include <stdexcept>
#include <unordered_map>

namespace immersive
{

class McapRecorder::Impl
{
public:
    Impl() = default;

    ~Impl()
    {
        close();
    }

    void open(const std::string& filename)
    {
        filename_ = filename;

        mcap::McapWriterOptions options("immersive");
        options.compression = mcap::Compression::None;

        auto status = writer_.open(filename, options);
        if (!status.ok())
        {
            throw std::runtime_error("McapRecorder: Failed to open " + filename + ": " + status.message);
        }
        is_open_ = true;

        std::cout << "McapRecorder: Opened " << filename << " for recording" << std::endl;
    }

    void add_subsystem(const std::shared_ptr<DetectionSubsystem>& subsystem)
    {
        const std::string channel_name(subsystem->get_record_channel());
        if (channel_name.empty())
        {
            throw std::runtime_error("McapRecorder: " + std::string(subsystem->get_name()) + " has no record channel");
        }
        if (!channel_names_.insert(channel_name).second)
        {
            throw std::runtime_error("McapRecorder: Duplicate channel " + channel_name);
        }

        const std::string schema_name(subsystem->get_schema_name());
        if (schema_ids_.find(schema_name) == schema_ids_.end())
        {
            mcap::Schema schema(schema_name, "flatbuffer", std::string(subsystem->get_schema_text()));
            writer_.addSchema(schema);
            schema_ids_[schema_name] = schema.id;
        }

        mcap::Channel channel(channel_name, "flatbuffer", schema_ids_[schema_name]);
        writer_.addChannel(channel);

        subsystems_.push_back(subsystem);
        channel_ids_[subsystem.get()] = channel.id;
    }

    void close()
    {
        if (is_open_)
        {
            writer_.close();
            is_open_ = false;
            std::cout << "McapRecorder: Closed " << filename_ << " with " << message_count_ << " messages" << std::endl;
        }
    }

    size_t record_all(const Timestamp& timestamp)
    {
        size_t written = 0;
        for (const auto& subsystem : subsystems_)
        {
            if (subsystem->available() && record(*subsystem, timestamp))
            {
                ++written;
            }
        }
        return written;
    }

    bool record(const DetectionSubsystem& subsystem, const Timestamp& timestamp)
    {
        if (!is_open_)
        {
            return false;
        }

        auto it = channel_ids_.find(&subsystem);
        if (it == channel_ids_.end())
        {
            std::cerr << "McapRecorder: " << subsystem.get_name() << " is not registered" << std::endl;
            return false;
        }

        flatbuffers::FlatBufferBuilder builder(1024);
        subsystem.serialize(builder, timestamp);

        const auto log_time = static_cast<mcap::Timestamp>(timestamp.common_time());

        mcap::Message msg;
        msg.channelId = it->second;
        msg.logTime = log_time;
        msg.publishTime = log_time;
        msg.sequence = static_cast<uint32_t>(message_count_);
        msg.data = reinterpret_cast<const std::byte*>(builder.GetBufferPointer());
        msg.dataSize = builder.GetSize();

        auto status = writer_.write(msg);
        if (!status.ok())
        {
            std::cerr << "McapRecorder: Failed to write message: " << status.message << std::endl;
            return false;
        }

        ++message_count_;
        return true;
    }

    uint64_t message_count() const
    {
        return message_count_;
    }

    const std::string& filename() const
    {
        return filename_;
    }

private:
    mcap::McapWriter writer_;
    std::string filename_;
    bool is_open_ = false;
    uint64_t message_count_ = 0;

    std::vector<std::shared_ptr<DetectionSubsystem>> subsystems_;
    std::set<std::string> channel_names_;
    std::unordered_map<std::string, mcap::SchemaId> schema_ids_;
    std::unordered_map<const DetectionSubsystem*, mcap::ChannelId> channel_ids_;
};

McapRecorder::McapRecorder() : impl_(std::make_unique<Impl>())
{
}

McapRecorder::~McapRecorder() = default;

std::unique_ptr<McapRecorder> McapRecorder::create(const std::string& filename,
                                                   const std::vector<std::shared_ptr<DetectionSubsystem>>& subsystems)
{
    auto recorder = std::unique_ptr<McapRecorder>(new McapRecorder());
    recorder->impl_->open(filename);
    for (const auto& subsystem : subsystems)
    {
        recorder->impl_->add_subsystem(subsystem);
    }
    return recorder;
}

size_t McapRecorder::record(const Timestamp& timestamp)
{
    return impl_->record_all(timestamp);
}

bool McapRecorder::record(const DetectionSubsystem& subsystem, const Timestamp& timestamp)
{
    return impl_->record(subsystem, timestamp);
}

uint64_t McapRecorder::message_count() const
{
    return impl_->message_count();
}

const std::string& McapRecorder::filename() const
{
    return impl_->filename();
}

} // namespace immersive
