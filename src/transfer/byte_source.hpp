#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <ssh/remote_channel.hpp>
#include "transfer_result.hpp"

// What the source said about the stream it is about to deliver.
struct StreamInfo {
    bool range_honored = false;             // false: the body starts at byte 0
    std::optional<uint64_t> total_size;     // declared size of the whole file
};

using StreamStart = std::function<bool(const StreamInfo&)>;

// A readable byte stream that can start at an offset.
class ByteSource {
public:
    virtual ~ByteSource() = default;

    virtual std::string describe() const = 0;

    // Deliver bytes from offset to the end. on_start runs exactly once
    // before the first byte (also for an empty body); returning false
    // from either callback aborts the stream.
    virtual TransferResult stream(uint64_t offset, const StreamStart& on_start,
                                  const ByteSink& sink) = 0;
};

// A file on the worker, read over the channel.
class RemoteFileSource : public ByteSource {
public:
    RemoteFileSource(RemoteChannel& channel, std::string path)
        : channel_(channel), path_(std::move(path)) {}

    std::string describe() const override { return "remote:" + path_; }
    TransferResult stream(uint64_t offset, const StreamStart& on_start,
                          const ByteSink& sink) override;

private:
    RemoteChannel& channel_;
    std::string path_;
};

// Supplies a byte stream for a logical archive name.
class ArchiveSource {
public:
    virtual ~ArchiveSource() = default;
    virtual std::unique_ptr<ByteSource> open(const std::string& archive_name) = 0;
};
