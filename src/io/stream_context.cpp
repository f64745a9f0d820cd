// =============================================================================
// sendstream-upgrade - Stream Context Implementation
// =============================================================================

#include "ssu/io/stream_context.h"

#include <chrono>

#include <fmt/format.h>

#include "ssu/io/buffer_cache.h"
#include "ssu/pipeline/sync_container.h"

namespace ssu::io {

namespace {

using Clock = std::chrono::steady_clock;

}  // namespace

StreamContext::StreamContext(std::shared_ptr<const pipeline::UpgradeOptions> options,
                             std::optional<ByteSource> source,
                             std::optional<ByteSink> destination)
    : options_(std::move(options)),
      source_(std::move(source)),
      destination_(std::move(destination)) {
    if (!options_) {
        throw ConfigurationError("Stream context created without options");
    }
}

StreamContext::StreamContext(std::shared_ptr<const pipeline::UpgradeOptions> options,
                             std::shared_ptr<const pipeline::SyncContainer> sync)
    : options_(std::move(options)), sync_(std::move(sync)) {}

StreamContext::~StreamContext() = default;
StreamContext::StreamContext(StreamContext&&) noexcept = default;
StreamContext& StreamContext::operator=(StreamContext&&) noexcept = default;

// =============================================================================
// Worker contexts
// =============================================================================

Result<StreamContext> StreamContext::cloneForWorker(bool preserveSource,
                                                    bool preserveDestination) {
    if (preserveSource && !source_) {
        return makeError<StreamContext>(ErrorCode::kConfigurationError,
                                        "Source handle is not held by this context");
    }
    if (preserveDestination && !destination_) {
        return makeError<StreamContext>(ErrorCode::kConfigurationError,
                                        "Destination handle is not held by this context");
    }

    StreamContext child(options_, sync_);
    child.sourceVersion_ = sourceVersion_;
    child.destinationVersion_ = destinationVersion_;
    child.readOffset_ = readOffset_;
    child.writeOffset_ = writeOffset_;

    if (preserveSource) {
        child.source_ = std::move(source_);
        source_.reset();
    }
    if (preserveDestination) {
        child.destination_ = std::move(destination_);
        destination_.reset();
    }
    return child;
}

void StreamContext::attachSync(std::shared_ptr<const pipeline::SyncContainer> sync) noexcept {
    sync_ = std::move(sync);
}

void StreamContext::rolloverStats(SharedStats& into) noexcept {
    into.add(stats_);
    stats_ = UpgradeStats{};
}

// =============================================================================
// Reading
// =============================================================================

std::size_t StreamContext::read(std::span<std::uint8_t> dst) {
    if (!source_) {
        readCachedAt(readOffset_, dst);
        readOffset_ += dst.size();
        return dst.size();
    }

    const auto start = Clock::now();
    const std::size_t count = source_->read(dst);
    stats_.storageReadTime += Clock::now() - start;
    stats_.bytesRead += count;
    ++stats_.readsIssued;
    readOffset_ += count;
    return count;
}

void StreamContext::readExact(std::span<std::uint8_t> dst) {
    const StreamOffset offset = readOffset_;
    const std::size_t count = read(dst);
    if (count != dst.size()) {
        throw UnexpectedEofError(
            fmt::format("Failed to read {} bytes, instead read {} bytes", dst.size(), count),
            ErrorContext().withOffset(offset));
    }
}

void StreamContext::readCachedAt(StreamOffset offset, std::span<std::uint8_t> dst) {
    sync().bufferCache->readExact(dst, offset, stats_);
}

std::uint32_t StreamContext::read32() {
    std::uint8_t bytes[sizeof(std::uint32_t)];
    readExact(bytes);
    return loadLE<std::uint32_t>(bytes);
}

// =============================================================================
// Writing
// =============================================================================

void StreamContext::write(std::span<const std::uint8_t> bytes, std::size_t logicalBytes) {
    if (!destination_) {
        throw SSUException(ErrorCode::kInvalidState,
                           "Write through a context without the destination handle",
                           ErrorContext().withOffset(writeOffset_));
    }

    const auto start = Clock::now();
    destination_->write(bytes);
    stats_.storageWriteTime += Clock::now() - start;
    stats_.bytesWritten += bytes.size();
    stats_.logicalBytesWritten += logicalBytes;
    ++stats_.writesIssued;
    writeOffset_ += bytes.size();
}

void StreamContext::write32(std::uint32_t value) {
    std::uint8_t bytes[sizeof(std::uint32_t)];
    storeLE(bytes, value);
    write(bytes);
}

void StreamContext::flush() {
    if (destination_) {
        destination_->flush();
    }
}

// =============================================================================
// Accessors
// =============================================================================

void StreamContext::setVersions(format::StreamVersion source,
                                format::StreamVersion destination) noexcept {
    sourceVersion_ = source;
    destinationVersion_ = destination;
}

format::StreamVersion StreamContext::sourceVersion() const {
    if (!sourceVersion_) {
        throw SSUException(ErrorCode::kInvalidState, "Source version read before the header");
    }
    return *sourceVersion_;
}

format::StreamVersion StreamContext::destinationVersion() const {
    if (!destinationVersion_) {
        throw SSUException(ErrorCode::kInvalidState, "Destination version used before it was set");
    }
    return *destinationVersion_;
}

const pipeline::SyncContainer& StreamContext::sync() const {
    if (!sync_) {
        throw SSUException(ErrorCode::kInvalidState,
                           "Context has neither a source handle nor a buffer cache");
    }
    return *sync_;
}

}  // namespace ssu::io
