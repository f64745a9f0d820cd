// =============================================================================
// sendstream-upgrade - Upgrade Pipeline Implementation
// =============================================================================

#include "ssu/pipeline/upgrade_pipeline.h"

#include <vector>

#include <fmt/format.h>

#include "ssu/common/logger.h"
#include "ssu/format/stream_codec.h"
#include "ssu/format/zstd_codec.h"
#include "ssu/pipeline/command_batcher.h"
#include "ssu/pipeline/coordinator.h"

namespace ssu::pipeline {

UpgradePipeline::UpgradePipeline(UpgradeOptions options)
    : options_(std::make_shared<const UpgradeOptions>(std::move(options))) {}

VoidResult UpgradePipeline::run() {
    if (auto valid = options_->validate(); !valid) {
        return valid;
    }

    std::optional<io::ByteSource> source;
    std::optional<io::ByteSink> destination;
    auto opened = tryExecute([&] {
        source.emplace(options_->readsStandardInput() ? io::ByteSource::standardInput()
                                                      : io::ByteSource::openFile(options_->inputPath));
        destination.emplace(options_->writesStandardOutput()
                                ? io::ByteSink::standardOutput()
                                : io::ByteSink::createFile(options_->outputPath,
                                                           options_->forceOverwrite));
    });
    if (!opened) {
        return opened;
    }
    return run(std::move(*source), std::move(*destination));
}

VoidResult UpgradePipeline::run(io::ByteSource source, io::ByteSink destination) {
    if (auto valid = options_->validate(); !valid) {
        return valid;
    }
    stats_ = io::UpgradeStats{};
    threadCounts_.reset();

    auto primary = tryExecute([&] { return prepare(std::move(source), std::move(destination)); });
    if (!primary) {
        return std::unexpected(primary.error());
    }

    if (options_->isSingleThreaded()) {
        SSU_LOG_INFO("Running single-threaded");
        auto result = tryExecute([&] { runSingleThreaded(*primary); });
        stats_ = primary->stats();
        return result;
    }

    Coordinator coordinator;
    auto result = coordinator.run(*primary);
    threadCounts_ = coordinator.threadCounts();
    stats_ = coordinator.stats();
    return result;
}

io::StreamContext UpgradePipeline::prepare(io::ByteSource source, io::ByteSink destination) {
    io::StreamContext primary(options_, std::move(source), std::move(destination));

    const auto header = format::readHeader(primary);
    const auto target = options_->destinationVersion.value_or(format::kNewestStreamVersion);
    if (!format::isSupportedVersionPair(header.version, target)) {
        throw UnsupportedVersionError(fmt::format("Cannot transcode a {} stream to {}",
                                                  format::streamVersionToString(header.version),
                                                  format::streamVersionToString(target)));
    }

    sourceVersion_ = header.version;
    destinationVersion_ = target;
    primary.setVersions(header.version, target);
    format::writeHeader(primary, target);

    SSU_LOG_INFO("Transcoding {} stream to {}", format::streamVersionToString(header.version),
                 format::streamVersionToString(target));
    return primary;
}

void UpgradePipeline::runSingleThreaded(io::StreamContext& context) {
    const auto& options = context.options();
    const auto capabilities = format::capabilitiesFor(
        context.sourceVersion(), context.destinationVersion(), options.compressionLevel);

    CommandBatcher batcher(options.maxBatchedExtentSize, capabilities.coalescing);
    std::optional<format::ZstdCompressor> compressor;
    if (capabilities.compression) {
        compressor.emplace(options.compressionLevel);
    }

    std::vector<OutputCommand> ready;
    for (CommandId id = 0;; ++id) {
        auto info = format::readCommand(context, id);
        const bool end = info.isEnd();

        batcher.push(id, format::constructCommand(context, info), ready, context.stats());
        if (end) {
            batcher.flush(ready);
        }

        for (auto& output : ready) {
            if (compressor) {
                compressCommand(output.command, *compressor, context.stats());
            }
            format::writeCommand(context, output.command, output.firstId);
        }
        ready.clear();

        if (end) {
            break;
        }
    }
    context.flush();
}

}  // namespace ssu::pipeline
