// =============================================================================
// sendstream-upgrade - Command Batcher Implementation
// =============================================================================

#include "ssu/pipeline/command_batcher.h"

#include <chrono>

#include "ssu/format/zstd_codec.h"

namespace ssu::pipeline {

CommandBatcher::CommandBatcher(std::size_t maxExtentSize, bool coalescing) noexcept
    : maxExtentSize_(maxExtentSize), enabled_(coalescing && maxExtentSize > 0) {}

void CommandBatcher::push(CommandId id, format::SendCommand command,
                          std::vector<OutputCommand>& out, io::UpgradeStats& stats) {
    if (!enabled_) {
        out.push_back(OutputCommand{id, id, false, std::move(command)});
        return;
    }

    if (pending_ && pending_->command.canAppend(command)) {
        const std::size_t moved = pending_->command.append(command, maxExtentSize_);
        stats.bytesCoalesced += moved;

        if (moved > 0 && command.isEmpty()) {
            // Fully absorbed.
            ++stats.commandsCoalesced;
            pending_->lastId = id;
            if (pending_->command.isFull(maxExtentSize_)) {
                out.push_back(std::move(*pending_));
                pending_.reset();
            }
            return;
        }

        if (moved > 0) {
            // The front of this command now travels with the pending one.
            pending_->lastId = id;
            pending_->lastIdShared = true;
        }
    }

    flush(out);

    if (command.isAppendable() && !command.isFull(maxExtentSize_)) {
        pending_.emplace(OutputCommand{id, id, false, std::move(command)});
        return;
    }
    out.push_back(OutputCommand{id, id, false, std::move(command)});
}

void CommandBatcher::flush(std::vector<OutputCommand>& out) {
    if (pending_) {
        out.push_back(std::move(*pending_));
        pending_.reset();
    }
}

bool compressCommand(format::SendCommand& command, format::ZstdCompressor& compressor,
                     io::UpgradeStats& stats) {
    if (command.type() != format::CommandType::kWrite || command.dataSize() == 0) {
        return false;
    }

    const auto start = std::chrono::steady_clock::now();
    auto encoded = command.compress(compressor);
    stats.compressTime += std::chrono::steady_clock::now() - start;

    if (!encoded) {
        ++stats.compressionRejected;
        return false;
    }

    ++stats.compressionPassed;
    stats.bytesBeforeCompression += command.dataSize();
    stats.bytesAfterCompression += encoded->dataSize();
    command = std::move(*encoded);
    return true;
}

}  // namespace ssu::pipeline
