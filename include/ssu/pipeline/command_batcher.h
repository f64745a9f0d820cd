// =============================================================================
// sendstream-upgrade - Command Batcher
// =============================================================================
// Sequential write coalescing shared by the single-threaded path and the
// batching stage.
//
// Commands are pushed in source id order. Contiguous WRITEs to the same file
// are merged up to the extent limit; a WRITE that only partially fits leaves
// its remainder as the next output command, and the merged command is tagged
// with a shared last id. Output therefore depends only on the input order,
// never on the thread count.
// =============================================================================

#ifndef SSU_PIPELINE_COMMAND_BATCHER_H
#define SSU_PIPELINE_COMMAND_BATCHER_H

#include <cstddef>
#include <optional>
#include <vector>

#include "ssu/common/types.h"
#include "ssu/format/send_command.h"
#include "ssu/io/upgrade_stats.h"
#include "ssu/pipeline/command_batch.h"

namespace ssu::format {
class ZstdCompressor;
}  // namespace ssu::format

namespace ssu::pipeline {

/// @brief Coalesces WRITE commands pushed in id order.
///
/// Only one command is held back at a time: the WRITE still being extended.
/// Any other command, a WRITE to another file, or a gap in the file offset
/// emits it first.
class CommandBatcher {
public:
    /// @brief Construct a batcher
    /// @param maxExtentSize Largest DATA payload to build, 0 disables merging.
    /// @param coalescing Whether the destination version allows merging.
    CommandBatcher(std::size_t maxExtentSize, bool coalescing) noexcept;

    /// @brief Feed the next command; completed output commands go to out.
    /// @param id Source id of the command
    /// @param command Decoded and transcoded command
    /// @param out Receives zero or more completed output commands
    /// @param stats Receives the coalescing counters
    void push(CommandId id, format::SendCommand command, std::vector<OutputCommand>& out,
              io::UpgradeStats& stats);

    /// @brief Emit the command still being extended, if any.
    /// @param out Receives the pending command
    void flush(std::vector<OutputCommand>& out);

    /// @brief Check if a WRITE is being held for extension
    [[nodiscard]] bool hasPending() const noexcept { return pending_.has_value(); }

    /// @brief Check if coalescing is active (non-zero limit, version allows it)
    [[nodiscard]] bool isEnabled() const noexcept { return enabled_; }

private:
    std::size_t maxExtentSize_;
    bool enabled_;
    std::optional<OutputCommand> pending_;
};

/// @brief Replace a WRITE with its ENCODED_WRITE form when that is smaller.
/// @param command Command to convert in place; non-WRITE commands are left alone
/// @param compressor Per-thread compression context
/// @param stats Receives the compression counters and time
/// @return true if the command was replaced.
bool compressCommand(format::SendCommand& command, format::ZstdCompressor& compressor,
                     io::UpgradeStats& stats);

}  // namespace ssu::pipeline

#endif  // SSU_PIPELINE_COMMAND_BATCHER_H
