// =============================================================================
// sendstream-upgrade - Command Batches
// =============================================================================
// Units of work passed between pipeline stages. Every batch covers a
// contiguous range of source command ids, so it can travel through either
// kind of queue.
// =============================================================================

#ifndef SSU_PIPELINE_COMMAND_BATCH_H
#define SSU_PIPELINE_COMMAND_BATCH_H

#include <cstddef>
#include <utility>
#include <vector>

#include "ssu/common/types.h"
#include "ssu/format/send_command.h"

namespace ssu::pipeline {

/// @brief Output command tagged with the source ids it carries bytes of.
/// @note lastIdShared is set when the command holds only the front part of
///       lastId's data; the rest follows in the next output command.
struct OutputCommand {
    CommandId firstId = kInvalidCommandId;
    CommandId lastId = kInvalidCommandId;
    bool lastIdShared = false;
    format::SendCommand command;
};

/// @brief Contiguous run of items covering [firstId(), lastId()].
template <typename Item>
struct CommandBatch {
    CommandId first = kInvalidCommandId;
    CommandId last = kInvalidCommandId;
    bool lastShared = false;

    /// @brief The batch ends with the END command.
    bool containsEnd = false;

    std::vector<Item> items;

    /// @brief Payload or wire bytes accumulated, used for batch sizing.
    std::size_t byteSize = 0;

    /// @brief Get id of the first command covered
    [[nodiscard]] CommandId firstId() const noexcept { return first; }

    /// @brief Get id of the last command covered
    [[nodiscard]] CommandId lastId() const noexcept { return last; }

    /// @brief Check if the next batch continues the last command's data
    [[nodiscard]] bool isLastIdShared() const noexcept { return lastShared; }

    /// @brief Check if the batch holds no items
    [[nodiscard]] bool empty() const noexcept { return items.empty(); }
};

/// @brief Commands read but not yet decoded (Read -> Construct).
using CommandBatchInfo = CommandBatch<format::CommandInfo>;

/// @brief Decoded and transcoded commands, one per source id (Construct -> Batch).
using ConstructedBatch = CommandBatch<format::SendCommand>;

/// @brief Coalesced commands ready for compression and writing.
using OutputBatch = CommandBatch<OutputCommand>;

static_assert(OrderedElement<CommandBatchInfo>);
static_assert(OrderedElement<ConstructedBatch>);
static_assert(OrderedElement<OutputBatch>);
static_assert(UnorderedElement<CommandBatchInfo>);
static_assert(UnorderedElement<OutputBatch>);

}  // namespace ssu::pipeline

#endif  // SSU_PIPELINE_COMMAND_BATCH_H
