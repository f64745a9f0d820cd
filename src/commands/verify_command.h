// =============================================================================
// sendstream-upgrade - Verify Command
// =============================================================================
// Command handler for validating a send-stream without writing output.
//
// This module provides:
// - VerifyCommand: header, per-command checksum and framing, END checks
// - Parallel checksum validation of command batches with oneTBB
// - [PASS]/[FAIL] reporting and a per-type command summary
// =============================================================================

#ifndef SSU_COMMANDS_VERIFY_COMMAND_H
#define SSU_COMMANDS_VERIFY_COMMAND_H

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "ssu/common/error.h"
#include "ssu/common/types.h"
#include "ssu/format/send_command.h"
#include "ssu/format/send_format.h"

namespace ssu::io {
class StreamContext;
}  // namespace ssu::io

namespace ssu::commands {

// =============================================================================
// Verification Result
// =============================================================================

/// @brief Result of a single verification check.
struct VerificationResult {
    std::string checkName;
    bool passed = false;
    std::string errorMessage;

    /// @brief Error category of a failed check.
    ErrorCode code = ErrorCode::kSuccess;
};

/// @brief Overall verification summary.
struct VerificationSummary {
    std::uint32_t totalChecks = 0;
    std::uint32_t passedChecks = 0;
    std::uint32_t failedChecks = 0;
    std::vector<VerificationResult> results;

    /// @brief Stream version found in the header.
    std::optional<format::StreamVersion> version;

    std::uint64_t commands = 0;
    std::uint64_t bytes = 0;
    std::map<format::CommandType, std::uint64_t> commandsByType;

    [[nodiscard]] bool passed() const noexcept { return failedChecks == 0; }

    /// @brief Code of the first failed check (kSuccess if none failed).
    [[nodiscard]] ErrorCode firstFailure() const noexcept;

    void addResult(VerificationResult result) {
        ++totalChecks;
        if (result.passed) {
            ++passedChecks;
        } else {
            ++failedChecks;
        }
        results.push_back(std::move(result));
    }
};

// =============================================================================
// Verify Options
// =============================================================================

struct VerifyOptions {
    /// @brief Send-stream to check ("-" or empty reads standard input).
    std::filesystem::path inputPath;

    /// @brief Stop at the first failed command.
    bool failFast = false;

    /// @brief Print every check, not only failures.
    bool verbose = false;

    /// @brief Commands checked per parallel batch.
    std::size_t batchCommands = 1024;
};

// =============================================================================
// VerifyCommand Class
// =============================================================================

/// @brief Command handler for validating send-streams.
class VerifyCommand {
public:
    explicit VerifyCommand(VerifyOptions options);

    ~VerifyCommand();

    // Non-copyable, movable
    VerifyCommand(const VerifyCommand&) = delete;
    VerifyCommand& operator=(const VerifyCommand&) = delete;
    VerifyCommand(VerifyCommand&&) noexcept;
    VerifyCommand& operator=(VerifyCommand&&) noexcept;

    /// @brief Execute the verify command.
    /// @return Exit code (0 = valid stream).
    [[nodiscard]] int execute();

    [[nodiscard]] const VerificationSummary& summary() const noexcept { return summary_; }

    [[nodiscard]] const VerifyOptions& options() const noexcept { return options_; }

private:
    [[nodiscard]] VerificationResult verifyHeader(io::StreamContext& context);

    /// @brief END must have been reached with nothing after it.
    [[nodiscard]] VerificationResult verifyEnd(io::StreamContext& context, bool reachedEnd);

    /// @brief Read and check every command.
    /// @return true if the END command was reached.
    bool verifyCommands(io::StreamContext& context);

    /// @brief Check one batch in parallel and record its failures.
    /// @return true if every command of the batch is valid.
    bool verifyBatch(const std::vector<format::CommandInfo>& batch, format::StreamVersion version);

    void report(const VerificationResult& result) const;

    void printSummary() const;

    VerifyOptions options_;
    VerificationSummary summary_;
};

}  // namespace ssu::commands

#endif  // SSU_COMMANDS_VERIFY_COMMAND_H
