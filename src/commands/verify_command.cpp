// =============================================================================
// sendstream-upgrade - Verify Command Implementation
// =============================================================================
// Command handler implementation for validating send-streams.
// =============================================================================

#include "verify_command.h"

#include <iostream>
#include <memory>
#include <span>
#include <utility>

#include <fmt/format.h>
#include <tbb/blocked_range.h>
#include <tbb/parallel_for.h>

#include "ssu/common/logger.h"
#include "ssu/format/stream_codec.h"
#include "ssu/io/byte_stream.h"
#include "ssu/io/stream_context.h"
#include "ssu/pipeline/upgrade_options.h"

namespace ssu::commands {

namespace {

/// @brief Failure recorded by a parallel checksum task.
struct CommandFailure {
    ErrorCode code = ErrorCode::kSuccess;
    std::string message;
};

}  // namespace

// =============================================================================
// VerificationSummary
// =============================================================================

ErrorCode VerificationSummary::firstFailure() const noexcept {
    for (const auto& result : results) {
        if (!result.passed) {
            return result.code;
        }
    }
    return ErrorCode::kSuccess;
}

// =============================================================================
// VerifyCommand Implementation
// =============================================================================

VerifyCommand::VerifyCommand(VerifyOptions options) : options_(std::move(options)) {}

VerifyCommand::~VerifyCommand() = default;

VerifyCommand::VerifyCommand(VerifyCommand&&) noexcept = default;
VerifyCommand& VerifyCommand::operator=(VerifyCommand&&) noexcept = default;

int VerifyCommand::execute() {
    summary_ = VerificationSummary{};
    if (options_.batchCommands == 0) {
        options_.batchCommands = 1;
    }

    try {
        const bool fromStdin = options_.inputPath.empty() || options_.inputPath == "-";
        auto source = fromStdin ? io::ByteSource::standardInput()
                                : io::ByteSource::openFile(options_.inputPath);

        if (options_.verbose) {
            std::cout << "Verifying: " << source.name() << std::endl;
            std::cout << std::endl;
        }

        io::StreamContext context(std::make_shared<const pipeline::UpgradeOptions>(),
                                  std::move(source), std::nullopt);

        // 1. Stream header
        auto headerResult = verifyHeader(context);
        summary_.addResult(headerResult);
        report(headerResult);

        // 2. Commands, then 3. END command
        if (headerResult.passed) {
            const bool reachedEnd = verifyCommands(context);
            const bool stoppedEarly = !reachedEnd && options_.failFast && !summary_.passed();

            if (!stoppedEarly) {
                auto endResult = verifyEnd(context, reachedEnd);
                summary_.addResult(endResult);
                report(endResult);
            }
        }

        summary_.bytes = context.readOffset();
        printSummary();

        return summary_.passed() ? 0 : toExitCode(summary_.firstFailure());

    } catch (const SSUException& e) {
        SSU_LOG_ERROR("Verification failed: {}", e.what());
        return toExitCode(e.code());
    } catch (const std::exception& e) {
        SSU_LOG_ERROR("Unexpected error: {}", e.what());
        return 1;
    }
}

VerificationResult VerifyCommand::verifyEnd(io::StreamContext& context, bool reachedEnd) {
    VerificationResult result;
    result.checkName = "End Command";
    if (!reachedEnd) {
        result.errorMessage = "Stream does not end with an END command";
        result.code = ErrorCode::kUnexpectedEof;
        return result;
    }

    std::uint8_t trailing = 0;
    if (context.read(std::span<std::uint8_t>(&trailing, 1)) != 0) {
        result.errorMessage =
            fmt::format("Trailing bytes after the END command at offset {}", context.readOffset() - 1);
        result.code = ErrorCode::kProtocolError;
        return result;
    }
    result.passed = true;
    return result;
}

VerificationResult VerifyCommand::verifyHeader(io::StreamContext& context) {
    VerificationResult result;
    result.checkName = "Stream Header";

    try {
        const auto header = format::readHeader(context);
        context.setVersions(header.version, header.version);
        summary_.version = header.version;
        result.passed = true;
    } catch (const SSUException& e) {
        result.errorMessage = e.message();
        result.code = e.code();
    }
    return result;
}

bool VerifyCommand::verifyCommands(io::StreamContext& context) {
    const auto version = context.sourceVersion();
    std::vector<format::CommandInfo> batch;
    batch.reserve(options_.batchCommands);

    CommandId nextId = 0;
    bool reachedEnd = false;
    bool allValid = true;

    while (!reachedEnd) {
        batch.clear();
        try {
            while (batch.size() < options_.batchCommands) {
                auto info = format::readCommand(context, nextId++);
                reachedEnd = info.isEnd();
                batch.push_back(std::move(info));
                if (reachedEnd) {
                    break;
                }
            }
        } catch (const SSUException& e) {
            // Commands read before the framing error are still checked.
            allValid = verifyBatch(batch, version) && allValid;

            VerificationResult framing;
            framing.checkName = "Command Framing";
            framing.errorMessage = e.message();
            framing.code = e.code();
            summary_.addResult(framing);
            report(framing);
            return false;
        }

        allValid = verifyBatch(batch, version) && allValid;
        if (!allValid && options_.failFast) {
            return false;
        }
    }

    VerificationResult framing;
    framing.checkName = "Command Framing";
    framing.passed = true;
    summary_.addResult(framing);
    report(framing);
    return true;
}

bool VerifyCommand::verifyBatch(const std::vector<format::CommandInfo>& batch,
                                format::StreamVersion version) {
    if (batch.empty()) {
        return true;
    }

    std::vector<CommandFailure> failures(batch.size());

    tbb::parallel_for(tbb::blocked_range<std::size_t>(0, batch.size()),
                      [&](const tbb::blocked_range<std::size_t>& range) {
                          for (std::size_t i = range.begin(); i < range.end(); ++i) {
                              try {
                                  static_cast<void>(format::SendCommand::decode(batch[i], version, true));
                              } catch (const SSUException& e) {
                                  failures[i].code = e.code();
                                  failures[i].message = e.message();
                              }
                          }
                      });

    bool valid = true;
    for (std::size_t i = 0; i < batch.size(); ++i) {
        const auto& info = batch[i];
        ++summary_.commands;
        if (const auto type = format::commandTypeFor(info.header.rawType, version)) {
            ++summary_.commandsByType[*type];
        }

        if (isSuccess(failures[i].code)) {
            continue;
        }
        valid = false;

        VerificationResult result;
        result.checkName = fmt::format("Command {}", info.id);
        result.errorMessage = failures[i].message;
        result.code = failures[i].code;
        summary_.addResult(result);
        report(result);
    }

    SSU_LOG_DEBUG("Checked {} commands ending at id {}", batch.size(), batch.back().id);
    return valid;
}

void VerifyCommand::report(const VerificationResult& result) const {
    if (!options_.verbose && result.passed) {
        return;
    }
    std::cout << "[" << (result.passed ? "PASS" : "FAIL") << "] " << result.checkName;
    if (!result.passed) {
        std::cout << ": " << result.errorMessage;
    }
    std::cout << std::endl;
}

void VerifyCommand::printSummary() const {
    std::cout << std::endl;
    std::cout << "=== Verification Summary ===" << std::endl;
    std::cout << "File:     "
              << (options_.inputPath.empty() ? std::string("-") : options_.inputPath.string())
              << std::endl;
    if (summary_.version) {
        std::cout << "Version:  " << format::streamVersionToString(*summary_.version) << std::endl;
    }
    std::cout << "Commands: " << summary_.commands << std::endl;
    std::cout << "Bytes:    " << summary_.bytes << std::endl;
    std::cout << "Checks:   " << summary_.passedChecks << "/" << summary_.totalChecks << " passed"
              << std::endl;

    if (options_.verbose && !summary_.commandsByType.empty()) {
        std::cout << std::endl;
        std::cout << "Commands by type:" << std::endl;
        for (const auto& [type, count] : summary_.commandsByType) {
            std::cout << fmt::format("  {:<14} {}", format::commandTypeToString(type), count)
                      << std::endl;
        }
    }

    if (summary_.passed()) {
        std::cout << "Status:   OK" << std::endl;
    } else {
        std::cout << "Status:   FAILED" << std::endl;
        std::cout << std::endl;
        std::cout << "Failed checks:" << std::endl;
        for (const auto& result : summary_.results) {
            if (!result.passed) {
                std::cout << "  - " << result.checkName << ": " << result.errorMessage << std::endl;
            }
        }
    }
}

}  // namespace ssu::commands
