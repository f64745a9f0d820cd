// =============================================================================
// sendstream-upgrade - Upgrade Command Implementation
// =============================================================================

#include "upgrade_command.h"

#include <iostream>
#include <utility>

#include "ssu/common/logger.h"
#include "ssu/format/send_format.h"
#include "ssu/pipeline/upgrade_pipeline.h"

namespace ssu::commands {

UpgradeCommand::UpgradeCommand(UpgradeCommandOptions options) : options_(std::move(options)) {}

UpgradeCommand::~UpgradeCommand() = default;

UpgradeCommand::UpgradeCommand(UpgradeCommand&&) noexcept = default;
UpgradeCommand& UpgradeCommand::operator=(UpgradeCommand&&) noexcept = default;

int UpgradeCommand::execute() {
    const auto startTime = std::chrono::steady_clock::now();

    try {
        pipeline::UpgradePipeline upgrade(options_.upgrade);
        auto result = upgrade.run();

        elapsed_ = std::chrono::duration_cast<std::chrono::nanoseconds>(
            std::chrono::steady_clock::now() - startTime);
        stats_ = upgrade.stats();
        threadCounts_ = upgrade.threadCounts();

        if (!result) {
            SSU_LOG_ERROR("Upgrade failed: {}", result.error().message());
            if (options_.errorsToStderr) {
                std::cerr << "ssu: upgrade failed: " << result.error().message() << std::endl;
            }
            if (!options_.upgrade.writesStandardOutput()) {
                SSU_LOG_ERROR("Output {} is incomplete and must not be received",
                              options_.upgrade.outputPath.string());
            }
            return result.error().exitCode();
        }

        SSU_LOG_INFO("Upgraded {} stream to {} in {:.3f}s",
                     format::streamVersionToString(*upgrade.sourceVersion()),
                     format::streamVersionToString(*upgrade.destinationVersion()),
                     std::chrono::duration<double>(elapsed_).count());

        if (options_.showSummary) {
            printSummary();
        }
        return 0;

    } catch (const SSUException& e) {
        SSU_LOG_ERROR("Upgrade failed: {}", e.what());
        return e.exitCode();
    } catch (const std::exception& e) {
        SSU_LOG_ERROR("Unexpected error: {}", e.what());
        return 1;
    }
}

void UpgradeCommand::printSummary() const {
    // stdout may carry the upgraded stream.
    std::cerr << std::endl;
    std::cerr << "=== Upgrade Summary ===" << std::endl;
    if (threadCounts_) {
        std::cerr << "Constructors: " << threadCounts_->constructors << std::endl;
        std::cerr << "Compressors:  " << threadCounts_->compressors << std::endl;
    } else {
        std::cerr << "Threads:      1" << std::endl;
    }
    std::cerr << stats_.summary(elapsed_) << std::endl;
}

}  // namespace ssu::commands
