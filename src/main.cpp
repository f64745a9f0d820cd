// =============================================================================
// sendstream-upgrade - btrfs Send-Stream Upgrader
// =============================================================================
// Main entry point for the ssu command-line tool.
//
// This file implements the CLI framework using CLI11, providing:
// - Subcommands: upgrade, verify
// - Global options: verbosity, quiet, log file
// - Console logging is turned off when the upgraded stream goes to stdout
// =============================================================================

#include <CLI/CLI.hpp>

#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>

#include "ssu/common/error.h"
#include "ssu/common/logger.h"
#include "ssu/format/send_format.h"
#include "ssu/format/zstd_codec.h"
#include "ssu/pipeline/upgrade_options.h"

// Command implementations
#include "commands/upgrade_command.h"
#include "commands/verify_command.h"

// Forward declarations for command handlers
namespace ssu::commands {
int runUpgrade(CLI::App* app);
int runVerify(CLI::App* app);
}  // namespace ssu::commands

namespace {

// =============================================================================
// Version Information
// =============================================================================

constexpr const char* kVersion = "0.1.0";
constexpr const char* kDescription =
    "sendstream-upgrade: transcode btrfs send-streams to a newer protocol version\n"
    "Version 1 streams are rewritten as version 2, with contiguous writes coalesced\n"
    "and optionally compressed into ENCODED_WRITE commands.";

// =============================================================================
// Global Options
// =============================================================================

struct GlobalOptions {
    int verbosity = 0;  // 0 = info, 1 = debug, 2 = trace
    bool quiet = false;
    std::string logLevel;
    std::string logFile;
};

GlobalOptions gOptions;

// =============================================================================
// Upgrade Command Options
// =============================================================================

struct CliUpgradeOptions {
    std::string input = "-";
    std::string output = "-";
    std::uint32_t threads = 0;        // 0 = half the CPUs
    int level = ssu::format::kDefaultCompressionLevel;
    std::uint32_t toVersion = 0;      // 0 = newest
    std::size_t maxExtent = ssu::pipeline::kDefaultMaxBatchedExtentSize;
    bool pad = false;
    bool verifyCommands = false;
    bool skipInputCrc = false;
    bool force = false;
};

CliUpgradeOptions gUpgradeOpts;

// =============================================================================
// Verify Command Options
// =============================================================================

struct CliVerifyOptions {
    std::string input = "-";
    bool failFast = false;
};

CliVerifyOptions gVerifyOpts;

// =============================================================================
// Command Setup Functions
// =============================================================================

void setupUpgradeCommand(CLI::App& app) {
    auto* upgrade = app.add_subcommand("upgrade", "Transcode a send-stream to a newer version");
    upgrade->alias("u");

    upgrade->add_option("-i,--input", gUpgradeOpts.input, "Input send-stream (or '-' for stdin)")
        ->check(CLI::ExistingFile | CLI::IsMember({"-"}));

    upgrade->add_option("-o,--output", gUpgradeOpts.output,
                        "Output send-stream (or '-' for stdout)");

    upgrade->add_option("-t,--threads", gUpgradeOpts.threads,
                        "Thread budget (0 = half the CPUs, 1 = single-threaded)")
        ->check(CLI::NonNegativeNumber);

    upgrade->add_option("-l,--level", gUpgradeOpts.level,
                        "zstd compression level (0 disables compression)")
        ->check(CLI::Range(0, ssu::format::kMaxCompressionLevel));

    upgrade->add_option("--to-version", gUpgradeOpts.toVersion,
                        "Destination stream version (default: newest)")
        ->check(CLI::Range(ssu::format::versionNumber(ssu::format::kOldestStreamVersion),
                           ssu::format::versionNumber(ssu::format::kNewestStreamVersion)));

    upgrade->add_option("--max-extent", gUpgradeOpts.maxExtent,
                        "Largest coalesced WRITE payload in bytes (0 disables coalescing)");

    upgrade->add_flag("--pad", gUpgradeOpts.pad,
                      "Pad with UPDATE_EXTENT commands so aligned writes stay aligned");

    upgrade->add_flag("--verify-commands", gUpgradeOpts.verifyCommands,
                      "Re-decode every command before writing it");

    upgrade->add_flag("--skip-input-crc", gUpgradeOpts.skipInputCrc,
                      "Do not validate input command checksums");

    upgrade->add_flag("-f,--force", gUpgradeOpts.force, "Overwrite existing output file");
}

void setupVerifyCommand(CLI::App& app) {
    auto* verify = app.add_subcommand("verify", "Validate a send-stream without writing output");
    verify->alias("v");

    verify->add_option("-i,--input", gVerifyOpts.input, "Input send-stream (or '-' for stdin)")
        ->check(CLI::ExistingFile | CLI::IsMember({"-"}));

    verify->add_flag("--fail-fast", gVerifyOpts.failFast, "Stop at the first invalid command");
}

}  // namespace

// =============================================================================
// Main Entry Point
// =============================================================================

int main(int argc, char* argv[]) {
    CLI::App app{kDescription};
    app.set_version_flag("-V,--version", kVersion);

    // Global options
    app.add_flag("-v,--verbose", gOptions.verbosity,
                 "Increase verbosity (-v for debug, -vv for trace)");

    app.add_flag("-q,--quiet", gOptions.quiet, "Only report errors");

    app.add_option("--log-level", gOptions.logLevel,
                   "Log level, overriding -v and -q")
        ->check(CLI::IsMember({"trace", "debug", "info", "warning", "error", "critical"},
                              CLI::ignore_case));

    app.add_option("--log-file", gOptions.logFile, "Also write log messages to this file");

    // Setup subcommands
    setupUpgradeCommand(app);
    setupVerifyCommand(app);

    // Require a subcommand
    app.require_subcommand(1);

    // Parse arguments
    CLI11_PARSE(app, argc, argv);

    // Initialize logger
    try {
        ssu::log::Config config;
        config.logFile = gOptions.logFile;
        if (gOptions.quiet) {
            config.level = ssu::log::Level::kError;
        } else if (gOptions.verbosity >= 2) {
            config.level = ssu::log::Level::kTrace;
        } else if (gOptions.verbosity >= 1) {
            config.level = ssu::log::Level::kDebug;
        }
        if (!gOptions.logLevel.empty()) {
            config.level = ssu::log::levelFromString(gOptions.logLevel);
        }
        if (app.got_subcommand("upgrade") &&
            (gUpgradeOpts.output.empty() || gUpgradeOpts.output == "-")) {
            config.enableConsole = false;
        }
        ssu::log::init(config);
        SSU_LOG_DEBUG("Logging at level {}", ssu::log::levelToString(config.level));
    } catch (const std::exception& e) {
        std::cerr << "Failed to initialize logger: " << e.what() << std::endl;
        return EXIT_FAILURE;
    }

    // Dispatch to subcommand handlers
    int exitCode = EXIT_SUCCESS;
    try {
        if (app.got_subcommand("upgrade")) {
            exitCode = ssu::commands::runUpgrade(app.get_subcommand("upgrade"));
        } else if (app.got_subcommand("verify")) {
            exitCode = ssu::commands::runVerify(app.get_subcommand("verify"));
        }
    } catch (const ssu::SSUException& ex) {
        SSU_LOG_ERROR("Error: {}", ex.what());
        exitCode = ex.exitCode();
    } catch (const std::exception& ex) {
        SSU_LOG_ERROR("Unexpected error: {}", ex.what());
        exitCode = EXIT_FAILURE;
    }

    ssu::log::shutdown();
    return exitCode;
}

// =============================================================================
// Command Implementations
// =============================================================================

namespace ssu::commands {

int runUpgrade([[maybe_unused]] CLI::App* app) {
    try {
        UpgradeCommandOptions opts;
        opts.upgrade.inputPath = gUpgradeOpts.input;
        opts.upgrade.outputPath = gUpgradeOpts.output;
        opts.upgrade.forceOverwrite = gUpgradeOpts.force;
        opts.upgrade.threadCount = gUpgradeOpts.threads;
        opts.upgrade.compressionLevel = gUpgradeOpts.level;
        opts.upgrade.maxBatchedExtentSize = gUpgradeOpts.maxExtent;
        opts.upgrade.padWithDummyCommands = gUpgradeOpts.pad;
        opts.upgrade.verifyCommands = gUpgradeOpts.verifyCommands;
        opts.upgrade.skipInputChecksums = gUpgradeOpts.skipInputCrc;
        if (gUpgradeOpts.toVersion != 0) {
            opts.upgrade.destinationVersion = format::versionFromNumber(gUpgradeOpts.toVersion);
        }
        opts.showSummary = !gOptions.quiet;
        opts.errorsToStderr = gUpgradeOpts.output.empty() || gUpgradeOpts.output == "-";

        auto cmd = std::make_unique<UpgradeCommand>(std::move(opts));
        return cmd->execute();
    } catch (const SSUException& e) {
        SSU_LOG_ERROR("Upgrade failed: {}", e.what());
        return e.exitCode();
    } catch (const std::exception& e) {
        SSU_LOG_ERROR("Unexpected error: {}", e.what());
        return EXIT_FAILURE;
    }
}

int runVerify([[maybe_unused]] CLI::App* app) {
    try {
        VerifyOptions opts;
        opts.inputPath = gVerifyOpts.input;
        opts.failFast = gVerifyOpts.failFast;
        opts.verbose = gOptions.verbosity > 0;

        auto cmd = std::make_unique<VerifyCommand>(std::move(opts));
        return cmd->execute();
    } catch (const SSUException& e) {
        SSU_LOG_ERROR("Verification failed: {}", e.what());
        return e.exitCode();
    } catch (const std::exception& e) {
        SSU_LOG_ERROR("Unexpected error: {}", e.what());
        return EXIT_FAILURE;
    }
}

}  // namespace ssu::commands
