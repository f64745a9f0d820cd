// =============================================================================
// sendstream-upgrade - Upgrade Statistics Implementation
// =============================================================================

#include "ssu/io/upgrade_stats.h"

#include <fmt/format.h>

namespace ssu::io {

namespace {

constexpr std::array kCounterFields = {
    &UpgradeStats::bytesRead,
    &UpgradeStats::readsIssued,
    &UpgradeStats::commandsRead,
    &UpgradeStats::bytesWritten,
    &UpgradeStats::writesIssued,
    &UpgradeStats::commandsWritten,
    &UpgradeStats::logicalBytesWritten,
    &UpgradeStats::paddingCommands,
    &UpgradeStats::paddingBytes,
    &UpgradeStats::checksumsVerified,
    &UpgradeStats::checksumBytes,
    &UpgradeStats::bytesCoalesced,
    &UpgradeStats::commandsCoalesced,
    &UpgradeStats::compressionPassed,
    &UpgradeStats::compressionRejected,
    &UpgradeStats::bytesBeforeCompression,
    &UpgradeStats::bytesAfterCompression,
};

constexpr std::array kTimerFields = {
    &UpgradeStats::storageReadTime,
    &UpgradeStats::storageWriteTime,
    &UpgradeStats::bufferWaitTime,
    &UpgradeStats::compressTime,
    &UpgradeStats::decodeTime,
};

double toSeconds(std::chrono::nanoseconds duration) {
    return std::chrono::duration<double>(duration).count();
}

double toMiB(std::uint64_t bytes) {
    return static_cast<double>(bytes) / (1024.0 * 1024.0);
}

}  // namespace

UpgradeStats& UpgradeStats::operator+=(const UpgradeStats& other) noexcept {
    for (auto field : kCounterFields) {
        this->*field += other.*field;
    }
    for (auto field : kTimerFields) {
        this->*field += other.*field;
    }
    return *this;
}

double UpgradeStats::compressionRatio() const noexcept {
    if (bytesBeforeCompression == 0) {
        return 1.0;
    }
    return static_cast<double>(bytesAfterCompression) / static_cast<double>(bytesBeforeCompression);
}

std::string UpgradeStats::summary(std::chrono::nanoseconds elapsed) const {
    const double seconds = toSeconds(elapsed);
    const double throughput = seconds > 0.0 ? toMiB(bytesRead) / seconds : 0.0;

    std::string out;
    out += fmt::format("Commands:    {} read, {} written ({} coalesced away)\n", commandsRead,
                       commandsWritten, commandsCoalesced);
    out += fmt::format("Source:      {:.2f} MiB in {} reads ({:.3f}s)\n", toMiB(bytesRead),
                       readsIssued, toSeconds(storageReadTime));
    out += fmt::format("Destination: {:.2f} MiB in {} writes ({:.3f}s), {:.2f} MiB uncompressed\n",
                       toMiB(bytesWritten), writesIssued, toSeconds(storageWriteTime),
                       toMiB(logicalBytesWritten));
    out += fmt::format("Compression: {} passed, {} rejected, ratio {:.3f} ({:.3f}s)\n",
                       compressionPassed, compressionRejected, compressionRatio(),
                       toSeconds(compressTime));
    out += fmt::format("Padding:     {} commands, {} bytes\n", paddingCommands, paddingBytes);
    out += fmt::format("Checksums:   {} verified ({:.2f} MiB), decode {:.3f}s, buffer wait {:.3f}s\n",
                       checksumsVerified, toMiB(checksumBytes), toSeconds(decodeTime),
                       toSeconds(bufferWaitTime));
    out += fmt::format("Elapsed:     {:.3f}s ({:.2f} MiB/s)", seconds, throughput);
    return out;
}

// =============================================================================
// SharedStats
// =============================================================================

SharedStats::SharedStats() noexcept {
    static_assert(kCounterFields.size() == kCounterCount);
    static_assert(kTimerFields.size() == kTimerCount);
    for (auto& counter : counters_) {
        counter.store(0, std::memory_order_relaxed);
    }
    for (auto& timer : timersNs_) {
        timer.store(0, std::memory_order_relaxed);
    }
}

void SharedStats::add(const UpgradeStats& stats) noexcept {
    for (std::size_t i = 0; i < kCounterFields.size(); ++i) {
        counters_[i].fetch_add(stats.*kCounterFields[i], std::memory_order_relaxed);
    }
    for (std::size_t i = 0; i < kTimerFields.size(); ++i) {
        timersNs_[i].fetch_add((stats.*kTimerFields[i]).count(), std::memory_order_relaxed);
    }
}

UpgradeStats SharedStats::snapshot() const noexcept {
    UpgradeStats stats;
    for (std::size_t i = 0; i < kCounterFields.size(); ++i) {
        stats.*kCounterFields[i] = counters_[i].load(std::memory_order_relaxed);
    }
    for (std::size_t i = 0; i < kTimerFields.size(); ++i) {
        stats.*kTimerFields[i] = std::chrono::nanoseconds(timersNs_[i].load(std::memory_order_relaxed));
    }
    return stats;
}

}  // namespace ssu::io
