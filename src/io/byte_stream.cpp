// =============================================================================
// sendstream-upgrade - Byte Source and Sink Implementation
// =============================================================================

#include "ssu/io/byte_stream.h"

#include <fstream>
#include <iostream>
#include <system_error>
#include <utility>

#include "ssu/common/error.h"
#include "ssu/common/logger.h"

namespace ssu::io {

// =============================================================================
// ByteSource
// =============================================================================

ByteSource::ByteSource(std::unique_ptr<std::istream> owned, std::istream* stream, std::string name)
    : owned_(std::move(owned)), stream_(stream), name_(std::move(name)) {}

ByteSource::~ByteSource() = default;

ByteSource::ByteSource(ByteSource&& other) noexcept
    : owned_(std::move(other.owned_)),
      stream_(std::exchange(other.stream_, nullptr)),
      name_(std::move(other.name_)) {}

ByteSource& ByteSource::operator=(ByteSource&& other) noexcept {
    if (this != &other) {
        owned_ = std::move(other.owned_);
        stream_ = std::exchange(other.stream_, nullptr);
        name_ = std::move(other.name_);
    }
    return *this;
}

ByteSource ByteSource::standardInput() {
    return ByteSource(nullptr, &std::cin, "<stdin>");
}

ByteSource ByteSource::openFile(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        throw SSUException(ErrorCode::kFileNotFound, "Input file does not exist",
                           ErrorContext(path.string()));
    }

    auto stream = std::make_unique<std::ifstream>(path, std::ios::in | std::ios::binary);
    if (!stream->is_open()) {
        throw SSUException(ErrorCode::kFileOpenFailed, "Failed to open input file",
                           ErrorContext(path.string()));
    }
    std::istream* raw = stream.get();
    return ByteSource(std::move(stream), raw, path.string());
}

ByteSource ByteSource::fromStream(std::unique_ptr<std::istream> stream, std::string name) {
    std::istream* raw = stream.get();
    return ByteSource(std::move(stream), raw, std::move(name));
}

ByteSource ByteSource::borrow(std::istream& stream, std::string name) {
    return ByteSource(nullptr, &stream, std::move(name));
}

std::size_t ByteSource::read(std::span<std::uint8_t> dst) {
    if (stream_ == nullptr) {
        throw SSUException(ErrorCode::kInvalidState, "Read from a moved-from source handle");
    }

    std::size_t total = 0;
    while (total < dst.size() && stream_->good()) {
        stream_->read(reinterpret_cast<char*>(dst.data() + total),
                      static_cast<std::streamsize>(dst.size() - total));
        total += static_cast<std::size_t>(stream_->gcount());
    }

    if (stream_->bad()) {
        throw IOError("Failed to read from source", ErrorContext(name_));
    }
    return total;
}

// =============================================================================
// ByteSink
// =============================================================================

ByteSink::ByteSink(std::unique_ptr<std::ostream> owned, std::ostream* stream, std::string name)
    : owned_(std::move(owned)), stream_(stream), name_(std::move(name)) {}

ByteSink::~ByteSink() {
    if (stream_ == nullptr) {
        return;
    }
    stream_->flush();
    if (stream_->bad()) {
        SSU_LOG_WARNING("Flushing {} on close failed", name_);
    }
}

ByteSink::ByteSink(ByteSink&& other) noexcept
    : owned_(std::move(other.owned_)),
      stream_(std::exchange(other.stream_, nullptr)),
      name_(std::move(other.name_)) {}

ByteSink& ByteSink::operator=(ByteSink&& other) noexcept {
    if (this != &other) {
        if (stream_ != nullptr) {
            stream_->flush();
        }
        owned_ = std::move(other.owned_);
        stream_ = std::exchange(other.stream_, nullptr);
        name_ = std::move(other.name_);
    }
    return *this;
}

ByteSink ByteSink::standardOutput() {
    return ByteSink(nullptr, &std::cout, "<stdout>");
}

ByteSink ByteSink::createFile(const std::filesystem::path& path, bool force) {
    std::error_code ec;
    if (!force && std::filesystem::exists(path, ec)) {
        throw SSUException(ErrorCode::kFileExists,
                           "Output file already exists (use --force to overwrite)",
                           ErrorContext(path.string()));
    }

    auto stream = std::make_unique<std::ofstream>(
        path, std::ios::out | std::ios::binary | std::ios::trunc);
    if (!stream->is_open()) {
        throw SSUException(ErrorCode::kFileOpenFailed, "Failed to create output file",
                           ErrorContext(path.string()));
    }
    std::ostream* raw = stream.get();
    return ByteSink(std::move(stream), raw, path.string());
}

ByteSink ByteSink::fromStream(std::unique_ptr<std::ostream> stream, std::string name) {
    std::ostream* raw = stream.get();
    return ByteSink(std::move(stream), raw, std::move(name));
}

ByteSink ByteSink::borrow(std::ostream& stream, std::string name) {
    return ByteSink(nullptr, &stream, std::move(name));
}

void ByteSink::write(std::span<const std::uint8_t> bytes) {
    if (stream_ == nullptr) {
        throw SSUException(ErrorCode::kInvalidState, "Write to a moved-from destination handle");
    }
    stream_->write(reinterpret_cast<const char*>(bytes.data()),
                   static_cast<std::streamsize>(bytes.size()));
    if (!stream_->good()) {
        throw IOError("Failed to write to destination", ErrorContext(name_));
    }
}

void ByteSink::flush() {
    if (stream_ == nullptr) {
        return;
    }
    stream_->flush();
    if (!stream_->good()) {
        throw IOError("Failed to flush destination", ErrorContext(name_));
    }
}

}  // namespace ssu::io
