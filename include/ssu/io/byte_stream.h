// =============================================================================
// sendstream-upgrade - Byte Source and Sink Handles
// =============================================================================
// Move-only handles over the source and destination streams.
//
// Exactly one StreamContext holds each handle at a time; transferring the
// handle to a worker moves it. Standard input and output are borrowed, files
// are owned and closed when the handle is destroyed.
// =============================================================================

#ifndef SSU_IO_BYTE_STREAM_H
#define SSU_IO_BYTE_STREAM_H

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <iosfwd>
#include <memory>
#include <span>
#include <string>

namespace ssu::io {

/// @brief Readable end of the pipeline.
class ByteSource {
public:
    /// @brief Borrow std::cin.
    [[nodiscard]] static ByteSource standardInput();

    /// @brief Open a file for reading.
    /// @throws IOError (kFileNotFound, kFileOpenFailed)
    [[nodiscard]] static ByteSource openFile(const std::filesystem::path& path);

    /// @brief Take ownership of an arbitrary stream.
    [[nodiscard]] static ByteSource fromStream(std::unique_ptr<std::istream> stream,
                                               std::string name);

    /// @brief Borrow a stream owned by the caller, which must outlive the handle.
    [[nodiscard]] static ByteSource borrow(std::istream& stream, std::string name);

    ~ByteSource();

    // Non-copyable, movable
    ByteSource(const ByteSource&) = delete;
    ByteSource& operator=(const ByteSource&) = delete;
    ByteSource(ByteSource&&) noexcept;
    ByteSource& operator=(ByteSource&&) noexcept;

    /// @brief Fill dst, stopping early only at end of stream.
    /// @return Number of bytes read.
    /// @throws IOError on a stream failure other than end of file.
    std::size_t read(std::span<std::uint8_t> dst);

    [[nodiscard]] const std::string& name() const noexcept { return name_; }

private:
    ByteSource(std::unique_ptr<std::istream> owned, std::istream* stream, std::string name);

    std::unique_ptr<std::istream> owned_;
    std::istream* stream_ = nullptr;
    std::string name_;
};

/// @brief Writable end of the pipeline.
class ByteSink {
public:
    /// @brief Borrow std::cout.
    [[nodiscard]] static ByteSink standardOutput();

    /// @brief Create (or with force, truncate) a file for writing.
    /// @throws IOError (kFileExists, kFileOpenFailed)
    [[nodiscard]] static ByteSink createFile(const std::filesystem::path& path, bool force);

    [[nodiscard]] static ByteSink fromStream(std::unique_ptr<std::ostream> stream,
                                             std::string name);

    [[nodiscard]] static ByteSink borrow(std::ostream& stream, std::string name);

    /// @brief Flushes owned streams; errors at this point are only logged.
    ~ByteSink();

    // Non-copyable, movable
    ByteSink(const ByteSink&) = delete;
    ByteSink& operator=(const ByteSink&) = delete;
    ByteSink(ByteSink&&) noexcept;
    ByteSink& operator=(ByteSink&&) noexcept;

    /// @throws IOError if the stream rejects the bytes.
    void write(std::span<const std::uint8_t> bytes);

    /// @throws IOError
    void flush();

    [[nodiscard]] const std::string& name() const noexcept { return name_; }

private:
    ByteSink(std::unique_ptr<std::ostream> owned, std::ostream* stream, std::string name);

    std::unique_ptr<std::ostream> owned_;
    std::ostream* stream_ = nullptr;
    std::string name_;
};

}  // namespace ssu::io

#endif  // SSU_IO_BYTE_STREAM_H
