// =============================================================================
// sendstream-upgrade - Error Handling Framework
// =============================================================================
// Error handling shared by the codec, the I/O layer and the worker pipeline.
//
// This module provides:
// - ErrorCode enum doubling as the CLI exit code
// - SSUException hierarchy for the throwing codec paths
// - Result<T, E> (std::expected) for queue, worker and coordinator boundaries
// - ErrorContext carrying the file, command id, stage and stream offset
//
// Exit Code Convention:
// - 0: Success
// - 1: Usage/argument error
// - 2: I/O error (short read/write, broken pipe, open failure)
// - 3: Protocol error (bad magic, malformed command or attribute)
// - 4: Checksum verification failure
// - 5: Unsupported stream version or version pair
// =============================================================================

#ifndef SSU_COMMON_ERROR_H
#define SSU_COMMON_ERROR_H

#include <cstdint>
#include <exception>
#include <expected>
#include <optional>
#include <source_location>
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>
#include <utility>
#include <variant>

namespace ssu {

// =============================================================================
// Error Code Enumeration
// =============================================================================

/// @brief Error codes matching CLI exit codes.
/// @note These values are used as process exit codes.
enum class ErrorCode : std::uint8_t {
    /// @brief Operation completed successfully.
    kSuccess = 0,

    /// @brief Usage or argument error.
    kUsageError = 1,

    /// @brief I/O error.
    /// @note Read/write failure, broken pipe, permission denied, etc.
    kIOError = 2,

    /// @brief Protocol error.
    /// @note Bad magic, unknown command/attribute type, malformed TLV.
    kProtocolError = 3,

    /// @brief Command checksum mismatch.
    kChecksumError = 4,

    /// @brief Unsupported stream version or version pair.
    kUnsupportedVersion = 5,

    /// @brief Invalid argument value.
    kInvalidArgument = 6,

    /// @brief File not found.
    kFileNotFound = 7,

    /// @brief File already exists.
    kFileExists = 8,

    /// @brief Failed to open file.
    kFileOpenFailed = 9,

    /// @brief Stream ended in the middle of a header or command.
    kUnexpectedEof = 10,

    /// @brief Invalid state for operation.
    kInvalidState = 11,

    /// @brief Operation was cancelled by an unplanned halt.
    kCancelled = 12,

    /// @brief Payload compression failed inside the compressor library.
    kCompressionFailed = 13,

    /// @brief Internal invariant violation or unexpected exception in a worker.
    kWorkerFault = 14,

    /// @brief Invalid run configuration (resource ownership, sizing).
    kConfigurationError = 15
};

/// @brief Convert ErrorCode to its integer exit code value.
[[nodiscard]] constexpr int toExitCode(ErrorCode code) noexcept {
    return static_cast<int>(code);
}

/// @brief Convert ErrorCode to string representation.
/// @param code The error code.
/// @return Human-readable string describing the error category.
[[nodiscard]] constexpr std::string_view errorCodeToString(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::kSuccess:
            return "success";
        case ErrorCode::kUsageError:
            return "usage error";
        case ErrorCode::kIOError:
            return "I/O error";
        case ErrorCode::kProtocolError:
            return "protocol error";
        case ErrorCode::kChecksumError:
            return "checksum error";
        case ErrorCode::kUnsupportedVersion:
            return "unsupported version";
        case ErrorCode::kInvalidArgument:
            return "invalid argument";
        case ErrorCode::kFileNotFound:
            return "file not found";
        case ErrorCode::kFileExists:
            return "file exists";
        case ErrorCode::kFileOpenFailed:
            return "file open failed";
        case ErrorCode::kUnexpectedEof:
            return "unexpected end of stream";
        case ErrorCode::kInvalidState:
            return "invalid state";
        case ErrorCode::kCancelled:
            return "cancelled";
        case ErrorCode::kCompressionFailed:
            return "compression failed";
        case ErrorCode::kWorkerFault:
            return "worker fault";
        case ErrorCode::kConfigurationError:
            return "configuration error";
    }
    return "unknown error";
}

/// @brief Check if an error code represents success.
[[nodiscard]] constexpr bool isSuccess(ErrorCode code) noexcept {
    return code == ErrorCode::kSuccess;
}

// =============================================================================
// Error Context Structure
// =============================================================================

/// @brief Where in the run an error occurred.
struct ErrorContext {
    /// @brief File path associated with the error (if applicable).
    std::string filePath;

    /// @brief Pipeline stage or worker name (if applicable).
    std::string stage;

    /// @brief Sequence id of the command being processed (if applicable).
    std::optional<std::uint64_t> commandId;

    /// @brief Byte offset in the source or destination stream (if applicable).
    std::optional<std::uint64_t> byteOffset;

    /// @brief Source location where the error was created.
    std::source_location location;

    ErrorContext(std::source_location loc = std::source_location::current()) : location(loc) {}

    explicit ErrorContext(std::string path,
                          std::source_location loc = std::source_location::current())
        : filePath(std::move(path)), location(loc) {}

    ErrorContext& withFile(std::string path) {
        filePath = std::move(path);
        return *this;
    }

    ErrorContext& withStage(std::string name) {
        stage = std::move(name);
        return *this;
    }

    ErrorContext& withCommand(std::uint64_t id) {
        commandId = id;
        return *this;
    }

    ErrorContext& withOffset(std::uint64_t offset) {
        byteOffset = offset;
        return *this;
    }

    /// @brief Format context as a string for error messages.
    [[nodiscard]] std::string format() const;
};

// =============================================================================
// Base Exception Class
// =============================================================================

/// @brief Base exception class for all sendstream-upgrade errors.
/// @note Provides error code, message, and optional context.
class SSUException : public std::exception {
public:
    SSUException(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {
        formatWhat();
    }

    SSUException(ErrorCode code, std::string message, ErrorContext context)
        : code_(code), message_(std::move(message)), context_(std::move(context)) {
        formatWhat();
    }

    ~SSUException() override = default;

    SSUException(const SSUException&) = default;
    SSUException(SSUException&&) noexcept = default;
    SSUException& operator=(const SSUException&) = default;
    SSUException& operator=(SSUException&&) noexcept = default;

    [[nodiscard]] const char* what() const noexcept override { return what_.c_str(); }

    [[nodiscard]] ErrorCode code() const noexcept { return code_; }

    [[nodiscard]] int exitCode() const noexcept { return toExitCode(code_); }

    /// @brief Get the error message (without context).
    [[nodiscard]] const std::string& message() const noexcept { return message_; }

    [[nodiscard]] const std::optional<ErrorContext>& context() const noexcept { return context_; }

    [[nodiscard]] bool hasContext() const noexcept { return context_.has_value(); }

protected:
    /// @brief Format the what() string from message and context.
    void formatWhat();

    ErrorCode code_;
    std::string message_;
    std::optional<ErrorContext> context_;
    std::string what_;
};

// =============================================================================
// Specific Exception Classes
// =============================================================================

/// @brief Exception for usage and argument errors (exit code 1).
class UsageError : public SSUException {
public:
    explicit UsageError(std::string message)
        : SSUException(ErrorCode::kUsageError, std::move(message)) {}

    UsageError(std::string message, ErrorContext context)
        : SSUException(ErrorCode::kUsageError, std::move(message), std::move(context)) {}
};

/// @brief Exception for I/O errors (exit code 2).
/// @note Thrown for short reads/writes, broken pipes, open failures.
class IOError : public SSUException {
public:
    explicit IOError(std::string message)
        : SSUException(ErrorCode::kIOError, std::move(message)) {}

    IOError(std::string message, ErrorContext context)
        : SSUException(ErrorCode::kIOError, std::move(message), std::move(context)) {}

    /// @brief Construct from system error code.
    IOError(std::string message, std::error_code ec)
        : SSUException(ErrorCode::kIOError, formatWithSystemError(message, ec)),
          systemError_(ec) {}

    /// @brief Construct from system error code with context.
    IOError(std::string message, std::error_code ec, ErrorContext context)
        : SSUException(ErrorCode::kIOError, formatWithSystemError(message, ec),
                       std::move(context)),
          systemError_(ec) {}

    [[nodiscard]] const std::optional<std::error_code>& systemError() const noexcept {
        return systemError_;
    }

private:
    static std::string formatWithSystemError(const std::string& message, std::error_code ec);

    std::optional<std::error_code> systemError_;
};

/// @brief Exception for a stream that ends inside a header or command.
class UnexpectedEofError : public SSUException {
public:
    explicit UnexpectedEofError(std::string message)
        : SSUException(ErrorCode::kUnexpectedEof, std::move(message)) {}

    UnexpectedEofError(std::string message, ErrorContext context)
        : SSUException(ErrorCode::kUnexpectedEof, std::move(message), std::move(context)) {}
};

/// @brief Exception for protocol errors (exit code 3).
/// @note Thrown for bad magic, unknown command or attribute types, attributes
///       overrunning their command, DATA not being the last attribute.
class ProtocolError : public SSUException {
public:
    explicit ProtocolError(std::string message)
        : SSUException(ErrorCode::kProtocolError, std::move(message)) {}

    ProtocolError(std::string message, ErrorContext context)
        : SSUException(ErrorCode::kProtocolError, std::move(message), std::move(context)) {}
};

/// @brief Exception for command checksum failures (exit code 4).
class ChecksumError : public SSUException {
public:
    explicit ChecksumError(std::string message)
        : SSUException(ErrorCode::kChecksumError, std::move(message)) {}

    ChecksumError(std::string message, ErrorContext context)
        : SSUException(ErrorCode::kChecksumError, std::move(message), std::move(context)) {}

    /// @brief Construct with the stored and recomputed CRC32C values.
    ChecksumError(std::uint32_t stored, std::uint32_t computed, ErrorContext context)
        : SSUException(ErrorCode::kChecksumError,
                       formatChecksumMismatch(stored, computed),
                       std::move(context)),
          stored_(stored),
          computed_(computed) {}

    [[nodiscard]] std::optional<std::uint32_t> stored() const noexcept { return stored_; }

    [[nodiscard]] std::optional<std::uint32_t> computed() const noexcept { return computed_; }

private:
    static std::string formatChecksumMismatch(std::uint32_t stored, std::uint32_t computed);

    std::optional<std::uint32_t> stored_;
    std::optional<std::uint32_t> computed_;
};

/// @brief Exception for unsupported versions or version pairs (exit code 5).
class UnsupportedVersionError : public SSUException {
public:
    explicit UnsupportedVersionError(std::string message)
        : SSUException(ErrorCode::kUnsupportedVersion, std::move(message)) {}

    UnsupportedVersionError(std::string message, ErrorContext context)
        : SSUException(ErrorCode::kUnsupportedVersion, std::move(message), std::move(context)) {}

    /// @brief Construct from a raw version number read off the wire.
    UnsupportedVersionError(std::uint32_t version, ErrorContext context)
        : SSUException(ErrorCode::kUnsupportedVersion,
                       formatUnsupportedVersion(version),
                       std::move(context)),
          version_(version) {}

    [[nodiscard]] std::optional<std::uint32_t> version() const noexcept { return version_; }

private:
    static std::string formatUnsupportedVersion(std::uint32_t version);

    std::optional<std::uint32_t> version_;
};

/// @brief Exception for invalid run configuration.
class ConfigurationError : public SSUException {
public:
    explicit ConfigurationError(std::string message)
        : SSUException(ErrorCode::kConfigurationError, std::move(message)) {}

    ConfigurationError(std::string message, ErrorContext context)
        : SSUException(ErrorCode::kConfigurationError, std::move(message), std::move(context)) {}
};

/// @brief Exception for internal invariant violations inside a worker.
class WorkerFault : public SSUException {
public:
    explicit WorkerFault(std::string message)
        : SSUException(ErrorCode::kWorkerFault, std::move(message)) {}

    WorkerFault(std::string message, ErrorContext context)
        : SSUException(ErrorCode::kWorkerFault, std::move(message), std::move(context)) {}
};

// =============================================================================
// Result Type (using std::expected)
// =============================================================================

/// @brief Error type for Result, wrapping ErrorCode and message.
class Error {
public:
    Error(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {}

    /// @brief Construct from an SSUException, keeping its formatted context.
    explicit Error(const SSUException& ex);

    [[nodiscard]] ErrorCode code() const noexcept { return code_; }

    [[nodiscard]] const std::string& message() const noexcept { return message_; }

    [[nodiscard]] int exitCode() const noexcept { return toExitCode(code_); }

    /// @brief True when the error only reports an unplanned halt of a primitive.
    [[nodiscard]] bool isCancellation() const noexcept { return code_ == ErrorCode::kCancelled; }

    /// @brief Convert to the appropriate exception type.
    [[nodiscard]] SSUException toException() const;

    /// @brief Throw the appropriate exception.
    [[noreturn]] void throwException() const;

private:
    ErrorCode code_;
    std::string message_;
};

/// @brief Result type for operations that can fail.
template <typename T, typename E = Error>
using Result = std::expected<T, E>;

template <typename T>
[[nodiscard]] Result<T> makeSuccess(T value) {
    return Result<T>{std::move(value)};
}

template <typename T>
[[nodiscard]] Result<T> makeError(ErrorCode code, std::string message) {
    return std::unexpected(Error{code, std::move(message)});
}

template <typename T>
[[nodiscard]] Result<T> makeError(Error error) {
    return std::unexpected(std::move(error));
}

template <typename T>
[[nodiscard]] Result<T> makeError(const SSUException& ex) {
    return std::unexpected(Error{ex});
}

// =============================================================================
// Void Result Type
// =============================================================================

/// @brief Result type for operations that return nothing on success.
using VoidResult = Result<std::monostate>;

[[nodiscard]] inline VoidResult makeVoidSuccess() {
    return VoidResult{std::monostate{}};
}

[[nodiscard]] inline VoidResult makeVoidError(ErrorCode code, std::string message) {
    return std::unexpected(Error{code, std::move(message)});
}

// =============================================================================
// Utility Functions
// =============================================================================

/// @brief Convert a Result to its value or throw the matching exception.
template <typename T>
[[nodiscard]] T unwrapOrThrow(Result<T> result) {
    if (result.has_value()) {
        return std::move(result.value());
    }
    result.error().throwException();
}

/// @brief Throw the matching exception if the result holds an error.
inline void unwrapOrThrow(VoidResult result) {
    if (!result.has_value()) {
        result.error().throwException();
    }
}

/// @brief Execute a function and convert exceptions to Result.
/// @note A void function yields VoidResult.
template <typename F>
[[nodiscard]] auto tryExecute(F&& func) {
    using ReturnType = std::invoke_result_t<F>;
    using ValueType = std::conditional_t<std::is_void_v<ReturnType>, std::monostate, ReturnType>;
    try {
        if constexpr (std::is_void_v<ReturnType>) {
            std::forward<F>(func)();
            return Result<ValueType>{std::monostate{}};
        } else {
            return Result<ValueType>{std::forward<F>(func)()};
        }
    } catch (const SSUException& ex) {
        return Result<ValueType>{std::unexpected(Error{ex})};
    } catch (const std::exception& ex) {
        return Result<ValueType>{std::unexpected(Error{ErrorCode::kWorkerFault, ex.what()})};
    }
}

}  // namespace ssu

#endif  // SSU_COMMON_ERROR_H
