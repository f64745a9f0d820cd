// =============================================================================
// sendstream-upgrade - Error Handling Framework Implementation
// =============================================================================

#include "ssu/common/error.h"

#include <format>
#include <sstream>

namespace ssu {

// =============================================================================
// ErrorContext Implementation
// =============================================================================

std::string ErrorContext::format() const {
    std::ostringstream oss;
    bool hasContent = false;

    auto separate = [&]() {
        if (hasContent) {
            oss << ", ";
        }
        hasContent = true;
    };

    if (!stage.empty()) {
        separate();
        oss << "stage: " << stage;
    }

    if (!filePath.empty()) {
        separate();
        oss << "file: " << filePath;
    }

    if (commandId.has_value()) {
        separate();
        oss << "command: " << *commandId;
    }

    if (byteOffset.has_value()) {
        separate();
        oss << "offset: 0x" << std::hex << *byteOffset << std::dec;
    }

#ifndef NDEBUG
    if (hasContent) {
        oss << " (at " << location.file_name() << ":" << location.line() << ")";
    }
#endif

    return oss.str();
}

// =============================================================================
// SSUException Implementation
// =============================================================================

void SSUException::formatWhat() {
    std::ostringstream oss;
    oss << "[" << errorCodeToString(code_) << "] " << message_;

    if (context_.has_value()) {
        std::string contextStr = context_->format();
        if (!contextStr.empty()) {
            oss << " (" << contextStr << ")";
        }
    }

    what_ = oss.str();
}

std::string IOError::formatWithSystemError(const std::string& message, std::error_code ec) {
    return std::format("{}: {} (error code: {})", message, ec.message(), ec.value());
}

std::string ChecksumError::formatChecksumMismatch(std::uint32_t stored, std::uint32_t computed) {
    return std::format("Mismatch between stored CRC32C 0x{:08x} and computed 0x{:08x}", stored,
                       computed);
}

std::string UnsupportedVersionError::formatUnsupportedVersion(std::uint32_t version) {
    return std::format("unsupported send-stream version: {}", version);
}

// =============================================================================
// Error Implementation
// =============================================================================

Error::Error(const SSUException& ex) : code_(ex.code()), message_(ex.message()) {
    if (ex.hasContext()) {
        std::string contextStr = ex.context()->format();
        if (!contextStr.empty()) {
            message_ += " (" + contextStr + ")";
        }
    }
}

SSUException Error::toException() const {
    return SSUException(code_, message_);
}

[[noreturn]] void Error::throwException() const {
    switch (code_) {
        case ErrorCode::kUsageError:
            throw UsageError(message_);
        case ErrorCode::kIOError:
            throw IOError(message_);
        case ErrorCode::kUnexpectedEof:
            throw UnexpectedEofError(message_);
        case ErrorCode::kProtocolError:
            throw ProtocolError(message_);
        case ErrorCode::kChecksumError:
            throw ChecksumError(message_);
        case ErrorCode::kUnsupportedVersion:
            throw UnsupportedVersionError(message_);
        case ErrorCode::kConfigurationError:
            throw ConfigurationError(message_);
        case ErrorCode::kWorkerFault:
            throw WorkerFault(message_);
        default:
            break;
    }
    throw SSUException(code_, message_);
}

}  // namespace ssu
