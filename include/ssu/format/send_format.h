// =============================================================================
// sendstream-upgrade - Send-Stream Wire Format
// =============================================================================
// Constants and enumerations of the btrfs send-stream protocol.
//
// Stream layout:
// +--------------------------+
// | "btrfs-stream\0"         |  13 bytes
// | version (u32 LE)         |  4 bytes
// +--------------------------+
// | command header           |  10 bytes: len (u32), type (u16), crc32c (u32)
// | attributes (TLV)         |  len bytes
// +--------------------------+
// | ...                      |
// | END command              |  zero-length payload
// +--------------------------+
//
// Attributes are framed as type (u16), length (u16), payload. From version 2
// on, the DATA attribute drops its length: it is always last and runs to the
// end of the command.
// =============================================================================

#ifndef SSU_FORMAT_SEND_FORMAT_H
#define SSU_FORMAT_SEND_FORMAT_H

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>

namespace ssu::format {

// =============================================================================
// Stream Header
// =============================================================================

/// @brief Magic bytes opening every send-stream, NUL included.
inline constexpr std::array<std::uint8_t, 13> kStreamMagic = {
    'b', 't', 'r', 'f', 's', '-', 's', 't', 'r', 'e', 'a', 'm', '\0'};

inline constexpr std::size_t kStreamHeaderSize = kStreamMagic.size() + sizeof(std::uint32_t);

/// @brief Send-stream protocol version.
enum class StreamVersion : std::uint32_t {
    kV1 = 1,
    kV2 = 2
};

inline constexpr StreamVersion kOldestStreamVersion = StreamVersion::kV1;
inline constexpr StreamVersion kNewestStreamVersion = StreamVersion::kV2;

[[nodiscard]] constexpr std::uint32_t versionNumber(StreamVersion version) noexcept {
    return static_cast<std::uint32_t>(version);
}

/// @brief Map a raw wire value onto a supported version.
[[nodiscard]] constexpr std::optional<StreamVersion> versionFromNumber(std::uint32_t value) noexcept {
    if (value < versionNumber(kOldestStreamVersion) || value > versionNumber(kNewestStreamVersion)) {
        return std::nullopt;
    }
    return static_cast<StreamVersion>(value);
}

[[nodiscard]] constexpr std::string_view streamVersionToString(StreamVersion version) noexcept {
    switch (version) {
        case StreamVersion::kV1:
            return "v1";
        case StreamVersion::kV2:
            return "v2";
    }
    return "unknown";
}

/// @brief Whether DATA attributes in this version carry a length field.
[[nodiscard]] constexpr bool hasSizedDataAttribute(StreamVersion version) noexcept {
    return version == StreamVersion::kV1;
}

// =============================================================================
// Command Header
// =============================================================================

inline constexpr std::size_t kCommandHeaderSize = 10;
inline constexpr std::size_t kCommandLengthOffset = 0;
inline constexpr std::size_t kCommandTypeOffset = 4;
inline constexpr std::size_t kCommandCrcOffset = 6;

/// @brief Command type codes.
enum class CommandType : std::uint16_t {
    kUnspec = 0,
    kSubvol = 1,
    kSnapshot = 2,
    kMkfile = 3,
    kMkdir = 4,
    kMknod = 5,
    kMkfifo = 6,
    kMksock = 7,
    kSymlink = 8,
    kRename = 9,
    kLink = 10,
    kUnlink = 11,
    kRmdir = 12,
    kSetXattr = 13,
    kRemoveXattr = 14,
    kWrite = 15,
    kClone = 16,
    kTruncate = 17,
    kChmod = 18,
    kChown = 19,
    kUtimes = 20,
    kEnd = 21,
    kUpdateExtent = 22,
    // Version 2
    kFallocate = 23,
    kSetflags = 24,
    kEncodedWrite = 25
};

inline constexpr std::uint16_t kLastCommandTypeV1 = static_cast<std::uint16_t>(CommandType::kUpdateExtent);
inline constexpr std::uint16_t kLastCommandTypeV2 = static_cast<std::uint16_t>(CommandType::kEncodedWrite);

[[nodiscard]] constexpr std::string_view commandTypeToString(CommandType type) noexcept {
    switch (type) {
        case CommandType::kUnspec:
            return "UNSPEC";
        case CommandType::kSubvol:
            return "SUBVOL";
        case CommandType::kSnapshot:
            return "SNAPSHOT";
        case CommandType::kMkfile:
            return "MKFILE";
        case CommandType::kMkdir:
            return "MKDIR";
        case CommandType::kMknod:
            return "MKNOD";
        case CommandType::kMkfifo:
            return "MKFIFO";
        case CommandType::kMksock:
            return "MKSOCK";
        case CommandType::kSymlink:
            return "SYMLINK";
        case CommandType::kRename:
            return "RENAME";
        case CommandType::kLink:
            return "LINK";
        case CommandType::kUnlink:
            return "UNLINK";
        case CommandType::kRmdir:
            return "RMDIR";
        case CommandType::kSetXattr:
            return "SET_XATTR";
        case CommandType::kRemoveXattr:
            return "REMOVE_XATTR";
        case CommandType::kWrite:
            return "WRITE";
        case CommandType::kClone:
            return "CLONE";
        case CommandType::kTruncate:
            return "TRUNCATE";
        case CommandType::kChmod:
            return "CHMOD";
        case CommandType::kChown:
            return "CHOWN";
        case CommandType::kUtimes:
            return "UTIMES";
        case CommandType::kEnd:
            return "END";
        case CommandType::kUpdateExtent:
            return "UPDATE_EXTENT";
        case CommandType::kFallocate:
            return "FALLOCATE";
        case CommandType::kSetflags:
            return "SETFLAGS";
        case CommandType::kEncodedWrite:
            return "ENCODED_WRITE";
    }
    return "UNKNOWN";
}

/// @brief Decode a raw command type, rejecting codes the version lacks.
/// @note UNSPEC is never valid on the wire.
[[nodiscard]] constexpr std::optional<CommandType> commandTypeFor(std::uint16_t raw,
                                                                 StreamVersion version) noexcept {
    const std::uint16_t last =
        version == StreamVersion::kV1 ? kLastCommandTypeV1 : kLastCommandTypeV2;
    if (raw == 0 || raw > last) {
        return std::nullopt;
    }
    return static_cast<CommandType>(raw);
}

// =============================================================================
// Attributes
// =============================================================================

inline constexpr std::size_t kAttributeHeaderSize = 4;

/// @brief Header size of a version 2 DATA attribute (type only).
inline constexpr std::size_t kUnsizedDataHeaderSize = 2;

/// @brief Largest payload a length-prefixed attribute can describe.
inline constexpr std::size_t kMaxSizedAttributeLength = 0xFFFF;

/// @brief Attribute type codes.
enum class AttributeType : std::uint16_t {
    kUnspec = 0,
    kUuid = 1,
    kCtransid = 2,
    kIno = 3,
    kSize = 4,
    kMode = 5,
    kUid = 6,
    kGid = 7,
    kRdev = 8,
    kCtime = 9,
    kMtime = 10,
    kAtime = 11,
    kOtime = 12,
    kXattrName = 13,
    kXattrData = 14,
    kPath = 15,
    kPathTo = 16,
    kPathLink = 17,
    kFileOffset = 18,
    kData = 19,
    kCloneUuid = 20,
    kCloneCtransid = 21,
    kClonePath = 22,
    kCloneOffset = 23,
    kCloneLen = 24,
    // Version 2
    kFallocateMode = 25,
    kSetflagsFlags = 26,
    kUnencodedFileLen = 27,
    kUnencodedLen = 28,
    kUnencodedOffset = 29,
    kCompression = 30,
    kEncryption = 31
};

inline constexpr std::uint16_t kLastAttributeTypeV1 = static_cast<std::uint16_t>(AttributeType::kCloneLen);
inline constexpr std::uint16_t kLastAttributeTypeV2 = static_cast<std::uint16_t>(AttributeType::kEncryption);

[[nodiscard]] constexpr std::string_view attributeTypeToString(AttributeType type) noexcept {
    switch (type) {
        case AttributeType::kUnspec:
            return "UNSPEC";
        case AttributeType::kUuid:
            return "UUID";
        case AttributeType::kCtransid:
            return "CTRANSID";
        case AttributeType::kIno:
            return "INO";
        case AttributeType::kSize:
            return "SIZE";
        case AttributeType::kMode:
            return "MODE";
        case AttributeType::kUid:
            return "UID";
        case AttributeType::kGid:
            return "GID";
        case AttributeType::kRdev:
            return "RDEV";
        case AttributeType::kCtime:
            return "CTIME";
        case AttributeType::kMtime:
            return "MTIME";
        case AttributeType::kAtime:
            return "ATIME";
        case AttributeType::kOtime:
            return "OTIME";
        case AttributeType::kXattrName:
            return "XATTR_NAME";
        case AttributeType::kXattrData:
            return "XATTR_DATA";
        case AttributeType::kPath:
            return "PATH";
        case AttributeType::kPathTo:
            return "PATH_TO";
        case AttributeType::kPathLink:
            return "PATH_LINK";
        case AttributeType::kFileOffset:
            return "FILE_OFFSET";
        case AttributeType::kData:
            return "DATA";
        case AttributeType::kCloneUuid:
            return "CLONE_UUID";
        case AttributeType::kCloneCtransid:
            return "CLONE_CTRANSID";
        case AttributeType::kClonePath:
            return "CLONE_PATH";
        case AttributeType::kCloneOffset:
            return "CLONE_OFFSET";
        case AttributeType::kCloneLen:
            return "CLONE_LEN";
        case AttributeType::kFallocateMode:
            return "FALLOCATE_MODE";
        case AttributeType::kSetflagsFlags:
            return "SETFLAGS_FLAGS";
        case AttributeType::kUnencodedFileLen:
            return "UNENCODED_FILE_LEN";
        case AttributeType::kUnencodedLen:
            return "UNENCODED_LEN";
        case AttributeType::kUnencodedOffset:
            return "UNENCODED_OFFSET";
        case AttributeType::kCompression:
            return "COMPRESSION";
        case AttributeType::kEncryption:
            return "ENCRYPTION";
    }
    return "UNKNOWN";
}

/// @brief Decode a raw attribute type, rejecting codes the version lacks.
[[nodiscard]] constexpr std::optional<AttributeType> attributeTypeFor(std::uint16_t raw,
                                                                     StreamVersion version) noexcept {
    const std::uint16_t last =
        version == StreamVersion::kV1 ? kLastAttributeTypeV1 : kLastAttributeTypeV2;
    if (raw == 0 || raw > last) {
        return std::nullopt;
    }
    return static_cast<AttributeType>(raw);
}

// =============================================================================
// Encoded Writes and Padding
// =============================================================================

/// @brief BTRFS_ENCODED_IO_COMPRESSION_ZSTD.
inline constexpr std::uint32_t kEncodedIoCompressionZstd = 2;

/// @brief zstd window log the receiving kernel accepts for encoded writes.
inline constexpr int kZstdWindowLog = 17;

/// @brief Alignment target for DATA payloads when padding is enabled.
inline constexpr std::size_t kPadAlignment = 4096;

// =============================================================================
// Version Pair Capabilities
// =============================================================================

/// @brief What a source/destination version pair allows the pipeline to do.
struct TranscodeCapabilities {
    /// @brief DATA attributes in the destination carry no length field.
    bool unsizedDestinationData = false;

    /// @brief Contiguous WRITE commands may be coalesced.
    bool coalescing = false;

    /// @brief WRITE commands may be turned into zstd ENCODED_WRITE commands.
    bool compression = false;
};

/// @brief Capabilities of a version pair.
/// @note Compression additionally requires a non-zero compression level.
[[nodiscard]] constexpr TranscodeCapabilities capabilitiesFor(StreamVersion source,
                                                              StreamVersion destination,
                                                              int compressionLevel) noexcept {
    (void)source;
    TranscodeCapabilities caps;
    caps.unsizedDestinationData = !hasSizedDataAttribute(destination);
    caps.coalescing = caps.unsizedDestinationData;
    caps.compression = caps.unsizedDestinationData && compressionLevel != 0;
    return caps;
}

/// @brief Whether a single pass can transcode between two versions.
[[nodiscard]] constexpr bool isSupportedVersionPair(StreamVersion source,
                                                    StreamVersion destination) noexcept {
    const auto src = versionNumber(source);
    const auto dst = versionNumber(destination);
    return (src > dst ? src - dst : dst - src) <= 1;
}

}  // namespace ssu::format

#endif  // SSU_FORMAT_SEND_FORMAT_H
