// =============================================================================
// sendstream-upgrade - Test Stream Builder Implementation
// =============================================================================

#include "support/stream_builder.h"

#include <algorithm>
#include <array>
#include <filesystem>
#include <fstream>
#include <memory>
#include <random>
#include <stdexcept>

#include <fmt/format.h>

#include "ssu/common/crc32c.h"
#include "ssu/format/send_attribute.h"

namespace ssu::test {

namespace {

constexpr std::size_t kSampleChunkSize = 48 * 1024;

}  // namespace

ByteBuffer patternData(std::size_t size, std::uint32_t seed) {
    ByteBuffer data(size);
    std::mt19937 rng(seed);
    std::uint8_t current = static_cast<std::uint8_t>(rng());
    for (std::size_t i = 0; i < size; ++i) {
        // Runs of repeated bytes with occasional changes.
        if (rng() % 16 == 0) {
            current = static_cast<std::uint8_t>(rng() % 8);
        }
        data[i] = current;
    }
    return data;
}

ByteBuffer randomData(std::size_t size, std::uint32_t seed) {
    ByteBuffer data(size);
    std::mt19937 rng(seed);
    std::generate(data.begin(), data.end(), [&rng] { return static_cast<std::uint8_t>(rng()); });
    return data;
}

ByteBuffer buildCommand(format::CommandType type, const ByteBuffer& attributes,
                        std::optional<std::span<const std::uint8_t>> data,
                        format::StreamVersion version) {
    ByteBuffer out(format::kCommandHeaderSize);
    out.insert(out.end(), attributes.begin(), attributes.end());
    if (data) {
        format::encodeDataAttributeHeader(out, data->size(), version);
        out.insert(out.end(), data->begin(), data->end());
    }

    storeLE(out.data() + format::kCommandLengthOffset,
            static_cast<std::uint32_t>(out.size() - format::kCommandHeaderSize));
    storeLE(out.data() + format::kCommandTypeOffset, static_cast<std::uint16_t>(type));
    storeLE(out.data() + format::kCommandCrcOffset, std::uint32_t{0});
    storeLE(out.data() + format::kCommandCrcOffset, sendStreamChecksum(out));
    return out;
}

// =============================================================================
// StreamBuilder
// =============================================================================

StreamBuilder::StreamBuilder(format::StreamVersion version) : version_(version) {
    bytes_.assign(format::kStreamMagic.begin(), format::kStreamMagic.end());
    appendLE(bytes_, format::versionNumber(version));
}

StreamBuilder& StreamBuilder::add(format::CommandType type, const ByteBuffer& attributes,
                                  std::optional<std::span<const std::uint8_t>> data) {
    commandOffsets_.push_back(bytes_.size());
    const ByteBuffer command = buildCommand(type, attributes, data, version_);
    bytes_.insert(bytes_.end(), command.begin(), command.end());
    return *this;
}

StreamBuilder& StreamBuilder::subvol(std::string_view path) {
    ByteBuffer attributes;
    format::encodeStringAttribute(attributes, format::AttributeType::kPath, path);
    const std::array<std::uint8_t, 16> uuid{1, 2, 3, 4, 5, 6, 7, 8, 9, 10, 11, 12, 13, 14, 15, 16};
    format::encodeAttribute(attributes, format::AttributeType::kUuid, uuid);
    format::encodeU64Attribute(attributes, format::AttributeType::kCtransid, 42);
    return add(format::CommandType::kSubvol, attributes);
}

StreamBuilder& StreamBuilder::mkfile(std::string_view path) {
    ByteBuffer attributes;
    format::encodeStringAttribute(attributes, format::AttributeType::kPath, path);
    format::encodeU64Attribute(attributes, format::AttributeType::kIno, 257);
    return add(format::CommandType::kMkfile, attributes);
}

StreamBuilder& StreamBuilder::mkdir(std::string_view path) {
    ByteBuffer attributes;
    format::encodeStringAttribute(attributes, format::AttributeType::kPath, path);
    format::encodeU64Attribute(attributes, format::AttributeType::kIno, 256);
    return add(format::CommandType::kMkdir, attributes);
}

StreamBuilder& StreamBuilder::write(std::string_view path, std::uint64_t offset,
                                    std::span<const std::uint8_t> data) {
    ByteBuffer attributes;
    format::encodeStringAttribute(attributes, format::AttributeType::kPath, path);
    format::encodeU64Attribute(attributes, format::AttributeType::kFileOffset, offset);
    return add(format::CommandType::kWrite, attributes, data);
}

StreamBuilder& StreamBuilder::truncate(std::string_view path, std::uint64_t size) {
    ByteBuffer attributes;
    format::encodeStringAttribute(attributes, format::AttributeType::kPath, path);
    format::encodeU64Attribute(attributes, format::AttributeType::kSize, size);
    return add(format::CommandType::kTruncate, attributes);
}

StreamBuilder& StreamBuilder::chmod(std::string_view path, std::uint64_t mode) {
    ByteBuffer attributes;
    format::encodeStringAttribute(attributes, format::AttributeType::kPath, path);
    format::encodeU64Attribute(attributes, format::AttributeType::kMode, mode);
    return add(format::CommandType::kChmod, attributes);
}

StreamBuilder& StreamBuilder::end() {
    return add(format::CommandType::kEnd, ByteBuffer{});
}

StreamBuilder& StreamBuilder::raw(const ByteBuffer& command) {
    commandOffsets_.push_back(bytes_.size());
    bytes_.insert(bytes_.end(), command.begin(), command.end());
    return *this;
}

ByteBuffer sampleStream(std::size_t files, std::size_t bytesPerFile, std::uint32_t seed) {
    StreamBuilder builder;
    builder.subvol("snapshot").mkdir("dir");
    for (std::size_t i = 0; i < files; ++i) {
        const std::string path = fmt::format("dir/file{}", i);
        builder.mkfile(path);

        const ByteBuffer contents = (i % 3 == 2) ? randomData(bytesPerFile, seed + i)
                                                 : patternData(bytesPerFile, seed + i);
        for (std::size_t offset = 0; offset < contents.size(); offset += kSampleChunkSize) {
            const std::size_t size = std::min(kSampleChunkSize, contents.size() - offset);
            builder.write(path, offset,
                          std::span<const std::uint8_t>(contents).subspan(offset, size));
        }
        builder.truncate(path, contents.size()).chmod(path, 0644);
    }
    return builder.end().bytes();
}

// =============================================================================
// Memory streams
// =============================================================================

io::ByteSource memorySource(const ByteBuffer& bytes) {
    return io::ByteSource::fromStream(
        std::make_unique<std::istringstream>(std::string(bytes.begin(), bytes.end())), "memory");
}

io::ByteSink memorySink(std::ostringstream& out) {
    return io::ByteSink::borrow(out, "memory");
}

ByteBuffer toBytes(const std::ostringstream& out) {
    const std::string text = out.str();
    return ByteBuffer(text.begin(), text.end());
}

FailingStreamBuf::FailingStreamBuf(ByteBuffer prefix) : prefix_(prefix.begin(), prefix.end()) {}

FailingStreamBuf::int_type FailingStreamBuf::underflow() {
    if (!served_) {
        served_ = true;
        if (!prefix_.empty()) {
            setg(prefix_.data(), prefix_.data(), prefix_.data() + prefix_.size());
            return traits_type::to_int_type(prefix_.front());
        }
    }
    throw std::runtime_error("simulated device error");
}

std::string writeTempFile(std::string_view name, const ByteBuffer& bytes) {
    const auto path = std::filesystem::temp_directory_path() /
                      fmt::format("ssu_test_{}_{}", name, std::random_device{}());
    std::ofstream out(path, std::ios::binary);
    out.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
    return path.string();
}

}  // namespace ssu::test
