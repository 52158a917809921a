#include "mailclass/snapshot.hpp"

#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <sstream>
#include "mailclass/logging.hpp"

namespace mailclass {

namespace {

constexpr char kMagic[8] = {'M', 'C', 'L', 'S', 'N', 'A', 'P', '\0'};

std::string read_file(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw ResourceError("Can't open snapshot " + path, "SnapshotReader");
    }
    std::ostringstream content;
    content << file.rdbuf();
    if (file.bad()) {
        throw ResourceError("Read failed on snapshot " + path, "SnapshotReader");
    }
    return content.str();
}

} // namespace

// =============================================================================
// SnapshotWriter
// =============================================================================

SnapshotWriter::SnapshotWriter(const std::string& kind) {
    buffer_.append(kMagic, sizeof(kMagic));
    ByteWriter w(buffer_);
    w.put_u32(SnapshotReader::kVersion);
    w.put_string(kind);
}

void SnapshotWriter::write_options(const Config& options) {
    ByteWriter w(buffer_);
    w.put_u32(static_cast<uint32_t>(options.values().size()));
    for (const auto& [key, value] : options.values()) {
        w.put_string(key);
        w.put_string(value);
    }
}

void SnapshotWriter::write_u64(uint64_t value) {
    ByteWriter(buffer_).put_u64(value);
}

void SnapshotWriter::commit(const std::string& path) const {
    const std::string tmp = path + ".tmp";
    {
        std::ofstream file(tmp, std::ios::binary | std::ios::trunc);
        if (!file.is_open()) {
            throw ResourceError("Can't create snapshot " + tmp, "SnapshotWriter::commit");
        }
        file.write(buffer_.data(), static_cast<std::streamsize>(buffer_.size()));
        file.flush();
        if (!file) {
            std::error_code ec;
            std::filesystem::remove(tmp, ec);
            throw ResourceError("Write failed on snapshot " + tmp, "SnapshotWriter::commit");
        }
    }

    std::error_code ec;
    std::filesystem::rename(tmp, path, ec);
    if (ec) {
        std::filesystem::remove(tmp, ec);
        throw ResourceError("Can't move snapshot into place at " + path, "SnapshotWriter::commit");
    }
    LOG_DEBUG("Saved snapshot ", path, " (", buffer_.size(), " bytes)");
}

// =============================================================================
// SnapshotReader
// =============================================================================

SnapshotReader::SnapshotReader(const std::string& path)
    : path_(path)
    , data_(read_file(path))
    , reader_(data_) {
    if (data_.size() < sizeof(kMagic) || data_.compare(0, sizeof(kMagic), kMagic, sizeof(kMagic)) != 0) {
        throw CorruptSnapshotError("Not a mailclass snapshot", path_);
    }
    reader_ = ByteReader(data_.data() + sizeof(kMagic), data_.size() - sizeof(kMagic));

    const uint32_t version = reader_.get_u32();
    if (version != kVersion) {
        throw CorruptSnapshotError("Unsupported snapshot version " + std::to_string(version), path_);
    }
    kind_ = reader_.get_string();
}

Config SnapshotReader::read_options() {
    Config config;
    const uint32_t n = reader_.get_u32();
    for (uint32_t i = 0; i < n; ++i) {
        std::string key = reader_.get_string();
        config.set(key, reader_.get_string());
    }
    return config;
}

uint64_t SnapshotReader::read_u64() {
    return reader_.get_u64();
}

void SnapshotReader::finish() const {
    if (!reader_.at_end()) {
        throw CorruptSnapshotError("Trailing data after snapshot content", path_);
    }
}

} // namespace mailclass
