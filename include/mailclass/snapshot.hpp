#pragma once

#include <cstdint>
#include <string>
#include "mailclass/codec.hpp"
#include "mailclass/config.hpp"
#include "mailclass/error.hpp"
#include "mailclass/table.hpp"

namespace mailclass {

/**
 * Classifier snapshot file.
 *
 * Layout (little-endian):
 *   char[8]  magic "MCLSNAP\0"
 *   u32      format version
 *   string   classifier kind
 *   u32      option count, then (string key, string value) pairs
 *   ...      variant data: tables and counters in a fixed order
 *
 * A table is written as its name, its on_disk flag, a u64 row count and the
 * rows (string key, encoded record). Disk tables are written by content;
 * loading re-creates them on fresh scratch files.
 */
class SnapshotWriter {
public:
    explicit SnapshotWriter(const std::string& kind);

    void write_options(const Config& options);
    void write_u64(uint64_t value);

    // Caller holds the table's lock.
    template<typename Record>
    void write_table(const Table<Record>& table) {
        ByteWriter w(buffer_);
        w.put_string(table.name());
        w.put_u32(table.on_disk() ? 1 : 0);
        w.put_u64(static_cast<uint64_t>(table.backend().size()));
        table.backend().for_each([this](const std::string& key, const Record& record) {
            ByteWriter(buffer_).put_string(key);
            RecordCodec<Record>::encode(record, buffer_);
        });
    }

    // Write to `path` through a temporary file. Throws ResourceError.
    void commit(const std::string& path) const;

private:
    std::string buffer_;
};

class SnapshotReader {
public:
    static constexpr uint32_t kVersion = 1;

    // Reads the whole file and checks the header. Throws ResourceError when
    // the file can't be read and CorruptSnapshotError on a bad header.
    explicit SnapshotReader(const std::string& path);

    SnapshotReader(const SnapshotReader&) = delete;
    SnapshotReader& operator=(const SnapshotReader&) = delete;

    const std::string& kind() const { return kind_; }
    const std::string& path() const { return path_; }

    Config read_options();
    uint64_t read_u64();

    // Replace the content of `table` with the next table in the file, whose
    // name must match. Caller holds the table's lock.
    template<typename Record>
    void read_table(Table<Record>& table) {
        const std::string name = reader_.get_string();
        if (name != table.name()) {
            throw CorruptSnapshotError("Expected table '" + table.name() + "', found '" + name + "'",
                                       path_);
        }
        reader_.get_u32();  // on_disk flag of the saved table
        const uint64_t rows = reader_.get_u64();
        table.backend().clear();
        for (uint64_t i = 0; i < rows; ++i) {
            std::string key = reader_.get_string();
            table.backend().put(key, RecordCodec<Record>::decode(reader_));
        }
    }

    // Throws CorruptSnapshotError if unread bytes remain.
    void finish() const;

private:
    std::string path_;
    std::string data_;
    ByteReader reader_;
    std::string kind_;
};

} // namespace mailclass
