#pragma once

#include <cstdio>
#include <filesystem>
#include <fstream>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include <unistd.h>

#include "mailclass/codec.hpp"
#include "mailclass/error.hpp"
#include "mailclass/logging.hpp"

namespace mailclass {

// =============================================================================
// Backends
// =============================================================================

/**
 * Storage behind a Table. Backends do no locking of their own beyond what
 * they need to keep their internal state consistent; the owning Table's
 * reader/writer lock defines the access discipline.
 */
template<typename Record>
class TableBackend {
public:
    using Visitor = std::function<void(const std::string&, const Record&)>;

    virtual ~TableBackend() = default;

    virtual std::optional<Record> get(const std::string& key) const = 0;
    virtual void put(const std::string& key, const Record& record) = 0;
    virtual bool erase(const std::string& key) = 0;
    virtual void clear() = 0;
    virtual size_t size() const = 0;
    virtual void for_each(const Visitor& visit) const = 0;

    virtual bool on_disk() const = 0;
    // Scratch file of a disk backend, empty for memory.
    virtual std::string location() const = 0;
};

template<typename Record>
class MemoryBackend : public TableBackend<Record> {
public:
    using typename TableBackend<Record>::Visitor;

    std::optional<Record> get(const std::string& key) const override {
        auto it = map_.find(key);
        if (it == map_.end()) return std::nullopt;
        return it->second;
    }

    void put(const std::string& key, const Record& record) override { map_[key] = record; }
    bool erase(const std::string& key) override { return map_.erase(key) > 0; }
    void clear() override { map_.clear(); }
    size_t size() const override { return map_.size(); }

    void for_each(const Visitor& visit) const override {
        for (const auto& [key, record] : map_) visit(key, record);
    }

    bool on_disk() const override { return false; }
    std::string location() const override { return ""; }

private:
    std::unordered_map<std::string, Record> map_;
};

/**
 * Append-only scratch file with an in-memory offset index.
 *
 * Every put appends `[u32 key][key][u32 len][value]` and repoints the index;
 * values are read back from the file on get. The file is rewritten once the
 * dead bytes outgrow the live ones, and removed on destruction.
 */
template<typename Record>
class DiskBackend : public TableBackend<Record> {
public:
    using typename TableBackend<Record>::Visitor;

    explicit DiskBackend(const std::string& table_name) {
        std::string pattern = (std::filesystem::temp_directory_path() /
                               ("mailclass-" + table_name + "-XXXXXX")).string();
        std::vector<char> buf(pattern.begin(), pattern.end());
        buf.push_back('\0');
        int fd = ::mkstemp(buf.data());
        if (fd < 0) {
            throw ResourceError("Can't create scratch file for table '" + table_name + "'",
                                "DiskBackend");
        }
        ::close(fd);
        path_ = buf.data();
        open(std::ios::in | std::ios::out | std::ios::binary | std::ios::trunc);
        LOG_DEBUG("Table '", table_name, "' stored in ", path_);
    }

    ~DiskBackend() override {
        file_.close();
        std::error_code ec;
        std::filesystem::remove(path_, ec);
    }

    DiskBackend(const DiskBackend&) = delete;
    DiskBackend& operator=(const DiskBackend&) = delete;

    std::optional<Record> get(const std::string& key) const override {
        std::lock_guard<std::mutex> lock(io_mutex_);
        auto it = index_.find(key);
        if (it == index_.end()) return std::nullopt;
        return read_value(it->second);
    }

    void put(const std::string& key, const Record& record) override {
        std::lock_guard<std::mutex> lock(io_mutex_);
        std::string value;
        RecordCodec<Record>::encode(record, value);

        std::string entry;
        ByteWriter w(entry);
        w.put_string(key);
        w.put_string(value);

        file_.clear();
        file_.seekp(0, std::ios::end);
        std::streamoff offset = file_.tellp();
        file_.write(entry.data(), static_cast<std::streamsize>(entry.size()));
        file_.flush();
        if (!file_) {
            throw ResourceError("Write failed on scratch file " + path_, "DiskBackend::put");
        }

        Slot slot{offset + static_cast<std::streamoff>(4 + key.size() + 4),
                  static_cast<uint32_t>(value.size())};
        auto it = index_.find(key);
        if (it != index_.end()) {
            dead_bytes_ += 8 + key.size() + it->second.length;
            it->second = slot;
        } else {
            index_.emplace(key, slot);
        }
        total_bytes_ += entry.size();
        live_bytes_ = total_bytes_ - dead_bytes_;

        if (dead_bytes_ > kCompactThreshold && dead_bytes_ > live_bytes_) {
            compact();
        }
    }

    bool erase(const std::string& key) override {
        std::lock_guard<std::mutex> lock(io_mutex_);
        auto it = index_.find(key);
        if (it == index_.end()) return false;
        dead_bytes_ += 8 + key.size() + it->second.length;
        live_bytes_ = total_bytes_ - dead_bytes_;
        index_.erase(it);
        return true;
    }

    void clear() override {
        std::lock_guard<std::mutex> lock(io_mutex_);
        file_.close();
        open(std::ios::in | std::ios::out | std::ios::binary | std::ios::trunc);
        index_.clear();
        total_bytes_ = live_bytes_ = dead_bytes_ = 0;
    }

    size_t size() const override {
        std::lock_guard<std::mutex> lock(io_mutex_);
        return index_.size();
    }

    void for_each(const Visitor& visit) const override {
        std::vector<std::pair<std::string, Record>> rows;
        {
            std::lock_guard<std::mutex> lock(io_mutex_);
            rows.reserve(index_.size());
            for (const auto& [key, slot] : index_) {
                rows.emplace_back(key, read_value(slot));
            }
        }
        for (const auto& [key, record] : rows) visit(key, record);
    }

    bool on_disk() const override { return true; }
    std::string location() const override { return path_; }

private:
    struct Slot {
        std::streamoff offset;
        uint32_t length;
    };

    static constexpr size_t kCompactThreshold = 1 << 20;

    void open(std::ios::openmode mode) {
        file_.open(path_, mode);
        if (!file_.is_open()) {
            throw ResourceError("Can't open scratch file " + path_, "DiskBackend");
        }
    }

    Record read_value(const Slot& slot) const {
        std::string buf(slot.length, '\0');
        file_.clear();
        file_.seekg(slot.offset);
        file_.read(buf.data(), slot.length);
        if (!file_) {
            throw ResourceError("Read failed on scratch file " + path_, "DiskBackend::get");
        }
        ByteReader r(buf);
        return RecordCodec<Record>::decode(r);
    }

    // Caller holds io_mutex_.
    void compact() {
        std::vector<std::pair<std::string, std::string>> live;
        live.reserve(index_.size());
        for (const auto& [key, slot] : index_) {
            std::string buf(slot.length, '\0');
            file_.clear();
            file_.seekg(slot.offset);
            file_.read(buf.data(), slot.length);
            if (!file_) {
                throw ResourceError("Read failed while compacting " + path_, "DiskBackend::compact");
            }
            live.emplace_back(key, std::move(buf));
        }

        file_.close();
        open(std::ios::in | std::ios::out | std::ios::binary | std::ios::trunc);
        index_.clear();
        total_bytes_ = 0;

        for (const auto& [key, value] : live) {
            std::string entry;
            ByteWriter w(entry);
            w.put_string(key);
            w.put_string(value);
            file_.write(entry.data(), static_cast<std::streamsize>(entry.size()));
            index_.emplace(key, Slot{static_cast<std::streamoff>(total_bytes_ + 4 + key.size() + 4),
                                     static_cast<uint32_t>(value.size())});
            total_bytes_ += entry.size();
        }
        file_.flush();
        if (!file_) {
            throw ResourceError("Write failed while compacting " + path_, "DiskBackend::compact");
        }
        live_bytes_ = total_bytes_;
        dead_bytes_ = 0;
        LOG_DEBUG("Compacted ", path_, " to ", total_bytes_, " bytes");
    }

    std::string path_;
    mutable std::fstream file_;
    mutable std::mutex io_mutex_;
    std::unordered_map<std::string, Slot> index_;
    size_t total_bytes_ = 0;
    size_t live_bytes_ = 0;
    size_t dead_bytes_ = 0;
};

template<typename Record>
std::unique_ptr<TableBackend<Record>> make_backend(const std::string& table_name, bool on_disk) {
    if (on_disk) {
        return std::make_unique<DiskBackend<Record>>(table_name);
    }
    return std::make_unique<MemoryBackend<Record>>();
}

// =============================================================================
// Table
// =============================================================================

/**
 * A named, independently lockable key/value table.
 *
 * The convenience accessors lock internally. Multi-table operations take
 * the locks themselves through mutex() and then work on backend().
 */
template<typename Record>
class Table {
public:
    using Row = std::pair<std::string, Record>;

    Table(std::string name, std::unique_ptr<TableBackend<Record>> backend)
        : name_(std::move(name)), backend_(std::move(backend)) {}

    Table(std::string name, bool on_disk)
        : Table(name, make_backend<Record>(name, on_disk)) {}

    const std::string& name() const { return name_; }
    bool on_disk() const { return backend_->on_disk(); }
    std::string location() const { return backend_->location(); }

    std::shared_mutex& mutex() const { return mutex_; }
    std::unique_lock<std::shared_mutex> lock() const { return std::unique_lock<std::shared_mutex>(mutex_); }
    std::shared_lock<std::shared_mutex> read_lock() const { return std::shared_lock<std::shared_mutex>(mutex_); }

    // Unlocked access; the caller holds the appropriate lock.
    TableBackend<Record>& backend() { return *backend_; }
    const TableBackend<Record>& backend() const { return *backend_; }

    std::optional<Record> get(const std::string& key) const {
        auto guard = read_lock();
        return backend_->get(key);
    }

    void put(const std::string& key, const Record& record) {
        auto guard = lock();
        backend_->put(key, record);
    }

    void clear() {
        auto guard = lock();
        backend_->clear();
    }

    size_t size() const {
        auto guard = read_lock();
        return backend_->size();
    }

    // Copy of every row taken under the read lock.
    std::vector<Row> rows() const {
        auto guard = read_lock();
        return rows_unlocked();
    }

    std::vector<Row> rows_unlocked() const {
        std::vector<Row> out;
        out.reserve(backend_->size());
        backend_->for_each([&out](const std::string& key, const Record& record) {
            out.emplace_back(key, record);
        });
        return out;
    }

    // Swap in a complete new content under the write lock.
    void replace_all(const std::vector<Row>& rows) {
        auto guard = lock();
        replace_all_unlocked(rows);
    }

    void replace_all_unlocked(const std::vector<Row>& rows) {
        backend_->clear();
        for (const auto& [key, record] : rows) {
            backend_->put(key, record);
        }
    }

private:
    std::string name_;
    std::unique_ptr<TableBackend<Record>> backend_;
    mutable std::shared_mutex mutex_;
};

} // namespace mailclass
