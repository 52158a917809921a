#pragma once

#include <cstdint>
#include <cstring>
#include <string>
#include "mailclass/error.hpp"
#include "mailclass/types.hpp"

namespace mailclass {

/**
 * Little-endian binary encoding shared by the disk backend and snapshots.
 */
class ByteWriter {
public:
    explicit ByteWriter(std::string& out) : out_(out) {}

    void put_u32(uint32_t v) {
        for (int i = 0; i < 4; ++i) out_.push_back(static_cast<char>((v >> (8 * i)) & 0xFF));
    }

    void put_u64(uint64_t v) {
        for (int i = 0; i < 8; ++i) out_.push_back(static_cast<char>((v >> (8 * i)) & 0xFF));
    }

    void put_f64(double v) {
        uint64_t bits;
        std::memcpy(&bits, &v, sizeof(bits));
        put_u64(bits);
    }

    void put_string(const std::string& s) {
        put_u32(static_cast<uint32_t>(s.size()));
        out_.append(s);
    }

private:
    std::string& out_;
};

class ByteReader {
public:
    ByteReader(const char* data, size_t size) : data_(data), size_(size) {}
    explicit ByteReader(const std::string& in) : ByteReader(in.data(), in.size()) {}

    uint32_t get_u32() {
        require(4);
        uint32_t v = 0;
        for (int i = 0; i < 4; ++i) v |= static_cast<uint32_t>(static_cast<unsigned char>(data_[pos_ + i])) << (8 * i);
        pos_ += 4;
        return v;
    }

    uint64_t get_u64() {
        require(8);
        uint64_t v = 0;
        for (int i = 0; i < 8; ++i) v |= static_cast<uint64_t>(static_cast<unsigned char>(data_[pos_ + i])) << (8 * i);
        pos_ += 8;
        return v;
    }

    double get_f64() {
        uint64_t bits = get_u64();
        double v;
        std::memcpy(&v, &bits, sizeof(v));
        return v;
    }

    std::string get_string() {
        uint32_t len = get_u32();
        require(len);
        std::string s(data_ + pos_, len);
        pos_ += len;
        return s;
    }

    bool at_end() const { return pos_ == size_; }

private:
    void require(size_t n) const {
        if (size_ - pos_ < n) {
            throw CorruptSnapshotError("Truncated record", "ByteReader");
        }
    }

    const char* data_;
    size_t size_;
    size_t pos_ = 0;
};

template<typename Record>
struct RecordCodec;

template<>
struct RecordCodec<CountRecord> {
    static void encode(const CountRecord& record, std::string& out) {
        ByteWriter w(out);
        w.put_u32(static_cast<uint32_t>(record.size()));
        for (const auto& [category, count] : record) {
            w.put_string(category);
            w.put_u64(count);
        }
    }

    static CountRecord decode(ByteReader& r) {
        CountRecord record;
        uint32_t n = r.get_u32();
        for (uint32_t i = 0; i < n; ++i) {
            std::string category = r.get_string();
            record[category] = r.get_u64();
        }
        return record;
    }
};

template<>
struct RecordCodec<PredictorRecord> {
    static void encode(const PredictorRecord& record, std::string& out) {
        ByteWriter w(out);
        w.put_u32(static_cast<uint32_t>(record.size()));
        for (const auto& [category, predictor] : record) {
            w.put_string(category);
            w.put_f64(predictor.probability);
            w.put_f64(predictor.significance);
        }
    }

    static PredictorRecord decode(ByteReader& r) {
        PredictorRecord record;
        uint32_t n = r.get_u32();
        for (uint32_t i = 0; i < n; ++i) {
            std::string category = r.get_string();
            Predictor p;
            p.probability = r.get_f64();
            p.significance = r.get_f64();
            record[category] = p;
        }
        return record;
    }
};

template<>
struct RecordCodec<uint64_t> {
    static void encode(uint64_t v, std::string& out) { ByteWriter(out).put_u64(v); }
    static uint64_t decode(ByteReader& r) { return r.get_u64(); }
};

template<>
struct RecordCodec<double> {
    static void encode(double v, std::string& out) { ByteWriter(out).put_f64(v); }
    static double decode(ByteReader& r) { return r.get_f64(); }
};

} // namespace mailclass
