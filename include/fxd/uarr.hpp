#pragma once
// UArr: self-describing binary record format
//
// Layout (little-endian):
// ┌──────────────────────────────────────────────┐
// │ Header (36 B): magic, version, flags, count, │
// │   schema/data offsets, total, name table off │
// │ Field descriptors (24 B each, by name hash)  │
// │ Name table: (len:u32, utf8) per field        │
// │ Data region: field values back to back       │
// └──────────────────────────────────────────────┘
//
// Anything that is not a map is wrapped as the single field "__value" and
// unwrapped again on decode. Nested maps are length-prefixed nested records.
// Arrays are count:u32 followed by (tag:u8, bytes) pairs.

#include "errors.hpp"
#include "value.hpp"
#include "version.hpp"
#include <algorithm>
#include <cstdio>
#include <limits>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace fxd {

constexpr uint32_t UARR_MAGIC = 0x55415252;  // "UARR"
constexpr uint16_t UARR_VERSION = FXD_UARR_FORMAT_VERSION;
constexpr size_t UARR_HEADER_SIZE = 36;
constexpr size_t UARR_FIELD_DESC_SIZE = 24;
constexpr int UARR_MAX_DEPTH = 64;
constexpr const char* UARR_VALUE_FIELD = "__value";

// Field descriptor flags
namespace field_flags {
    constexpr uint8_t NULLABLE = 0x01;
    constexpr uint8_t ARRAY = 0x02;
    constexpr uint8_t COMPRESSED = 0x04;
}

// FNV-1a over the name's UTF-16 code units (32-bit, stored in a u64 slot).
// Names are stored as UTF-8; code points above U+FFFF hash as their
// surrogate pair. A byte that does not start a valid sequence hashes alone.
inline uint64_t fnv1a(std::string_view s) {
    uint32_t hash = 0x811c9dc5u;
    auto mix = [&hash](uint32_t unit) {
        hash ^= unit;
        hash *= 0x01000193u;
    };

    size_t i = 0;
    while (i < s.size()) {
        unsigned char lead = static_cast<unsigned char>(s[i]);
        uint32_t cp = lead;
        size_t len = 1;
        if ((lead & 0xE0) == 0xC0) { cp = lead & 0x1F; len = 2; }
        else if ((lead & 0xF0) == 0xE0) { cp = lead & 0x0F; len = 3; }
        else if ((lead & 0xF8) == 0xF0) { cp = lead & 0x07; len = 4; }

        bool valid = (lead < 0x80 || len > 1) && i + len <= s.size();
        for (size_t k = 1; valid && k < len; ++k) {
            unsigned char cont = static_cast<unsigned char>(s[i + k]);
            if ((cont & 0xC0) != 0x80) valid = false;
            cp = (cp << 6) | (cont & 0x3F);
        }
        if (!valid) {
            mix(lead);
            ++i;
            continue;
        }

        if (cp >= 0x10000) {
            cp -= 0x10000;
            mix(0xD800 + (cp >> 10));
            mix(0xDC00 + (cp & 0x3FF));
        } else {
            mix(cp);
        }
        i += len;
    }
    return hash;
}

// Narrowest lossless tag for a value
inline TypeTag tag_for(const Value& v) {
    switch (v.kind()) {
        case Value::Kind::Null: return TypeTag::Null;
        case Value::Kind::Undefined: return TypeTag::Undefined;
        case Value::Kind::Bool: return TypeTag::Bool;
        case Value::Kind::Int: {
            int64_t i = v.as_int();
            if (i >= INT8_MIN && i <= INT8_MAX) return TypeTag::I8;
            if (i >= INT16_MIN && i <= INT16_MAX) return TypeTag::I16;
            if (i >= INT32_MIN && i <= INT32_MAX) return TypeTag::I32;
            return TypeTag::I64;
        }
        case Value::Kind::UInt: {
            uint64_t u = v.as_uint();
            if (u <= UINT8_MAX) return TypeTag::U8;
            if (u <= UINT16_MAX) return TypeTag::U16;
            if (u <= UINT32_MAX) return TypeTag::U32;
            return TypeTag::U64;
        }
        case Value::Kind::Float: return TypeTag::F64;
        case Value::Kind::String: return TypeTag::String;
        case Value::Kind::Bytes: return TypeTag::Bytes;
        case Value::Kind::Array: return TypeTag::Array;
        case Value::Kind::Map: return TypeTag::Map;
        case Value::Kind::NodeRef: return TypeTag::NodeRef;
        case Value::Kind::Time: return TypeTag::Timestamp;
        case Value::Kind::Uuid: return TypeTag::Uuid;
    }
    return TypeTag::Bytes;
}

namespace detail {

constexpr uint64_t U32_LIMIT = std::numeric_limits<uint32_t>::max();

inline void check_u32(uint64_t n, const char* what) {
    if (n > U32_LIMIT) {
        throw FormatError(std::string("UArr: ") + what + " exceeds 4 GiB");
    }
}

inline void write_blob(std::vector<uint8_t>& out, const uint8_t* data, size_t len) {
    check_u32(len, "string/bytes length");
    append_le<uint32_t>(out, static_cast<uint32_t>(len));
    out.insert(out.end(), data, data + len);
}

inline void encode_record(std::vector<uint8_t>& out,
                          const std::vector<std::pair<std::string_view, const Value*>>& fields,
                          int depth);

inline void write_value(std::vector<uint8_t>& out, const Value& v, TypeTag tag, int depth) {
    switch (tag) {
        case TypeTag::I8: out.push_back(static_cast<uint8_t>(static_cast<int8_t>(v.as_int()))); break;
        case TypeTag::I16: append_le<int16_t>(out, static_cast<int16_t>(v.as_int())); break;
        case TypeTag::I32: append_le<int32_t>(out, static_cast<int32_t>(v.as_int())); break;
        case TypeTag::I64: append_le<int64_t>(out, v.as_int()); break;
        case TypeTag::U8: out.push_back(static_cast<uint8_t>(v.as_uint())); break;
        case TypeTag::U16: append_le<uint16_t>(out, static_cast<uint16_t>(v.as_uint())); break;
        case TypeTag::U32: append_le<uint32_t>(out, static_cast<uint32_t>(v.as_uint())); break;
        case TypeTag::U64: append_le<uint64_t>(out, v.as_uint()); break;
        case TypeTag::F32: {
            float f = static_cast<float>(v.as_double());
            uint32_t bits;
            std::memcpy(&bits, &f, sizeof(bits));
            append_le<uint32_t>(out, bits);
            break;
        }
        case TypeTag::F64: append_le<uint64_t>(out, double_bits(v.as_double())); break;
        case TypeTag::Bool: out.push_back(v.as_bool() ? 1 : 0); break;
        case TypeTag::Null:
        case TypeTag::Undefined:
            break;
        case TypeTag::String: {
            const std::string& s = v.as_string();
            write_blob(out, reinterpret_cast<const uint8_t*>(s.data()), s.size());
            break;
        }
        case TypeTag::NodeRef: {
            const std::string& s = v.as_node_ref().id;
            write_blob(out, reinterpret_cast<const uint8_t*>(s.data()), s.size());
            break;
        }
        case TypeTag::Bytes: {
            const auto& b = v.as_bytes();
            write_blob(out, b.data(), b.size());
            break;
        }
        case TypeTag::Array: {
            if (depth >= UARR_MAX_DEPTH) throw FormatError("UArr: nesting too deep");
            const auto& items = v.as_array();
            check_u32(items.size(), "array count");
            append_le<uint32_t>(out, static_cast<uint32_t>(items.size()));
            for (const auto& item : items) {
                TypeTag item_tag = tag_for(item);
                out.push_back(static_cast<uint8_t>(item_tag));
                write_value(out, item, item_tag, depth + 1);
            }
            break;
        }
        case TypeTag::Map: {
            if (depth >= UARR_MAX_DEPTH) throw FormatError("UArr: nesting too deep");
            size_t len_pos = out.size();
            append_le<uint32_t>(out, 0);  // patched below
            std::vector<std::pair<std::string_view, const Value*>> fields;
            fields.reserve(v.as_map().size());
            for (const auto& f : v.as_map()) {
                fields.emplace_back(f.first, &f.second);
            }
            encode_record(out, fields, depth + 1);
            uint64_t nested = out.size() - len_pos - 4;
            check_u32(nested, "nested map");
            store_le<uint32_t>(out.data() + len_pos, static_cast<uint32_t>(nested));
            break;
        }
        case TypeTag::Timestamp: append_le<uint64_t>(out, v.as_time().ns); break;
        case TypeTag::Uuid: {
            const auto& b = v.as_uuid().bytes;
            out.insert(out.end(), b.begin(), b.end());
            break;
        }
    }
}

// Append one complete record to `out`; offsets inside are relative to its start
inline void encode_record(std::vector<uint8_t>& out,
                          const std::vector<std::pair<std::string_view, const Value*>>& fields,
                          int depth) {
    const size_t base = out.size();
    const uint64_t count = fields.size();

    uint64_t name_table_size = 0;
    for (const auto& f : fields) {
        check_u32(f.first.size(), "field name");
        name_table_size += 4 + f.first.size();
    }

    const uint64_t schema_offset = UARR_HEADER_SIZE;
    const uint64_t name_table_offset = schema_offset + count * UARR_FIELD_DESC_SIZE;
    const uint64_t data_offset = name_table_offset + name_table_size;
    check_u32(data_offset, "record schema");

    out.resize(base + data_offset, 0);
    uint8_t* h = out.data() + base;
    store_le<uint32_t>(h + 0, UARR_MAGIC);
    store_le<uint16_t>(h + 4, UARR_VERSION);
    store_le<uint16_t>(h + 6, 0);
    store_le<uint32_t>(h + 8, static_cast<uint32_t>(count));
    store_le<uint32_t>(h + 12, static_cast<uint32_t>(schema_offset));
    store_le<uint32_t>(h + 16, static_cast<uint32_t>(data_offset));
    store_le<uint64_t>(h + 28, name_table_offset);

    size_t pos = base + name_table_offset;
    for (const auto& f : fields) {
        store_le<uint32_t>(out.data() + pos, static_cast<uint32_t>(f.first.size()));
        std::memcpy(out.data() + pos + 4, f.first.data(), f.first.size());
        pos += 4 + f.first.size();
    }

    const size_t data_start = base + data_offset;
    for (size_t i = 0; i < fields.size(); ++i) {
        const Value& v = *fields[i].second;
        TypeTag tag = tag_for(v);
        size_t start = out.size();
        write_value(out, v, tag, depth);
        uint64_t rel = start - data_start;
        uint64_t len = out.size() - start;
        check_u32(rel, "data offset");
        check_u32(len, "field");

        uint8_t flags = 0;
        if (tag == TypeTag::Null || tag == TypeTag::Undefined) flags |= field_flags::NULLABLE;
        if (tag == TypeTag::Array) flags |= field_flags::ARRAY;

        uint8_t* d = out.data() + base + schema_offset + i * UARR_FIELD_DESC_SIZE;
        store_le<uint64_t>(d + 0, fnv1a(fields[i].first));
        d[8] = static_cast<uint8_t>(tag);
        d[9] = flags;
        store_le<uint16_t>(d + 10, 0);
        store_le<uint32_t>(d + 12, static_cast<uint32_t>(rel));
        store_le<uint32_t>(d + 16, static_cast<uint32_t>(len));
    }

    store_le<uint64_t>(out.data() + base + 20, out.size() - base);
}

} // namespace detail

// Encode any value; non-maps are wrapped under "__value"
inline std::vector<uint8_t> encode(const Value& value) {
    std::vector<uint8_t> out;
    std::vector<std::pair<std::string_view, const Value*>> fields;
    if (value.is_map()) {
        fields.reserve(value.as_map().size());
        for (const auto& f : value.as_map()) {
            fields.emplace_back(f.first, &f.second);
        }
    } else {
        fields.emplace_back(UARR_VALUE_FIELD, &value);
    }
    detail::encode_record(out, fields, 0);
    return out;
}

// Validated view over one encoded record. Reads fields in place.
class UArrReader {
public:
    UArrReader(const uint8_t* data, size_t len, int depth = 0)
        : data_(data), len_(len), depth_(depth) {
        parse();
    }

    explicit UArrReader(const std::vector<uint8_t>& buf)
        : UArrReader(buf.data(), buf.size()) {}

    size_t field_count() const { return fields_.size(); }
    uint16_t version() const { return version_; }
    uint16_t flags() const { return flags_; }
    uint64_t total_bytes() const { return total_bytes_; }

    const std::string& name(size_t i) const { return fields_.at(i).name; }
    TypeTag tag(size_t i) const { return fields_.at(i).tag; }

    // Index of a field by name, hash first and confirmed against the name table
    std::optional<size_t> index_of(std::string_view name) const {
        uint64_t hash = fnv1a(name);
        for (size_t i = 0; i < fields_.size(); ++i) {
            if (fields_[i].hash == hash && fields_[i].name == name) return i;
        }
        return std::nullopt;
    }

    bool has(std::string_view name) const { return index_of(name).has_value(); }

    std::optional<Value> get(std::string_view name) const {
        auto i = index_of(name);
        if (!i) return std::nullopt;
        return value(*i);
    }

    Value value(size_t i) const {
        const Field& f = fields_.at(i);
        size_t consumed = 0;
        return read_value(data_ + data_offset_ + f.offset, f.length, f.tag, depth_, consumed);
    }

    // Full decode; a lone "__value" field unwraps to the bare value
    Value decode() const {
        if (fields_.size() == 1 && fields_[0].name == UARR_VALUE_FIELD) {
            return value(0);
        }
        Value result = Value::map();
        for (size_t i = 0; i < fields_.size(); ++i) {
            result.set(fields_[i].name, value(i));
        }
        return result;
    }

private:
    struct Field {
        uint64_t hash;
        TypeTag tag;
        uint8_t flags;
        uint32_t offset;
        uint32_t length;
        std::string name;
    };

    static void need(uint64_t at, uint64_t n, uint64_t avail, const char* what) {
        if (at > avail || n > avail - at) {
            throw FormatError(std::string("UArr: ") + what + " out of bounds");
        }
    }

    void parse() {
        if (depth_ > UARR_MAX_DEPTH) throw FormatError("UArr: nesting too deep");
        need(0, UARR_HEADER_SIZE, len_, "header");

        uint32_t magic = load_le<uint32_t>(data_);
        if (magic != UARR_MAGIC) {
            char buf[64];
            std::snprintf(buf, sizeof(buf), "Invalid UArr magic: 0x%08x", magic);
            throw FormatError(buf);
        }
        version_ = load_le<uint16_t>(data_ + 4);
        if (!version::uarr_compatible(version_)) {
            throw FormatError("UArr: unsupported version " + std::to_string(version_));
        }
        flags_ = load_le<uint16_t>(data_ + 6);
        uint32_t count = load_le<uint32_t>(data_ + 8);
        uint32_t schema_offset = load_le<uint32_t>(data_ + 12);
        data_offset_ = load_le<uint32_t>(data_ + 16);
        total_bytes_ = load_le<uint64_t>(data_ + 20);
        uint64_t name_table_offset = load_le<uint64_t>(data_ + 28);

        need(0, total_bytes_, len_, "total size");
        need(schema_offset, static_cast<uint64_t>(count) * UARR_FIELD_DESC_SIZE, len_, "field descriptors");
        need(data_offset_, 0, len_, "data offset");

        fields_.resize(count);
        for (uint32_t i = 0; i < count; ++i) {
            const uint8_t* d = data_ + schema_offset + static_cast<size_t>(i) * UARR_FIELD_DESC_SIZE;
            Field& f = fields_[i];
            f.hash = load_le<uint64_t>(d);
            if (!is_known_tag(d[8])) {
                throw FormatError("UArr: unknown type tag " + std::to_string(d[8]));
            }
            f.tag = static_cast<TypeTag>(d[8]);
            f.flags = d[9];
            f.offset = load_le<uint32_t>(d + 12);
            f.length = load_le<uint32_t>(d + 16);
            need(static_cast<uint64_t>(data_offset_) + f.offset, f.length, len_, "field data");
        }

        uint64_t pos = name_table_offset;
        for (uint32_t i = 0; i < count; ++i) {
            need(pos, 4, len_, "name table");
            uint32_t n = load_le<uint32_t>(data_ + pos);
            need(pos + 4, n, len_, "field name");
            fields_[i].name.assign(reinterpret_cast<const char*>(data_ + pos + 4), n);
            pos += 4 + static_cast<uint64_t>(n);
        }
    }

    static size_t fixed_size(TypeTag tag) {
        switch (tag) {
            case TypeTag::I8: case TypeTag::U8: case TypeTag::Bool: return 1;
            case TypeTag::I16: case TypeTag::U16: return 2;
            case TypeTag::I32: case TypeTag::U32: case TypeTag::F32: return 4;
            case TypeTag::I64: case TypeTag::U64: case TypeTag::F64:
            case TypeTag::Timestamp: return 8;
            case TypeTag::Uuid: return 16;
            default: return 0;
        }
    }

    static std::string read_blob(const uint8_t* p, size_t avail, size_t& consumed) {
        need(0, 4, avail, "length prefix");
        uint32_t n = load_le<uint32_t>(p);
        need(4, n, avail, "string");
        consumed = 4 + static_cast<size_t>(n);
        return std::string(reinterpret_cast<const char*>(p + 4), n);
    }

    // Decode one value of `tag` from at most `avail` bytes
    static Value read_value(const uint8_t* p, size_t avail, TypeTag tag, int depth, size_t& consumed) {
        consumed = fixed_size(tag);
        need(0, consumed, avail, tag_name(tag));

        switch (tag) {
            case TypeTag::I8: return Value(static_cast<int64_t>(static_cast<int8_t>(p[0])));
            case TypeTag::I16: return Value(static_cast<int64_t>(load_le<int16_t>(p)));
            case TypeTag::I32: return Value(static_cast<int64_t>(load_le<int32_t>(p)));
            case TypeTag::I64: return Value(load_le<int64_t>(p));
            case TypeTag::U8: return Value(static_cast<uint64_t>(p[0]));
            case TypeTag::U16: return Value(static_cast<uint64_t>(load_le<uint16_t>(p)));
            case TypeTag::U32: return Value(static_cast<uint64_t>(load_le<uint32_t>(p)));
            case TypeTag::U64: return Value(load_le<uint64_t>(p));
            case TypeTag::F32: return Value(static_cast<double>(bits_float(load_le<uint32_t>(p))));
            case TypeTag::F64: return Value(bits_double(load_le<uint64_t>(p)));
            case TypeTag::Bool: return Value(p[0] != 0);
            case TypeTag::Null: return Value();
            case TypeTag::Undefined: return Value::undefined();
            case TypeTag::String: return Value(read_blob(p, avail, consumed));
            case TypeTag::NodeRef: return Value::node_ref(read_blob(p, avail, consumed));
            case TypeTag::Bytes: {
                need(0, 4, avail, "length prefix");
                uint32_t n = load_le<uint32_t>(p);
                need(4, n, avail, "bytes");
                consumed = 4 + static_cast<size_t>(n);
                return Value::bytes(Value::Bytes(p + 4, p + 4 + n));
            }
            case TypeTag::Array: {
                if (depth >= UARR_MAX_DEPTH) throw FormatError("UArr: nesting too deep");
                need(0, 4, avail, "array count");
                uint32_t count = load_le<uint32_t>(p);
                size_t pos = 4;
                Value::Array items;
                items.reserve(std::min<size_t>(count, avail));
                for (uint32_t i = 0; i < count; ++i) {
                    need(pos, 1, avail, "array item tag");
                    uint8_t item_tag = p[pos++];
                    if (!is_known_tag(item_tag)) {
                        throw FormatError("UArr: unknown type tag " + std::to_string(item_tag));
                    }
                    size_t used = 0;
                    items.push_back(read_value(p + pos, avail - pos, static_cast<TypeTag>(item_tag),
                                               depth + 1, used));
                    pos += used;
                }
                consumed = pos;
                return Value::array(std::move(items));
            }
            case TypeTag::Map: {
                if (depth >= UARR_MAX_DEPTH) throw FormatError("UArr: nesting too deep");
                need(0, 4, avail, "map length");
                uint32_t n = load_le<uint32_t>(p);
                need(4, n, avail, "nested map");
                consumed = 4 + static_cast<size_t>(n);
                UArrReader nested(p + 4, n, depth + 1);
                Value result = Value::map();
                for (size_t i = 0; i < nested.field_count(); ++i) {
                    result.set(nested.name(i), nested.value(i));
                }
                return result;
            }
            case TypeTag::Timestamp: return Value::time(load_le<uint64_t>(p));
            case TypeTag::Uuid: {
                fxd::Uuid u;
                std::memcpy(u.bytes.data(), p, 16);
                return Value(u);
            }
        }
        throw FormatError("UArr: unknown type tag");
    }

    const uint8_t* data_;
    size_t len_;
    int depth_;
    uint16_t version_ = 0;
    uint16_t flags_ = 0;
    uint32_t data_offset_ = 0;
    uint64_t total_bytes_ = 0;
    std::vector<Field> fields_;
};

inline Value decode(const uint8_t* data, size_t len) {
    return UArrReader(data, len).decode();
}

inline Value decode(const std::vector<uint8_t>& buf) {
    return decode(buf.data(), buf.size());
}

} // namespace fxd
