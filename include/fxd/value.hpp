#pragma once
// Value: the datum every persisted node carries
//
// A tagged union whose alternatives mirror the UArr type tags one to one,
// so encoding and decoding are exhaustive switches rather than type sniffing.
// Integers remember only their signedness; the encoder picks the width.

#include "types.hpp"
#include <nlohmann/json.hpp>
#include <array>
#include <cstdio>
#include <initializer_list>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace fxd {

// UArr type tags (wire values)
enum class TypeTag : uint8_t {
    I8 = 0x00,
    I16 = 0x01,
    I32 = 0x02,
    I64 = 0x03,
    U8 = 0x04,
    U16 = 0x05,
    U32 = 0x06,
    U64 = 0x07,
    F32 = 0x08,
    F64 = 0x09,
    Bool = 0x0A,
    Null = 0x0B,
    Undefined = 0x0C,
    String = 0x10,
    Bytes = 0x11,
    Array = 0x20,
    Map = 0x21,
    NodeRef = 0x30,
    Timestamp = 0x31,
    Uuid = 0x32,
};

inline bool is_known_tag(uint8_t tag) {
    return tag <= 0x0C || tag == 0x10 || tag == 0x11 || tag == 0x20 ||
           tag == 0x21 || tag == 0x30 || tag == 0x31 || tag == 0x32;
}

inline const char* tag_name(TypeTag tag) {
    switch (tag) {
        case TypeTag::I8: return "i8";
        case TypeTag::I16: return "i16";
        case TypeTag::I32: return "i32";
        case TypeTag::I64: return "i64";
        case TypeTag::U8: return "u8";
        case TypeTag::U16: return "u16";
        case TypeTag::U32: return "u32";
        case TypeTag::U64: return "u64";
        case TypeTag::F32: return "f32";
        case TypeTag::F64: return "f64";
        case TypeTag::Bool: return "bool";
        case TypeTag::Null: return "null";
        case TypeTag::Undefined: return "undefined";
        case TypeTag::String: return "string";
        case TypeTag::Bytes: return "bytes";
        case TypeTag::Array: return "array";
        case TypeTag::Map: return "map";
        case TypeTag::NodeRef: return "noderef";
        case TypeTag::Timestamp: return "timestamp";
        case TypeTag::Uuid: return "uuid";
    }
    return "unknown";
}

// Absent, as opposed to null
struct Undefined {
    bool operator==(const Undefined&) const { return true; }
};

// Reference to a foreign node by id
struct NodeRef {
    std::string id;
    bool operator==(const NodeRef& other) const { return id == other.id; }
};

// Point in time, Unix nanoseconds
struct TimePoint {
    Timestamp ns = 0;
    bool operator==(const TimePoint& other) const { return ns == other.ns; }
};

// 128-bit identifier
struct Uuid {
    std::array<uint8_t, 16> bytes{};

    bool operator==(const Uuid& other) const { return bytes == other.bytes; }

    std::string to_string() const {
        char buf[37];
        std::snprintf(buf, sizeof(buf),
                      "%02x%02x%02x%02x-%02x%02x-%02x%02x-%02x%02x-%02x%02x%02x%02x%02x%02x",
                      bytes[0], bytes[1], bytes[2], bytes[3], bytes[4], bytes[5],
                      bytes[6], bytes[7], bytes[8], bytes[9], bytes[10], bytes[11],
                      bytes[12], bytes[13], bytes[14], bytes[15]);
        return buf;
    }

    // Parse xxxxxxxx-xxxx-xxxx-xxxx-xxxxxxxxxxxx; returns false on malformed input
    static bool from_string(const std::string& s, Uuid& out) {
        size_t n = 0;
        for (size_t i = 0; i < s.size(); ++i) {
            char c = s[i];
            if (c == '-') continue;
            int v;
            if (c >= '0' && c <= '9') v = c - '0';
            else if (c >= 'a' && c <= 'f') v = c - 'a' + 10;
            else if (c >= 'A' && c <= 'F') v = c - 'A' + 10;
            else return false;
            if (n >= 32) return false;
            if (n % 2 == 0) out.bytes[n / 2] = static_cast<uint8_t>(v << 4);
            else out.bytes[n / 2] |= static_cast<uint8_t>(v);
            ++n;
        }
        return n == 32;
    }
};

class Value {
public:
    enum class Kind : uint8_t {
        Null,
        Undefined,
        Bool,
        Int,
        UInt,
        Float,
        String,
        Bytes,
        Array,
        Map,
        NodeRef,
        Time,
        Uuid,
    };

    using Array = std::vector<Value>;
    using Field = std::pair<std::string, Value>;
    using Map = std::vector<Field>;  // insertion ordered, keys unique
    using Bytes = std::vector<uint8_t>;

    Value() : data_(nullptr) {}
    Value(std::nullptr_t) : data_(nullptr) {}
    Value(bool b) : data_(b) {}
    Value(double d) : data_(d) {}
    Value(float f) : data_(static_cast<double>(f)) {}
    Value(const char* s) : data_(std::string(s)) {}
    Value(std::string s) : data_(std::move(s)) {}
    Value(std::string_view s) : data_(std::string(s)) {}
    Value(NodeRef r) : data_(std::move(r)) {}
    Value(TimePoint t) : data_(t) {}
    Value(fxd::Uuid u) : data_(u) {}

    template <typename T,
              std::enable_if_t<std::is_integral_v<T> && !std::is_same_v<T, bool>, int> = 0>
    Value(T v) {
        if constexpr (std::is_signed_v<T>) {
            data_ = static_cast<int64_t>(v);
        } else {
            data_ = static_cast<uint64_t>(v);
        }
    }

    static Value undefined() {
        Value v;
        v.data_ = fxd::Undefined{};
        return v;
    }

    static Value array(Array items = {}) {
        Value v;
        v.data_ = std::move(items);
        return v;
    }

    static Value map(Map fields = {}) {
        Value v;
        v.data_ = Map{};
        for (auto& f : fields) {
            v.set(std::move(f.first), std::move(f.second));
        }
        return v;
    }

    static Value bytes(Bytes raw) {
        Value v;
        v.data_ = std::move(raw);
        return v;
    }

    static Value node_ref(std::string id) {
        return Value(fxd::NodeRef{std::move(id)});
    }

    static Value time(Timestamp ns) {
        return Value(TimePoint{ns});
    }

    Kind kind() const { return static_cast<Kind>(data_.index()); }

    bool is_null() const { return kind() == Kind::Null; }
    bool is_undefined() const { return kind() == Kind::Undefined; }
    bool is_bool() const { return kind() == Kind::Bool; }
    bool is_int() const { return kind() == Kind::Int; }
    bool is_uint() const { return kind() == Kind::UInt; }
    bool is_integer() const { return is_int() || is_uint(); }
    bool is_float() const { return kind() == Kind::Float; }
    bool is_number() const { return is_integer() || is_float(); }
    bool is_string() const { return kind() == Kind::String; }
    bool is_bytes() const { return kind() == Kind::Bytes; }
    bool is_array() const { return kind() == Kind::Array; }
    bool is_map() const { return kind() == Kind::Map; }
    bool is_node_ref() const { return kind() == Kind::NodeRef; }
    bool is_time() const { return kind() == Kind::Time; }
    bool is_uuid() const { return kind() == Kind::Uuid; }

    bool as_bool() const { return std::get<bool>(data_); }

    int64_t as_int() const {
        if (is_uint()) return static_cast<int64_t>(std::get<uint64_t>(data_));
        return std::get<int64_t>(data_);
    }

    uint64_t as_uint() const {
        if (is_int()) return static_cast<uint64_t>(std::get<int64_t>(data_));
        return std::get<uint64_t>(data_);
    }

    double as_double() const {
        switch (kind()) {
            case Kind::Int: return static_cast<double>(std::get<int64_t>(data_));
            case Kind::UInt: return static_cast<double>(std::get<uint64_t>(data_));
            default: return std::get<double>(data_);
        }
    }

    const std::string& as_string() const { return std::get<std::string>(data_); }
    const Bytes& as_bytes() const { return std::get<Bytes>(data_); }
    const Array& as_array() const { return std::get<Array>(data_); }
    Array& as_array() { return std::get<Array>(data_); }
    const Map& as_map() const { return std::get<Map>(data_); }
    Map& as_map() { return std::get<Map>(data_); }
    const fxd::NodeRef& as_node_ref() const { return std::get<fxd::NodeRef>(data_); }
    TimePoint as_time() const { return std::get<TimePoint>(data_); }
    const fxd::Uuid& as_uuid() const { return std::get<fxd::Uuid>(data_); }

    // Map access (nullptr when absent or not a map)
    const Value* find(std::string_view key) const {
        if (!is_map()) return nullptr;
        for (const auto& f : as_map()) {
            if (f.first == key) return &f.second;
        }
        return nullptr;
    }

    Value* find(std::string_view key) {
        if (!is_map()) return nullptr;
        for (auto& f : as_map()) {
            if (f.first == key) return &f.second;
        }
        return nullptr;
    }

    bool contains(std::string_view key) const { return find(key) != nullptr; }

    // Insert or replace; a non-map becomes an empty map first
    void set(std::string key, Value value) {
        if (!is_map()) data_ = Map{};
        if (Value* existing = find(key)) {
            *existing = std::move(value);
            return;
        }
        as_map().emplace_back(std::move(key), std::move(value));
    }

    bool erase(std::string_view key) {
        if (!is_map()) return false;
        auto& m = as_map();
        for (auto it = m.begin(); it != m.end(); ++it) {
            if (it->first == key) {
                m.erase(it);
                return true;
            }
        }
        return false;
    }

    // String field of a map, or fallback
    std::string get_string(std::string_view key, const std::string& fallback = "") const {
        const Value* v = find(key);
        return (v && v->is_string()) ? v->as_string() : fallback;
    }

    void push_back(Value item) {
        if (!is_array()) data_ = Array{};
        as_array().push_back(std::move(item));
    }

    // Element count for arrays and maps, byte count for strings/bytes
    size_t size() const {
        switch (kind()) {
            case Kind::Array: return as_array().size();
            case Kind::Map: return as_map().size();
            case Kind::String: return as_string().size();
            case Kind::Bytes: return as_bytes().size();
            default: return 0;
        }
    }

    // Maps compare as key sets; integers compare by value across signedness
    bool operator==(const Value& other) const {
        if (is_integer() && other.is_integer()) {
            if (is_int() && as_int() < 0) return other.is_int() && other.as_int() == as_int();
            if (other.is_int() && other.as_int() < 0) return false;
            return as_uint() == other.as_uint();
        }
        if (kind() != other.kind()) return false;
        if (is_map()) {
            const Map& a = as_map();
            const Map& b = other.as_map();
            if (a.size() != b.size()) return false;
            for (const auto& f : a) {
                const Value* v = other.find(f.first);
                if (!v || !(*v == f.second)) return false;
            }
            return true;
        }
        return data_ == other.data_;
    }

    bool operator!=(const Value& other) const { return !(*this == other); }

    // Compact JSON rendering for log lines
    std::string dump() const;

private:
    std::variant<std::nullptr_t, fxd::Undefined, bool, int64_t, uint64_t, double,
                 std::string, Bytes, Array, Map, fxd::NodeRef, TimePoint, fxd::Uuid>
        data_;
};

// ═══════════════════════════════════════════════════════════════════════════
// JSON conversion (nlohmann::json)
//
// Non-JSON alternatives use single-key tagged objects:
//   {"$ref": id}  {"$time": ns}  {"$uuid": "..."}  {"$bytes": [..]}
// Undefined renders as null.
// ═══════════════════════════════════════════════════════════════════════════

using json = nlohmann::json;

inline void to_json(json& j, const Value& v) {
    switch (v.kind()) {
        case Value::Kind::Null:
        case Value::Kind::Undefined:
            j = nullptr;
            break;
        case Value::Kind::Bool:
            j = v.as_bool();
            break;
        case Value::Kind::Int:
            j = v.as_int();
            break;
        case Value::Kind::UInt:
            j = v.as_uint();
            break;
        case Value::Kind::Float:
            j = v.as_double();
            break;
        case Value::Kind::String:
            j = v.as_string();
            break;
        case Value::Kind::Bytes:
            j = json{{"$bytes", v.as_bytes()}};
            break;
        case Value::Kind::Array: {
            j = json::array();
            for (const auto& item : v.as_array()) {
                json child;
                to_json(child, item);
                j.push_back(std::move(child));
            }
            break;
        }
        case Value::Kind::Map: {
            j = json::object();
            for (const auto& [key, item] : v.as_map()) {
                json child;
                to_json(child, item);
                j[key] = std::move(child);
            }
            break;
        }
        case Value::Kind::NodeRef:
            j = json{{"$ref", v.as_node_ref().id}};
            break;
        case Value::Kind::Time:
            j = json{{"$time", v.as_time().ns}};
            break;
        case Value::Kind::Uuid:
            j = json{{"$uuid", v.as_uuid().to_string()}};
            break;
    }
}

inline void from_json(const json& j, Value& v) {
    switch (j.type()) {
        case json::value_t::null:
        case json::value_t::discarded:
            v = Value();
            return;
        case json::value_t::boolean:
            v = Value(j.get<bool>());
            return;
        case json::value_t::number_integer:
            v = Value(j.get<int64_t>());
            return;
        case json::value_t::number_unsigned: {
            // JSON has no signedness; keep non-negative integers signed when they fit
            uint64_t u = j.get<uint64_t>();
            if (u <= static_cast<uint64_t>(INT64_MAX)) v = Value(static_cast<int64_t>(u));
            else v = Value(u);
            return;
        }
        case json::value_t::number_float:
            v = Value(j.get<double>());
            return;
        case json::value_t::string:
            v = Value(j.get<std::string>());
            return;
        case json::value_t::binary:
            v = Value::bytes(Value::Bytes(j.get_binary().begin(), j.get_binary().end()));
            return;
        case json::value_t::array: {
            Value::Array items;
            items.reserve(j.size());
            for (const auto& child : j) {
                Value item;
                from_json(child, item);
                items.push_back(std::move(item));
            }
            v = Value::array(std::move(items));
            return;
        }
        case json::value_t::object: {
            if (j.size() == 1) {
                if (j.contains("$ref") && j["$ref"].is_string()) {
                    v = Value::node_ref(j["$ref"].get<std::string>());
                    return;
                }
                if (j.contains("$time") && j["$time"].is_number_unsigned()) {
                    v = Value::time(j["$time"].get<uint64_t>());
                    return;
                }
                if (j.contains("$uuid") && j["$uuid"].is_string()) {
                    fxd::Uuid u;
                    if (fxd::Uuid::from_string(j["$uuid"].get<std::string>(), u)) {
                        v = Value(u);
                        return;
                    }
                }
                if (j.contains("$bytes") && j["$bytes"].is_array()) {
                    v = Value::bytes(j["$bytes"].get<Value::Bytes>());
                    return;
                }
            }
            Value m = Value::map();
            for (auto it = j.begin(); it != j.end(); ++it) {
                Value item;
                from_json(it.value(), item);
                m.set(it.key(), std::move(item));
            }
            v = std::move(m);
            return;
        }
    }
}

inline std::string Value::dump() const {
    json j;
    to_json(j, *this);
    return j.dump();
}

} // namespace fxd
