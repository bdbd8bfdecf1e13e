#pragma once
// Signals: append-only stream of node mutations with cursor subscriptions
//
// Every mutation becomes a record with seq == its index in the stream.
// Subscribers hold a cursor; delivery brings each one from its cursor to the
// end of the log, so replay and live delivery share one path and a callback
// that appends simply nests another catch-up on the call stack.
//
// A backend makes the stream durable. WalSignalBackend writes each record as
// a SIGNAL entry in a write-ahead log.

#include "errors.hpp"
#include "wal.hpp"
#include <algorithm>
#include <chrono>
#include <deque>
#include <functional>
#include <iostream>
#include <memory>
#include <optional>
#include <type_traits>
#include <variant>
#include <vector>

namespace fxd {

enum class SignalKind : uint8_t {
    Value,     // Node value changed
    Children,  // Child added, removed or moved
    Metadata,  // Metadata key changed
    Custom,    // User event
};

enum class ChildOp : uint8_t {
    Add,
    Remove,
    Move,
};

inline const char* signal_kind_name(SignalKind kind) {
    switch (kind) {
        case SignalKind::Value: return "value";
        case SignalKind::Children: return "children";
        case SignalKind::Metadata: return "metadata";
        case SignalKind::Custom: return "custom";
    }
    return "unknown";
}

inline std::optional<SignalKind> parse_signal_kind(const std::string& name) {
    if (name == "value") return SignalKind::Value;
    if (name == "children") return SignalKind::Children;
    if (name == "metadata") return SignalKind::Metadata;
    if (name == "custom") return SignalKind::Custom;
    return std::nullopt;
}

inline const char* child_op_name(ChildOp op) {
    switch (op) {
        case ChildOp::Add: return "add";
        case ChildOp::Remove: return "remove";
        case ChildOp::Move: return "move";
    }
    return "unknown";
}

inline std::optional<ChildOp> parse_child_op(const std::string& name) {
    if (name == "add") return ChildOp::Add;
    if (name == "remove") return ChildOp::Remove;
    if (name == "move") return ChildOp::Move;
    return std::nullopt;
}

struct ValueDelta {
    Value old_value;
    Value new_value;
};

struct ChildrenDelta {
    ChildOp op = ChildOp::Add;
    std::string key;
    std::optional<std::string> child_id;
    std::optional<std::string> old_child_id;
};

struct MetadataDelta {
    std::string key;
    Value old_value;
    Value new_value;
};

struct CustomDelta {
    std::string event;
    Value payload;
};

using SignalDelta = std::variant<ValueDelta, ChildrenDelta, MetadataDelta, CustomDelta>;

inline SignalKind delta_kind(const SignalDelta& delta) {
    return static_cast<SignalKind>(delta.index());
}

// A signal as submitted; seq and timestamp are assigned on append and
// the record's kind is the kind of its delta
struct SignalInput {
    uint64_t base_version = 0;
    uint64_t new_version = 0;
    std::string source_node_id;
    SignalDelta delta;
};

struct SignalRecord {
    uint64_t seq = 0;
    Timestamp timestamp = 0;
    SignalKind kind = SignalKind::Value;
    uint64_t base_version = 0;
    uint64_t new_version = 0;
    std::string source_node_id;
    SignalDelta delta;
};

using SignalCallback = std::function<void(const SignalRecord&)>;
using Unsubscribe = std::function<void()>;

struct SubscribeOptions {
    std::optional<std::string> node_id;  // Only signals from this node
    std::optional<SignalKind> kind;      // Only signals of this kind
    uint64_t cursor = 0;                 // First seq to deliver
    bool tail = false;                   // Start at the end of the log
    size_t batch_size = 100;             // Replay chunk size
};

struct SignalStats {
    size_t total_signals = 0;
    size_t subscribers = 0;
    double avg_append_us = 0.0;
    double max_append_us = 0.0;
};

struct SignalConfig {
    size_t batch_size = 100;   // Replay chunk size used by tail()
    std::string wal_path;      // Durable backend log; empty keeps signals in memory
    bool sync_on_write = false;
};

// ═══════════════════════════════════════════════════════════════════════════
// Value mapping (payload of WAL SIGNAL records)
// ═══════════════════════════════════════════════════════════════════════════

inline Value delta_to_value(const SignalDelta& delta) {
    Value out = Value::map();
    out.set("kind", signal_kind_name(delta_kind(delta)));
    std::visit([&out](const auto& d) {
        using T = std::decay_t<decltype(d)>;
        if constexpr (std::is_same_v<T, ValueDelta>) {
            out.set("oldValue", d.old_value);
            out.set("newValue", d.new_value);
        } else if constexpr (std::is_same_v<T, ChildrenDelta>) {
            out.set("op", child_op_name(d.op));
            out.set("key", d.key);
            if (d.child_id) out.set("childId", *d.child_id);
            if (d.old_child_id) out.set("oldChildId", *d.old_child_id);
        } else if constexpr (std::is_same_v<T, MetadataDelta>) {
            out.set("key", d.key);
            out.set("oldValue", d.old_value);
            out.set("newValue", d.new_value);
        } else {
            out.set("event", d.event);
            out.set("payload", d.payload);
        }
    }, delta);
    return out;
}

inline Value signal_to_value(const SignalRecord& signal) {
    Value out = Value::map();
    out.set("seq", signal.seq);
    out.set("timestamp", Value::time(signal.timestamp));
    out.set("kind", signal_kind_name(signal.kind));
    out.set("baseVersion", signal.base_version);
    out.set("newVersion", signal.new_version);
    out.set("sourceNodeId", signal.source_node_id);
    out.set("delta", delta_to_value(signal.delta));
    return out;
}

namespace detail {

inline const Value& require_field(const Value& v, const char* key) {
    const Value* field = v.find(key);
    if (!field) {
        throw FormatError(std::string("Signal record missing field: ") + key);
    }
    return *field;
}

inline std::string require_string(const Value& v, const char* key) {
    const Value& field = require_field(v, key);
    if (!field.is_string()) {
        throw FormatError(std::string("Signal field is not a string: ") + key);
    }
    return field.as_string();
}

inline uint64_t require_uint(const Value& v, const char* key) {
    const Value& field = require_field(v, key);
    if (field.is_time()) return field.as_time().ns;
    if (!field.is_integer()) {
        throw FormatError(std::string("Signal field is not an integer: ") + key);
    }
    return field.as_uint();
}

inline Value optional_field(const Value& v, const char* key) {
    const Value* field = v.find(key);
    return field ? *field : Value::undefined();
}

} // namespace detail

// Throws FormatError when `v` is not a signal record
inline SignalRecord signal_from_value(const Value& v) {
    if (!v.is_map()) {
        throw FormatError("Signal record is not a map");
    }
    SignalRecord signal;
    signal.seq = detail::require_uint(v, "seq");
    signal.timestamp = detail::require_uint(v, "timestamp");
    auto kind = parse_signal_kind(detail::require_string(v, "kind"));
    if (!kind) {
        throw FormatError("Unknown signal kind: " + v.get_string("kind"));
    }
    signal.kind = *kind;
    signal.base_version = detail::require_uint(v, "baseVersion");
    signal.new_version = detail::require_uint(v, "newVersion");
    signal.source_node_id = detail::require_string(v, "sourceNodeId");

    const Value& d = detail::require_field(v, "delta");
    switch (signal.kind) {
        case SignalKind::Value:
            signal.delta = ValueDelta{detail::optional_field(d, "oldValue"),
                                      detail::optional_field(d, "newValue")};
            break;
        case SignalKind::Children: {
            ChildrenDelta cd;
            auto op = parse_child_op(detail::require_string(d, "op"));
            if (!op) {
                throw FormatError("Unknown child op: " + d.get_string("op"));
            }
            cd.op = *op;
            cd.key = detail::require_string(d, "key");
            if (d.contains("childId")) cd.child_id = detail::require_string(d, "childId");
            if (d.contains("oldChildId")) cd.old_child_id = detail::require_string(d, "oldChildId");
            signal.delta = std::move(cd);
            break;
        }
        case SignalKind::Metadata:
            signal.delta = MetadataDelta{detail::require_string(d, "key"),
                                         detail::optional_field(d, "oldValue"),
                                         detail::optional_field(d, "newValue")};
            break;
        case SignalKind::Custom:
            signal.delta = CustomDelta{detail::require_string(d, "event"),
                                       detail::optional_field(d, "payload")};
            break;
    }
    return signal;
}

// ═══════════════════════════════════════════════════════════════════════════
// Durable backends
// ═══════════════════════════════════════════════════════════════════════════

class SignalBackend {
public:
    virtual ~SignalBackend() = default;

    virtual void append(const SignalRecord& signal) = 0;

    // Signals with from <= seq < to
    virtual std::vector<SignalRecord> read(uint64_t from, uint64_t to) = 0;

    // Drop signals with seq < before_seq
    virtual void compact(uint64_t before_seq) = 0;

    virtual void close() = 0;
};

class MemorySignalBackend : public SignalBackend {
public:
    void append(const SignalRecord& signal) override {
        log_.push_back(signal);
    }

    std::vector<SignalRecord> read(uint64_t from, uint64_t to) override {
        std::vector<SignalRecord> out;
        for (const auto& s : log_) {
            if (s.seq >= from && s.seq < to) out.push_back(s);
        }
        return out;
    }

    void compact(uint64_t before_seq) override {
        std::vector<SignalRecord> kept;
        for (auto& s : log_) {
            if (s.seq >= before_seq) kept.push_back(std::move(s));
        }
        log_ = std::move(kept);
    }

    void close() override {}

    size_t size() const { return log_.size(); }

private:
    std::vector<SignalRecord> log_;
};

// Signals as WAL SIGNAL records: node id = source node, payload = signal
class WalSignalBackend : public SignalBackend {
public:
    explicit WalSignalBackend(WriteAheadLog& wal) : wal_(wal) {}

    void append(const SignalRecord& signal) override {
        wal_.append(RecordType::Signal, signal.source_node_id, signal_to_value(signal));
    }

    std::vector<SignalRecord> read(uint64_t from, uint64_t to) override {
        std::vector<SignalRecord> out;
        WalScan scan = wal_.read_from(0);
        for (const auto& record : scan) {
            if (record.type != RecordType::Signal) continue;
            std::optional<SignalRecord> signal = decode_signal(record);
            if (signal && signal->seq >= from && signal->seq < to) {
                out.push_back(std::move(*signal));
            }
        }
        return out;
    }

    // Rewrites the log; records of other types are carried over unchanged
    void compact(uint64_t before_seq) override {
        const std::string path = wal_.path();
        size_t dropped = 0;
        wal_.compact([&](WriteAheadLog& fresh) {
            WalScan scan(path, 0);
            for (const auto& record : scan) {
                if (record.type == RecordType::Signal) {
                    std::optional<SignalRecord> signal = decode_signal(record);
                    if (!signal || signal->seq < before_seq) {
                        ++dropped;
                        continue;
                    }
                }
                fresh.append(record.type, record.node_id, record.data);
            }
        });
        std::cerr << "[Signals] Compacted signal log, dropped " << dropped << " records\n";
    }

    void close() override {
        wal_.close();
    }

private:
    static std::optional<SignalRecord> decode_signal(const WalRecord& record) {
        try {
            return signal_from_value(record.data);
        } catch (const FormatError& e) {
            std::cerr << "[Signals] Bad signal record at seq " << record.seq << ": " << e.what() << "\n";
            return std::nullopt;
        }
    }

    WriteAheadLog& wal_;
};

// ═══════════════════════════════════════════════════════════════════════════
// Stream
// ═══════════════════════════════════════════════════════════════════════════

class SignalStream {
public:
    explicit SignalStream(SignalBackend* backend = nullptr, SignalConfig config = {})
        : backend_(backend), config_(std::move(config)) {}

    SignalStream(const SignalStream&) = delete;
    SignalStream& operator=(const SignalStream&) = delete;

    // Assign seq and timestamp, persist, then bring every subscriber up to date
    SignalRecord append(SignalInput input) {
        auto start = std::chrono::steady_clock::now();

        SignalRecord signal;
        signal.seq = log_.size();
        signal.timestamp = now_ns();
        signal.kind = delta_kind(input.delta);
        signal.base_version = input.base_version;
        signal.new_version = input.new_version;
        signal.source_node_id = std::move(input.source_node_id);
        signal.delta = std::move(input.delta);

        if (backend_) {
            backend_->append(signal);
        }
        log_.push_back(signal);
        ++total_signals_;

        notify();

        double us = std::chrono::duration<double, std::micro>(
            std::chrono::steady_clock::now() - start).count();
        if (us > max_append_us_) max_append_us_ = us;
        avg_append_us_ += (us - avg_append_us_) / static_cast<double>(total_signals_);

        return signal;
    }

    // Matching history is replayed before this returns (unless tail)
    Unsubscribe subscribe(const SubscribeOptions& options, SignalCallback callback) {
        auto sub = std::make_shared<Subscriber>();
        sub->cursor = options.tail ? log_.size() : options.cursor;
        sub->callback = std::move(callback);
        sub->options = options;
        if (sub->options.batch_size == 0) sub->options.batch_size = config_.batch_size;
        subscribers_.push_back(sub);

        if (!options.tail) {
            DeliveryScope scope(*this);
            drain(*sub);
        }

        std::weak_ptr<Subscriber> weak = sub;
        return [weak]() {
            if (auto s = weak.lock()) s->active = false;
        };
    }

    Unsubscribe tail(SignalCallback callback) {
        SubscribeOptions options;
        options.tail = true;
        options.batch_size = config_.batch_size;
        return subscribe(options, std::move(callback));
    }

    Unsubscribe tail(SignalKind kind, SignalCallback callback) {
        SubscribeOptions options;
        options.tail = true;
        options.kind = kind;
        options.batch_size = config_.batch_size;
        return subscribe(options, std::move(callback));
    }

    // Records with from <= seq < to, clamped to the log
    std::vector<SignalRecord> read_range(uint64_t from, uint64_t to) const {
        uint64_t end = std::min<uint64_t>(to, log_.size());
        std::vector<SignalRecord> out;
        for (uint64_t i = from; i < end; ++i) {
            out.push_back(log_[i]);
        }
        return out;
    }

    std::vector<SignalRecord> read_all() const {
        return std::vector<SignalRecord>(log_.begin(), log_.end());
    }

    // End of log; the seq the next append will get
    uint64_t cursor() const { return log_.size(); }

    // Drop the in-memory log; seq restarts at 0 and cursors rewind with it
    void clear() {
        log_.clear();
        total_signals_ = 0;
        for (auto& sub : subscribers_) {
            sub->cursor = 0;
        }
    }

    SignalStats stats() const {
        SignalStats s;
        s.total_signals = total_signals_;
        for (const auto& sub : subscribers_) {
            if (sub->active) ++s.subscribers;
        }
        s.avg_append_us = avg_append_us_;
        s.max_append_us = max_append_us_;
        return s;
    }

    SignalBackend* backend() const { return backend_; }

private:
    struct Subscriber {
        uint64_t cursor = 0;
        SignalCallback callback;
        SubscribeOptions options;
        bool active = true;
    };

    // Tracks nesting so inactive subscribers are purged only when no
    // delivery is iterating the list
    struct DeliveryScope {
        explicit DeliveryScope(SignalStream& s) : stream(s) { ++stream.depth_; }
        ~DeliveryScope() {
            if (--stream.depth_ == 0) stream.purge();
        }
        SignalStream& stream;
    };

    static bool matches(const SignalRecord& signal, const SubscribeOptions& options) {
        if (options.node_id && signal.source_node_id != *options.node_id) return false;
        if (options.kind && signal.kind != *options.kind) return false;
        return true;
    }

    void notify() {
        DeliveryScope scope(*this);
        std::vector<std::shared_ptr<Subscriber>> snapshot = subscribers_;
        for (const auto& sub : snapshot) {
            drain(*sub);
        }
    }

    // Deliver everything from the subscriber's cursor to the end of the log,
    // one batch at a time. The cursor moves past a record before its callback
    // runs, so a nested drain (callback appended) continues after it and the
    // outer loop skips whatever the nested one already delivered.
    void drain(Subscriber& sub) {
        const size_t batch_size = sub.options.batch_size ? sub.options.batch_size : 1;
        while (sub.active && sub.cursor < log_.size()) {
            std::vector<uint64_t> batch;
            uint64_t scan = sub.cursor;
            while (scan < log_.size() && batch.size() < batch_size) {
                if (matches(log_[scan], sub.options)) batch.push_back(scan);
                ++scan;
            }

            for (uint64_t index : batch) {
                if (!sub.active || index >= log_.size()) return;
                if (sub.cursor > index) continue;
                sub.cursor = index + 1;
                SignalRecord signal = log_[index];
                deliver(sub, signal);
            }
            if (sub.cursor < scan) sub.cursor = scan;
        }
    }

    static void deliver(Subscriber& sub, const SignalRecord& signal) {
        try {
            sub.callback(signal);
        } catch (const std::exception& e) {
            std::cerr << "[Signals] Subscriber error at seq " << signal.seq << ": " << e.what() << "\n";
        }
    }

    void purge() {
        std::vector<std::shared_ptr<Subscriber>> live;
        for (auto& sub : subscribers_) {
            if (sub->active) live.push_back(std::move(sub));
        }
        subscribers_ = std::move(live);
    }

    SignalBackend* backend_;
    SignalConfig config_;
    std::deque<SignalRecord> log_;
    std::vector<std::shared_ptr<Subscriber>> subscribers_;
    int depth_ = 0;
    size_t total_signals_ = 0;
    double avg_append_us_ = 0.0;
    double max_append_us_ = 0.0;
};

// A stream with the backend its configuration names: a log of its own at
// wal_path, or memory when wal_path is empty
class SignalLog {
public:
    explicit SignalLog(SignalConfig config) {
        if (!config.wal_path.empty()) {
            wal_ = std::make_unique<WriteAheadLog>(WalConfig{config.wal_path, config.sync_on_write});
            wal_->open();
            backend_ = std::make_unique<WalSignalBackend>(*wal_);
        } else {
            backend_ = std::make_unique<MemorySignalBackend>();
        }
        stream_ = std::make_unique<SignalStream>(backend_.get(), std::move(config));
    }

    SignalStream& stream() { return *stream_; }
    SignalBackend& backend() { return *backend_; }
    WriteAheadLog* wal() { return wal_.get(); }
    bool durable() const { return wal_ != nullptr; }

private:
    std::unique_ptr<WriteAheadLog> wal_;
    std::unique_ptr<SignalBackend> backend_;
    std::unique_ptr<SignalStream> stream_;
};

// ═══════════════════════════════════════════════════════════════════════════
// Emitter helpers
// ═══════════════════════════════════════════════════════════════════════════

class SignalEmitter {
public:
    explicit SignalEmitter(SignalStream& stream) : stream_(stream) {}

    SignalRecord emit_value(const std::string& node_id, Value old_value, Value new_value,
                            uint64_t base_version, uint64_t new_version) {
        return emit(node_id, base_version, new_version,
                    ValueDelta{std::move(old_value), std::move(new_value)});
    }

    SignalRecord emit_child_add(const std::string& node_id, const std::string& key,
                                const std::string& child_id,
                                uint64_t base_version, uint64_t new_version) {
        ChildrenDelta d;
        d.op = ChildOp::Add;
        d.key = key;
        d.child_id = child_id;
        return emit(node_id, base_version, new_version, std::move(d));
    }

    SignalRecord emit_child_remove(const std::string& node_id, const std::string& key,
                                   const std::string& child_id,
                                   uint64_t base_version, uint64_t new_version) {
        ChildrenDelta d;
        d.op = ChildOp::Remove;
        d.key = key;
        d.child_id = child_id;
        return emit(node_id, base_version, new_version, std::move(d));
    }

    // Key `key` now holds `child_id`, replacing `old_child_id`
    SignalRecord emit_child_move(const std::string& node_id, const std::string& key,
                                 const std::string& child_id, const std::string& old_child_id,
                                 uint64_t base_version, uint64_t new_version) {
        ChildrenDelta d;
        d.op = ChildOp::Move;
        d.key = key;
        d.child_id = child_id;
        d.old_child_id = old_child_id;
        return emit(node_id, base_version, new_version, std::move(d));
    }

    SignalRecord emit_metadata(const std::string& node_id, const std::string& key,
                               Value old_value, Value new_value,
                               uint64_t base_version, uint64_t new_version) {
        return emit(node_id, base_version, new_version,
                    MetadataDelta{key, std::move(old_value), std::move(new_value)});
    }

    SignalRecord emit_custom(const std::string& node_id, const std::string& event, Value payload,
                             uint64_t base_version, uint64_t new_version) {
        return emit(node_id, base_version, new_version,
                    CustomDelta{event, std::move(payload)});
    }

private:
    SignalRecord emit(const std::string& node_id,
                      uint64_t base_version, uint64_t new_version, SignalDelta delta) {
        SignalInput input;
        input.base_version = base_version;
        input.new_version = new_version;
        input.source_node_id = node_id;
        input.delta = std::move(delta);
        return stream_.append(std::move(input));
    }

    SignalStream& stream_;
};

} // namespace fxd
