#pragma once
// Disk: graph persistence over the write-ahead log
//
// save()    walks the live graph and appends one NODE_CREATE per node
// load()    replays the log and rebuilds the hierarchy from parent ids
// compact() rewrites the log as a fresh snapshot of the live graph
//
// Node record payload:
//   {id, parent_id, key_name, type, value?, meta?, proto?}
// parent_id and key_name are null for the root; proto is a one-element array.

#include "graph.hpp"
#include "snippet_index.hpp"
#include "wal.hpp"
#include <chrono>
#include <iostream>
#include <map>
#include <mutex>
#include <optional>
#include <unordered_map>
#include <unordered_set>

namespace fxd {

constexpr const char* DISK_EXTENSION = ".fxd";
constexpr const char* WAL_EXTENSION = ".fxwal";

struct DiskConfig {
    std::string path;
    bool sync_on_write = false;
    size_t compact_threshold = 10000;
};

// What a load did
struct LoadReport {
    size_t nodes = 0;            // NODE_CREATE records applied
    size_t patches = 0;          // NODE_PATCH records applied
    size_t deferred = 0;         // Creates that waited for a later parent
    size_t orphans = 0;          // Creates whose parent never appeared
    size_t dropped_patches = 0;  // Patches for ids never created
    size_t skipped = 0;          // Link, signal and checkpoint records
    size_t corrupt = 0;          // Records failing checksum or decode
};

struct DiskStats {
    size_t nodes = 0;     // Live node count
    size_t records = 0;   // Records in the log
    uint64_t bytes = 0;   // Log file size
};

namespace detail {

inline double elapsed_ms(std::chrono::steady_clock::time_point start) {
    return std::chrono::duration<double, std::milli>(
        std::chrono::steady_clock::now() - start).count();
}

inline std::string child_path(const std::string& parent_path, const std::string& key) {
    return parent_path.empty() ? key : parent_path + "." + key;
}

// Key a node is addressed by under its parent
inline std::string record_key(const Value& data) {
    std::string key = data.get_string("key_name");
    return key.empty() ? data.get_string("id") : key;
}

inline bool has_parent(const Value& data) {
    const Value* parent = data.find("parent_id");
    return parent && parent->is_string();
}

} // namespace detail

class Disk {
public:
    Disk(GraphHost& graph, SnippetIndex& snippets, DiskConfig config)
        : graph_(graph),
          snippets_(snippets),
          wal_path_(wal_path_for(config.path)),
          wal_(WalConfig{wal_path_, config.sync_on_write, config.compact_threshold}) {}

    // project.fxd -> project.fxwal, anything else gains .fxwal
    static std::string wal_path_for(const std::string& path) {
        if (ends_with(path, WAL_EXTENSION)) return path;
        if (ends_with(path, DISK_EXTENSION)) {
            return path.substr(0, path.size() - std::strlen(DISK_EXTENSION)) + WAL_EXTENSION;
        }
        return path + WAL_EXTENSION;
    }

    void open() {
        wal_.open();
    }

    void close() {
        wal_.close();
    }

    // Append the whole live tree; returns the number of nodes written
    size_t save() {
        std::lock_guard<std::mutex> lock(mutex_);
        auto start = std::chrono::steady_clock::now();
        size_t count = write_tree(wal_);
        std::cerr << "[Disk] Saved " << count << " nodes in "
                  << detail::elapsed_ms(start) << " ms\n";
        return count;
    }

    // Record an incremental edit; meta is shallow-merged on load
    uint64_t patch(const std::string& node_id,
                   const std::optional<Value>& value,
                   const std::optional<Value>& meta = std::nullopt) {
        Value data = Value::map();
        if (value) data.set("value", *value);
        if (meta) data.set("meta", *meta);
        std::lock_guard<std::mutex> lock(mutex_);
        return wal_.append(RecordType::NodePatch, node_id, data);
    }

    // Rebuild the graph below the reserved roots from the log.
    // Reads through its own scan and never opens the log for writing, so a
    // damaged log is left as found.
    LoadReport load() {
        std::lock_guard<std::mutex> lock(mutex_);
        auto start = std::chrono::steady_clock::now();

        graph_.clear();
        snippets_.clear();

        Replay replay(graph_, snippets_);
        if (!file_exists(wal_path_)) {
            return replay.report;
        }
        WalScan scan(wal_path_, 0);
        for (const auto& record : scan) {
            replay.apply(record);
        }
        replay.finish();
        replay.report.corrupt = scan.skipped();

        const LoadReport& r = replay.report;
        std::cerr << "[Disk] Loaded " << r.nodes << " nodes, " << r.patches << " patches in "
                  << detail::elapsed_ms(start) << " ms";
        if (r.orphans || r.dropped_patches || r.corrupt) {
            std::cerr << " (orphans=" << r.orphans << ", dropped_patches=" << r.dropped_patches
                      << ", corrupt=" << r.corrupt << ")";
        }
        std::cerr << "\n";
        return r;
    }

    // Replace the log with one NODE_CREATE per live node; returns that count
    size_t compact() {
        std::lock_guard<std::mutex> lock(mutex_);
        size_t count = 0;
        wal_.compact([&](WriteAheadLog& fresh) {
            count = write_tree(fresh);
        });
        std::cerr << "[Disk] Compacted to " << count << " nodes\n";
        return count;
    }

    DiskStats stats() {
        std::lock_guard<std::mutex> lock(mutex_);
        WalStats ws = wal_.stats();
        DiskStats s;
        s.nodes = count_nodes(graph_.root());
        s.records = ws.record_count;
        s.bytes = ws.byte_size;
        return s;
    }

    const std::string& wal_path() const { return wal_path_; }
    WriteAheadLog& wal() { return wal_; }

    // Payload describing one node
    static Value describe(const GraphNode& node, const std::string* parent_id,
                          const std::string* key_name) {
        Value data = Value::map();
        data.set("id", node.id());
        data.set("parent_id", parent_id ? Value(*parent_id) : Value());
        data.set("key_name", key_name ? Value(*key_name) : Value());
        data.set("type", node.type().empty() ? std::string("raw") : node.type());

        if (!node.value().is_undefined()) {
            data.set("value", node.value());
        }
        const Value& meta = node.meta();
        if (!meta.is_undefined() && !meta.is_null()) {
            data.set("meta", meta);
        }
        if (auto proto = node.proto()) {
            data.set("proto", Value::array({Value(*proto)}));
        }
        return data;
    }

private:
    // Depth-first, parents before children, children in key order
    static size_t write_tree(WriteAheadLog& wal, const GraphNode& node,
                             const std::string* parent_id, const std::string* key_name) {
        wal.append(RecordType::NodeCreate, node.id(), describe(node, parent_id, key_name));
        size_t count = 1;
        for (const auto& [key, child] : node.children()) {
            count += write_tree(wal, *child, &node.id(), &key);
        }
        return count;
    }

    size_t write_tree(WriteAheadLog& wal) {
        return write_tree(wal, graph_.root(), nullptr, nullptr);
    }

    // Streaming replay state: path map, creates waiting on a parent, and
    // patches waiting on those creates
    struct Replay {
        Replay(GraphHost& g, SnippetIndex& s) : graph(g), snippets(s) {}

        void apply(const WalRecord& record) {
            switch (record.type) {
                case RecordType::NodeCreate:
                    create(record.data);
                    break;
                case RecordType::NodePatch:
                    patch(record.node_id, record.data);
                    break;
                default:
                    ++report.skipped;
                    break;
            }
        }

        void create(const Value& data) {
            if (!detail::has_parent(data)) {
                resolve(data, "");
                return;
            }
            const std::string parent_id = data.get_string("parent_id");
            auto it = path_map.find(parent_id);
            if (it != path_map.end()) {
                resolve(data, detail::child_path(it->second, detail::record_key(data)));
                return;
            }
            waiting.insert(data.get_string("id"));
            pending[parent_id].push_back(data);
            ++report.deferred;
        }

        void patch(const std::string& node_id, const Value& data) {
            auto it = path_map.find(node_id);
            if (it != path_map.end()) {
                apply_patch(it->second, node_id, data);
                return;
            }
            if (waiting.count(node_id)) {
                queued_patches[node_id].push_back(data);
                return;
            }
            std::cerr << "[Disk] Cannot patch unknown node " << node_id << "\n";
            ++report.dropped_patches;
        }

        // Unresolved parents at end of stream: degrade to bare key
        void finish() {
            while (!pending.empty()) {
                auto it = pending.begin();
                std::string parent_id = it->first;
                std::vector<Value> orphans = std::move(it->second);
                pending.erase(it);
                for (const auto& data : orphans) {
                    std::cerr << "[Disk] Parent " << parent_id << " not found for "
                              << detail::record_key(data) << "\n";
                    ++report.orphans;
                    resolve(data, detail::record_key(data));
                }
            }
        }

        // Create the node at `path`, then every create waiting on it
        void resolve(const Value& first, const std::string& first_path) {
            std::vector<std::pair<Value, std::string>> work;
            work.emplace_back(first, first_path);

            while (!work.empty()) {
                auto [data, path] = std::move(work.back());
                work.pop_back();

                const std::string id = data.get_string("id");
                waiting.erase(id);
                path_map[id] = path;
                apply_create(path, id, data);

                auto queued = queued_patches.find(id);
                if (queued != queued_patches.end()) {
                    std::vector<Value> patches = std::move(queued->second);
                    queued_patches.erase(queued);
                    for (const auto& p : patches) apply_patch(path, id, p);
                }

                auto children = pending.find(id);
                if (children != pending.end()) {
                    std::vector<Value> ready = std::move(children->second);
                    pending.erase(children);
                    // Reverse so the stack pops them in log order
                    for (auto c = ready.rbegin(); c != ready.rend(); ++c) {
                        work.emplace_back(*c, detail::child_path(path, detail::record_key(*c)));
                    }
                }
            }
        }

        GraphNode& node_at(const std::string& path, const std::string& id) {
            return path.empty() ? graph.root() : graph.ensure(path, id);
        }

        // A create describes the whole node: fields it omits are cleared
        void apply_create(const std::string& path, const std::string& id, const Value& data) {
            GraphNode& node = node_at(path, id);

            std::string type = data.get_string("type");
            node.set_type(type == "raw" ? std::string() : type);

            const Value* value = data.find("value");
            node.set_value(value ? *value : Value::undefined());

            const Value* meta = data.find("meta");
            node.set_meta(meta && !meta->is_null() ? *meta : Value::undefined());

            const Value* proto = data.find("proto");
            if (proto && proto->is_array() && !proto->as_array().empty() &&
                proto->as_array()[0].is_string()) {
                node.set_proto(proto->as_array()[0].as_string());
            } else {
                node.set_proto(std::nullopt);
            }

            index_snippet(node, path);
            ++report.nodes;
        }

        void apply_patch(const std::string& path, const std::string& id, const Value& data) {
            GraphNode& node = node_at(path, id);

            if (const Value* value = data.find("value")) {
                node.set_value(*value);
            }
            const Value* meta = data.find("meta");
            if (meta && meta->is_map()) {
                Value merged = node.meta().is_map() ? node.meta() : Value::map();
                for (const auto& [key, v] : meta->as_map()) {
                    merged.set(key, v);
                }
                node.set_meta(std::move(merged));
            }

            index_snippet(node, path);
            ++report.patches;
        }

        void index_snippet(const GraphNode& node, const std::string& path) {
            if (node.type() != "snippet") return;
            std::string snippet_id = node.meta().get_string("id");
            if (!snippet_id.empty()) {
                snippets.index(snippet_id, path);
            }
        }

        GraphHost& graph;
        SnippetIndex& snippets;
        LoadReport report;
        std::unordered_map<std::string, std::string> path_map;
        std::map<std::string, std::vector<Value>> pending;  // parent id -> waiting creates
        std::unordered_set<std::string> waiting;            // ids of waiting creates
        std::unordered_map<std::string, std::vector<Value>> queued_patches;
    };

    GraphHost& graph_;
    SnippetIndex& snippets_;
    std::string wal_path_;
    WriteAheadLog wal_;
    std::mutex mutex_;
};

} // namespace fxd
