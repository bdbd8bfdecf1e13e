#pragma once
// The Graph boundary: what persistence sees of the live node tree
//
// The reactive graph engine lives outside this library. Disk only reads
// nodes on save and only creates them through GraphHost::ensure on load.
// MemoryGraph is a plain in-memory host for tools and tests.

#include "value.hpp"
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace fxd {

class GraphNode;

// Children in key insertion order
using ChildList = std::vector<std::pair<std::string, GraphNode*>>;

// Root children with this key prefix are system-reserved
constexpr const char* RESERVED_PREFIX = "__";

inline bool is_reserved_key(const std::string& key) {
    return key.compare(0, 2, RESERVED_PREFIX) == 0;
}

class GraphNode {
public:
    virtual ~GraphNode() = default;

    virtual const std::string& id() const = 0;

    virtual const std::string& type() const = 0;
    virtual void set_type(const std::string& type) = 0;

    // Undefined when the node holds no value
    virtual const Value& value() const = 0;
    virtual void set_value(Value value) = 0;

    // Undefined when the node has no metadata
    virtual const Value& meta() const = 0;
    virtual void set_meta(Value meta) = 0;

    virtual std::optional<std::string> proto() const = 0;
    virtual void set_proto(std::optional<std::string> proto) = 0;

    virtual ChildList children() const = 0;
};

class GraphHost {
public:
    virtual ~GraphHost() = default;

    virtual GraphNode& root() = 0;

    // Return the node at a dot-separated path below the root, creating it
    // and any missing ancestors. The node at `path` carries `id`.
    virtual GraphNode& ensure(const std::string& path, const std::string& id) = 0;

    // Remove every root child except the system-reserved ones
    virtual void clear() = 0;
};

// Count nodes reachable from `node`, itself included
inline size_t count_nodes(const GraphNode& node) {
    size_t n = 1;
    for (const auto& [key, child] : node.children()) {
        n += count_nodes(*child);
    }
    return n;
}

// ═══════════════════════════════════════════════════════════════════════════
// In-memory host
// ═══════════════════════════════════════════════════════════════════════════

class MemoryNode : public GraphNode {
public:
    explicit MemoryNode(std::string id) : id_(std::move(id)) {}

    const std::string& id() const override { return id_; }
    void set_id(std::string id) { id_ = std::move(id); }

    const std::string& type() const override { return type_; }
    void set_type(const std::string& type) override { type_ = type; }

    const Value& value() const override { return value_; }
    void set_value(Value value) override { value_ = std::move(value); }

    const Value& meta() const override { return meta_; }
    void set_meta(Value meta) override { meta_ = std::move(meta); }

    std::optional<std::string> proto() const override { return proto_; }
    void set_proto(std::optional<std::string> proto) override { proto_ = std::move(proto); }

    ChildList children() const override {
        ChildList out;
        out.reserve(children_.size());
        for (const auto& [key, child] : children_) {
            out.emplace_back(key, child.get());
        }
        return out;
    }

    MemoryNode* child(const std::string& key) const {
        for (const auto& [k, c] : children_) {
            if (k == key) return c.get();
        }
        return nullptr;
    }

    MemoryNode& add_child(const std::string& key, std::string id) {
        children_.emplace_back(key, std::make_unique<MemoryNode>(std::move(id)));
        return *children_.back().second;
    }

    // Remove children whose key satisfies `drop`
    template<typename Pred>
    void remove_children_if(Pred&& drop) {
        std::vector<std::pair<std::string, std::unique_ptr<MemoryNode>>> kept;
        for (auto& entry : children_) {
            if (!drop(entry.first)) kept.push_back(std::move(entry));
        }
        children_ = std::move(kept);
    }

private:
    std::string id_;
    std::string type_;
    Value value_ = Value::undefined();
    Value meta_ = Value::undefined();
    std::optional<std::string> proto_;
    std::vector<std::pair<std::string, std::unique_ptr<MemoryNode>>> children_;
};

class MemoryGraph : public GraphHost {
public:
    explicit MemoryGraph(std::string root_id = "root")
        : root_(std::make_unique<MemoryNode>(std::move(root_id))) {}

    MemoryNode& root() override { return *root_; }
    const MemoryNode& root() const { return *root_; }

    MemoryNode& ensure(const std::string& path, const std::string& id) override {
        MemoryNode* node = root_.get();
        if (path.empty()) return *node;

        size_t start = 0;
        for (;;) {
            size_t dot = path.find('.', start);
            std::string key = path.substr(start, dot == std::string::npos ? std::string::npos : dot - start);
            bool last = (dot == std::string::npos);

            MemoryNode* next = node->child(key);
            if (!next) {
                next = &node->add_child(key, last ? id : generate_id());
            } else if (last && !id.empty() && next->id() != id) {
                next->set_id(id);
            }
            node = next;
            if (last) break;
            start = dot + 1;
        }
        return *node;
    }

    void clear() override {
        root_->remove_children_if([](const std::string& key) { return !is_reserved_key(key); });
    }

    // Node at a dot-separated path, or nullptr
    MemoryNode* find(const std::string& path) const {
        MemoryNode* node = root_.get();
        if (path.empty()) return node;
        size_t start = 0;
        while (node) {
            size_t dot = path.find('.', start);
            node = node->child(path.substr(start, dot == std::string::npos ? std::string::npos : dot - start));
            if (dot == std::string::npos) break;
            start = dot + 1;
        }
        return node;
    }

    size_t node_count() const { return count_nodes(*root_); }

private:
    std::string generate_id() {
        return "n" + std::to_string(++next_id_);
    }

    std::unique_ptr<MemoryNode> root_;
    uint64_t next_id_ = 0;
};

} // namespace fxd
