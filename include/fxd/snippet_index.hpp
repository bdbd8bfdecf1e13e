#pragma once
// Snippet Index: snippet id -> graph path, rebuilt on every load
//
// One instance per session, owned by the host and handed to Disk.

#include <optional>
#include <string>
#include <unordered_map>

namespace fxd {

class SnippetIndex {
public:
    void index(const std::string& snippet_id, const std::string& path) {
        paths_[snippet_id] = path;
    }

    bool remove(const std::string& snippet_id) {
        return paths_.erase(snippet_id) > 0;
    }

    std::optional<std::string> find(const std::string& snippet_id) const {
        auto it = paths_.find(snippet_id);
        if (it == paths_.end()) return std::nullopt;
        return it->second;
    }

    void clear() { paths_.clear(); }
    size_t size() const { return paths_.size(); }

    const std::unordered_map<std::string, std::string>& entries() const { return paths_; }

private:
    std::unordered_map<std::string, std::string> paths_;
};

} // namespace fxd
