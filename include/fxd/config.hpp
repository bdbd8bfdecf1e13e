#pragma once
// Configuration: one JSON file for the disk and the signal stream
//
//   {
//     "disk":    {"path": "project.fxd", "sync_on_write": false, "compact_threshold": 10000},
//     "signals": {"batch_size": 100, "wal_path": "", "sync_on_write": false}
//   }
//
// disk.* configures the graph's log; signals.wal_path, when set, gives the
// signal stream a log of its own (see SignalLog).
// Every key is optional; missing keys keep the struct defaults.

#include "disk.hpp"
#include "errors.hpp"
#include "signals.hpp"
#include <nlohmann/json.hpp>
#include <fstream>
#include <sstream>
#include <string>

namespace fxd {

struct FxdConfig {
    DiskConfig disk;
    SignalConfig signals;
};

namespace detail {

inline json section(const json& root, const char* name) {
    if (!root.contains(name)) return json::object();
    const json& s = root.at(name);
    if (!s.is_object()) {
        throw ConfigError(std::string("Config section is not an object: ") + name);
    }
    return s;
}

} // namespace detail

// Throws ConfigError on a wrongly typed key
inline FxdConfig config_from_json(const json& j) {
    if (!j.is_object()) {
        throw ConfigError("Config root is not an object");
    }

    FxdConfig config;
    try {
        json disk = detail::section(j, "disk");
        config.disk.path = disk.value("path", config.disk.path);
        config.disk.sync_on_write = disk.value("sync_on_write", config.disk.sync_on_write);
        config.disk.compact_threshold = disk.value("compact_threshold", config.disk.compact_threshold);

        json signals = detail::section(j, "signals");
        config.signals.batch_size = signals.value("batch_size", config.signals.batch_size);
        config.signals.wal_path = signals.value("wal_path", config.signals.wal_path);
        config.signals.sync_on_write = signals.value("sync_on_write", config.signals.sync_on_write);
    } catch (const json::type_error& e) {
        throw ConfigError(std::string("Config type error: ") + e.what());
    }

    if (config.signals.batch_size == 0) {
        throw ConfigError("signals.batch_size must be positive");
    }
    return config;
}

inline json config_to_json(const FxdConfig& config) {
    return json{
        {"disk", {
            {"path", config.disk.path},
            {"sync_on_write", config.disk.sync_on_write},
            {"compact_threshold", config.disk.compact_threshold},
        }},
        {"signals", {
            {"batch_size", config.signals.batch_size},
            {"wal_path", config.signals.wal_path},
            {"sync_on_write", config.signals.sync_on_write},
        }},
    };
}

inline FxdConfig load_config(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw ConfigError("Cannot read config: " + path);
    }
    std::stringstream buffer;
    buffer << in.rdbuf();

    json j;
    try {
        j = json::parse(buffer.str());
    } catch (const json::parse_error& e) {
        throw ConfigError("Malformed config " + path + ": " + e.what());
    }
    return config_from_json(j);
}

} // namespace fxd
