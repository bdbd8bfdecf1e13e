// fxdwal: inspect and maintain fxd write-ahead logs
//
// Usage: fxdwal <command> [options]
//
// Commands:
//   stats      Show log statistics
//   dump       Print records (optionally from a sequence number)
//   verify     Check every record's checksum and payload
//   tree       Replay the log and print the reconstructed graph
//   compact    Rewrite the log as a snapshot of its replayed graph
//   version    Show version
//   help       Show this help

#include <fxd/fxd.hpp>
#include <iostream>
#include <string>
#include <cstring>
#include <cstdlib>
#include <cstdarg>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <map>
#include <sstream>
#include <sys/stat.h>

using namespace fxd;

// Get program name from path
static const char* prog_name(const char* path) {
    const char* last = path;
    for (const char* p = path; *p; ++p) {
        if (*p == '/') last = p + 1;
    }
    return last;
}

static bool verbose_mode = false;

void log_msg(const char* component, const char* fmt, ...) {
    if (!verbose_mode) return;

    auto now = std::chrono::system_clock::now();
    auto now_time_t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    char time_buf[32];
    std::strftime(time_buf, sizeof(time_buf), "%H:%M:%S", std::localtime(&now_time_t));

    std::cerr << "[" << time_buf << "." << std::setfill('0') << std::setw(3) << ms.count() << "][" << component << "] ";

    va_list args;
    va_start(args, fmt);
    vfprintf(stderr, fmt, args);
    va_end(args);
    std::cerr << "\n";
}

void print_usage(const char* prog) {
    const char* name = prog_name(prog);
    std::cerr << "fxdwal " << FXD_VERSION << " - Write-ahead log inspection\n\n"
              << "Usage: " << name << " <command> [options]\n\n"
              << "Commands:\n"
              << "  stats              Show record count, size and sequence range\n"
              << "  dump               Print records as text or JSON\n"
              << "  verify             Check checksums and payloads of every record\n"
              << "  tree               Replay the log and print the graph\n"
              << "  compact            Rewrite the log from its replayed graph\n"
              << "  version            Show version\n"
              << "  help               Show this help\n\n"
              << "Options:\n"
              << "  --path PATH        Disk (.fxd) or log (.fxwal) path\n"
              << "  --config FILE      JSON config; disk.path is used when --path is absent\n"
              << "  --from SEQ         First sequence number for dump (default: 0)\n"
              << "  --json             Output as JSON\n"
              << "  --verbose          Enable verbose logging\n"
              << "  -v, --version      Show version\n";
}

static std::string format_time(Timestamp ns) {
    std::time_t secs = static_cast<std::time_t>(ns / 1000000000ULL);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", std::localtime(&secs));
    std::ostringstream oss;
    oss << buf << "." << std::setfill('0') << std::setw(3) << (ns / 1000000ULL) % 1000;
    return oss.str();
}

static uint64_t file_size(const std::string& path) {
    struct stat st;
    return (::stat(path.c_str(), &st) == 0) ? static_cast<uint64_t>(st.st_size) : 0;
}

json record_to_json(const WalRecord& record) {
    json j;
    j["seq"] = record.seq;
    j["timestamp"] = record.timestamp;
    j["type"] = record_type_name(record.type);
    j["node_id"] = record.node_id;
    j["data"] = record.data;
    j["checksum"] = record.checksum;
    return j;
}

int cmd_stats(const std::string& wal_path, bool json_output) {
    WalScan scan(wal_path, 0);
    std::map<std::string, size_t> by_type;
    size_t records = 0;
    uint64_t oldest = 0, newest = 0;

    for (const auto& record : scan) {
        ++records;
        ++by_type[record_type_name(record.type)];
        if (oldest == 0) oldest = record.seq;
        newest = record.seq;
    }

    if (json_output) {
        json j;
        j["path"] = wal_path;
        j["records"] = records;
        j["bytes"] = file_size(wal_path);
        j["oldest_seq"] = oldest;
        j["newest_seq"] = newest;
        j["skipped"] = scan.skipped();
        j["types"] = by_type;
        std::cout << j.dump(2) << "\n";
    } else {
        std::cout << "fxd log: " << wal_path << "\n"
                  << "  records:  " << records << "\n"
                  << "  bytes:    " << file_size(wal_path) << "\n"
                  << "  seq:      " << oldest << " .. " << newest << "\n"
                  << "  skipped:  " << scan.skipped() << "\n";
        for (const auto& [type, count] : by_type) {
            std::cout << "  " << std::left << std::setw(12) << type << std::right << count << "\n";
        }
    }
    return 0;
}

int cmd_dump(const std::string& wal_path, uint64_t from, bool json_output) {
    WalScan scan(wal_path, from);
    json all = json::array();

    for (const auto& record : scan) {
        if (json_output) {
            all.push_back(record_to_json(record));
            continue;
        }
        std::cout << "#" << record.seq << "  " << format_time(record.timestamp)
                  << "  " << std::left << std::setw(12) << record_type_name(record.type) << std::right
                  << "  " << (record.node_id.empty() ? "-" : record.node_id) << "\n"
                  << "    " << json(record.data).dump() << "\n";
    }

    if (json_output) {
        std::cout << all.dump(2) << "\n";
    }
    log_msg("dump", "skipped %zu corrupt records", scan.skipped());
    return 0;
}

int cmd_verify(const std::string& wal_path, bool json_output) {
    WalScan scan(wal_path, 0);
    size_t ok = 0, bad_checksum = 0, bad_payload = 0;
    bool truncated = false;
    uint64_t truncated_at = 0;
    json problems = json::array();

    for (;;) {
        ScanEntry entry = scan.next_entry();
        if (entry.status == ScanStatus::End) break;
        if (entry.status == ScanStatus::Truncated) {
            truncated = true;
            truncated_at = entry.offset;
            break;
        }
        if (entry.status == ScanStatus::Ok) {
            ++ok;
            continue;
        }
        if (entry.status == ScanStatus::ChecksumMismatch) {
            ++bad_checksum;
        } else {
            ++bad_payload;
        }
        problems.push_back({
            {"offset", entry.offset},
            {"seq", entry.record.seq},
            {"problem", entry.status == ScanStatus::ChecksumMismatch ? "checksum" : "payload"},
        });
    }

    bool clean = (bad_checksum == 0 && bad_payload == 0 && !truncated);

    if (json_output) {
        json j;
        j["path"] = wal_path;
        j["ok"] = ok;
        j["checksum_mismatch"] = bad_checksum;
        j["bad_payload"] = bad_payload;
        j["truncated"] = truncated;
        if (truncated) j["truncated_at"] = truncated_at;
        j["problems"] = problems;
        j["clean"] = clean;
        std::cout << j.dump(2) << "\n";
    } else {
        std::cout << "Verified " << wal_path << "\n"
                  << "  valid records:     " << ok << "\n"
                  << "  checksum mismatch: " << bad_checksum << "\n"
                  << "  bad payload:       " << bad_payload << "\n";
        for (const auto& p : problems) {
            std::cout << "    seq " << p["seq"].get<uint64_t>() << " at offset "
                      << p["offset"].get<uint64_t>() << ": " << p["problem"].get<std::string>() << "\n";
        }
        if (truncated) {
            std::cout << "  truncated tail at offset " << truncated_at << "\n";
        }
        std::cout << (clean ? "OK" : "DAMAGED") << "\n";
    }
    return clean ? 0 : 1;
}

json node_to_json(const GraphNode& node) {
    json j;
    j["id"] = node.id();
    if (!node.type().empty()) j["type"] = node.type();
    if (!node.value().is_undefined()) j["value"] = node.value();
    if (!node.meta().is_undefined()) j["meta"] = node.meta();
    if (auto proto = node.proto()) j["proto"] = *proto;
    json children = json::object();
    for (const auto& [key, child] : node.children()) {
        children[key] = node_to_json(*child);
    }
    if (!children.empty()) j["children"] = children;
    return j;
}

void print_tree(const GraphNode& node, const std::string& key, int depth) {
    std::cout << std::string(depth * 2, ' ') << key << " (" << node.id();
    if (!node.type().empty()) std::cout << ", " << node.type();
    std::cout << ")";
    if (!node.value().is_undefined()) std::cout << " = " << node.value().dump();
    std::cout << "\n";
    for (const auto& [child_key, child] : node.children()) {
        print_tree(*child, child_key, depth + 1);
    }
}

int cmd_tree(const DiskConfig& config, bool json_output) {
    MemoryGraph graph;
    SnippetIndex snippets;
    Disk disk(graph, snippets, config);
    LoadReport report = disk.load();

    if (json_output) {
        json j;
        j["root"] = node_to_json(graph.root());
        j["nodes"] = report.nodes;
        j["patches"] = report.patches;
        j["orphans"] = report.orphans;
        j["snippets"] = snippets.entries();
        std::cout << j.dump(2) << "\n";
    } else {
        print_tree(graph.root(), "(root)", 0);
        std::cout << "\n" << report.nodes << " nodes, " << report.patches << " patches, "
                  << snippets.size() << " snippets";
        if (report.orphans) std::cout << ", " << report.orphans << " orphans";
        std::cout << "\n";
    }
    return 0;
}

int cmd_compact(const DiskConfig& config, bool json_output) {
    MemoryGraph graph;
    SnippetIndex snippets;
    Disk disk(graph, snippets, config);
    disk.open();

    DiskStats before = disk.stats();
    disk.load();
    size_t written = disk.compact();
    DiskStats after = disk.stats();

    if (json_output) {
        json j;
        j["records_before"] = before.records;
        j["bytes_before"] = before.bytes;
        j["records_after"] = after.records;
        j["bytes_after"] = after.bytes;
        j["nodes"] = written;
        std::cout << j.dump(2) << "\n";
    } else {
        std::cout << "Compacted " << disk.wal_path() << "\n"
                  << "  records: " << before.records << " -> " << after.records << "\n"
                  << "  bytes:   " << before.bytes << " -> " << after.bytes << "\n";
    }
    return 0;
}

int main(int argc, char* argv[]) {
    std::string command;
    std::string path;
    std::string config_path;
    uint64_t from_seq = 0;
    bool json_output = false;

    // Parse arguments
    for (int i = 1; i < argc; ++i) {
        if (strcmp(argv[i], "--path") == 0 && i + 1 < argc) {
            path = argv[++i];
        } else if (strcmp(argv[i], "--config") == 0 && i + 1 < argc) {
            config_path = argv[++i];
        } else if (strcmp(argv[i], "--from") == 0 && i + 1 < argc) {
            from_seq = std::strtoull(argv[++i], nullptr, 10);
        } else if (strcmp(argv[i], "--json") == 0) {
            json_output = true;
        } else if (strcmp(argv[i], "--verbose") == 0) {
            verbose_mode = true;
        } else if (strcmp(argv[i], "-h") == 0 || strcmp(argv[i], "--help") == 0) {
            print_usage(argv[0]);
            return 0;
        } else if (strcmp(argv[i], "-v") == 0 || strcmp(argv[i], "--version") == 0) {
            std::cout << "fxdwal " << FXD_VERSION << "\n";
            return 0;
        } else if (argv[i][0] != '-' && command.empty()) {
            command = argv[i];
        } else {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage(argv[0]);
            return 1;
        }
    }

    if (command.empty() || command == "help") {
        print_usage(argv[0]);
        return command.empty() ? 1 : 0;
    }
    if (command == "version") {
        std::cout << "fxdwal " << FXD_VERSION << "\n"
                  << "  wal format:  " << FXD_WAL_FORMAT_VERSION << "\n"
                  << "  uarr format: " << FXD_UARR_FORMAT_VERSION << "\n";
        return 0;
    }

    try {
        FxdConfig config;
        if (!config_path.empty()) {
            config = load_config(config_path);
            log_msg("config", "loaded %s", config_path.c_str());
        }
        if (path.empty()) path = config.disk.path;
        if (path.empty()) {
            std::cerr << "Error: --path is required\n";
            print_usage(argv[0]);
            return 1;
        }
        config.disk.path = path;

        std::string wal_path = Disk::wal_path_for(path);
        if (!file_exists(wal_path)) {
            std::cerr << "Error: no log at " << wal_path << "\n";
            return 1;
        }
        log_msg("fxdwal", "%s %s", command.c_str(), wal_path.c_str());

        if (command == "stats") {
            return cmd_stats(wal_path, json_output);
        } else if (command == "dump") {
            return cmd_dump(wal_path, from_seq, json_output);
        } else if (command == "verify") {
            return cmd_verify(wal_path, json_output);
        } else if (command == "tree") {
            return cmd_tree(config.disk, json_output);
        } else if (command == "compact") {
            return cmd_compact(config.disk, json_output);
        }

        std::cerr << "Unknown command: " << command << "\n";
        print_usage(argv[0]);
        return 1;
    } catch (const ConfigError& e) {
        std::cerr << "Config error: " << e.what() << "\n";
    } catch (const FormatError& e) {
        std::cerr << "Format error: " << e.what() << "\n";
    } catch (const IoError& e) {
        std::cerr << "I/O error: " << e.what() << "\n";
    }
    return 1;
}
