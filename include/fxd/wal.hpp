#pragma once
// Write-Ahead Log: ordered, checksummed, replayable record log
//
// File layout (little-endian):
//   Header (32 B): magic "FXWAL" | version:u16 | flags:u8 | reserved[24]
//   Record:        seq:u64 | ts_ns:u64 | type:u8 | node_id_len:u16 |
//                  data_len:u32 | reserved:u32 | node_id | data (UArr) | crc32:u32
//
// Design:
// - Append-only: one contiguous pwrite per record, never overwrite
// - Sequence numbers start at 1 and are gap-free within a file
// - CRC32 covers seq through end of data; a bad record is skipped, not fatal
// - A record with damaged length fields is stepped over by searching forward
//   for the next record that passes its checksum
// - Crash recovery: a torn final record is moved to <path>.tail on open
// - Compaction writes a fresh file and renames it over the old one

#include "errors.hpp"
#include "types.hpp"
#include "uarr.hpp"
#include "version.hpp"
#include <functional>
#include <iostream>
#include <iterator>
#include <mutex>
#include <string>
#include <vector>
#include <sys/file.h>
#include <sys/stat.h>
#include <fcntl.h>
#include <unistd.h>
#include <cstring>

namespace fxd {

// WAL record types
enum class RecordType : uint8_t {
    NodeCreate = 1,  // Full node description
    NodePatch = 2,   // Partial update of an existing node
    LinkAdd = 3,
    LinkDel = 4,
    Signal = 5,      // Durable signal stream entry
    Checkpoint = 6,  // Marker
};

inline const char* record_type_name(RecordType type) {
    switch (type) {
        case RecordType::NodeCreate: return "NODE_CREATE";
        case RecordType::NodePatch: return "NODE_PATCH";
        case RecordType::LinkAdd: return "LINK_ADD";
        case RecordType::LinkDel: return "LINK_DEL";
        case RecordType::Signal: return "SIGNAL";
        case RecordType::Checkpoint: return "CHECKPOINT";
    }
    return "UNKNOWN";
}

constexpr char WAL_MAGIC[5] = {'F', 'X', 'W', 'A', 'L'};
constexpr uint16_t WAL_VERSION = FXD_WAL_FORMAT_VERSION;
constexpr size_t WAL_HEADER_SIZE = 32;
constexpr size_t WAL_RECORD_HEADER_SIZE = 27;
constexpr size_t WAL_CHECKSUM_SIZE = 4;
constexpr size_t WAL_MAX_NODE_ID = 0xFFFF;

// One decoded record
struct WalRecord {
    uint64_t seq = 0;
    Timestamp timestamp = 0;
    RecordType type = RecordType::NodeCreate;
    std::string node_id;
    Value data;
    uint32_t checksum = 0;
};

// Per-record outcome of a scan
enum class ScanStatus {
    Ok,
    ChecksumMismatch,  // Record skipped
    BadPayload,        // Checksum fine, UArr payload undecodable; skipped
    Truncated,         // Torn tail; scan ends
    End,               // Clean end of file
};

struct ScanEntry {
    ScanStatus status = ScanStatus::End;
    uint64_t offset = 0;  // File offset of the record
    WalRecord record;     // Valid only when status == Ok
};

struct WalConfig {
    std::string path;
    bool sync_on_write = false;       // fsync after each append
    size_t compact_threshold = 10000; // Recommend compaction past this many records
};

struct WalStats {
    size_t record_count = 0;
    uint64_t byte_size = 0;
    uint64_t oldest_seq = 0;
    uint64_t newest_seq = 0;
};

// RAII advisory file lock
class ScopedFileLock {
public:
    ScopedFileLock(int fd, bool exclusive) : fd_(fd) {
        if (fd_ >= 0) {
            flock(fd_, exclusive ? LOCK_EX : LOCK_SH);
        }
    }

    ~ScopedFileLock() {
        if (fd_ >= 0) {
            flock(fd_, LOCK_UN);
        }
    }

    ScopedFileLock(const ScopedFileLock&) = delete;
    ScopedFileLock& operator=(const ScopedFileLock&) = delete;

private:
    int fd_;
};

namespace detail {

inline void pwrite_all(int fd, const uint8_t* data, size_t len, uint64_t offset,
                       const std::string& path) {
    while (len > 0) {
        ssize_t n = ::pwrite(fd, data, len, static_cast<off_t>(offset));
        if (n < 0) {
            if (errno == EINTR) continue;
            throw IoError::last("WAL write failed: " + path);
        }
        data += n;
        len -= static_cast<size_t>(n);
        offset += static_cast<uint64_t>(n);
    }
}

// Bytes actually read; short only at end of file
inline size_t pread_full(int fd, uint8_t* data, size_t len, uint64_t offset,
                         const std::string& path) {
    size_t got = 0;
    while (got < len) {
        ssize_t n = ::pread(fd, data + got, len - got, static_cast<off_t>(offset + got));
        if (n < 0) {
            if (errno == EINTR) continue;
            throw IoError::last("WAL read failed: " + path);
        }
        if (n == 0) break;
        got += static_cast<size_t>(n);
    }
    return got;
}

inline std::vector<uint8_t> build_file_header() {
    std::vector<uint8_t> header(WAL_HEADER_SIZE, 0);
    std::memcpy(header.data(), WAL_MAGIC, sizeof(WAL_MAGIC));
    store_le<uint16_t>(header.data() + 5, WAL_VERSION);
    header[7] = 0;  // flags
    return header;
}

// Check a file header; throws FormatError when it is not a WAL
inline void check_file_header(const uint8_t* header, const std::string& path) {
    if (std::memcmp(header, WAL_MAGIC, sizeof(WAL_MAGIC)) != 0) {
        throw FormatError("Invalid WAL file: magic mismatch: " + path);
    }
    uint16_t file_version = load_le<uint16_t>(header + 5);
    if (!version::wal_compatible(file_version)) {
        throw FormatError("Unsupported WAL version " + std::to_string(file_version) + ": " + path);
    }
}

inline std::vector<uint8_t> build_frame(uint64_t seq, Timestamp ts, RecordType type,
                                        const std::string& node_id,
                                        const std::vector<uint8_t>& payload) {
    std::vector<uint8_t> frame(WAL_RECORD_HEADER_SIZE + node_id.size() + payload.size() +
                               WAL_CHECKSUM_SIZE);
    uint8_t* p = frame.data();
    store_le<uint64_t>(p + 0, seq);
    store_le<uint64_t>(p + 8, ts);
    p[16] = static_cast<uint8_t>(type);
    store_le<uint16_t>(p + 17, static_cast<uint16_t>(node_id.size()));
    store_le<uint32_t>(p + 19, static_cast<uint32_t>(payload.size()));
    store_le<uint32_t>(p + 23, 0);  // reserved

    size_t at = WAL_RECORD_HEADER_SIZE;
    std::memcpy(p + at, node_id.data(), node_id.size());
    at += node_id.size();
    if (!payload.empty()) std::memcpy(p + at, payload.data(), payload.size());
    at += payload.size();

    store_le<uint32_t>(p + at, crc32(p, at));
    return frame;
}

// Raw record as framed on disk, before payload decode
struct Frame {
    uint64_t seq = 0;
    Timestamp timestamp = 0;
    uint8_t type = 0;
    std::string node_id;
    std::vector<uint8_t> data;
    uint32_t checksum = 0;
    uint64_t next_offset = 0;
};

inline uint64_t file_size(int fd, const std::string& path) {
    struct stat st;
    if (::fstat(fd, &st) != 0) {
        throw IoError::last("WAL stat failed: " + path);
    }
    return static_cast<uint64_t>(st.st_size);
}

// Read the frame at `offset` of a `size`-byte file.
// Returns Ok, ChecksumMismatch, Truncated or End.
inline ScanStatus read_frame(int fd, uint64_t offset, uint64_t size, const std::string& path,
                             Frame& out) {
    if (offset >= size) return ScanStatus::End;
    if (size - offset < WAL_RECORD_HEADER_SIZE) return ScanStatus::Truncated;

    uint8_t header[WAL_RECORD_HEADER_SIZE];
    size_t got = pread_full(fd, header, sizeof(header), offset, path);
    if (got == 0) return ScanStatus::End;
    if (got < sizeof(header)) return ScanStatus::Truncated;

    out.seq = load_le<uint64_t>(header + 0);
    out.timestamp = load_le<uint64_t>(header + 8);
    out.type = header[16];
    uint16_t node_id_len = load_le<uint16_t>(header + 17);
    uint32_t data_len = load_le<uint32_t>(header + 19);

    // Declared lengths past end of file: never allocate for them
    uint64_t body_len = static_cast<uint64_t>(node_id_len) + data_len + WAL_CHECKSUM_SIZE;
    if (body_len > size - offset - sizeof(header)) return ScanStatus::Truncated;

    std::vector<uint8_t> body(static_cast<size_t>(body_len));
    got = pread_full(fd, body.data(), body.size(), offset + sizeof(header), path);
    if (got < body.size()) return ScanStatus::Truncated;

    out.checksum = load_le<uint32_t>(body.data() + node_id_len + data_len);
    out.next_offset = offset + sizeof(header) + body.size();

    uint32_t state = crc32_update(0xFFFFFFFFu, header, sizeof(header));
    state = crc32_update(state, body.data(), static_cast<size_t>(node_id_len) + data_len);
    if (crc32_final(state) != out.checksum) return ScanStatus::ChecksumMismatch;

    out.node_id.assign(reinterpret_cast<const char*>(body.data()), node_id_len);
    out.data.assign(body.begin() + node_id_len, body.begin() + node_id_len + data_len);
    return ScanStatus::Ok;
}

// A record header at `offset` with a known type, zero reserved bytes and
// lengths that fit in the file. End of file counts as a boundary too.
inline bool frame_plausible(int fd, uint64_t offset, uint64_t size, const std::string& path) {
    if (offset == size) return true;
    if (offset > size || size - offset < WAL_RECORD_HEADER_SIZE + WAL_CHECKSUM_SIZE) return false;

    uint8_t header[WAL_RECORD_HEADER_SIZE];
    if (pread_full(fd, header, sizeof(header), offset, path) < sizeof(header)) return false;

    uint8_t type = header[16];
    if (type < static_cast<uint8_t>(RecordType::NodeCreate) ||
        type > static_cast<uint8_t>(RecordType::Checkpoint)) {
        return false;
    }
    if (load_le<uint32_t>(header + 23) != 0) return false;

    uint64_t body_len = static_cast<uint64_t>(load_le<uint16_t>(header + 17)) +
                        load_le<uint32_t>(header + 19) + WAL_CHECKSUM_SIZE;
    return body_len <= size - offset - sizeof(header);
}

// First offset at or after `from` holding a record that passes its
// checksum; `size` when there is none
inline uint64_t find_frame(int fd, uint64_t from, uint64_t size, const std::string& path) {
    Frame candidate;
    for (uint64_t at = from; at + WAL_RECORD_HEADER_SIZE + WAL_CHECKSUM_SIZE <= size; ++at) {
        if (!frame_plausible(fd, at, size, path)) continue;
        if (read_frame(fd, at, size, path, candidate) == ScanStatus::Ok) return at;
    }
    return size;
}

// Read the frame at `offset` and locate the one after it.
// A damaged frame keeps its declared length when a plausible record follows
// it; otherwise the scan resumes at the next record that checks out.
// Truncated means no valid record follows `offset`.
inline ScanStatus next_frame(int fd, uint64_t offset, const std::string& path, Frame& out) {
    uint64_t size = file_size(fd, path);
    ScanStatus status = read_frame(fd, offset, size, path, out);
    if (status == ScanStatus::Ok || status == ScanStatus::End) return status;

    if (status == ScanStatus::ChecksumMismatch &&
        frame_plausible(fd, out.next_offset, size, path)) {
        return status;
    }

    uint64_t next = find_frame(fd, offset + 1, size, path);
    if (next >= size) return ScanStatus::Truncated;

    std::cerr << "[WAL] Damaged record at offset " << offset << ", resuming at offset "
              << next << "\n";
    out.next_offset = next;
    return ScanStatus::ChecksumMismatch;
}

} // namespace detail

// Forward-only, lazily produced view of the records with seq >= cursor.
// Owns its own descriptor, so it is independent of the writer's position
// and a new scan can always start over from the beginning.
class WalScan {
public:
    WalScan(const std::string& path, uint64_t cursor)
        : path_(path), cursor_(cursor) {
        fd_ = ::open(path_.c_str(), O_RDONLY);
        if (fd_ < 0) {
            throw IoError::last("WAL open for read failed: " + path_);
        }
        uint8_t header[WAL_HEADER_SIZE];
        size_t got = detail::pread_full(fd_, header, sizeof(header), 0, path_);
        if (got < sizeof(header)) {
            ::close(fd_);
            fd_ = -1;
            throw FormatError("Invalid WAL file: header truncated: " + path_);
        }
        try {
            detail::check_file_header(header, path_);
        } catch (const FormatError&) {
            ::close(fd_);
            fd_ = -1;
            throw;
        }
        offset_ = WAL_HEADER_SIZE;
    }

    ~WalScan() {
        if (fd_ >= 0) ::close(fd_);
    }

    WalScan(const WalScan&) = delete;
    WalScan& operator=(const WalScan&) = delete;

    WalScan(WalScan&& o) noexcept
        : path_(std::move(o.path_)), cursor_(o.cursor_), fd_(o.fd_),
          offset_(o.offset_), done_(o.done_), skipped_(o.skipped_) {
        o.fd_ = -1;
        o.done_ = true;
    }

    WalScan& operator=(WalScan&&) = delete;

    // Next record in file order, whatever its seq, with its typed status.
    // After End or Truncated every further call returns the same status.
    ScanEntry next_entry() {
        ScanEntry entry;
        if (done_) {
            entry.status = final_status_;
            entry.offset = offset_;
            return entry;
        }

        detail::Frame frame;
        entry.offset = offset_;
        entry.status = detail::next_frame(fd_, offset_, path_, frame);

        switch (entry.status) {
            case ScanStatus::End:
            case ScanStatus::Truncated:
                done_ = true;
                final_status_ = entry.status;
                return entry;
            case ScanStatus::ChecksumMismatch:
                offset_ = frame.next_offset;
                entry.record.seq = frame.seq;
                return entry;
            default:
                break;
        }

        offset_ = frame.next_offset;
        entry.record.seq = frame.seq;
        entry.record.timestamp = frame.timestamp;
        entry.record.type = static_cast<RecordType>(frame.type);
        entry.record.node_id = std::move(frame.node_id);
        entry.record.checksum = frame.checksum;
        try {
            entry.record.data = decode(frame.data);
        } catch (const FormatError& e) {
            entry.status = ScanStatus::BadPayload;
            std::cerr << "[WAL] Undecodable payload at seq " << frame.seq << ": " << e.what() << "\n";
        }
        return entry;
    }

    // Next valid record with seq >= cursor; false at end of log
    bool next(WalRecord& out) {
        for (;;) {
            ScanEntry entry = next_entry();
            switch (entry.status) {
                case ScanStatus::Ok:
                    if (entry.record.seq >= cursor_) {
                        out = std::move(entry.record);
                        return true;
                    }
                    break;
                case ScanStatus::ChecksumMismatch:
                    ++skipped_;
                    std::cerr << "[WAL] Checksum mismatch at seq " << entry.record.seq
                              << " (offset " << entry.offset << "), skipping record\n";
                    break;
                case ScanStatus::BadPayload:
                    ++skipped_;
                    break;
                case ScanStatus::Truncated:
                    std::cerr << "[WAL] Incomplete record at offset " << entry.offset
                              << ", stopping replay\n";
                    return false;
                case ScanStatus::End:
                    return false;
            }
        }
    }

    size_t skipped() const { return skipped_; }

    class iterator {
    public:
        using iterator_category = std::input_iterator_tag;
        using value_type = WalRecord;
        using difference_type = std::ptrdiff_t;
        using pointer = const WalRecord*;
        using reference = const WalRecord&;

        iterator() = default;
        explicit iterator(WalScan* scan) : scan_(scan) { advance(); }

        reference operator*() const { return current_; }
        pointer operator->() const { return &current_; }

        iterator& operator++() {
            advance();
            return *this;
        }

        bool operator==(const iterator& other) const { return scan_ == other.scan_; }
        bool operator!=(const iterator& other) const { return scan_ != other.scan_; }

    private:
        void advance() {
            if (scan_ && !scan_->next(current_)) scan_ = nullptr;
        }

        WalScan* scan_ = nullptr;
        WalRecord current_;
    };

    iterator begin() { return iterator(this); }
    iterator end() { return iterator(); }

private:
    std::string path_;
    uint64_t cursor_;
    int fd_ = -1;
    uint64_t offset_ = 0;
    bool done_ = false;
    ScanStatus final_status_ = ScanStatus::End;
    size_t skipped_ = 0;
};

// Write-Ahead Log: single writer, any number of scans
class WriteAheadLog {
public:
    explicit WriteAheadLog(WalConfig config)
        : config_(std::move(config)) {}

    explicit WriteAheadLog(const std::string& path)
        : WriteAheadLog(WalConfig{path}) {}

    ~WriteAheadLog() {
        close();
    }

    WriteAheadLog(const WriteAheadLog&) = delete;
    WriteAheadLog& operator=(const WriteAheadLog&) = delete;

    // Open or create the WAL file. Throws IoError or FormatError.
    void open() {
        std::lock_guard<std::mutex> lock(mutex_);
        open_locked();
    }

    void close() {
        std::lock_guard<std::mutex> lock(mutex_);
        close_locked();
    }

    bool is_open() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return fd_ >= 0;
    }

    // Append a record; returns its sequence number
    uint64_t append(RecordType type, const std::string& node_id, const Value& data) {
        return append_raw(type, node_id, encode(data));
    }

    // Append a record whose payload is already UArr-encoded
    uint64_t append_raw(RecordType type, const std::string& node_id,
                        const std::vector<uint8_t>& payload) {
        if (node_id.size() > WAL_MAX_NODE_ID) {
            throw FormatError("WAL: node id longer than 65535 bytes");
        }
        if (payload.size() > detail::U32_LIMIT) {
            throw FormatError("WAL: payload exceeds 4 GiB");
        }

        std::lock_guard<std::mutex> lock(mutex_);
        if (fd_ < 0) open_locked();

        uint64_t seq = last_seq_ + 1;
        std::vector<uint8_t> frame = detail::build_frame(seq, now_ns(), type, node_id, payload);

        {
            ScopedFileLock file_lock(fd_, true);
            detail::pwrite_all(fd_, frame.data(), frame.size(), end_offset_, config_.path);
            if (config_.sync_on_write && ::fsync(fd_) != 0) {
                throw IoError::last("WAL fsync failed: " + config_.path);
            }
        }

        end_offset_ += frame.size();
        last_seq_ = seq;
        if (oldest_seq_ == 0) oldest_seq_ = seq;
        ++record_count_;

        if (config_.compact_threshold > 0 && record_count_ % config_.compact_threshold == 0) {
            std::cerr << "[WAL] Threshold reached (" << record_count_
                      << " records), compaction recommended\n";
        }

        return seq;
    }

    // Append checkpoint marker
    uint64_t checkpoint(const std::string& label) {
        Value data = Value::map();
        data.set("label", label);
        data.set("records", static_cast<uint64_t>(record_count()));
        return append(RecordType::Checkpoint, "", data);
    }

    // Records with seq >= cursor, read lazily
    WalScan read_from(uint64_t cursor) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (fd_ < 0) open_locked();
        }
        return WalScan(config_.path, cursor);
    }

    std::vector<WalRecord> read_all() {
        std::vector<WalRecord> records;
        WalScan scan = read_from(0);
        for (const auto& record : scan) {
            records.push_back(record);
        }
        return records;
    }

    // Rewrite the log from live state. `writer` appends the live records to
    // the fresh log it is handed; the result atomically replaces this file.
    void compact(const std::function<void(WriteAheadLog&)>& writer) {
        std::lock_guard<std::mutex> lock(mutex_);

        const std::string tmp_path = config_.path + ".compact";
        ::unlink(tmp_path.c_str());

        size_t written = 0;
        try {
            WriteAheadLog fresh(WalConfig{tmp_path, false, 0});
            fresh.open();
            writer(fresh);
            fresh.sync();
            written = fresh.record_count();
        } catch (const std::exception&) {
            ::unlink(tmp_path.c_str());
            throw;
        }

        close_locked();
        if (::rename(tmp_path.c_str(), config_.path.c_str()) != 0) {
            IoError err = IoError::last("WAL rename failed: " + tmp_path);
            ::unlink(tmp_path.c_str());
            open_locked();
            throw err;
        }
        fsync_dir(config_.path);
        open_locked();

        std::cerr << "[WAL] Compacted: " << config_.path << ", " << written << " records\n";
    }

    // Discard every record and start a new empty log
    void truncate() {
        std::lock_guard<std::mutex> lock(mutex_);
        close_locked();
        create();
        std::cerr << "[WAL] Truncated: " << config_.path << "\n";
    }

    void sync() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (fd_ >= 0 && ::fsync(fd_) != 0) {
            throw IoError::last("WAL fsync failed: " + config_.path);
        }
    }

    WalStats stats() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (fd_ < 0) open_locked();
        WalStats s;
        s.record_count = record_count_;
        s.byte_size = end_offset_;
        s.oldest_seq = oldest_seq_;
        s.newest_seq = last_seq_;
        return s;
    }

    size_t record_count() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return record_count_;
    }

    uint64_t last_sequence() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return last_seq_;
    }

    uint64_t next_sequence() const { return last_sequence() + 1; }
    const std::string& path() const { return config_.path; }
    const WalConfig& config() const { return config_; }

private:
    void open_locked() {
        if (fd_ >= 0) return;

        fd_ = ::open(config_.path.c_str(), O_RDWR);
        if (fd_ < 0) {
            if (errno != ENOENT) {
                throw IoError::last("WAL open failed: " + config_.path);
            }
            create();
            std::cerr << "[WAL] Created: " << config_.path << "\n";
            return;
        }

        uint8_t header[WAL_HEADER_SIZE];
        size_t got = detail::pread_full(fd_, header, sizeof(header), 0, config_.path);
        if (got == 0) {
            // Crashed between create and header write
            ::close(fd_);
            fd_ = -1;
            create();
            return;
        }
        if (got < sizeof(header)) {
            ::close(fd_);
            fd_ = -1;
            throw FormatError("Invalid WAL file: header truncated: " + config_.path);
        }
        try {
            detail::check_file_header(header, config_.path);
        } catch (const FormatError&) {
            ::close(fd_);
            fd_ = -1;
            throw;
        }

        scan_for_sequence();
        std::cerr << "[WAL] Opened: " << config_.path << ", records=" << record_count_
                  << ", last_seq=" << last_seq_ << "\n";
    }

    void close_locked() {
        if (fd_ >= 0) {
            ::close(fd_);
            fd_ = -1;
        }
    }

    void create() {
        fd_ = ::open(config_.path.c_str(), O_RDWR | O_CREAT | O_TRUNC, 0644);
        if (fd_ < 0) {
            throw IoError::last("WAL create failed: " + config_.path);
        }
        std::vector<uint8_t> header = detail::build_file_header();
        detail::pwrite_all(fd_, header.data(), header.size(), 0, config_.path);
        if (config_.sync_on_write) {
            if (::fsync(fd_) != 0) {
                throw IoError::last("WAL fsync failed: " + config_.path);
            }
            fsync_dir(config_.path);
        }
        end_offset_ = WAL_HEADER_SIZE;
        last_seq_ = 0;
        oldest_seq_ = 0;
        record_count_ = 0;
    }

    // Scan the whole log to recover the last sequence and the append offset
    void scan_for_sequence() {
        uint64_t offset = WAL_HEADER_SIZE;
        last_seq_ = 0;
        oldest_seq_ = 0;
        record_count_ = 0;

        for (;;) {
            detail::Frame frame;
            ScanStatus status = detail::next_frame(fd_, offset, config_.path, frame);
            if (status == ScanStatus::End) break;

            if (status == ScanStatus::Truncated) {
                cut_torn_tail(offset);
                break;
            }

            if (status == ScanStatus::ChecksumMismatch) {
                std::cerr << "[WAL] Checksum mismatch at offset " << offset << " during scan\n";
            } else {
                if (frame.seq > last_seq_) last_seq_ = frame.seq;
                if (oldest_seq_ == 0) oldest_seq_ = frame.seq;
                ++record_count_;
            }
            offset = frame.next_offset;
        }

        end_offset_ = offset;
    }

    // Nothing valid follows `offset`: move the torn bytes to <path>.tail so
    // that appends land where a scan reaches them
    void cut_torn_tail(uint64_t offset) {
        uint64_t size = detail::file_size(fd_, config_.path);
        if (size <= offset) return;

        std::vector<uint8_t> tail(static_cast<size_t>(size - offset));
        size_t got = detail::pread_full(fd_, tail.data(), tail.size(), offset, config_.path);
        tail.resize(got);

        const std::string tail_path = config_.path + ".tail";
        int out = ::open(tail_path.c_str(), O_WRONLY | O_CREAT | O_APPEND, 0644);
        if (out < 0) {
            throw IoError::last("WAL tail save failed: " + tail_path);
        }
        try {
            detail::pwrite_all(out, tail.data(), tail.size(),
                               detail::file_size(out, tail_path), tail_path);
            if (::fsync(out) != 0) {
                throw IoError::last("WAL fsync failed: " + tail_path);
            }
        } catch (const IoError&) {
            ::close(out);
            throw;
        }
        ::close(out);

        std::cerr << "[WAL] Torn record at end of log (offset " << offset << "), moved "
                  << tail.size() << " bytes to " << tail_path << "\n";
        if (::ftruncate(fd_, static_cast<off_t>(offset)) != 0) {
            throw IoError::last("WAL ftruncate failed: " + config_.path);
        }
    }

    WalConfig config_;
    int fd_ = -1;
    uint64_t last_seq_ = 0;
    uint64_t oldest_seq_ = 0;
    size_t record_count_ = 0;
    uint64_t end_offset_ = 0;
    mutable std::mutex mutex_;
};

} // namespace fxd
