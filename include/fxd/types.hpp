#pragma once
// Core types and utilities shared by every fxd component
//
// Time, checksums, little-endian byte packing and atomic file replacement.

#include <array>
#include <chrono>
#include <cstdint>
#include <cstring>
#include <string>
#include <type_traits>
#include <vector>

// POSIX headers for atomic file persistence (must be outside namespace)
#include <unistd.h>
#include <fcntl.h>
#include <sys/stat.h>

namespace fxd {

// Timestamp as Unix nanoseconds
using Timestamp = uint64_t;

// Current time as Timestamp
inline Timestamp now_ns() {
    auto duration = std::chrono::system_clock::now().time_since_epoch();
    return static_cast<Timestamp>(
        std::chrono::duration_cast<std::chrono::nanoseconds>(duration).count());
}

// Unix millis, for log lines
inline int64_t now_ms() {
    auto duration = std::chrono::system_clock::now().time_since_epoch();
    return std::chrono::duration_cast<std::chrono::milliseconds>(duration).count();
}

// ═══════════════════════════════════════════════════════════════════════════
// CRC32 (IEEE 802.3, reflected, poly 0xEDB88320), table-driven
// ═══════════════════════════════════════════════════════════════════════════

namespace detail {

constexpr std::array<uint32_t, 256> make_crc32_table() {
    std::array<uint32_t, 256> table{};
    for (uint32_t i = 0; i < 256; ++i) {
        uint32_t crc = i;
        for (int j = 0; j < 8; ++j) {
            crc = (crc >> 1) ^ (0xEDB88320u & (0u - (crc & 1u)));
        }
        table[i] = crc;
    }
    return table;
}

inline constexpr std::array<uint32_t, 256> CRC32_TABLE = make_crc32_table();

} // namespace detail

// Running CRC state: start with 0xFFFFFFFF, finish with crc32_final
inline uint32_t crc32_update(uint32_t state, const uint8_t* data, size_t length) {
    for (size_t i = 0; i < length; ++i) {
        state = detail::CRC32_TABLE[(state ^ data[i]) & 0xFFu] ^ (state >> 8);
    }
    return state;
}

inline uint32_t crc32_final(uint32_t state) {
    return ~state;
}

inline uint32_t crc32(const uint8_t* data, size_t length) {
    return crc32_final(crc32_update(0xFFFFFFFFu, data, length));
}

// ═══════════════════════════════════════════════════════════════════════════
// Little-endian packing (on-disk formats are little-endian on every host)
// ═══════════════════════════════════════════════════════════════════════════

template <typename T>
inline void store_le(uint8_t* out, T value) {
    using U = std::make_unsigned_t<T>;
    U u = static_cast<U>(value);
    for (size_t i = 0; i < sizeof(T); ++i) {
        out[i] = static_cast<uint8_t>(u >> (8 * i));
    }
}

template <typename T>
inline T load_le(const uint8_t* in) {
    using U = std::make_unsigned_t<T>;
    U u = 0;
    for (size_t i = 0; i < sizeof(T); ++i) {
        u |= static_cast<U>(in[i]) << (8 * i);
    }
    return static_cast<T>(u);
}

template <typename T>
inline void append_le(std::vector<uint8_t>& out, T value) {
    size_t at = out.size();
    out.resize(at + sizeof(T));
    store_le<T>(out.data() + at, value);
}

inline uint64_t double_bits(double d) {
    uint64_t bits;
    std::memcpy(&bits, &d, sizeof(bits));
    return bits;
}

inline double bits_double(uint64_t bits) {
    double d;
    std::memcpy(&d, &bits, sizeof(d));
    return d;
}

inline float bits_float(uint32_t bits) {
    float f;
    std::memcpy(&f, &bits, sizeof(f));
    return f;
}

// ═══════════════════════════════════════════════════════════════════════════
// Atomic file persistence: write temp → fsync → rename → fsync dir
// ═══════════════════════════════════════════════════════════════════════════

// Fsync parent directory for durability
inline bool fsync_dir(const std::string& path) {
    auto slash = path.find_last_of('/');
    std::string dir = (slash == std::string::npos) ? "." : path.substr(0, slash);
    if (dir.empty()) dir = "/";
    int dfd = ::open(dir.c_str(), O_RDONLY | O_DIRECTORY);
    if (dfd < 0) return false;
    int rc = ::fsync(dfd);
    ::close(dfd);
    return rc == 0;
}

inline bool file_exists(const std::string& path) {
    struct stat st;
    return ::stat(path.c_str(), &st) == 0;
}

inline bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

} // namespace fxd
