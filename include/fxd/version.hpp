#pragma once

#define FXD_VERSION "1.0.0"
#define FXD_WAL_FORMAT_VERSION 1
#define FXD_UARR_FORMAT_VERSION 1

namespace fxd {
namespace version {

// Readers accept any file written at or below their own format version
inline bool wal_compatible(int file_version) {
    return file_version >= 1 && file_version <= FXD_WAL_FORMAT_VERSION;
}

inline bool uarr_compatible(int record_version) {
    return record_version >= 1 && record_version <= FXD_UARR_FORMAT_VERSION;
}

} // namespace version
} // namespace fxd
