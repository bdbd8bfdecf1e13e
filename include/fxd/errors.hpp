#pragma once
// Error taxonomy
//
// FormatError  malformed bytes handed to a decoder; fatal to that call only
// IoError      file-system failure; always propagated to the caller
// ConfigError  unreadable or malformed configuration
//
// Per-record integrity failures in the WAL are not exceptions: they surface
// as ScanStatus values (see wal.hpp) and the record is skipped.

#include <cerrno>
#include <stdexcept>
#include <string>
#include <system_error>

namespace fxd {

class FormatError : public std::runtime_error {
public:
    explicit FormatError(const std::string& what)
        : std::runtime_error(what) {}
};

class IoError : public std::system_error {
public:
    IoError(int err, const std::string& what)
        : std::system_error(err, std::generic_category(), what) {}

    // Capture errno at the failing call site
    static IoError last(const std::string& what) {
        return IoError(errno, what);
    }
};

class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& what)
        : std::runtime_error(what) {}
};

} // namespace fxd
