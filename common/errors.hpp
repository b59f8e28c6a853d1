#pragma once

// ============================================================
// errors.hpp -- Exception taxonomy
//
//   ConfigurationError     bad algorithm/key/encoding/options; fatal at startup
//   KernelResourceError    a syscall failed; fatal to the current unit of work
//   PathError              open/create/mkdir of a path failed; fatal to its subtree
//   LockContention         non-blocking advisory lock unavailable; caller skips
//   ShortTransferAssertion kernel moved fewer bytes than the pump accounted for
// ============================================================

#include "platform.hpp"
#include <stdexcept>
#include <string>

class ConfigurationError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class KernelResourceError : public std::runtime_error {
public:
    KernelResourceError(const std::string& call, int err)
        : std::runtime_error(call + "() failed: " + os_error_str(err))
        , call_(call), code_(err) {}

    const std::string& call() const { return call_; }
    int code() const { return code_; }

private:
    std::string call_;
    int         code_;
};

class PathError : public std::runtime_error {
public:
    PathError(const std::string& path, int err)
        : std::runtime_error(path + ": " + os_error_str(err))
        , path_(path), code_(err) {}

    const std::string& path() const { return path_; }
    int code() const { return code_; }

private:
    std::string path_;
    int         code_;
};

class LockContention : public std::runtime_error {
public:
    explicit LockContention(const std::string& path)
        : std::runtime_error("could not be locked: " + path), path_(path) {}

    const std::string& path() const { return path_; }

private:
    std::string path_;
};

class ShortTransferAssertion : public std::logic_error {
public:
    using std::logic_error::logic_error;
};
