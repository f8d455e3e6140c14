#pragma once

#include <string>
#include <optional>
#include <vector>
#include <functional>
#include <cstdint>
#include <filesystem>
#include <stdexcept>

// Everything a user can get wrong, plus the few internal failures we surface.
enum class ErrorKind {
    None,
    CacheRootMissing,
    MalformedPackageName,
    InvalidCategoryToken,
    DateParseFailure,
    TrimLimitUnitParseFailure,
    NoCargoManifest,
    UnparsableManifest,
    QueryRegexFailure,
    NoRustupHome,
    RemovalFailed,
    UnknownSourcePath,
    VerificationFailed,
    GitFailed,
    ConfigInvalid,
    InvalidArgument,
};

// Result type for operations that can fail
template <typename T>
struct Result {
    bool success;
    T value;
    std::string error;
    ErrorKind kind = ErrorKind::None;

    static Result<T> Ok(T val) {
        return {true, std::move(val), "", ErrorKind::None};
    }

    static Result<T> Err(ErrorKind kind, const std::string& err) {
        return {false, T{}, err, kind};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Specialization for void
template <>
struct Result<void> {
    bool success;
    std::string error;
    ErrorKind kind = ErrorKind::None;

    static Result<void> Ok() {
        return {true, "", ErrorKind::None};
    }

    static Result<void> Err(ErrorKind kind, const std::string& err) {
        return {false, err, kind};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Fatal error, caught once in main().
class CacheError : public std::runtime_error {
public:
    CacheError(ErrorKind kind, const std::string& msg)
        : std::runtime_error(msg), kind_(kind) {}

    ErrorKind kind() const { return kind_; }

private:
    ErrorKind kind_;
};

// Unwrap a Result or throw its error as a CacheError.
template <typename T>
T unwrap_or_throw(Result<T> r) {
    if (r.is_err()) throw CacheError(r.kind, r.error);
    return std::move(r.value);
}

inline void unwrap_or_throw(const Result<void>& r) {
    if (r.is_err()) throw CacheError(r.kind, r.error);
}

// Process exit code for a fatal error kind.
int exit_code_for(ErrorKind kind);

// Short label, used in diagnostics and the debug log.
const char* error_kind_name(ErrorKind kind);

// Child process execution result (manifest resolver, git)
struct ProcessResult {
    int exit_code;
    std::string stdout_data;
    std::string stderr_data;

    bool success() const { return exit_code == 0; }
    bool failed() const { return exit_code != 0; }

    std::string get_output() const {
        return stdout_data.empty() ? stderr_data : stdout_data;
    }
};

// Access times are kept in nanoseconds since the epoch.
using FileTime = std::int64_t;

// Status callback for operations
using StatusCallback = std::function<void(const std::string&)>;
