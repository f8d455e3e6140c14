#include "types.hpp"

int exit_code_for(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None:                 return 0;
        case ErrorKind::CacheRootMissing:     return 2;
        case ErrorKind::VerificationFailed:   return 3;
        case ErrorKind::InvalidCategoryToken: return 5;
        case ErrorKind::NoCargoManifest:      return 123;
        default:                              return 1;
    }
}

const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None:                      return "none";
        case ErrorKind::CacheRootMissing:          return "cache-root-missing";
        case ErrorKind::MalformedPackageName:      return "malformed-package-name";
        case ErrorKind::InvalidCategoryToken:      return "invalid-category-token";
        case ErrorKind::DateParseFailure:          return "date-parse-failure";
        case ErrorKind::TrimLimitUnitParseFailure: return "trim-limit-parse-failure";
        case ErrorKind::NoCargoManifest:           return "no-cargo-manifest";
        case ErrorKind::UnparsableManifest:        return "unparsable-manifest";
        case ErrorKind::QueryRegexFailure:         return "query-regex-failure";
        case ErrorKind::NoRustupHome:              return "no-rustup-home";
        case ErrorKind::RemovalFailed:             return "removal-failed";
        case ErrorKind::UnknownSourcePath:         return "unknown-source-path";
        case ErrorKind::VerificationFailed:        return "verification-failed";
        case ErrorKind::GitFailed:                 return "git-failed";
        case ErrorKind::ConfigInvalid:             return "config-invalid";
        case ErrorKind::InvalidArgument:           return "invalid-argument";
    }
    return "unknown";
}
