#pragma once

#include <string>
#include <core/types.hpp>

struct PackageName {
    std::string name;
    std::string version;
};

// Split "<name>-<version>[.crate]" into name and version.
// The version starts at the first '-'-separated segment (after the first)
// that begins with a digit and contains a '.'; failing that, the first one
// that begins with a digit. So "x86-64-0.2.1" is ("x86-64", "0.2.1") and
// "foo-0.1.0-beta.1.crate" is ("foo", "0.1.0-beta.1").
Result<PackageName> parse_package_file_name(const std::string& file_name);

// Semantic-version precedence: <0 if a sorts before b, 0 if equal, >0 after.
// Falls back to plain string comparison when a core is not numeric.
int compare_versions(const std::string& a, const std::string& b);
