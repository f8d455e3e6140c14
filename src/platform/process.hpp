#pragma once

#include <string>
#include <vector>
#include <filesystem>
#include <core/types.hpp>

namespace platform {

// Run a child process to completion, capturing stdout and stderr.
// The program is looked up on PATH. If it cannot be executed the result
// has exit code 127 and a message on stderr_data.
// cwd: if non-empty, the child changes into this directory first.
ProcessResult run_capture(const std::string& program,
                          const std::vector<std::string>& args,
                          const std::filesystem::path& cwd = {});

} // namespace platform
