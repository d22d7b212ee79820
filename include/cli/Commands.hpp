#pragma once

#include "config/Config.hpp"

#include <ostream>
#include <string>
#include <vector>

namespace bfs::cli {

constexpr int EXIT_OK = 0;
constexpr int EXIT_ERROR = 1;  // service errors, failed `exists`, anything unexpected
constexpr int EXIT_USAGE = 2;

int usage(std::ostream& err);

/// Runs one blobfs command (`args[0]`) against the storage described by `cfg`.
/// Records go to `out` as JSON, diagnostics to `err`; the return value is the
/// process exit code.
int execute(const config::Config& cfg, const std::vector<std::string>& args, std::ostream& out, std::ostream& err);

}
