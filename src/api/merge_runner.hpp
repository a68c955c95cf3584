#pragma once

#include <ostream>

#include "api/merge_config.hpp"

namespace api {

inline constexpr int exit_ok = 0;
inline constexpr int exit_config_error = 1;
inline constexpr int exit_merge_failure = 2;

// Runs a merge (or a dry run when no output is configured) and prints the
// summary to `out`. Returns one of the exit_* codes.
int run_merge(const MergeConfig& cfg, std::ostream& out);

// Prints one line per packet (or per action for a chunk entry) of the single
// configured input without writing anything.
int run_dump(const MergeConfig& cfg, std::ostream& out);

} // namespace api
