#pragma once

// ============================================================
// subprocess.hpp -- fork/exec helpers for external tools
// ============================================================

#include "../common/platform.hpp"
#include <string>
#include <vector>
#include <functional>

namespace subprocess {

struct Result {
    int         exit_code{-1};  // -1 when killed by a signal
    std::string err_tail;       // last lines of stderr
};

using LineFn = std::function<void(const std::string& line)>;

// Run argv[0] (PATH lookup) in cwd (empty = inherit). Each stdout line
// goes to on_line when given; stderr is kept as a bounded tail.
// Throws std::runtime_error when the process cannot be started.
Result run(const std::vector<std::string>& argv, const std::string& cwd,
           const LineFn& on_line);

// Run and return the whole of stdout. Throws std::runtime_error with
// the stderr tail on a non-zero exit.
std::vector<u8> capture(const std::vector<std::string>& argv);

// argv joined for log lines
std::string describe(const std::vector<std::string>& argv);

} // namespace subprocess
