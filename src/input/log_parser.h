#pragma once

#include <string>
#include <vector>

#include "types.h"

namespace logrca::input {

// Parses Sleuth-formatted lines:
//   2025-01-01T10:00:00.123Z ERROR [svc,trace,span] ... com.x.Class : message
// Non-matching lines continue the previous record's message. Output is sorted
// by timestamp; records with equal timestamps keep file order.
auto ParseLogLines(const std::vector<std::string>& lines) -> std::vector<LogEvent>;

// Throws std::runtime_error if the file cannot be opened.
auto ParseLogFile(const std::string& path) -> std::vector<LogEvent>;

} // namespace logrca::input
