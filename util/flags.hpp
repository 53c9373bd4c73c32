#ifndef UTIL_FLAGS_HPP
#define UTIL_FLAGS_HPP

#include "gflags/gflags.h"

// Server
DECLARE_string(address);
DECLARE_int32(port);
DECLARE_int32(max_concurrent_submissions);

// Execution
DECLARE_int32(execution_timeout);
DECLARE_int32(lint_timeout);
DECLARE_string(python);
DECLARE_string(linter);
DECLARE_string(temp_directory);

// Limits
DECLARE_int32(memory_limit_mb);
DECLARE_int32(output_limit_kb);
DECLARE_int32(process_limit);

#endif
