#ifndef EXECUTOR_PROCESS_RUNNER_MOCK_HPP
#define EXECUTOR_PROCESS_RUNNER_MOCK_HPP

#include <string>
#include <vector>

#include "executor/process_runner.hpp"
#include "gmock/gmock.h"

namespace executor {

class MockProcessRunner : public ProcessRunner {
 public:
  MOCK_METHOD(ProcessResult, Run,
              (const std::string& command,
               const std::vector<std::string>& args,
               const absl::optional<std::string>& input,
               const absl::optional<int32_t>& deadline_seconds),
              (override));
};

}  // namespace executor

#endif
