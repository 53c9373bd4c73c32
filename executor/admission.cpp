#include "executor/admission.hpp"

#include <thread>

#include "glog/logging.h"

namespace {
size_t DefaultMaxRunning() {
  size_t cores = std::thread::hardware_concurrency();
  return cores ? cores : 1;
}
}  // namespace

namespace executor {

Admission::Admission(size_t max_running)
    : max_running_(max_running ? max_running : DefaultMaxRunning()) {}

size_t Admission::Running() const {
  std::lock_guard<std::mutex> lck(mutex_);
  return running_;
}

void Admission::Acquire() {
  std::unique_lock<std::mutex> lck(mutex_);
  if (running_ >= max_running_) {
    VLOG(1) << "All " << max_running_ << " execution slots busy, waiting";
  }
  slot_free_.wait(lck, [this]() { return running_ < max_running_; });
  running_++;
}

void Admission::Release() {
  {
    std::lock_guard<std::mutex> lck(mutex_);
    running_--;
  }
  slot_free_.notify_one();
}

Admission::Slot::Slot(Admission* admission) : admission_(admission) {
  admission_->Acquire();
}

Admission::Slot::~Slot() { admission_->Release(); }

}  // namespace executor
