#ifndef EXECUTOR_ADMISSION_HPP
#define EXECUTOR_ADMISSION_HPP

#include <condition_variable>
#include <cstddef>
#include <mutex>

namespace executor {

// Bounds the number of submissions that run their processes at the same
// time. Submissions above the bound wait for a free slot.
class Admission {
 public:
  // max_running == 0 means one slot per hardware thread.
  explicit Admission(size_t max_running = 0);

  Admission(const Admission&) = delete;
  Admission& operator=(const Admission&) = delete;
  Admission(Admission&&) = delete;
  Admission& operator=(Admission&&) = delete;

  // Holds one slot for its lifetime.
  class Slot {
   public:
    explicit Slot(Admission* admission);
    ~Slot();
    Slot(const Slot&) = delete;
    Slot& operator=(const Slot&) = delete;
    Slot(Slot&&) = delete;
    Slot& operator=(Slot&&) = delete;

   private:
    Admission* admission_;
  };

  size_t MaxRunning() const { return max_running_; }
  size_t Running() const;

 private:
  void Acquire();
  void Release();

  const size_t max_running_;
  size_t running_ = 0;
  mutable std::mutex mutex_;
  std::condition_variable slot_free_;
};

}  // namespace executor

#endif
