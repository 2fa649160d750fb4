#include <tandem/dispatch/object.hpp>

#include <wheels/core/assert.hpp>

namespace tandem::dispatch {

void DispatchObject::Start() {
  const bool already_started =
      started_.exchange(true, std::memory_order::acq_rel);

  WHEELS_VERIFY(!already_started, "Dispatch object is already started");

  OnStartup();
}

void DispatchObject::Suspend() {
  if (suspend_count_.fetch_add(1, std::memory_order::seq_cst) == 0) {
    OnSuspend();
  }
}

void DispatchObject::Resume() {
  size_t count = suspend_count_.load(std::memory_order::relaxed);

  do {
    WHEELS_VERIFY(count > 0, "Resume without matching Suspend");
  } while (!suspend_count_.compare_exchange_weak(count, count - 1,
                                                 std::memory_order::seq_cst,
                                                 std::memory_order::relaxed));

  if (count == 1) {
    OnResume();
  }
}

}  // namespace tandem::dispatch
