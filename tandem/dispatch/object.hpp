#pragma once

#include <twist/ed/stdlike/atomic.hpp>

#include <cstddef>

namespace tandem::dispatch {

// Start / Suspend / Resume lifecycle shared by dispatch objects

class DispatchObject {
 public:
  virtual ~DispatchObject() = default;

  // Invokes OnStartup, at most once
  void Start();

  // Reference counted: every Suspend needs a matching Resume
  void Suspend();

  // Invokes OnResume when the last suspension is lifted
  void Resume();

  bool IsSuspended() const {
    return suspend_count_.load(std::memory_order::seq_cst) > 0;
  }

 protected:
  virtual void OnStartup() {
  }

  virtual void OnSuspend() {
  }

  virtual void OnResume() {
  }

 private:
  twist::ed::stdlike::atomic<size_t> suspend_count_{0};
  twist::ed::stdlike::atomic<bool> started_{false};
};

}  // namespace tandem::dispatch
