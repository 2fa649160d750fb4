#pragma once

#include <cstddef>
#include <string>
#include <thread>

namespace tandem::dispatch {

#if defined(__TANDEM_PROFILE__)
inline const bool kProfileByDefault = true;
#else
inline const bool kProfileByDefault = false;
#endif

inline size_t DefaultThreads() {
  const size_t cores = std::thread::hardware_concurrency();
  return cores > 0 ? cores : 1;
}

struct DispatcherSettings {
  // Worker threads of the owned pool, ignored for external executors
  size_t threads = DefaultThreads();

  // Label of the global queue
  std::string label = "global";

  // Profile every queue created via Dispatcher::CreateQueue
  bool profile = kProfileByDefault;
};

}  // namespace tandem::dispatch
