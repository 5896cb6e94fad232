#ifndef EXECUTOR_POLLER_HPP
#define EXECUTOR_POLLER_HPP
#include <atomic>
#include <chrono>
#include <string>

#include "executor/dispatcher.hpp"
#include "store/queue_store.hpp"

namespace executor {

// Periodically looks for new commands in a queue store and hands them to a
// dispatcher, sequentially.
class Poller {
 public:
  Poller(store::QueueStore* store, Dispatcher* dispatcher,
         std::chrono::milliseconds interval)
      : store_(store), dispatcher_(dispatcher), interval_(interval) {}

  // Processes the commands currently in the store. Returns how many were
  // found; failures to list them are logged.
  size_t PollOnce();

  // Calls PollOnce every interval until Stop is called.
  void Run();

  // Makes Run return after the current iteration. Thread safe.
  void Stop() { stopped_ = true; }

 private:
  store::QueueStore* store_;
  Dispatcher* dispatcher_;
  std::chrono::milliseconds interval_;
  std::atomic<bool> stopped_{false};
};

}  // namespace executor

#endif
