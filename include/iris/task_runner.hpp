#pragma once

#include <cstddef>
#include <deque>
#include <functional>

namespace iris {

enum class Poll { Pending, Ready };

// Single-threaded cooperative runner. Every step runs on the thread calling
// runPending(); a step returning Poll::Pending is resumed on the next pass, so a
// task can wait on another thread's result without blocking this one.
class TaskRunner {
 public:
  using Step = std::function<Poll()>;

  void post(Step step);

  // Runs each step queued before this call once. Steps posted during the pass
  // run on the next pass. An exception thrown by a step drops that step and
  // propagates to the caller; the remaining steps stay queued.
  void runPending();

  // Drops every queued step without running it.
  void clear() { steps_.clear(); }

  std::size_t pendingCount() const { return steps_.size(); }
  bool idle() const { return steps_.empty(); }

 private:
  std::deque<Step> steps_;
};

}  // namespace iris
