#include "iris/task_runner.hpp"

#include <utility>

namespace iris {

void TaskRunner::post(Step step) {
  if (step) steps_.push_back(std::move(step));
}

void TaskRunner::runPending() {
  std::size_t budget = steps_.size();
  while (budget-- > 0 && !steps_.empty()) {
    Step step = std::move(steps_.front());
    steps_.pop_front();
    if (step() == Poll::Pending) {
      steps_.push_back(std::move(step));
    }
  }
}

}  // namespace iris
