/**
 * @file task_queue.cpp
 * @brief Thread-safe task queue and result collection implementation
 */

#include "shortsmith/task_queue.hpp"

#include <algorithm>
#include <iterator>

namespace shortsmith {

// **----- TaskQueue -----**

void TaskQueue::push(ScanTask task) {
  std::lock_guard<std::mutex> lock(mutex);
  tasks.push(task);
  cv.notify_one();
}

bool TaskQueue::pop(ScanTask &task) {
  std::unique_lock<std::mutex> lock(mutex);
  cv.wait(lock, [this] { return !tasks.empty() || done.load(); });
  if (tasks.empty())
    return false;
  task = tasks.front();
  tasks.pop();
  return true;
}

void TaskQueue::finish() {
  {
    std::lock_guard<std::mutex> lock(mutex);
    done.store(true);
  }
  cv.notify_all();
}

// **----- ResultCollector -----**

void ResultCollector::reserve(size_t n) {
  std::lock_guard<std::mutex> lock(mutex);
  samples.reserve(n);
}

void ResultCollector::add(std::vector<FrameDiffSample> &&results) {
  std::lock_guard<std::mutex> lock(mutex);
  samples.insert(samples.end(), std::make_move_iterator(results.begin()),
                 std::make_move_iterator(results.end()));
}

std::vector<FrameDiffSample> ResultCollector::extract() {
  std::lock_guard<std::mutex> lock(mutex);
  std::sort(samples.begin(), samples.end(),
            [](const FrameDiffSample &a, const FrameDiffSample &b) {
              return a.frame_index < b.frame_index;
            });
  return std::move(samples);
}

} // namespace shortsmith
