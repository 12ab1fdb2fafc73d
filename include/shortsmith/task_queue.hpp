/**
 * @file task_queue.hpp
 * @brief Thread-safe task queue and result collection for the frame scan
 *
 * @details Provides:
 *          - TaskQueue: shared queue of sample ranges for dynamic load
 *            balancing between scan workers
 *
 *          - ResultCollector: thread-safe aggregator for per-chunk samples
 */

#ifndef SHORTSMITH_TASK_QUEUE_HPP
#define SHORTSMITH_TASK_QUEUE_HPP

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <queue>
#include <vector>

#include "types.hpp"

namespace shortsmith {

/**
 * @struct ScanTask
 * @brief A range of sample indices [first_sample, last_sample) to scan.
 * @note Cache-line aligned to prevent false sharing between threads.
 */
struct alignas(CACHE_LINE_SIZE) ScanTask {
  int64_t first_sample; //< First sample index (inclusive)
  int64_t last_sample;  //< Last sample index (exclusive)
  int id;               //< Chunk ID for logging
};

/**
 * @class TaskQueue
 * @brief Shared work queue; idle workers pick up the next chunk, so a slow
 *        chunk (expensive codec section) does not stall the others.
 */
class TaskQueue {
  std::queue<ScanTask> tasks;
  std::mutex mutex;
  std::condition_variable cv;
  std::atomic<bool> done{false};

public:
  void push(ScanTask task);

  /**
   * @brief Pop a task, blocking until one is available or finish() is called.
   * @return true if a task was retrieved, false if empty and finished
   */
  bool pop(ScanTask &task);

  /// Signal that no more tasks will be added and wake all workers.
  void finish();
};

/**
 * @class ResultCollector
 * @brief Thread-safe aggregator for scan results.
 */
class ResultCollector {
  std::vector<FrameDiffSample> samples;
  std::mutex mutex;

public:
  void reserve(size_t n);

  /// Append one chunk's samples (moved in)
  void add(std::vector<FrameDiffSample> &&results);

  /// Move all samples out, sorted by frame index
  std::vector<FrameDiffSample> extract();
};

} // namespace shortsmith

#endif // SHORTSMITH_TASK_QUEUE_HPP
