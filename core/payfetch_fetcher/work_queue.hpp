// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef PAYFETCH_WORK_QUEUE_HPP
#define PAYFETCH_WORK_QUEUE_HPP

#include <condition_variable>
#include <mutex>
#include <optional>
#include <queue>
#include <string>

namespace payfetch {
namespace fetcher {

/**
 * Thread-safe FIFO of payment IDs feeding the dispatch threads
 *
 * The dispatch engine enqueues the whole batch and closes the queue; the
 * dispatch threads take IDs until it runs dry. close() lets consumers finish
 * what is queued, shutdown() makes every dequeue return immediately.
 */
class WorkQueue {
public:
  WorkQueue() = default;
  ~WorkQueue();

  WorkQueue(const WorkQueue&) = delete;
  WorkQueue& operator=(const WorkQueue&) = delete;

  /**
   * @return false once the queue is closed or shut down
   */
  bool enqueue(std::string payment_id);

  /**
   * Blocks until an ID is available, the queue is closed and empty, or
   * shutdown is requested.
   *
   * @return Next ID, or std::nullopt when there is no more work
   */
  std::optional<std::string> dequeue();

  void close();
  void shutdown();

private:
  std::mutex mutex_;
  std::condition_variable cv_;
  std::queue<std::string> queue_;
  bool closed_ = false;
  bool shutdown_ = false;
};

}  // namespace fetcher
}  // namespace payfetch

#endif  // PAYFETCH_WORK_QUEUE_HPP
