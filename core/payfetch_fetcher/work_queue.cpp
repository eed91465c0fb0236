// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "work_queue.hpp"

namespace payfetch {
namespace fetcher {

WorkQueue::~WorkQueue() {
  shutdown();
}

bool WorkQueue::enqueue(std::string payment_id) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_ || shutdown_) {
      return false;
    }
    queue_.push(std::move(payment_id));
  }
  cv_.notify_one();
  return true;
}

std::optional<std::string> WorkQueue::dequeue() {
  std::unique_lock<std::mutex> lock(mutex_);
  cv_.wait(lock, [this] {
    return shutdown_ || closed_ || !queue_.empty();
  });

  if (shutdown_ || queue_.empty()) {
    return std::nullopt;
  }

  std::string payment_id = std::move(queue_.front());
  queue_.pop();
  return payment_id;
}

void WorkQueue::close() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    closed_ = true;
  }
  cv_.notify_all();
}

void WorkQueue::shutdown() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    shutdown_ = true;
  }
  cv_.notify_all();
}

}  // namespace fetcher
}  // namespace payfetch
