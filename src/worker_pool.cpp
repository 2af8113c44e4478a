#include "tftpd/worker_pool.hpp"
#include "tftpd/log.hpp"

#include <exception>
#include <utility>

namespace tftpd {

WorkerPool::WorkerPool(size_t workers, size_t max_pending)
    : max_pending_(max_pending), stopping_(false) {
  if (workers == 0)
    workers = 1;
  threads_.reserve(workers);
  try {
    for (size_t i = 0; i < workers; ++i) {
      threads_.emplace_back(&WorkerPool::worker_loop, this);
    }
  } catch (...) {
    // Join the workers that did start before the vector destroys them
    shutdown();
    throw;
  }
}

WorkerPool::~WorkerPool() { shutdown(); }

bool WorkerPool::try_submit(Task task) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (stopping_ || tasks_.size() >= max_pending_) {
      return false;
    }
    tasks_.push_back(std::move(task));
  }
  cv_.notify_one();
  return true;
}

void WorkerPool::shutdown() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    stopping_ = true;
  }
  cv_.notify_all();
  for (std::thread &thread : threads_) {
    if (thread.joinable())
      thread.join();
  }
}

size_t WorkerPool::pending() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return tasks_.size();
}

void WorkerPool::worker_loop() {
  while (true) {
    Task task;
    {
      std::unique_lock<std::mutex> lock(mutex_);
      cv_.wait(lock, [this] { return stopping_ || !tasks_.empty(); });
      if (tasks_.empty())
        return; // stopping and drained
      task = std::move(tasks_.front());
      tasks_.pop_front();
    }
    try {
      task();
    } catch (const std::exception &e) {
      TFTPD_LOG_ERROR("Worker task failed: " << e.what());
    }
  }
}

} // namespace tftpd
