#ifndef TFTPD_WORKER_POOL_HPP
#define TFTPD_WORKER_POOL_HPP

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

namespace tftpd {

// Fixed set of worker threads fed from a bounded queue. Caps the number of
// concurrent transfers at `workers` and queued requests at `max_pending`.
class WorkerPool {
public:
  using Task = std::function<void()>;

  WorkerPool(size_t workers, size_t max_pending);
  ~WorkerPool();

  WorkerPool(const WorkerPool &) = delete;
  WorkerPool &operator=(const WorkerPool &) = delete;

  // Never blocks. Returns false when the queue is full or the pool is
  // shutting down; the task is not run in that case.
  bool try_submit(Task task);

  // Stops accepting tasks, runs everything already queued and joins the
  // workers. Safe to call more than once.
  void shutdown();

  size_t size() const { return threads_.size(); }
  size_t pending() const;

private:
  void worker_loop();

  std::vector<std::thread> threads_;
  std::deque<Task> tasks_;
  size_t max_pending_;
  bool stopping_;
  mutable std::mutex mutex_;
  std::condition_variable cv_;
};

} // namespace tftpd

#endif // TFTPD_WORKER_POOL_HPP
