#ifndef BV_UTILS_TASK_GROUP_HPP
#define BV_UTILS_TASK_GROUP_HPP

#include <condition_variable>
#include <cstddef>
#include <exception>
#include <mutex>
#include <utility>
#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>

namespace bv {
namespace utils {

// Runs tasks on a thread pool with a cap on how many may be outstanding at
// once. The first exception thrown by a task is kept and rethrown by
// rethrow_if_failed(); after a failure or cancel() queued tasks are skipped.
class TaskGroup {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  TaskGroup(boost::asio::thread_pool& pool, std::size_t max_in_flight);
  // Waits for outstanding tasks
  ~TaskGroup();

  TaskGroup(const TaskGroup&) = delete;
  TaskGroup& operator=(const TaskGroup&) = delete;


  // ---- SUBMISSION ----
  // Blocks while max_in_flight tasks are outstanding. Returns false without
  // running task if the group has failed or was cancelled. Task may be
  // move-only.
  template <typename Task>
  bool submit(Task&& task);


  // ---- CONTROL ----
  // Waits until every submitted task has finished or been skipped
  void wait();
  // Stops queued tasks from running
  void cancel();
  void rethrow_if_failed();


  // ---- GETTERS ----
  bool failed() const;
  bool stopped() const;
  std::size_t in_flight() const;
  std::size_t peak_in_flight() const;

private:
  boost::asio::thread_pool& pool_;
  std::size_t max_in_flight_;

  mutable std::mutex mutex_;
  std::condition_variable changed_;
  std::size_t in_flight_ = 0;
  std::size_t peak_in_flight_ = 0;
  bool stopped_ = false;
  std::exception_ptr first_error_;

  // Returns false if the group stopped while waiting for a slot
  bool acquire_slot();
  void release_slot(std::exception_ptr error);
  bool should_run() const;
};

template <typename Task>
bool TaskGroup::submit(Task&& task) {
  if (!acquire_slot()) {
    return false;
  }

  boost::asio::post(pool_, [this, task = std::forward<Task>(task)]() mutable {
    std::exception_ptr error;
    if (should_run()) {
      try {
        task();
      } catch (...) {
        // Handed to the submitting thread through rethrow_if_failed()
        error = std::current_exception();
      }
    }
    release_slot(error);
  });
  return true;
}

} // namespace utils
} // namespace bv

#endif // BV_UTILS_TASK_GROUP_HPP
