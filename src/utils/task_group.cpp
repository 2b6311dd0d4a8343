#include "utils/task_group.hpp"
#include <stdexcept>
#include <boost/log/trivial.hpp>

namespace bv {
namespace utils {

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

TaskGroup::TaskGroup(boost::asio::thread_pool& pool, std::size_t max_in_flight)
  : pool_(pool)
  , max_in_flight_(max_in_flight) {
  if (max_in_flight_ == 0) {
    throw std::invalid_argument("Task group: max_in_flight must be greater than zero");
  }
}

TaskGroup::~TaskGroup() {
  wait();
}


//==============================================
// CONTROL
//==============================================

void TaskGroup::wait() {
  std::unique_lock<std::mutex> lock(mutex_);
  changed_.wait(lock, [this] { return in_flight_ == 0; });
}

void TaskGroup::cancel() {
  std::lock_guard<std::mutex> lock(mutex_);
  stopped_ = true;
  changed_.notify_all();
}

void TaskGroup::rethrow_if_failed() {
  std::exception_ptr error;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    error = first_error_;
  }
  if (error) {
    std::rethrow_exception(error);
  }
}


//==============================================
// GETTERS
//==============================================

bool TaskGroup::failed() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return static_cast<bool>(first_error_);
}

bool TaskGroup::stopped() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return stopped_;
}

std::size_t TaskGroup::in_flight() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return in_flight_;
}

std::size_t TaskGroup::peak_in_flight() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return peak_in_flight_;
}


//==============================================
// SLOT ACCOUNTING
//==============================================

bool TaskGroup::acquire_slot() {
  std::unique_lock<std::mutex> lock(mutex_);
  changed_.wait(lock, [this] { return stopped_ || in_flight_ < max_in_flight_; });
  if (stopped_) {
    return false;
  }
  ++in_flight_;
  if (in_flight_ > peak_in_flight_) {
    peak_in_flight_ = in_flight_;
  }
  return true;
}

void TaskGroup::release_slot(std::exception_ptr error) {
  // Notify under the lock: once wait() sees in_flight_ == 0 the group may be
  // destroyed, so no worker may touch changed_ after that point
  std::lock_guard<std::mutex> lock(mutex_);
  if (error && !first_error_) {
    first_error_ = error;
    stopped_ = true;
    BOOST_LOG_TRIVIAL(debug) << "Task group: First task failure recorded, skipping queued tasks";
  }
  --in_flight_;
  changed_.notify_all();
}

bool TaskGroup::should_run() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return !stopped_;
}

} // namespace utils
} // namespace bv
