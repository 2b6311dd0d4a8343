#ifndef BV_UTILS_CANCELLATION_HPP
#define BV_UTILS_CANCELLATION_HPP

#include <atomic>
#include <string>
#include "common/error.hpp"

namespace bv {
namespace utils {

// Shared flag checked by long running operations between chunks
class CancellationToken {
public:
  void cancel() { cancelled_ = true; }
  void reset() { cancelled_ = false; }
  bool cancelled() const { return cancelled_; }

  // Throws OperationCancelled if cancel() was called
  void throw_if_cancelled(const std::string& operation) const {
    if (cancelled_) {
      throw OperationCancelled(operation);
    }
  }

private:
  std::atomic<bool> cancelled_{false};
};

} // namespace utils
} // namespace bv

#endif // BV_UTILS_CANCELLATION_HPP
