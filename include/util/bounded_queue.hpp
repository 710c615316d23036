#pragma once
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <utility>

namespace util {

// Blocking FIFO with a fixed capacity. push() waits while full, pop() waits
// while empty. close() lets consumers drain what is queued; abort() wakes
// everybody and drops the backlog.
template <typename T>
class BoundedQueue {
public:
  explicit BoundedQueue(size_t capacity) : cap_(capacity ? capacity : 1) {}

  BoundedQueue(const BoundedQueue&) = delete;
  BoundedQueue& operator=(const BoundedQueue&) = delete;

  bool push(T item){
    std::unique_lock<std::mutex> lk(mtx_);
    not_full_.wait(lk, [&]{ return aborted_ || closed_ || q_.size() < cap_; });
    if (aborted_ || closed_) return false;
    q_.push_back(std::move(item));
    not_empty_.notify_one();
    return true;
  }

  bool pop(T& out){
    std::unique_lock<std::mutex> lk(mtx_);
    not_empty_.wait(lk, [&]{ return aborted_ || closed_ || !q_.empty(); });
    if (aborted_ || q_.empty()) return false;
    out = std::move(q_.front());
    q_.pop_front();
    not_full_.notify_one();
    return true;
  }

  void close(){
    std::lock_guard<std::mutex> lk(mtx_);
    closed_ = true;
    not_empty_.notify_all();
    not_full_.notify_all();
  }

  void abort(){
    std::lock_guard<std::mutex> lk(mtx_);
    aborted_ = true;
    q_.clear();
    not_empty_.notify_all();
    not_full_.notify_all();
  }

  size_t size() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return q_.size();
  }

private:
  const size_t cap_;
  mutable std::mutex mtx_;
  std::condition_variable not_full_;
  std::condition_variable not_empty_;
  std::deque<T> q_;
  bool closed_ = false;
  bool aborted_ = false;
};

}
