// A thread-safe FIFO that lets a consumer block until work arrives.
// Author: Philip Salvaggio

#ifndef WAIT_QUEUE_H
#define WAIT_QUEUE_H

#include <condition_variable>
#include <memory>
#include <mutex>
#include <queue>
#include <vector>

namespace apsim {

template<typename T>
class WaitQueue {
 public:
  WaitQueue();
  WaitQueue(const WaitQueue& other) = delete;
  WaitQueue& operator=(const WaitQueue& other) = delete;

  // Push a value onto the queue. The queue assumes ownership of val.
  void push(T* val);

  bool empty() const;
  size_t size() const;

  // Block until an element is available and pop it. Returns nullptr once the
  // queue is closed and empty.
  std::unique_ptr<T> wait();

  // Pop every element that is currently queued, oldest first, without
  // blocking.
  std::vector<std::unique_ptr<T>> drain();

  // Wake up all waiters. Elements still queued can be popped, but wait() no
  // longer blocks once the queue is empty.
  void close();

 private:
  std::queue<std::unique_ptr<T>> queue_;
  mutable std::mutex mutex_;
  std::condition_variable not_empty_;
  bool closed_;
};

}

#include "wait_queue.hpp"

#endif  // WAIT_QUEUE_H
