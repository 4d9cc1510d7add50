// File Description
// Author: Philip Salvaggio

#ifndef WAIT_QUEUE_HPP
#define WAIT_QUEUE_HPP

#include "wait_queue.h"

#include <utility>

namespace apsim {

template<typename T>
WaitQueue<T>::WaitQueue() : queue_(), mutex_(), not_empty_(), closed_(false) {}

template<typename T>
void WaitQueue<T>::push(T* val) {
  std::unique_ptr<T> ptr(val);
  {
    std::lock_guard<std::mutex> lock(mutex_);
    queue_.push(std::move(ptr));
  }
  not_empty_.notify_one();
}

template<typename T>
bool WaitQueue<T>::empty() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return queue_.empty();
}

template<typename T>
size_t WaitQueue<T>::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return queue_.size();
}

template<typename T>
std::unique_ptr<T> WaitQueue<T>::wait() {
  std::unique_lock<std::mutex> lock(mutex_);
  not_empty_.wait(lock, [this] { return closed_ || !queue_.empty(); });

  if (queue_.empty()) return nullptr;

  std::unique_ptr<T> ptr(std::move(queue_.front()));
  queue_.pop();
  return ptr;
}

template<typename T>
std::vector<std::unique_ptr<T>> WaitQueue<T>::drain() {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<std::unique_ptr<T>> elements;
  while (!queue_.empty()) {
    elements.push_back(std::move(queue_.front()));
    queue_.pop();
  }
  return elements;
}

template<typename T>
void WaitQueue<T>::close() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    closed_ = true;
  }
  not_empty_.notify_all();
}

}

#endif  // WAIT_QUEUE_HPP
