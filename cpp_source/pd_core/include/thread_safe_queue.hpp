#pragma once

#include <atomic>
#include <boost/circular_buffer.hpp>
#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <utility>

/**
 * @brief A bounded thread-safe queue for handing work between threads.
 *
 * Backed by a fixed-capacity boost::circular_buffer. Producers either block
 * while the queue is full or overwrite the oldest element, depending on
 * dropOldest. Closing the queue wakes every waiter; consumers keep draining
 * what is left and then see wait_and_pop() return false.
 *
 * @tparam T The type of elements stored in the queue.
 */
template <typename T> class ThreadQueue {
public:
  /**
   * @brief Constructs a new ThreadQueue object.
   *
   * @param maxSize    Capacity of the underlying circular buffer.
   * @param dropOldest If true, a push into a full queue overwrites the oldest
   *                   element instead of blocking.
   */
  explicit ThreadQueue(size_t maxSize = 1000, bool dropOldest = false)
      : m_queue(maxSize), m_dropOldest(dropOldest) {}

  ~ThreadQueue() = default;

  /**
   * @brief Pushes an element into the queue.
   *
   * Blocks while the queue is full unless dropOldest is set.
   *
   * @param value The element to be pushed.
   * @return false if the queue was closed and the element was not queued.
   */
  bool push(T value) {
    std::unique_lock<std::mutex> lock(m_mutex);

    if (!m_dropOldest) {
      m_notFull.wait(lock, [this] { return m_closed || !m_queue.full(); });
    }
    if (m_closed)
      return false;

    if (m_queue.full()) {
      ++dropped_count_;
    }

    m_queue.push_back(std::move(value));
    m_notEmpty.notify_one();
    return true;
  }

  /**
   * @brief Attempts to pop an element from the queue without blocking.
   *
   * @param result Reference to store the popped element.
   * @return true if an element was popped; false if the queue was empty.
   */
  bool try_pop(T &result) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_queue.empty())
      return false;
    result = std::move(m_queue.front());
    m_queue.pop_front();
    m_notFull.notify_one();
    return true;
  }

  /**
   * @brief Waits until an element is available and then pops it.
   *
   * @param result Reference to store the popped element.
   * @return false once the queue is closed and fully drained.
   */
  bool wait_and_pop(T &result) {
    std::unique_lock<std::mutex> lock(m_mutex);

    m_notEmpty.wait(lock, [this] { return m_closed || !m_queue.empty(); });
    if (m_queue.empty())
      return false; // closed and drained

    result = std::move(m_queue.front());
    m_queue.pop_front();
    m_notFull.notify_one();
    return true;
  }

  /**
   * @brief Stops accepting new elements and wakes every waiting thread.
   */
  void close() {
    {
      std::lock_guard<std::mutex> lock(m_mutex);
      m_closed = true;
    }
    m_notEmpty.notify_all();
    m_notFull.notify_all();
  }

  bool closed() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_closed;
  }

  bool empty() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_queue.empty();
  }

  /**
   * @brief Returns the number of elements dropped due to queue overflow.
   */
  size_t get_dropped_count() const noexcept { return dropped_count_.load(); }

  size_t size() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_queue.size();
  }

private:
  boost::circular_buffer<T> m_queue; ///< Underlying circular queue
  mutable std::mutex m_mutex;        ///< Mutex to protect the queue
  std::condition_variable m_notEmpty;
  std::condition_variable m_notFull;
  bool m_dropOldest = false; ///< Overwrite the oldest element when full
  bool m_closed = false;
  std::atomic<size_t> dropped_count_{0}; ///< Count of dropped elements
};
