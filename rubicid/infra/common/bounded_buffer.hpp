// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <utility>

#include <boost/circular_buffer.hpp>
#include <boost/thread/condition_variable.hpp>
#include <boost/thread/mutex.hpp>

namespace rubicid {

/**
 * @class BoundedBuffer
 * @brief A thread-safe bounded FIFO hand-off between producer and consumer threads.
 * Producers block in push_front while the buffer is full, consumers block in pop_back while it is empty.
 * terminate_and_release_all wakes every waiter: afterwards push_front drops its item and pop_back returns false.
 * @tparam T The type of items stored in the buffer.
 */
template <class T>
class BoundedBuffer {
  public:
    using size_type = typename boost::circular_buffer<T>::size_type;
    using value_type = typename boost::circular_buffer<T>::value_type;

    explicit BoundedBuffer(size_type capacity) : capacity_{capacity}, container_(capacity) {}

    BoundedBuffer(const BoundedBuffer&) = delete;
    BoundedBuffer& operator=(const BoundedBuffer&) = delete;

    //! \brief Enqueue one item waiting for free space
    //! \return false if the buffer has been terminated and the item was not enqueued
    bool push_front(value_type&& item) {
        boost::unique_lock<boost::mutex> lock(mutex_);
        not_full_.wait(lock, [&] { return stop_ || is_not_full(); });
        if (stop_) {
            return false;
        }
        container_.push_front(std::move(item));
        ++unread_;
        lock.unlock();
        not_empty_.notify_one();
        return true;
    }

    //! \brief Dequeue the oldest item waiting for one to be available
    //! \return false if the buffer has been terminated, in which case item is left untouched
    bool pop_back(value_type* item) {
        boost::unique_lock<boost::mutex> lock(mutex_);
        not_empty_.wait(lock, [&] { return stop_ || is_not_empty(); });
        if (stop_) {
            return false;
        }
        *item = std::move(container_[--unread_]);
        lock.unlock();
        not_full_.notify_one();
        return true;
    }

    void terminate_and_release_all() {
        boost::unique_lock<boost::mutex> lock(mutex_);
        stop_ = true;
        lock.unlock();
        not_empty_.notify_all();
        not_full_.notify_all();
    }

    bool is_stopped() const {
        boost::unique_lock<boost::mutex> lock(mutex_);
        return stop_;
    }

    size_type size() const {
        boost::unique_lock<boost::mutex> lock(mutex_);
        return unread_;
    }

    size_type capacity() const { return capacity_; }

  private:
    bool is_not_empty() const { return unread_ > 0; }
    bool is_not_full() const { return unread_ < capacity_; }

    bool stop_{false};
    size_type capacity_;
    size_type unread_{0};
    boost::circular_buffer<T> container_;
    mutable boost::mutex mutex_;
    boost::condition_variable not_empty_;
    boost::condition_variable not_full_;
};

}  // namespace rubicid
