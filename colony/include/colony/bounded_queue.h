/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>

namespace colony
{
    enum class overflow_policy
    {
        drop_oldest, // evict the head to make room
        drop_newest  // refuse the incoming item
    };

    // Mutex guarded FIFO with a hard capacity. Never blocks the producer.
    template<class T> class bounded_queue
    {
    public:
        explicit bounded_queue(size_t capacity, overflow_policy policy = overflow_policy::drop_oldest)
            : capacity_(capacity == 0 ? 1 : capacity)
            , policy_(policy)
        {
        }

        bounded_queue(const bounded_queue&) = delete;
        bounded_queue& operator=(const bounded_queue&) = delete;

        // Returns false when an item was lost to the overflow policy
        bool push(T item)
        {
            std::scoped_lock lock(mutex_);
            if (items_.size() < capacity_)
            {
                items_.push_back(std::move(item));
                return true;
            }

            ++dropped_;
            if (policy_ == overflow_policy::drop_oldest)
            {
                items_.pop_front();
                items_.push_back(std::move(item));
            }
            return false;
        }

        std::optional<T> try_pop()
        {
            std::scoped_lock lock(mutex_);
            if (items_.empty())
                return std::nullopt;
            T item = std::move(items_.front());
            items_.pop_front();
            return item;
        }

        size_t size() const
        {
            std::scoped_lock lock(mutex_);
            return items_.size();
        }

        bool empty() const { return size() == 0; }

        void clear()
        {
            std::scoped_lock lock(mutex_);
            items_.clear();
        }

        uint64_t dropped_count() const
        {
            std::scoped_lock lock(mutex_);
            return dropped_;
        }

        size_t capacity() const { return capacity_; }
        overflow_policy policy() const { return policy_; }

    private:
        mutable std::mutex mutex_;
        std::deque<T> items_;
        const size_t capacity_;
        const overflow_policy policy_;
        uint64_t dropped_ = 0;
    };
}
