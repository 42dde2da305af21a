#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <utility>

namespace copypasta::client
{

    // Multi-producer, multi-consumer FIFO. A capacity of zero means unbounded.
    // After close() pushes fail and pop() drains what is left, then returns
    // std::nullopt.
    template <typename T>
    class BlockingQueue
    {
    public:
        explicit BlockingQueue(std::size_t capacity = 0)
            : capacity_(capacity) {}

        BlockingQueue(const BlockingQueue &) = delete;
        BlockingQueue &operator=(const BlockingQueue &) = delete;

        bool push(T value)
        {
            std::unique_lock lock(mutex_);
            not_full_.wait(lock, [this]
                           { return closed_ || !full(); });
            if (closed_)
            {
                return false;
            }
            items_.push_back(std::move(value));
            not_empty_.notify_one();
            return true;
        }

        bool try_push(T value)
        {
            std::lock_guard lock(mutex_);
            if (closed_ || full())
            {
                return false;
            }
            items_.push_back(std::move(value));
            not_empty_.notify_one();
            return true;
        }

        std::optional<T> pop()
        {
            std::unique_lock lock(mutex_);
            not_empty_.wait(lock, [this]
                            { return closed_ || !items_.empty(); });
            if (items_.empty())
            {
                return std::nullopt;
            }
            T value = std::move(items_.front());
            items_.pop_front();
            not_full_.notify_one();
            return value;
        }

        void close()
        {
            std::lock_guard lock(mutex_);
            closed_ = true;
            not_empty_.notify_all();
            not_full_.notify_all();
        }

        bool closed() const
        {
            std::lock_guard lock(mutex_);
            return closed_;
        }

        std::size_t size() const
        {
            std::lock_guard lock(mutex_);
            return items_.size();
        }

    private:
        bool full() const
        {
            return capacity_ != 0 && items_.size() >= capacity_;
        }

        const std::size_t capacity_;
        mutable std::mutex mutex_;
        std::condition_variable not_empty_;
        std::condition_variable not_full_;
        std::deque<T> items_;
        bool closed_{false};
    };

} // namespace copypasta::client
