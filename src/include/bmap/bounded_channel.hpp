#pragma once
/**
 * @file bounded_channel.hpp
 * @brief A fixed-capacity FIFO between one producer and one consumer thread.
 *
 * `push()` blocks while the channel is full, `pop()` blocks while it is empty.
 * `close()` wakes both sides: later pushes fail, pops drain what is left and then
 * return nullopt.
 */
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <stdexcept>

namespace bmapcopy::bmap
{

template <typename T> class BoundedChannel
{
  public:
    explicit BoundedChannel(size_t capacity) : m_capacity(capacity)
    {
        if (capacity == 0)
        {
            throw std::invalid_argument("BoundedChannel capacity must be at least 1");
        }
    }

    BoundedChannel(const BoundedChannel &) = delete;
    BoundedChannel &operator=(const BoundedChannel &) = delete;

    /** @return false if the channel was closed before the item could be queued. */
    bool push(T item)
    {
        std::unique_lock<std::mutex> lock(m_mutex);
        m_not_full.wait(lock, [this] { return m_closed || m_queue.size() < m_capacity; });
        if (m_closed)
        {
            return false;
        }
        m_queue.push_back(std::move(item));
        if (m_queue.size() > m_high_water)
        {
            m_high_water = m_queue.size();
        }
        lock.unlock();
        m_not_empty.notify_one();
        return true;
    }

    /** @return the oldest item, or nullopt once the channel is closed and drained. */
    std::optional<T> pop()
    {
        std::unique_lock<std::mutex> lock(m_mutex);
        m_not_empty.wait(lock, [this] { return m_closed || !m_queue.empty(); });
        if (m_queue.empty())
        {
            return std::nullopt;
        }
        T item = std::move(m_queue.front());
        m_queue.pop_front();
        lock.unlock();
        m_not_full.notify_one();
        return item;
    }

    void close()
    {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_closed = true;
        }
        m_not_full.notify_all();
        m_not_empty.notify_all();
    }

    [[nodiscard]] size_t capacity() const noexcept { return m_capacity; }

    [[nodiscard]] size_t size() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_queue.size();
    }

    /** @brief Largest number of items ever queued at once. */
    [[nodiscard]] size_t high_water_mark() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_high_water;
    }

  private:
    const size_t m_capacity;
    mutable std::mutex m_mutex;
    std::condition_variable m_not_full;
    std::condition_variable m_not_empty;
    std::deque<T> m_queue;
    size_t m_high_water = 0;
    bool m_closed = false;
};

} // namespace bmapcopy::bmap
