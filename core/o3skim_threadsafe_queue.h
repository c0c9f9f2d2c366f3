#ifndef o3skim_threadsafe_queue_h
#define o3skim_threadsafe_queue_h

/// @file

#include <mutex>
#include <queue>

/// A mutex protected FIFO used to hand tasks to the threads of a pool.
template<typename T>
class o3skim_threadsafe_queue
{
public:
    o3skim_threadsafe_queue() = default;
    o3skim_threadsafe_queue(const o3skim_threadsafe_queue<T> &) = delete;
    void operator=(const o3skim_threadsafe_queue<T> &) = delete;

    /// push a value onto the back of the queue
    void push(T &&val)
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_queue.push(std::move(val));
    }

    /** move the value at the front of the queue into val. returns false
     * without blocking when the queue is empty.
     */
    bool try_pop(T &val)
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_queue.empty())
            return false;
        val = std::move(m_queue.front());
        m_queue.pop();
        return true;
    }

private:
    std::mutex m_mutex;
    std::queue<T> m_queue;
};

#endif
