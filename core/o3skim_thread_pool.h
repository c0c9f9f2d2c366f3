#ifndef o3skim_thread_pool_h
#define o3skim_thread_pool_h

/// @file

#include "o3skim_config.h"
#include "o3skim_common.h"
#include "o3skim_threadsafe_queue.h"

#include <vector>
#include <thread>
#include <atomic>
#include <future>
#include <memory>
#include <algorithm>

template <typename task_t, typename data_t>
class o3skim_thread_pool;

template <typename task_t, typename data_t>
using p_o3skim_thread_pool = std::shared_ptr<o3skim_thread_pool<task_t, data_t>>;

/** A class to manage a fixed size pool of threads that dispatch work. Tasks
 * are std::packaged_task like objects, callable with no arguments and
 * providing get_future. Results are gathered in the order the tasks were
 * pushed.
 */
template <typename task_t, typename data_t>
class o3skim_thread_pool
{
public:
    o3skim_thread_pool() = delete;

    /** construct/destruct the thread pool.
     *
     * @param[in] n        number of threads to create for the pool. -1 will
     *                     create 1 thread per hardware thread.
     * @param[in] verbose  report the number of threads created
     */
    o3skim_thread_pool(int n, bool verbose);
    ~o3skim_thread_pool() noexcept;

    o3skim_thread_pool(const o3skim_thread_pool &) = delete;
    void operator=(const o3skim_thread_pool &) = delete;

    /// add a task to the queue
    void push_task(task_t &task);

    /** wait for all of the tasks to execute and transfer the results in the
     * order that corresponding tasks were added to the queue.
     */
    template <template <typename ... > class container_t, typename ... args>
    void wait_all(container_t<data_t, args ...> &data);

    /// get the number of threads
    unsigned int size() const noexcept
    { return m_threads.size(); }

private:
    /// create n threads for the pool
    void create_threads(int n_threads, bool verbose);

private:
    std::atomic<bool> m_live;
    o3skim_threadsafe_queue<task_t> m_queue;
    std::vector<std::future<data_t>> m_futures;
    std::vector<std::thread> m_threads;
};

// --------------------------------------------------------------------------
template <typename task_t, typename data_t>
o3skim_thread_pool<task_t, data_t>::o3skim_thread_pool(int n, bool verbose)
    : m_live(true)
{
    this->create_threads(n, verbose);
}

// --------------------------------------------------------------------------
template <typename task_t, typename data_t>
void o3skim_thread_pool<task_t, data_t>::create_threads(int n_requested,
    bool verbose)
{
    int n_threads = n_requested;
    if (n_threads < 1)
    {
        n_threads = std::thread::hardware_concurrency();
        if (n_threads < 1)
        {
            O3SKIM_WARNING("Cannot automatically detect threading parameters "
                "on this platform. The default is 1 thread per process.")
            n_threads = 1;
        }
    }

    if (verbose)
    {
        O3SKIM_STATUS("Creating a pool of " << n_threads << " threads")
    }

    for (int i = 0; i < n_threads; ++i)
    {
        m_threads.push_back(std::thread([this]()
        {
            // "main" for each thread in the pool
            while (m_live.load())
            {
                task_t task;
                if (m_queue.try_pop(task))
                    task();
                else
                    std::this_thread::yield();
            }
        }));
    }
}

// --------------------------------------------------------------------------
template <typename task_t, typename data_t>
o3skim_thread_pool<task_t, data_t>::~o3skim_thread_pool() noexcept
{
    m_live = false;
    std::for_each(m_threads.begin(), m_threads.end(),
        [](std::thread &t) { t.join(); });
}

// --------------------------------------------------------------------------
template <typename task_t, typename data_t>
void o3skim_thread_pool<task_t, data_t>::push_task(task_t &task)
{
    m_futures.push_back(task.get_future());
    m_queue.push(std::move(task));
}

// --------------------------------------------------------------------------
template <typename task_t, typename data_t>
template <template <typename ... > class container_t, typename ... args>
void o3skim_thread_pool<task_t, data_t>::wait_all(
    container_t<data_t, args ...> &data)
{
    // wait on all pending tasks and gather the results
    std::for_each(m_futures.begin(), m_futures.end(),
        [&data] (std::future<data_t> &f)
        {
            data.push_back(f.get());
        });
    m_futures.clear();
}

#endif
