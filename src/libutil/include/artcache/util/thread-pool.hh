#pragma once
///@file

#include "artcache/util/error.hh"
#include "artcache/util/sync.hh"

#include <condition_variable>
#include <functional>
#include <queue>
#include <string>
#include <thread>
#include <vector>

namespace artcache {

MakeError(ThreadPoolShutDown, Error);

/**
 * A long-lived thread pool that executes a queue of work items
 * (lambdas) in the background. Worker threads are started on demand,
 * up to `maxThreads`.
 */
class ThreadPool
{
public:

    ThreadPool(size_t maxThreads = 0, std::string name = "thread pool");

    ~ThreadPool();

    /**
     * An individual work item.
     */
    typedef std::function<void()> work_t;

    /**
     * Enqueue a function to be executed by the thread pool.
     *
     * @throws ThreadPoolShutDown if `shutdown()` has been called.
     */
    void enqueue(work_t t);

    /**
     * Wait until no work items are pending or active.
     *
     * \note Work items are allowed to add new items to the queue; this
     * waits for those too.
     *
     * If a work item threw an exception since the last call, it is
     * rethrown here. If several did, only the first is propagated;
     * the others have already been logged.
     */
    void process();

    /**
     * Stop accepting new work, finish the items already queued, and
     * join the worker threads. Idempotent.
     */
    void shutdown();

    size_t getMaxThreads() const
    {
        return maxThreads;
    }

private:

    size_t maxThreads;

    std::string name;

    struct State
    {
        std::queue<work_t> pending;
        size_t active = 0;
        std::exception_ptr exception;
        std::vector<std::thread> workers;
        bool quit = false;
    };

    Sync<State> state_;

    /**
     * Signalled when work is added or the pool is shutting down.
     */
    std::condition_variable work;

    /**
     * Signalled when the pool runs out of pending and active work.
     */
    std::condition_variable idle;

    void doWork();
};

} // namespace artcache
