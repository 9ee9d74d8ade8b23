#include "artcache/util/thread-pool.hh"
#include "artcache/util/logging.hh"

#include <cassert>

namespace artcache {

ThreadPool::ThreadPool(size_t _maxThreads, std::string name)
    : maxThreads(_maxThreads)
    , name(std::move(name))
{
    if (!maxThreads) {
        maxThreads = std::thread::hardware_concurrency();
        if (!maxThreads)
            maxThreads = 1;
    }

    debug("starting %s with up to %d threads", this->name, maxThreads);
}

ThreadPool::~ThreadPool()
{
    try {
        shutdown();
    } catch (...) {
        ignoreExceptionInDestructor();
    }
}

void ThreadPool::shutdown()
{
    std::vector<std::thread> workers;
    {
        auto state(state_.lock());
        state->quit = true;
        std::swap(workers, state->workers);
    }

    if (workers.empty())
        return;

    debug("reaping %d worker threads of %s", workers.size(), name);

    work.notify_all();

    for (auto & thr : workers)
        thr.join();
}

void ThreadPool::enqueue(work_t t)
{
    auto state(state_.lock());
    if (state->quit)
        throw ThreadPoolShutDown("cannot enqueue a work item while %s is shutting down", name);
    state->pending.push(std::move(t));
    auto busy = state->active;
    auto available = state->workers.size() - std::min(busy, state->workers.size());
    if (state->pending.size() > available && state->workers.size() < maxThreads)
        state->workers.emplace_back(&ThreadPool::doWork, this);
    work.notify_one();
}

void ThreadPool::process()
{
    std::exception_ptr exc;
    {
        auto state(state_.lock());
        while (state->active || !state->pending.empty()) {
            /* Items queued after shutdown() reaped the workers would
               never run. */
            if (state->workers.empty() && state->quit)
                break;
            state.wait(idle);
        }
        std::swap(exc, state->exception);
    }
    if (exc)
        std::rethrow_exception(exc);
}

void ThreadPool::doWork()
{
    bool didWork = false;
    std::exception_ptr exc;

    while (true) {
        work_t w;
        {
            auto state(state_.lock());

            if (didWork) {
                assert(state->active);
                state->active--;

                if (exc) {
                    if (!state->exception)
                        state->exception = exc;
                    else {
                        /* Log the exception, since we can't
                           propagate it. */
                        try {
                            std::rethrow_exception(exc);
                        } catch (std::exception & e) {
                            printError("error in %s: %s", name, e.what());
                        }
                    }
                    exc = nullptr;
                }

                if (!state->active && state->pending.empty())
                    idle.notify_all();
            }

            /* Wait until a work item is available or we're asked to
               quit. Queued items are still run after quitting. */
            while (state->pending.empty()) {
                if (state->quit)
                    return;
                state.wait(work);
            }

            w = std::move(state->pending.front());
            state->pending.pop();
            state->active++;
        }

        try {
            w();
        } catch (...) {
            exc = std::current_exception();
        }

        didWork = true;
    }
}

} // namespace artcache
