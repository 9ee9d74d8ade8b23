#pragma once
///@file

#include <cassert>
#include <functional>
#include <limits>
#include <list>
#include <memory>

#include "artcache/util/ref.hh"
#include "artcache/util/sync.hh"

namespace artcache {

/**
 * This template class implements a simple pool manager of resources
 * of some type R, such as connections. It is used as follows:
 *
 *   class Connection { ... };
 *
 *   Pool<Connection> pool;
 *
 *   {
 *     auto conn(pool.get());
 *     conn->exec("select ...");
 *   }
 *
 * Here, the Connection object referenced by ‘conn’ is automatically
 * returned to the pool when ‘conn’ goes out of scope. A resource that
 * is left in an unknown state should be flagged with `markBad()`, in
 * which case it is destroyed instead.
 */
template<class R>
class Pool
{
public:

    /**
     * A function that produces new instances of R on demand.
     */
    typedef std::function<ref<R>()> Factory;

private:

    Factory factory;

    /**
     * The maximum number of resources that may be idle in the pool at
     * once. Surplus resources are destroyed when they are released.
     */
    size_t maxIdle;

    struct State
    {
        /**
         * The number of resources currently handed out.
         */
        size_t inUse = 0;

        /**
         * Resources available for reuse.
         */
        std::list<ref<R>> idle;
    };

    Sync<State> state;

public:

    Pool(
        size_t maxIdle = std::numeric_limits<size_t>::max(),
        const Factory & factory = []() { return make_ref<R>(); })
        : factory(factory)
        , maxIdle(maxIdle)
    {
    }

    ~Pool()
    {
        auto state_(state.lock());
        assert(!state_->inUse);
        state_->idle.clear();
    }

    class Handle
    {
    private:
        Pool & pool;
        std::shared_ptr<R> r;
        bool bad = false;

        friend Pool;

        Handle(Pool & pool, std::shared_ptr<R> r)
            : pool(pool)
            , r(r)
        {
        }

    public:
        Handle(Handle && h)
            : pool(h.pool)
            , r(h.r)
            , bad(h.bad)
        {
            h.r.reset();
        }

        Handle(const Handle & l) = delete;

        ~Handle()
        {
            if (!r)
                return;
            auto state_(pool.state.lock());
            if (!bad && state_->idle.size() < pool.maxIdle)
                state_->idle.push_back(ref<R>(r));
            assert(state_->inUse);
            state_->inUse--;
        }

        R * operator->()
        {
            return &*r;
        }

        R & operator*()
        {
            return *r;
        }

        void markBad()
        {
            bad = true;
        }
    };

    Handle get()
    {
        {
            auto state_(state.lock());
            state_->inUse++;
            if (!state_->idle.empty()) {
                auto p = state_->idle.back();
                state_->idle.pop_back();
                return Handle(*this, p);
            }
        }

        /* Note: we don't hold the lock while creating a new instance,
           because creation might take a long time. */
        try {
            return Handle(*this, factory());
        } catch (...) {
            state.lock()->inUse--;
            throw;
        }
    }

    size_t count()
    {
        auto state_(state.lock());
        return state_->idle.size() + state_->inUse;
    }
};

} // namespace artcache
