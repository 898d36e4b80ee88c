/*
 * A C++ object pool for expensive-to-construct values shared by many
 * concurrent callers. Items are borrowed through move-only handles, returned
 * explicitly or on scope exit, and can be discarded when found unusable.
 * An optional admission gate bounds the number of items on loan at once.
 *
 * Created: Oct 2026
 * License: BSD license
 *
 */

#pragma once

//------------------------------------------------------------------------------
// Includes
//------------------------------------------------------------------------------

#include <boost/smart_ptr/intrusive_ptr.hpp>
#include <boost/smart_ptr/intrusive_ref_counter.hpp>
#include <boost/throw_exception.hpp>

#include <atomic>
#include <cassert>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace borrowpool {
//------------------------------------------------------------------------------
// Constants
//------------------------------------------------------------------------------

#define BORROW_POOL_NO_MAX_SIZE (0)

#ifndef BORROW_POOL_DEBUG_CHECKS
// if you define BORROW_POOL_DEBUG_CHECKS=1 before including this header file,
// you will activate assert-based checks on the pool bookkeeping and on misuse of
// borrowed_item handles; this is useful during e.g. debug builds
#define BORROW_POOL_DEBUG_CHECKS (0)
#endif

//------------------------------------------------------------------------------
// config_error
// Thrown by the borrow_pool constructors on invalid configuration.
//------------------------------------------------------------------------------

class config_error : public std::invalid_argument {
public:
    explicit config_error(const std::string& what)
        : std::invalid_argument(what)
    {
    }
};

//------------------------------------------------------------------------------
// pool_options
// Construction-time configuration of a borrow_pool.
//------------------------------------------------------------------------------

struct pool_options {
    pool_options()
        : initial(0)
        , max(BORROW_POOL_NO_MAX_SIZE)
        , enable_count(false)
    {
    }
    pool_options(size_t initial_size, size_t max_size, bool count = false)
        : initial(initial_size)
        , max(max_size)
        , enable_count(count)
    {
    }

    // Number of items created and placed in the pool before the constructor returns.
    size_t initial;

    // Maximum number of items that can be on loan at the same time.
    // BORROW_POOL_NO_MAX_SIZE means that borrow() never blocks.
    // Items sitting unused in the pool do not count against this limit.
    size_t max;

    // Enables idle_count() and on_loan_count(). Costs two atomic updates per borrow.
    bool enable_count;
};

//------------------------------------------------------------------------------
// admission_gate
// Weighted semaphore bounding how many items can be on loan at once.
//------------------------------------------------------------------------------

class admission_gate {
public:
    explicit admission_gate(size_t weight)
        : m_weight(weight)
        , m_in_use(0)
    {
        assert(weight > 0);
    }

    admission_gate(const admission_gate& other) = delete;
    admission_gate& operator=(const admission_gate& other) = delete;

    // Blocks until a permit is available. No fairness among waiters.
    void acquire()
    {
        std::unique_lock<std::mutex> lock(m_mutex);
        m_cond.wait(lock, [this] { return m_in_use < m_weight; });
        m_in_use++;
    }

    bool try_acquire()
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_in_use >= m_weight)
            return false;
        m_in_use++;
        return true;
    }

    // Returns false, without taking a permit, if none became free before the deadline.
    template <class Clock, class Duration>
    bool try_acquire_until(const std::chrono::time_point<Clock, Duration>& deadline)
    {
        std::unique_lock<std::mutex> lock(m_mutex);
        if (!m_cond.wait_until(lock, deadline, [this] { return m_in_use < m_weight; }))
            return false;
        m_in_use++;
        return true;
    }

    template <class Rep, class Period> bool try_acquire_for(const std::chrono::duration<Rep, Period>& timeout)
    {
        return try_acquire_until(std::chrono::steady_clock::now() + timeout);
    }

    void release()
    {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            assert(m_in_use > 0); // releasing a permit that was never acquired?
            m_in_use--;
        }
        m_cond.notify_one();
    }

    size_t weight() const { return m_weight; }

    size_t in_use() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_in_use;
    }

private:
    const size_t m_weight;
    size_t m_in_use;

    mutable std::mutex m_mutex;
    std::condition_variable m_cond;
};

//------------------------------------------------------------------------------
// live_counter
// Optional accounting of items in existence and items on loan.
//------------------------------------------------------------------------------

class live_counter {
public:
    explicit live_counter(bool enabled)
        : m_enabled(enabled)
        , m_live(0)
        , m_borrowed(0)
    {
    }

    live_counter(const live_counter& other) = delete;
    live_counter& operator=(const live_counter& other) = delete;

    bool is_enabled() const { return m_enabled; }

    void on_item_created()
    {
        if (m_enabled)
            m_live.fetch_add(1);
    }
    void on_item_destroyed()
    {
        if (m_enabled)
            m_live.fetch_sub(1);
    }
    void on_borrow()
    {
        if (m_enabled)
            m_borrowed.fetch_add(1);
    }
    void on_return()
    {
        if (m_enabled)
            m_borrowed.fetch_sub(1);
    }

    // Items that exist, either idle in the pool or on loan.
    size_t live_count() const { return m_enabled ? m_live.load() : 0; }

    size_t on_loan_count() const { return m_enabled ? m_borrowed.load() : 0; }

    // Under concurrent borrow/return the two loads are not a consistent snapshot:
    // the result is exact only when the pool is quiescent.
    size_t idle_count() const
    {
        if (!m_enabled)
            return 0;
        size_t borrowed = m_borrowed.load();
        size_t live = m_live.load();
        return (live > borrowed) ? live - borrowed : 0;
    }

private:
    const bool m_enabled;
    std::atomic<size_t> m_live;
    std::atomic<size_t> m_borrowed;
};

//------------------------------------------------------------------------------
// free_list
// Intrusive LIFO list of nodes, protected by a mutex. Owns the nodes it holds.
//------------------------------------------------------------------------------

template <typename Node> class free_list {
public:
    free_list()
        : m_first_free(nullptr)
        , m_free_count(0)
    {
    }
    ~free_list() { clear(); }

    free_list(const free_list& other) = delete;
    free_list& operator=(const free_list& other) = delete;

    void push(Node* node)
    {
        assert(node && node->_get_next() == nullptr); // pushing a node that is already linked?

        std::lock_guard<std::mutex> lock(m_mutex);
        node->_set_next(m_first_free);
        m_first_free = node;
        m_free_count++;
    }

    // Returns nullptr when the list is empty.
    Node* pop()
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        Node* node = m_first_free;
        if (!node)
            return nullptr;

        m_first_free = node->_get_next();
        m_free_count--;

        // unlink the node to return
        node->_set_next(nullptr);
        return node;
    }

    // Deletes all nodes. The destructors run outside the lock.
    void clear()
    {
        Node* pcurr = nullptr;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            pcurr = m_first_free;
            m_first_free = nullptr;
            m_free_count = 0;
        }
        while (pcurr) {
            Node* pnext = pcurr->_get_next();
            delete pcurr;
            pcurr = pnext;
        }
    }

    size_t size() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_free_count;
    }

    void check() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        size_t n = 0;
        for (const Node* pcurr = m_first_free; pcurr; pcurr = pcurr->_get_next())
            n++;
        assert(n == m_free_count);
    }

private:
    Node* m_first_free;
    size_t m_free_count;
    mutable std::mutex m_mutex;
};

//------------------------------------------------------------------------------
// pool_item_node
// Owns one pooled value. The node lifetime is the item lifetime, so the
// live count is updated here rather than by the pool.
//------------------------------------------------------------------------------

template <typename T> class pool_item_node {
public:
    pool_item_node(T&& item, live_counter& counter)
        : m_item(std::move(item))
        , m_next(nullptr)
        , m_counter(counter)
    {
        m_counter.on_item_created();
    }
    ~pool_item_node() { m_counter.on_item_destroyed(); }

    pool_item_node(const pool_item_node& other) = delete;
    pool_item_node& operator=(const pool_item_node& other) = delete;

    T& item() { return m_item; }
    const T& item() const { return m_item; }

    pool_item_node* _get_next() const { return m_next; }
    void _set_next(pool_item_node* p) { m_next = p; }

private:
    T m_item;
    pool_item_node* m_next; // free-list link, nullptr while on loan
    live_counter& m_counter;
};

//------------------------------------------------------------------------------
// pool_handle_node
// The recyclable state of one loan: the item and its validity flag.
//------------------------------------------------------------------------------

template <typename T> class pool_handle_node {
public:
    pool_handle_node()
        : m_item(nullptr)
        , m_invalid(false)
        , m_next(nullptr)
    {
    }

    pool_handle_node(const pool_handle_node& other) = delete;
    pool_handle_node& operator=(const pool_handle_node& other) = delete;

    pool_item_node<T>* _get_item() const { return m_item; }
    void _set_item(pool_item_node<T>* item)
    {
        m_item = item;
        m_invalid = false;
    }

    void mark_as_invalid() { m_invalid = true; }
    bool is_invalid() const { return m_invalid; }

    // restores the blank state of a handle sitting in the recycler
    void reset()
    {
        m_item = nullptr;
        m_invalid = false;
    }

    pool_handle_node* _get_next() const { return m_next; }
    void _set_next(pool_handle_node* p) { m_next = p; }

private:
    pool_item_node<T>* m_item;
    bool m_invalid;
    pool_handle_node* m_next;
};

//------------------------------------------------------------------------------
// handle_recycler
// Free list of handle nodes, so that a borrow does not malloc a new handle
// once the pool has warmed up.
//------------------------------------------------------------------------------

template <typename T> class handle_recycler {
public:
    // Returns a recycled handle, or allocates one if none is available.
    pool_handle_node<T>* get()
    {
        pool_handle_node<T>* handle = m_free.pop();
        if (!handle)
            handle = new pool_handle_node<T>();
        return handle;
    }

    void put(pool_handle_node<T>* handle)
    {
        assert(handle && handle->_get_item() == nullptr); // recycling a handle that still holds an item?
        m_free.push(handle);
    }

    size_t unused_count() const { return m_free.size(); }

    void clear() { m_free.clear(); }

    void check() const { m_free.check(); }

private:
    free_list<pool_handle_node<T>> m_free;
};

template <typename T> class borrow_pool;
template <typename T> class borrowed_item;

namespace detail {

    //------------------------------------------------------------------------------
    // pool_core
    // The state shared between a borrow_pool and its outstanding handles.
    //------------------------------------------------------------------------------

    template <typename T>
    class pool_core : public boost::intrusive_ref_counter<pool_core<T>, boost::thread_safe_counter> {
    public:
        using factory_function = std::function<T()>;
        using recycle_function = std::function<void(T&)>;

        pool_core(factory_function factory, const pool_options& options, recycle_function recycle_fn)
            : m_factory(std::move(factory))
            , m_recycle_fn(std::move(recycle_fn))
            , m_counter(options.enable_count)
            , m_factory_invocations(0)
            , m_orphaned(false)
        {
            if (options.max != BORROW_POOL_NO_MAX_SIZE)
                m_gate.reset(new admission_gate(options.max));
        }

        pool_core(const pool_core& other) = delete;
        pool_core& operator=(const pool_core& other) = delete;

        //------------------------------------------------------------------------------
        // borrow/return protocol
        //------------------------------------------------------------------------------

        pool_handle_node<T>* borrow()
        {
            if (m_gate)
                m_gate->acquire();
            return borrow_admitted();
        }

        // Returns nullptr, with no side effects, if no permit is available.
        pool_handle_node<T>* try_borrow()
        {
            if (m_gate && !m_gate->try_acquire())
                return nullptr;
            return borrow_admitted();
        }

        template <class Clock, class Duration>
        pool_handle_node<T>* try_borrow_until(const std::chrono::time_point<Clock, Duration>& deadline)
        {
            if (m_gate && !m_gate->try_acquire_until(deadline))
                return nullptr;
            return borrow_admitted();
        }

        void give_back(pool_handle_node<T>* handle)
        {
            pool_item_node<T>* item = handle->_get_item();
            assert(item != nullptr); // returning a handle that has already been returned?

            if (handle->is_invalid() || m_orphaned.load()) {
                // the item never goes back to the free list: destroying the node
                // also updates the live count
                delete item;
            } else {
                if (m_recycle_fn)
                    m_recycle_fn(item->item());
                m_items.push(item);
            }

            handle->reset();
            m_handles.put(handle);

            m_counter.on_return();

            // the permit goes back last: a waiter woken up now finds the item in the free list
            if (m_gate)
                m_gate->release();
        }

        // Called when the borrow_pool goes away: nobody can borrow anymore, so idle
        // items are released right now and items still on loan will be destroyed as
        // soon as they are returned.
        void orphan()
        {
            m_orphaned.store(true);
            m_items.clear();
            m_handles.clear();
        }

        //------------------------------------------------------------------------------
        // getters
        //------------------------------------------------------------------------------

        bool is_bounded() const { return m_gate != nullptr; }
        size_t max_size() const { return m_gate ? m_gate->weight() : BORROW_POOL_NO_MAX_SIZE; }
        bool is_counting() const { return m_counter.is_enabled(); }
        size_t idle_count() const { return m_counter.idle_count(); }
        size_t on_loan_count() const { return m_counter.on_loan_count(); }
        size_t unused_count() const { return m_items.size(); }
        size_t unused_handle_count() const { return m_handles.unused_count(); }
        size_t factory_invocations() const { return m_factory_invocations.load(); }

        void check() const
        {
            m_items.check();
            m_handles.check();
            if (m_gate && m_counter.is_enabled()) {
                // this condition should hold at any time:
                assert(m_counter.on_loan_count() <= m_gate->weight());
                assert(m_gate->in_use() <= m_gate->weight());
            }
            if (m_counter.is_enabled())
                assert(m_counter.live_count() >= m_items.size());
        }

    private:
        // Runs once admission has been granted. On failure every side effect
        // (permit, borrowed count, handle) is undone before rethrowing.
        pool_handle_node<T>* borrow_admitted()
        {
            m_counter.on_borrow();

            pool_handle_node<T>* handle = nullptr;
            try {
                handle = m_handles.get();

                pool_item_node<T>* item = m_items.pop();
                if (!item)
                    item = make_item();

                handle->_set_item(item);
            } catch (...) {
                if (handle)
                    m_handles.put(handle);
                m_counter.on_return();
                if (m_gate)
                    m_gate->release();
                throw;
            }
            return handle;
        }

        // The factory runs outside any lock: concurrent borrows may construct items in parallel.
        pool_item_node<T>* make_item()
        {
            m_factory_invocations.fetch_add(1);
            return new pool_item_node<T>(m_factory(), m_counter);
        }

    private:
        const factory_function m_factory;
        const recycle_function m_recycle_fn;

        std::unique_ptr<admission_gate> m_gate; // nullptr for an unbounded pool

        // the counter must outlive the free lists: destroying an item node updates it
        live_counter m_counter;
        free_list<pool_item_node<T>> m_items;
        handle_recycler<T> m_handles;

        std::atomic<size_t> m_factory_invocations;
        std::atomic<bool> m_orphaned;
    };

} // namespace detail

//------------------------------------------------------------------------------
// borrowed_item
// Move-only handle to one item on loan. The item goes back to the pool when
// return_to_pool() is called or when the handle is destroyed, whichever
// happens first. A handle is owned by one thread at a time.
//------------------------------------------------------------------------------

template <typename T> class borrowed_item {
    friend class borrow_pool<T>;

public:
    // Creates an empty handle, like the one returned by a timed-out try_borrow_for().
    borrowed_item()
        : m_handle(nullptr)
    {
    }
    borrowed_item(borrowed_item&& other)
        : m_pool(std::move(other.m_pool))
        , m_handle(other.m_handle)
    {
        other.m_handle = nullptr;
    }
    borrowed_item& operator=(borrowed_item&& other)
    {
        if (this != &other) {
            return_to_pool();
            m_pool = std::move(other.m_pool);
            m_handle = other.m_handle;
            other.m_handle = nullptr;
        }
        return *this;
    }
    ~borrowed_item() { return_to_pool(); }

    borrowed_item(const borrowed_item& other) = delete;
    borrowed_item& operator=(const borrowed_item& other) = delete;

    T& item() const
    {
#if BORROW_POOL_DEBUG_CHECKS
        assert(m_handle != nullptr); // using an item after returning it?
#endif
        return m_handle->_get_item()->item();
    }
    T& operator*() const { return item(); }
    T* operator->() const { return &item(); }

    explicit operator bool() const { return m_handle != nullptr; }

    // Flags the item as unusable: when returned, it is destroyed instead of being
    // placed back in the pool. This does not return the item.
    void mark_as_invalid()
    {
#if BORROW_POOL_DEBUG_CHECKS
        assert(m_handle != nullptr);
#endif
        m_handle->mark_as_invalid();
    }
    bool is_invalid() const { return m_handle && m_handle->is_invalid(); }

    // Gives the item back to its pool and leaves this handle empty.
    // Calling it on an empty handle does nothing.
    void return_to_pool()
    {
        if (!m_handle)
            return;

        pool_handle_node<T>* handle = m_handle;
        m_handle = nullptr;
        m_pool->give_back(handle);

        // may destroy the pool core if the borrow_pool is already gone
        m_pool.reset();
    }

private:
    borrowed_item(boost::intrusive_ptr<detail::pool_core<T>> pool, pool_handle_node<T>* handle)
        : m_pool(std::move(pool))
        , m_handle(handle)
    {
    }

    boost::intrusive_ptr<detail::pool_core<T>> m_pool;
    pool_handle_node<T>* m_handle;
};

//------------------------------------------------------------------------------
// borrow_pool
// The pool itself.
//------------------------------------------------------------------------------

template <typename T> class borrow_pool {
public:
    using value_type = T;
    using item_handle = borrowed_item<T>;

    // The factory is the only source of new items. It can be invoked concurrently from
    // several threads and it must not call back into the pool.
    using factory_function = std::function<T()>;

    // If specified the recycle function will be called every time a valid item gets recycled
    // into the pool. This allows e.g. buffers to be cleared before the next borrower sees them.
    // It must not throw.
    using recycle_function = std::function<void(T&)>;

public:
    // Unbounded pool, no initial items, no counting.
    explicit borrow_pool(factory_function factory)
        : borrow_pool(std::move(factory), pool_options())
    {
    }

    // Pool allowing at most max_size items on loan at once.
    borrow_pool(factory_function factory, size_t max_size)
        : borrow_pool(std::move(factory), pool_options(0, max_size))
    {
    }

    // Throws config_error if the factory is empty or options.initial exceeds options.max.
    borrow_pool(factory_function factory, const pool_options& options, recycle_function recycle_fn = nullptr)
    {
        if (!factory)
            BOOST_THROW_EXCEPTION(config_error("borrow_pool: the factory function is empty"));
        if (options.max != BORROW_POOL_NO_MAX_SIZE && options.initial > options.max)
            BOOST_THROW_EXCEPTION(config_error("borrow_pool: initial size " + std::to_string(options.initial)
                + " exceeds max size " + std::to_string(options.max)));

        m_pool = boost::intrusive_ptr<core>(new core(std::move(factory), options, std::move(recycle_fn)));

        prewarm(options.initial);
    }

    virtual ~borrow_pool()
    {
        if (m_pool)
            m_pool->orphan();
    }

    // Copy constructor
    borrow_pool(const borrow_pool& other) = delete;

    // Move constructor
    borrow_pool(borrow_pool&& other) = delete;

    // Copy assignment
    borrow_pool& operator=(const borrow_pool& other) = delete;

    // Move assignment
    borrow_pool& operator=(borrow_pool&& other) = delete;

    //------------------------------------------------------------------------------
    // borrow method variants
    //------------------------------------------------------------------------------

    // Returns an idle item, or a new one from the factory.
    // If the pool is bounded, blocks until fewer than max_size() items are on loan.
    // Exceptions thrown by the factory propagate unchanged.
    item_handle borrow()
    {
        pool_handle_node<T>* handle = m_pool->borrow();
        return item_handle(m_pool, handle);
    }

    // Like borrow() but never blocks: returns an empty handle if max_size() items are on loan.
    item_handle try_borrow()
    {
        pool_handle_node<T>* handle = m_pool->try_borrow();
        if (!handle)
            return item_handle();
        return item_handle(m_pool, handle);
    }

    // Like borrow() but gives up when the timeout expires, returning an empty handle.
    // A borrow that times out has no side effects.
    template <class Rep, class Period> item_handle try_borrow_for(const std::chrono::duration<Rep, Period>& timeout)
    {
        return try_borrow_until(std::chrono::steady_clock::now() + timeout);
    }

    template <class Clock, class Duration>
    item_handle try_borrow_until(const std::chrono::time_point<Clock, Duration>& deadline)
    {
        pool_handle_node<T>* handle = m_pool->try_borrow_until(deadline);
        if (!handle)
            return item_handle();
        return item_handle(m_pool, handle);
    }

    //------------------------------------------------------------------------------
    // other functions operating on items
    //------------------------------------------------------------------------------

    // Returns an item to this pool. Equivalent to handle.return_to_pool().
    void give_back(item_handle& handle)
    {
#if BORROW_POOL_DEBUG_CHECKS
        assert(!handle || handle.m_pool == m_pool); // handle borrowed from another pool?
#endif
        handle.return_to_pool();
    }

    // sanity checks for the whole pool. Useful for debug only.
    void check() const { m_pool->check(); }

    //------------------------------------------------------------------------------
    // getters
    //------------------------------------------------------------------------------

    bool is_bounded() const { return m_pool->is_bounded(); }

    // returns BORROW_POOL_NO_MAX_SIZE for an unbounded pool
    size_t max_size() const { return m_pool->max_size(); }

    bool is_counting() const { return m_pool->is_counting(); }

    // Number of idle items: items in existence minus items on loan.
    // Zero when counting is not enabled. Meant for observability only: under
    // concurrent use it can be stale by the time the caller looks at it.
    size_t idle_count() const { return m_pool->idle_count(); }

    // Number of items currently on loan. Zero when counting is not enabled.
    size_t on_loan_count() const { return m_pool->on_loan_count(); }

    // returns the number of items in the free list
    size_t unused_count() const { return m_pool->unused_count(); }

    // returns the number of handles ready for reuse
    size_t unused_handle_count() const { return m_pool->unused_handle_count(); }

    // returns the number of factory calls done so far
    size_t factory_invocations() const { return m_pool->factory_invocations(); }

private:
    using core = detail::pool_core<T>;

    // Borrows n items and returns them in reverse order, so that the free list
    // holds n items and the first one borrowed is on top.
    void prewarm(size_t n)
    {
        if (n == 0)
            return;

        std::vector<item_handle> items;
        items.reserve(n);
        for (size_t i = 0; i < n; i++)
            items.push_back(borrow());

        while (!items.empty()) {
            items.back().return_to_pool();
            items.pop_back();
        }

#if BORROW_POOL_DEBUG_CHECKS
        check();
#endif
    }

private:
    boost::intrusive_ptr<core> m_pool;
};

} // namespace borrowpool
