/*
 * Small example program to show how a borrowpool::borrow_pool
 * saves the construction of expensive objects and, once warm,
 * serves borrowers without any memory allocation
 *
 * Created: Oct 2026
 * License: BSD license
 *
 */

//------------------------------------------------------------------------------
// Includes
//------------------------------------------------------------------------------

#include "borrow_pool.hpp"
#include "tracing_malloc.h"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

//------------------------------------------------------------------------------
// Utility classes
//------------------------------------------------------------------------------

// Pretend this is a database connection: expensive to open, cheap to reuse.
class DummyConnection {
public:
    DummyConnection(uint32_t n = 0)
        : m_id(n)
        , m_broken(false)
    {
        TRACE_METHOD();
    }
    ~DummyConnection()
    {
        TRACE_METHOD(); // this shows that dtor runs only for connections leaving the pool for good!
    }

    uint32_t id() const { return m_id; }

    void query(const std::string& sql)
    {
        std::cout << "  Connection #" << m_id << " runs: " << sql << std::endl;
        if (sql.find("DROP") != std::string::npos)
            m_broken = true;
    }
    bool is_broken() const { return m_broken; }

private:
    uint32_t m_id;
    bool m_broken;

    // just some fat buffer:
    char buf[1024];
};

typedef std::unique_ptr<DummyConnection> HDummyConnection;

//------------------------------------------------------------------------------
// Utility functions
//------------------------------------------------------------------------------

template <class Item> void observe_pool(const borrowpool::borrow_pool<Item>& pool)
{
    std::cout << "  The pool now has idle_count=" << pool.idle_count() << ", on_loan_count=" << pool.on_loan_count()
              << ", unused_count=" << pool.unused_count() << ", factory_invocations=" << pool.factory_invocations()
              << std::endl;
}

//------------------------------------------------------------------------------
// Showcase routines
//------------------------------------------------------------------------------

void showcase_borrow_and_return()
{
    print_header();
    std::cout << "Running some examples for borrow() and return:" << std::endl;

    uint32_t next_id = 0;
    borrowpool::borrow_pool<HDummyConnection> pool(
        [&next_id] { return HDummyConnection(new DummyConnection(next_id++)); },
        borrowpool::pool_options(2 /* initial */, 4 /* max */, true /* enable count */));

    std::cout << "  The pool has been created with 2 ready-to-use connections" << std::endl;
    observe_pool(pool);

    {
        std::cout << "  Now borrowing a connection: no connection is opened and, with the pool warm, no malloc happens!"
                  << std::endl;

        allocation_tracer tracer;
        {
            borrowpool::borrowed_item<HDummyConnection> conn = pool.borrow();
            conn.item()->query("SELECT 1");
            observe_pool(pool);
        } // the connection returns to the pool here

        std::cout << "  Allocations while borrowing and returning: " << tracer.allocations() << std::endl;
    }

    observe_pool(pool);

    {
        std::cout << "  Now borrowing 3 connections at once: the pool has 2 idle ones, so 1 new connection is opened"
                  << std::endl;
        std::vector<borrowpool::borrowed_item<HDummyConnection>> conns;
        for (unsigned int i = 0; i < 3; i++)
            conns.push_back(pool.borrow());
        observe_pool(pool);

        std::cout << "  Going to return all connections explicitly" << std::endl;
        for (auto& c : conns)
            pool.give_back(c);
    }

    observe_pool(pool);

    std::cout << "  Going to release the whole pool. You will see a bunch of dtor happen!" << std::endl;
}

void showcase_invalidation()
{
    print_header();
    std::cout << "Running some examples for mark_as_invalid():" << std::endl;

    uint32_t next_id = 100;
    borrowpool::borrow_pool<HDummyConnection> pool(
        [&next_id] { return HDummyConnection(new DummyConnection(next_id++)); },
        borrowpool::pool_options(1, BORROW_POOL_NO_MAX_SIZE, true));

    {
        borrowpool::borrowed_item<HDummyConnection> conn = pool.borrow();
        conn.item()->query("DROP TABLE students");

        if (conn.item()->is_broken()) {
            std::cout << "  The connection is broken: marking it as invalid. The dtor will run on return." << std::endl;
            conn.mark_as_invalid();
        }
    }

    observe_pool(pool);

    std::cout << "  Borrowing again: a new connection gets opened" << std::endl;
    borrowpool::borrowed_item<HDummyConnection> conn = pool.borrow();
    conn.item()->query("SELECT 1");
    observe_pool(pool);
}

void showcase_bounded_pool()
{
    print_header();
    std::cout << "Running some examples for a bounded pool shared by several threads:" << std::endl;

    std::atomic<uint32_t> next_id(200);
    borrowpool::borrow_pool<HDummyConnection> pool(
        [&next_id] { return HDummyConnection(new DummyConnection(next_id++)); }, 2 /* max */);

    std::vector<std::thread> workers;
    for (unsigned int t = 0; t < 4; t++) {
        workers.push_back(std::thread([&pool] {
            // at most 2 threads at a time get past this line:
            borrowpool::borrowed_item<HDummyConnection> conn = pool.borrow();
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
        }));
    }

    for (auto& t : workers)
        t.join();

    std::cout << "  4 threads were served by " << pool.factory_invocations() << " connections" << std::endl;

    borrowpool::borrowed_item<HDummyConnection> c1 = pool.borrow();
    borrowpool::borrowed_item<HDummyConnection> c2 = pool.borrow();
    borrowpool::borrowed_item<HDummyConnection> c3 = pool.try_borrow_for(std::chrono::milliseconds(100));
    std::cout << "  With 2 connections on loan a third borrow times out: " << (c3 ? "no" : "yes") << std::endl;
}

//------------------------------------------------------------------------------
// Main
//------------------------------------------------------------------------------

int main()
{
    showcase_borrow_and_return();
    showcase_invalidation();
    showcase_bounded_pool();

    print_header();
    std::cout << "Exiting" << std::endl;
    return 0;
}
