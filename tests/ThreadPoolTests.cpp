#define BOOST_TEST_MODULE ThreadPoolTests
#include <boost/test/unit_test.hpp>

#include "ThreadPool.hpp"
#include <atomic>
#include <chrono>
#include <future>
#include <memory>

namespace {

// Signals once the task that owns it has been destroyed.
struct LastOwner {
    std::shared_ptr<ThreadPool> pool;
    std::promise<void>* released = nullptr;

    ~LastOwner() {
        pool.reset();
        released->set_value();
    }
};

} // namespace

BOOST_AUTO_TEST_SUITE(Lifetime)

BOOST_AUTO_TEST_CASE(WaitIdleReturnsAfterEveryTask) {
    ThreadPool pool(3);
    std::atomic<int> done{ 0 };
    for (int i = 0; i < 20; ++i)
        pool.enqueue([&done] { ++done; });

    pool.wait_idle();
    BOOST_CHECK_EQUAL(done.load(), 20);
}

BOOST_AUTO_TEST_CASE(TaskMayReleaseTheLastReferenceToItsPool) {
    std::promise<void> gate;
    std::shared_future<void> opened = gate.get_future().share();
    std::promise<void> released;
    std::future<void> releasedFuture = released.get_future();

    auto pool = std::make_shared<ThreadPool>(1);
    auto owner = std::make_shared<LastOwner>();
    owner->pool = pool;
    owner->released = &released;

    pool->enqueue([owner, opened] { opened.wait(); });
    owner.reset();
    pool.reset(); // only the queued task still owns the pool

    gate.set_value();
    BOOST_CHECK(releasedFuture.wait_for(std::chrono::seconds(5)) == std::future_status::ready);
}

BOOST_AUTO_TEST_SUITE_END()
